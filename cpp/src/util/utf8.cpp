#include "lambdalang/util/utf8.hpp"

namespace lambdalang::util {

std::vector<Utf8Char> split_utf8(std::string_view data) {
    std::vector<Utf8Char> chars;
    chars.reserve(data.size());

    const uint8_t* begin = reinterpret_cast<const uint8_t*>(data.data());
    const uint8_t* p = begin;
    const uint8_t* end = p + data.size();

    while (p < end) {
        const uint8_t* start = p;
        uint32_t cp;

        if (*p < 0x80) {
            cp = *p++;
        } else if ((*p & 0xE0) == 0xC0 && p + 1 < end && (p[1] & 0xC0) == 0x80) {
            cp = ((p[0] & 0x1F) << 6) | (p[1] & 0x3F);
            p += 2;
            if (cp < 0x80) { cp = 0xFFFD; p = start + 1; } // Overlong
        } else if ((*p & 0xF0) == 0xE0 && p + 2 < end &&
                   (p[1] & 0xC0) == 0x80 && (p[2] & 0xC0) == 0x80) {
            cp = ((p[0] & 0x0F) << 12) | ((p[1] & 0x3F) << 6) | (p[2] & 0x3F);
            p += 3;
            if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) { cp = 0xFFFD; p = start + 1; }
        } else if ((*p & 0xF8) == 0xF0 && p + 3 < end &&
                   (p[1] & 0xC0) == 0x80 && (p[2] & 0xC0) == 0x80 && (p[3] & 0xC0) == 0x80) {
            cp = ((p[0] & 0x07) << 18) | ((p[1] & 0x3F) << 12) | ((p[2] & 0x3F) << 6) | (p[3] & 0x3F);
            p += 4;
            if (cp < 0x10000 || cp > 0x10FFFF) { cp = 0xFFFD; p = start + 1; }
        } else {
            // Invalid start byte, bad continuation or truncated sequence
            cp = 0xFFFD;
            ++p;
        }

        chars.push_back(Utf8Char{cp, static_cast<size_t>(start - begin), static_cast<size_t>(p - start)});
    }

    return chars;
}

bool is_space(uint32_t cp) noexcept {
    if (cp == ' ' || (cp >= 0x09 && cp <= 0x0D)) return true;
    if (cp == 0x85 || cp == 0xA0 || cp == 0x1680) return true;
    if (cp >= 0x2000 && cp <= 0x200A) return true;
    if (cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F) return true;
    return cp == 0x3000 || cp == 0xFEFF;
}

} // namespace lambdalang::util
