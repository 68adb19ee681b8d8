#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace lambdalang::util {

// One decoded code point and the byte span it occupies in the source
struct Utf8Char {
    uint32_t codepoint;
    size_t offset;
    size_t size;
};

// Decode UTF-8 into code points with their byte spans.
// Invalid sequences become U+FFFD covering a single byte, so the spans
// always tile the input exactly.
std::vector<Utf8Char> split_utf8(std::string_view data);

// Unicode white space (ASCII controls, NBSP, the U+2000 block, ideographic space, BOM)
bool is_space(uint32_t codepoint) noexcept;

inline bool is_ascii_lower(uint32_t codepoint) noexcept {
    return codepoint >= 'a' && codepoint <= 'z';
}

} // namespace lambdalang::util
