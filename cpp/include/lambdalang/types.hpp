#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace lambdalang {

// =============================================================================
// Rendering languages
// =============================================================================

enum class Lang : uint8_t {
    EN = 0,
    ZH = 1
};

constexpr const char* lang_tag(Lang lang) noexcept {
    return lang == Lang::ZH ? "zh" : "en";
}

// "en" / "zh", anything else is nullopt
std::optional<Lang> parse_lang(std::string_view tag);

// =============================================================================
// Gloss - the rendering of one meaning in every supported language
// =============================================================================

struct Gloss {
    std::string en;
    std::string zh;

    const std::string& in(Lang lang) const noexcept {
        return lang == Lang::ZH ? zh : en;
    }
};

// =============================================================================
// Atom categories
// =============================================================================

enum class Category : uint8_t {
    Types = 0,
    Entities,
    Verbs,
    Modifiers,
    Time,
    Quantifiers,
    Aspect,
    Extended,
    Discourse,
    Emotion,
    COUNT
};

constexpr size_t kCategoryCount = static_cast<size_t>(Category::COUNT);

// Single-character categories in lookup precedence order
constexpr std::array<Category, 7> kCoreCategories = {
    Category::Types, Category::Entities, Category::Verbs, Category::Modifiers,
    Category::Time, Category::Quantifiers, Category::Aspect
};

// Section name used in the vocabulary source ("types", "extended", ...)
const char* category_name(Category category) noexcept;

std::optional<Category> parse_category(std::string_view name);

// =============================================================================
// Atom - one vocabulary entry
// =============================================================================

struct Atom {
    std::string key;
    Gloss gloss;
    Category category;
};

using AtomTable = std::map<std::string, Atom, std::less<>>;

// =============================================================================
// Domain - an activatable namespace with its own private atoms
// =============================================================================

struct Domain {
    std::string code;
    Gloss name;
    std::map<std::string, Gloss, std::less<>> atoms;

    const Gloss* find(std::string_view key) const {
        auto it = atoms.find(key);
        return it != atoms.end() ? &it->second : nullptr;
    }
};

// =============================================================================
// Disambiguation - alternate meanings selected by a trailing marker
// =============================================================================

// Markers accepted after an apostrophe: de'E, fe'V ...
constexpr std::string_view kQuotedMarkers = "EVS23";

// Positional marker written directly after the key: lo-
constexpr char kPositionalMarker = '-';

constexpr bool is_quoted_marker(uint32_t c) noexcept {
    return c < 0x80 && kQuotedMarkers.find(static_cast<char>(c)) != std::string_view::npos;
}

constexpr bool is_marker(char c) noexcept {
    return c == kPositionalMarker || kQuotedMarkers.find(c) != std::string_view::npos;
}

struct DisambiguationEntry {
    std::string key;
    Gloss primary;
    std::map<char, Gloss> alternates;

    // Alternate for `marker` if known, primary otherwise (including no marker)
    const Gloss& select(std::optional<char> marker) const {
        if (marker) {
            auto it = alternates.find(*marker);
            if (it != alternates.end()) return it->second;
        }
        return primary;
    }
};

} // namespace lambdalang
