#include "lambdalang/types.hpp"

namespace lambdalang {

std::optional<Lang> parse_lang(std::string_view tag) {
    if (tag == "en") return Lang::EN;
    if (tag == "zh") return Lang::ZH;
    return std::nullopt;
}

const char* category_name(Category category) noexcept {
    switch (category) {
        case Category::Types:       return "types";
        case Category::Entities:    return "entities";
        case Category::Verbs:       return "verbs";
        case Category::Modifiers:   return "modifiers";
        case Category::Time:        return "time";
        case Category::Quantifiers: return "quantifiers";
        case Category::Aspect:      return "aspect";
        case Category::Extended:    return "extended";
        case Category::Discourse:   return "discourse";
        case Category::Emotion:     return "emotion";
        case Category::COUNT:       break;
    }
    return "unknown";
}

std::optional<Category> parse_category(std::string_view name) {
    for (size_t i = 0; i < kCategoryCount; ++i) {
        auto category = static_cast<Category>(i);
        if (name == category_name(category)) return category;
    }
    return std::nullopt;
}

} // namespace lambdalang
