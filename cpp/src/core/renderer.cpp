#include "lambdalang/renderer.hpp"

namespace lambdalang {

bool Renderer::is_type_marker(const Interpretation& item) {
    return item.meaning && item.meaning->source == ResolutionSource::Core &&
           item.meaning->category == Category::Types;
}

std::string Renderer::render(const std::vector<Interpretation>& items, Lang lang) const {
    std::string prefix;
    bool have_type = false;
    std::vector<std::string> parts;
    parts.reserve(items.size());

    for (const auto& item : items) {
        switch (item.token.kind) {
            case TokenKind::Block:
                continue;
            case TokenKind::Bracket:
                parts.push_back(item.token.text);
                continue;
            default:
                break;
        }

        if (!have_type && is_type_marker(item)) {
            prefix = "(" + item.meaning->in(lang) + ")";
            have_type = true;
        } else if (item.meaning) {
            parts.push_back(item.meaning->in(lang));
        } else {
            parts.push_back("[" + item.token.text + "]");
        }
    }

    std::string body;
    const char* sep = separator(lang);
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) body += sep;
        body += parts[i];
    }

    if (prefix.empty()) return body;
    if (body.empty()) return prefix;
    return prefix + " " + body;
}

} // namespace lambdalang
