#include "lambdalang/control_block.hpp"
#include "lambdalang/context.hpp"
#include "lambdalang/logging.hpp"

namespace lambdalang {

namespace {

constexpr std::string_view kNamespacePrefix = "ns:";
constexpr std::string_view kDefinitionPrefix = "def:";

std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// Split on commas that are not inside double quotes
std::vector<std::string_view> split_pairs(std::string_view s) {
    std::vector<std::string_view> parts;
    bool quoted = false;
    size_t start = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') {
            quoted = !quoted;
        } else if (s[i] == ',' && !quoted) {
            parts.push_back(s.substr(start, i - start));
            start = i + 1;
        }
    }
    parts.push_back(s.substr(start));
    return parts;
}

std::string unquote(std::string_view value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return std::string(value);
}

struct Applier {
    Context& context;

    void operator()(const NamespaceActivation& block) const {
        for (const auto& code : block.codes) {
            if (context.activate_domain(code)) {
                LOG_DEBUG("Activated domain '", code, "'");
            }
        }
    }

    void operator()(const DefinitionBlock& block) const {
        for (const auto& [key, value] : block.entries) {
            LOG_DEBUG("Defined '", key, "' = '", value, "'");
            context.define(key, value);
        }
    }

    void operator()(const UnknownBlock& block) const {
        LOG_DEBUG("Ignoring unrecognized control block '{", block.body, "}'");
    }
};

} // namespace

ControlBlock parse_control_block(std::string_view body) {
    std::string_view text = trim(body);

    if (text.substr(0, kNamespacePrefix.size()) == kNamespacePrefix) {
        NamespaceActivation block;
        for (std::string_view part : split_pairs(text.substr(kNamespacePrefix.size()))) {
            std::string_view code = trim(part);
            if (!code.empty()) block.codes.emplace_back(code);
        }
        return block;
    }

    if (text.substr(0, kDefinitionPrefix.size()) == kDefinitionPrefix) {
        DefinitionBlock block;
        for (std::string_view part : split_pairs(text.substr(kDefinitionPrefix.size()))) {
            size_t eq = part.find('=');
            if (eq == std::string_view::npos) {
                if (!trim(part).empty()) {
                    LOG_WARNING("Dropping definition without '=': '", part, "'");
                }
                continue;
            }
            std::string_view key = trim(part.substr(0, eq));
            if (key.empty()) {
                LOG_WARNING("Dropping definition with empty key: '", part, "'");
                continue;
            }
            block.entries.emplace_back(std::string(key), unquote(trim(part.substr(eq + 1))));
        }
        return block;
    }

    return UnknownBlock{std::string(body)};
}

void apply_control_block(const ControlBlock& block, Context& context) {
    std::visit(Applier{context}, block);
}

} // namespace lambdalang
