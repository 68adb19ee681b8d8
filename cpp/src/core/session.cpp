#include "lambdalang/session.hpp"

#include <cctype>

namespace lambdalang {

namespace {

// ":word" is a session command; ":)" and other notation starting with ':' is not
bool is_command(std::string_view line) {
    if (line.size() < 2 || line.front() != ':') return false;
    for (char c : line.substr(1)) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

Session::Session(const Translator& translator, Lang lang)
    : translator_(translator), lang_(lang) {}

std::string Session::handle(std::string_view line) {
    size_t first = line.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return "";
    size_t last = line.find_last_not_of(" \t\r\n");
    line = line.substr(first, last - first + 1);

    if (is_command(line)) return command(line.substr(1));
    return translator_.render(line, lang_, context_);
}

std::string Session::describe_context() const {
    std::string out = "domains:";
    if (context_.active_domains().empty()) out += " (none)";
    for (const auto& code : context_.active_domains()) out += " " + code;

    out += "\ndefinitions:";
    if (context_.definitions().empty()) out += " (none)";
    for (const auto& [key, value] : context_.definitions()) out += " " + key + "=" + value;
    return out;
}

std::string Session::command(std::string_view name) {
    if (name == "en" || name == "zh") {
        lang_ = name == "zh" ? Lang::ZH : Lang::EN;
        return std::string("language: ") + lang_tag(lang_);
    }
    if (name == "ctx") return describe_context();
    if (name == "reset") {
        context_.clear();
        return "context cleared";
    }
    if (name == "quit" || name == "q") {
        finished_ = true;
        return "";
    }
    return "unknown command ':" + std::string(name) + "' (try :en :zh :ctx :reset :quit)";
}

} // namespace lambdalang
