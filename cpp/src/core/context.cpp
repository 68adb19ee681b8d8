#include "lambdalang/context.hpp"
#include "lambdalang/error.hpp"

#include <algorithm>

namespace lambdalang {

bool Context::activate_domain(const std::string& code) {
    LAMBDALANG_CHECK_ARGUMENT(!code.empty(), "domain code must not be empty");
    if (is_active(code)) return false;
    domains_.push_back(code);
    return true;
}

bool Context::is_active(std::string_view code) const {
    return std::find(domains_.begin(), domains_.end(), code) != domains_.end();
}

void Context::define(const std::string& key, std::string value) {
    LAMBDALANG_CHECK_ARGUMENT(!key.empty(), "definition key must not be empty");
    definitions_[key] = std::move(value);
}

const std::string* Context::definition(std::string_view key) const {
    auto it = definitions_.find(key);
    return it != definitions_.end() ? &it->second : nullptr;
}

void Context::clear() {
    domains_.clear();
    definitions_.clear();
}

} // namespace lambdalang
