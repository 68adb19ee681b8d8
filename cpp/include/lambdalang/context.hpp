// =============================================================================
// context.hpp - Per-Session Resolution State
// =============================================================================
// Owned by exactly one session. Control blocks ({ns:..}, {def:..}) are the
// only writers during a scan; hosts that keep a session alive across inputs
// pass the same Context to successive calls, one call at a time.
// =============================================================================

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lambdalang {

class Context {
public:
    // Append `code` to the activated domains. Returns false if it was already active.
    bool activate_domain(const std::string& code);

    bool is_active(std::string_view code) const;

    // Activation order, duplicates suppressed
    const std::vector<std::string>& active_domains() const noexcept { return domains_; }

    // Install or overwrite a local definition
    void define(const std::string& key, std::string value);

    // Literal override for `key`, nullptr if none
    const std::string* definition(std::string_view key) const;

    const std::map<std::string, std::string, std::less<>>& definitions() const noexcept {
        return definitions_;
    }

    bool empty() const noexcept { return domains_.empty() && definitions_.empty(); }

    // Clear all state (for reuse)
    void clear();

private:
    std::vector<std::string> domains_;
    std::map<std::string, std::string, std::less<>> definitions_;
};

// Free-function form of the session API
inline bool activate_domain(Context& context, const std::string& code) {
    return context.activate_domain(code);
}

inline void define_local(Context& context, const std::string& key, std::string value) {
    context.define(key, std::move(value));
}

} // namespace lambdalang
