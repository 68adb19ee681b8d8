#pragma once

#include <optional>
#include <string>
#include <vector>

#include "lambdalang/resolver.hpp"
#include "lambdalang/token.hpp"
#include "lambdalang/types.hpp"

namespace lambdalang {

// A token together with what it meant at the moment it was scanned
struct Interpretation {
    Token token;
    std::optional<Meaning> meaning;

    bool resolved() const noexcept { return meaning.has_value(); }
};

/**
 * Renderer - turns interpreted tokens into English or Chinese text
 *
 * The first token that resolves from the `types` category becomes a
 * "(type) " prefix. Blocks are dropped, brackets copied through, and
 * anything unresolved is shown as "[raw]". English bodies are joined with
 * a space, Chinese bodies with nothing.
 */
class Renderer {
public:
    std::string render(const std::vector<Interpretation>& items, Lang lang) const;

    static const char* separator(Lang lang) noexcept {
        return lang == Lang::ZH ? "" : " ";
    }

private:
    static bool is_type_marker(const Interpretation& item);
};

} // namespace lambdalang
