// =============================================================================
// scanner.hpp - Notation String -> Token Sequence
// =============================================================================
// Single left-to-right pass over code points. At each position the first
// matching rule wins:
//   1. whitespace (skipped)          6. discourse / emotion pair
//   2. {control block}               7. two lowercase letters that resolve
//   3. bracket ( ) [ ]               8. single character that resolves
//   4. domain:atom                   9. unknown run (at least one char)
//   5. xx'M or xx- (disambiguated)
// Rule 2 is the only one that touches the Context, so a block changes how
// later tokens in the same message scan and resolve, never earlier ones.
// Rules 7 and 8 consult the resolver, which makes tokenization depend on
// the active domains and definitions.
// =============================================================================

#pragma once

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include "lambdalang/context.hpp"
#include "lambdalang/resolver.hpp"
#include "lambdalang/token.hpp"
#include "lambdalang/util/utf8.hpp"

namespace lambdalang {

class Scanner {
public:
    // Invoked for every token as it is emitted, with the context as it
    // stands at that point of the scan
    using TokenCallback = std::function<void(const Token&, const Context&)>;

    explicit Scanner(Resolver resolver);
    explicit Scanner(VocabularyPtr vocabulary);

    // Total: never throws on any input, always terminates
    std::vector<Token> scan(std::string_view raw, Context& context) const;

    std::vector<Token> scan(std::string_view raw, Context& context, const TokenCallback& on_token) const;

    const Resolver& resolver() const noexcept { return resolver_; }

private:
    struct Match {
        TokenKind kind;
        size_t length;  // in code points
    };

    // Rules 3-8 at position i; no side effects
    std::optional<Match> match_at(const std::vector<util::Utf8Char>& chars, size_t i,
                                  std::string_view raw, const Context& context) const;

    void activate_block(std::string_view body, Context& context) const;

    Resolver resolver_;
};

} // namespace lambdalang
