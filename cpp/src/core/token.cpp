#include "lambdalang/token.hpp"

namespace lambdalang {

const char* token_kind_name(TokenKind kind) noexcept {
    switch (kind) {
        case TokenKind::Atom:          return "atom";
        case TokenKind::DomainAtom:    return "domain_atom";
        case TokenKind::Disambiguated: return "disambiguated";
        case TokenKind::Block:         return "block";
        case TokenKind::Bracket:       return "bracket";
        case TokenKind::Literal:       return "literal";
    }
    return "unknown";
}

} // namespace lambdalang
