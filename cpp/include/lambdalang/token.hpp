#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace lambdalang {

enum class TokenKind : uint8_t {
    Atom,           // plain 1-2 character atom: I, k, co, bc
    DomainAtom,     // explicit namespace: cd:bg
    Disambiguated,  // atom with marker: de'E, lo-
    Block,          // control block, markers included: {ns:cd}
    Bracket,        // ( ) [ ]
    Literal         // unknown run or unterminated block
};

const char* token_kind_name(TokenKind kind) noexcept;

// A raw slice of the input. `offset`/`size` are byte positions in the
// scanned string, so token spans plus skipped whitespace tile it exactly.
struct Token {
    TokenKind kind;
    std::string text;
    size_t offset;
    size_t size;

    bool is_block() const noexcept { return kind == TokenKind::Block; }
};

inline bool operator==(const Token& a, const Token& b) {
    return a.kind == b.kind && a.text == b.text && a.offset == b.offset && a.size == b.size;
}

inline bool operator!=(const Token& a, const Token& b) {
    return !(a == b);
}

} // namespace lambdalang
