#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "lambdalang/vocabulary.hpp"

namespace lambdalang {

/**
 * Encoder - heuristic English -> notation conversion
 *
 * Keyword substitution only: each English word whose text matches the
 * first "/"-separated alternative of an atom's English rendering is
 * replaced by that atom's key. Words with no match are dropped. Not the
 * inverse of rendering.
 */
class Encoder {
public:
    explicit Encoder(VocabularyPtr vocabulary);

    std::string encode(std::string_view text) const;

    // English word -> atom key
    const std::unordered_map<std::string, std::string>& reverse_map() const noexcept { return reverse_; }

private:
    VocabularyPtr vocabulary_;
    std::unordered_map<std::string, std::string> reverse_;
};

} // namespace lambdalang
