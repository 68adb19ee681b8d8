// =============================================================================
// translator.hpp - Notation <-> Natural Language Facade
// =============================================================================
// Ties the shared Vocabulary to a Scanner, Resolver and Renderer. A
// Translator is immutable and may be used from several threads at once as
// long as each thread brings its own Context.
// =============================================================================

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lambdalang/context.hpp"
#include "lambdalang/renderer.hpp"
#include "lambdalang/resolver.hpp"
#include "lambdalang/scanner.hpp"
#include "lambdalang/vocabulary.hpp"

namespace lambdalang {

class Translator {
public:
    explicit Translator(VocabularyPtr vocabulary);

    std::vector<Token> scan(std::string_view raw, Context& context) const;

    std::optional<std::string> resolve(std::string_view token, Lang lang, const Context& context) const;

    // Scan and resolve each token against the context as it is at that point
    std::vector<Interpretation> interpret(std::string_view raw, Context& context) const;

    std::string render(std::string_view raw, Lang lang, Context& context) const;

    // One-shot translation with a fresh context
    std::string to_english(std::string_view raw) const;
    std::string to_chinese(std::string_view raw) const;

    const Vocabulary& vocabulary() const noexcept { return *vocabulary_; }
    const VocabularyPtr& vocabulary_ptr() const noexcept { return vocabulary_; }
    const Resolver& resolver() const noexcept { return scanner_.resolver(); }

private:
    VocabularyPtr vocabulary_;
    Scanner scanner_;
    Renderer renderer_;
};

} // namespace lambdalang
