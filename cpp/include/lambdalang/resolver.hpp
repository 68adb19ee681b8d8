// =============================================================================
// resolver.hpp - Token -> Meaning via a Fixed Precedence Chain
// =============================================================================
// Precedence (first match wins):
//   1. local definitions        4. activated domains (activation order)
//   2. disambiguation table     5. discourse, emotion, extended, core
//   3. explicit domain:atom
// The chain is a table of strategies so each level can be exercised alone.
// =============================================================================

#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "lambdalang/context.hpp"
#include "lambdalang/types.hpp"
#include "lambdalang/vocabulary.hpp"

namespace lambdalang {

enum class ResolutionSource : uint8_t {
    Definition = 0,
    Disambiguation,
    DomainPrefix,
    ActiveDomain,
    Discourse,
    Emotion,
    Extended,
    Core
};

constexpr size_t kResolutionSourceCount = 8;

const char* resolution_source_name(ResolutionSource source) noexcept;

// A token split into its parts: "de'E" -> key "de", marker "E";
// "cd:bg" -> key "cd:bg", domain "cd", atom "bg".
// The marker is one code point and may lie outside the marker alphabet.
struct AtomRef {
    std::string_view key;
    std::string_view marker;
    std::string_view domain;
    std::string_view atom;

    bool has_marker() const noexcept { return !marker.empty(); }
    bool prefixed() const noexcept { return !domain.empty(); }
};

AtomRef split_token(std::string_view token);

struct Meaning {
    Gloss gloss;
    ResolutionSource source;
    std::optional<Category> category;  // set for table lookups
    std::string domain;                // set for domain lookups

    const std::string& in(Lang lang) const noexcept { return gloss.in(lang); }
};

class Resolver {
public:
    explicit Resolver(VocabularyPtr vocabulary);

    // Full chain, both renderings at once. nullopt means Unresolved.
    std::optional<Meaning> resolve(std::string_view token, const Context& context) const;

    std::optional<std::string> resolve(std::string_view token, Lang lang, const Context& context) const;

    // One precedence level in isolation
    std::optional<Meaning> resolve_at(ResolutionSource source, std::string_view token,
                                      const Context& context) const;

    // Order in which levels are consulted
    static const std::array<ResolutionSource, kResolutionSourceCount>& precedence();

    const Vocabulary& vocabulary() const noexcept { return *vocabulary_; }

private:
    std::optional<Meaning> run_step(size_t index, const AtomRef& ref, const Context& context) const;

    VocabularyPtr vocabulary_;
};

} // namespace lambdalang
