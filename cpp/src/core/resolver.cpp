#include "lambdalang/resolver.hpp"
#include "lambdalang/error.hpp"
#include "lambdalang/util/utf8.hpp"

namespace lambdalang {

namespace {

bool is_lower_pair(std::string_view s) {
    return s.size() == 2 && util::is_ascii_lower(static_cast<unsigned char>(s[0])) &&
           util::is_ascii_lower(static_cast<unsigned char>(s[1]));
}

bool is_domain_code(std::string_view s) {
    if (s.size() < 2 || s.size() > 3) return false;
    for (char c : s) {
        if (!util::is_ascii_lower(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Meaning from_table(const Atom& atom, ResolutionSource source) {
    return Meaning{atom.gloss, source, atom.category, {}};
}

// =============================================================================
// Strategies
// =============================================================================

using Strategy = std::optional<Meaning> (*)(const Vocabulary&, const AtomRef&, const Context&);

std::optional<Meaning> by_definition(const Vocabulary&, const AtomRef& ref, const Context& context) {
    const std::string* value = context.definition(ref.key);
    if (!value) return std::nullopt;
    return Meaning{Gloss{*value, *value}, ResolutionSource::Definition, std::nullopt, {}};
}

// Unknown markers fall back to the primary rendering
std::optional<Meaning> by_disambiguation(const Vocabulary& vocab, const AtomRef& ref, const Context&) {
    const DisambiguationEntry* entry = vocab.find_disambiguation(ref.key);
    if (!entry) return std::nullopt;
    std::optional<char> marker;
    if (ref.marker.size() == 1) marker = ref.marker.front();
    return Meaning{entry->select(marker), ResolutionSource::Disambiguation, Category::Extended, {}};
}

std::optional<Meaning> by_domain_prefix(const Vocabulary& vocab, const AtomRef& ref, const Context&) {
    if (!ref.prefixed()) return std::nullopt;
    const Domain* domain = vocab.find_domain(ref.domain);
    if (!domain) return std::nullopt;
    const Gloss* gloss = domain->find(ref.atom);
    if (!gloss) return std::nullopt;
    return Meaning{*gloss, ResolutionSource::DomainPrefix, std::nullopt, domain->code};
}

std::optional<Meaning> by_active_domain(const Vocabulary& vocab, const AtomRef& ref, const Context& context) {
    for (const auto& code : context.active_domains()) {
        const Domain* domain = vocab.find_domain(code);
        if (!domain) continue;
        if (const Gloss* gloss = domain->find(ref.key)) {
            return Meaning{*gloss, ResolutionSource::ActiveDomain, std::nullopt, domain->code};
        }
    }
    return std::nullopt;
}

template <Category C, ResolutionSource S>
std::optional<Meaning> by_table(const Vocabulary& vocab, const AtomRef& ref, const Context&) {
    const Atom* atom = vocab.find(C, ref.key);
    if (!atom) return std::nullopt;
    return from_table(*atom, S);
}

std::optional<Meaning> by_core(const Vocabulary& vocab, const AtomRef& ref, const Context&) {
    const Atom* atom = vocab.find_core(ref.key);
    if (!atom) return std::nullopt;
    return from_table(*atom, ResolutionSource::Core);
}

struct ResolutionStep {
    ResolutionSource source;
    Strategy strategy;
};

constexpr ResolutionStep kChain[kResolutionSourceCount] = {
    {ResolutionSource::Definition,     by_definition},
    {ResolutionSource::Disambiguation, by_disambiguation},
    {ResolutionSource::DomainPrefix,   by_domain_prefix},
    {ResolutionSource::ActiveDomain,   by_active_domain},
    {ResolutionSource::Discourse,      by_table<Category::Discourse, ResolutionSource::Discourse>},
    {ResolutionSource::Emotion,        by_table<Category::Emotion, ResolutionSource::Emotion>},
    {ResolutionSource::Extended,       by_table<Category::Extended, ResolutionSource::Extended>},
    {ResolutionSource::Core,           by_core},
};

size_t step_index(ResolutionSource source) {
    for (size_t i = 0; i < kResolutionSourceCount; ++i) {
        if (kChain[i].source == source) return i;
    }
    return kResolutionSourceCount;
}

} // namespace

const char* resolution_source_name(ResolutionSource source) noexcept {
    switch (source) {
        case ResolutionSource::Definition:     return "definition";
        case ResolutionSource::Disambiguation: return "disambiguation";
        case ResolutionSource::DomainPrefix:   return "domain-prefix";
        case ResolutionSource::ActiveDomain:   return "active-domain";
        case ResolutionSource::Discourse:      return "discourse";
        case ResolutionSource::Emotion:        return "emotion";
        case ResolutionSource::Extended:       return "extended";
        case ResolutionSource::Core:           return "core";
    }
    return "unknown";
}

// Markers split only off a two-letter base, mirroring the scanner's syntax:
// de'E, lo-. Domain prefixes need a 2-3 letter code: cd:bg, phi:ex.
AtomRef split_token(std::string_view token) {
    AtomRef ref{token, {}, {}, {}};

    const auto chars = util::split_utf8(token);
    if (chars.size() == 4 && chars[2].codepoint == '\'' && is_lower_pair(token.substr(0, 2))) {
        ref.key = token.substr(0, 2);
        ref.marker = token.substr(chars[3].offset);
        return ref;
    }
    if (chars.size() == 3 && chars[2].codepoint == static_cast<uint32_t>(kPositionalMarker) &&
        is_lower_pair(token.substr(0, 2))) {
        ref.key = token.substr(0, 2);
        ref.marker = token.substr(2, 1);
        return ref;
    }

    size_t colon = token.find(':');
    if (colon != std::string_view::npos && colon + 1 < token.size() &&
        is_domain_code(token.substr(0, colon))) {
        ref.domain = token.substr(0, colon);
        ref.atom = token.substr(colon + 1);
    }
    return ref;
}

Resolver::Resolver(VocabularyPtr vocabulary) : vocabulary_(std::move(vocabulary)) {
    LAMBDALANG_CHECK_ARGUMENT(vocabulary_ != nullptr, "Resolver requires a vocabulary");
}

const std::array<ResolutionSource, kResolutionSourceCount>& Resolver::precedence() {
    static const std::array<ResolutionSource, kResolutionSourceCount> order = [] {
        std::array<ResolutionSource, kResolutionSourceCount> sources{};
        for (size_t i = 0; i < kResolutionSourceCount; ++i) sources[i] = kChain[i].source;
        return sources;
    }();
    return order;
}

std::optional<Meaning> Resolver::run_step(size_t index, const AtomRef& ref, const Context& context) const {
    return kChain[index].strategy(*vocabulary_, ref, context);
}

std::optional<Meaning> Resolver::resolve(std::string_view token, const Context& context) const {
    if (token.empty()) return std::nullopt;

    const AtomRef ref = split_token(token);
    for (size_t i = 0; i < kResolutionSourceCount; ++i) {
        // A domain:atom token means exactly that domain; no partial fallthrough
        if (ref.prefixed() && kChain[i].source == ResolutionSource::ActiveDomain) break;

        if (auto meaning = run_step(i, ref, context)) return meaning;
    }
    return std::nullopt;
}

std::optional<std::string> Resolver::resolve(std::string_view token, Lang lang, const Context& context) const {
    auto meaning = resolve(token, context);
    if (!meaning) return std::nullopt;
    return meaning->in(lang);
}

std::optional<Meaning> Resolver::resolve_at(ResolutionSource source, std::string_view token,
                                            const Context& context) const {
    if (token.empty()) return std::nullopt;
    const size_t index = step_index(source);
    if (index == kResolutionSourceCount) return std::nullopt;
    return run_step(index, split_token(token), context);
}

} // namespace lambdalang
