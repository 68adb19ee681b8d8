#include "lambdalang/scanner.hpp"
#include "lambdalang/control_block.hpp"
#include "lambdalang/logging.hpp"

#include <variant>

namespace lambdalang {

namespace {

using util::Utf8Char;

uint32_t cp_at(const std::vector<Utf8Char>& chars, size_t i) {
    return i < chars.size() ? chars[i].codepoint : 0;
}

bool lower_at(const std::vector<Utf8Char>& chars, size_t i) {
    return util::is_ascii_lower(cp_at(chars, i));
}

bool is_bracket(uint32_t cp) {
    return cp == '(' || cp == ')' || cp == '[' || cp == ']';
}

// Byte slice covering code points [i, i + count)
std::string_view slice(const std::vector<Utf8Char>& chars, std::string_view raw, size_t i, size_t count) {
    size_t begin = chars[i].offset;
    size_t end = (i + count < chars.size()) ? chars[i + count].offset : raw.size();
    return raw.substr(begin, end - begin);
}

} // namespace

Scanner::Scanner(Resolver resolver) : resolver_(std::move(resolver)) {}

Scanner::Scanner(VocabularyPtr vocabulary) : resolver_(std::move(vocabulary)) {}

std::optional<Scanner::Match> Scanner::match_at(const std::vector<Utf8Char>& chars, size_t i,
                                                std::string_view raw, const Context& context) const {
    const Vocabulary& vocab = resolver_.vocabulary();
    const size_t n = chars.size();

    // 3. Bracket
    if (is_bracket(chars[i].codepoint)) {
        return Match{TokenKind::Bracket, 1};
    }

    // 4. Domain-prefixed atom: <2-3 lowercase>:<2 lowercase>
    if (lower_at(chars, i) && lower_at(chars, i + 1)) {
        if (cp_at(chars, i + 2) == ':' && lower_at(chars, i + 3) && lower_at(chars, i + 4)) {
            return Match{TokenKind::DomainAtom, 5};
        }
        if (lower_at(chars, i + 2) && cp_at(chars, i + 3) == ':' &&
            lower_at(chars, i + 4) && lower_at(chars, i + 5)) {
            return Match{TokenKind::DomainAtom, 6};
        }

        // 5. Disambiguated atom: <2 lowercase>'<marker> or <2 lowercase>-
        if (cp_at(chars, i + 2) == '\'' && is_quoted_marker(cp_at(chars, i + 3))) {
            return Match{TokenKind::Disambiguated, 4};
        }
        if (cp_at(chars, i + 2) == static_cast<uint32_t>(kPositionalMarker)) {
            return Match{TokenKind::Disambiguated, 3};
        }
    }

    if (i + 1 < n) {
        std::string_view pair = slice(chars, raw, i, 2);

        // 6. Discourse / emotion pair
        if (vocab.find(Category::Discourse, pair) || vocab.find(Category::Emotion, pair)) {
            return Match{TokenKind::Atom, 2};
        }

        // 7. Extended pair, resolved against the live context
        if (lower_at(chars, i) && lower_at(chars, i + 1) && resolver_.resolve(pair, context)) {
            return Match{TokenKind::Atom, 2};
        }
    }

    // 8. Single character
    std::string_view single = slice(chars, raw, i, 1);
    if (resolver_.resolve(single, context) || vocab.is_type_marker(single)) {
        return Match{TokenKind::Atom, 1};
    }

    return std::nullopt;
}

void Scanner::activate_block(std::string_view body, Context& context) const {
    ControlBlock block = parse_control_block(body);

    if (const auto* ns = std::get_if<NamespaceActivation>(&block)) {
        for (const auto& code : ns->codes) {
            if (!resolver_.vocabulary().find_domain(code)) {
                LOG_WARNING("Activating unknown domain '", code, "'; it will not resolve any atoms");
            }
        }
    }
    apply_control_block(block, context);
}

std::vector<Token> Scanner::scan(std::string_view raw, Context& context) const {
    return scan(raw, context, TokenCallback());
}

std::vector<Token> Scanner::scan(std::string_view raw, Context& context, const TokenCallback& on_token) const {
    const std::vector<Utf8Char> chars = util::split_utf8(raw);
    const size_t n = chars.size();

    std::vector<Token> tokens;

    auto emit = [&](TokenKind kind, size_t i, size_t count) {
        std::string_view text = slice(chars, raw, i, count);
        tokens.push_back(Token{kind, std::string(text), chars[i].offset, text.size()});
        if (on_token) on_token(tokens.back(), context);
    };

    size_t i = 0;
    while (i < n) {
        const uint32_t cp = chars[i].codepoint;

        // 1. Whitespace
        if (util::is_space(cp)) {
            ++i;
            continue;
        }

        // 2. Control block
        if (cp == '{') {
            size_t close = i + 1;
            while (close < n && chars[close].codepoint != '}') ++close;

            if (close == n) {
                // Unterminated: literal to end of input, context untouched
                LOG_DEBUG("Unterminated control block at byte ", chars[i].offset);
                emit(TokenKind::Literal, i, n - i);
                break;
            }

            std::string_view body = slice(chars, raw, i + 1, close - i - 1);
            activate_block(body, context);
            emit(TokenKind::Block, i, close - i + 1);
            i = close + 1;
            continue;
        }

        // 3-8. Atoms and brackets
        if (auto match = match_at(chars, i, raw, context)) {
            emit(match->kind, i, match->length);
            i += match->length;
            continue;
        }

        // 9. Unknown run
        size_t j = i + 1;
        while (j < n) {
            const uint32_t next = chars[j].codepoint;
            if (util::is_space(next) || next == '{' || next == '}') break;
            if (match_at(chars, j, raw, context)) break;
            ++j;
        }
        emit(TokenKind::Literal, i, j - i);
        i = j;
    }

    return tokens;
}

} // namespace lambdalang
