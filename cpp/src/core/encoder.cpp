#include "lambdalang/encoder.hpp"
#include "lambdalang/error.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <vector>

namespace lambdalang {

namespace {

// Categories feeding the reverse map; later ones overwrite earlier ones
constexpr std::array<Category, 6> kEncodable = {
    Category::Entities, Category::Verbs, Category::Modifiers,
    Category::Time, Category::Quantifiers, Category::Extended
};

constexpr std::array<std::string_view, 5> kCommandWords = {"please", "do", "find", "make", "create"};
constexpr std::array<std::string_view, 3> kArticles = {"the", "a", "an"};

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string primary_word(const std::string& english) {
    return to_lower(english.substr(0, english.find('/')));
}

template <size_t N>
bool contains(const std::array<std::string_view, N>& words, const std::string& w) {
    return std::find(words.begin(), words.end(), w) != words.end();
}

} // namespace

Encoder::Encoder(VocabularyPtr vocabulary) : vocabulary_(std::move(vocabulary)) {
    LAMBDALANG_CHECK_ARGUMENT(vocabulary_ != nullptr, "Encoder requires a vocabulary");

    for (Category category : kEncodable) {
        for (const auto& [key, atom] : vocabulary_->table(category)) {
            std::string word = primary_word(atom.gloss.en);
            if (!word.empty()) reverse_[word] = key;
        }
    }
}

std::string Encoder::encode(std::string_view text) const {
    std::string lowered = to_lower(text);

    // Trim
    size_t first = lowered.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "!";
    size_t last = lowered.find_last_not_of(" \t\r\n");
    lowered = lowered.substr(first, last - first + 1);

    const bool is_question = !lowered.empty() && lowered.back() == '?';

    // Keep word characters and spaces; non-ASCII bytes count as word characters
    std::string cleaned;
    cleaned.reserve(lowered.size());
    for (unsigned char c : lowered) {
        if (std::isalnum(c) || c == '_' || std::isspace(c) || c >= 0x80) {
            cleaned.push_back(static_cast<char>(c));
        }
    }

    std::vector<std::string> words;
    std::istringstream in(cleaned);
    for (std::string w; in >> w;) words.push_back(w);

    std::string result;
    if (is_question) {
        result = "?";
    } else if (std::any_of(words.begin(), words.begin() + std::min<size_t>(2, words.size()),
                           [](const std::string& w) { return contains(kCommandWords, w); })) {
        result = ".";
    } else {
        result = "!";
    }

    for (const auto& w : words) {
        if (contains(kArticles, w)) continue;
        auto it = reverse_.find(w);
        if (it != reverse_.end()) result += it->second;
    }
    return result;
}

} // namespace lambdalang
