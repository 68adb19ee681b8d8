#include "lambdalang/translator.hpp"

namespace lambdalang {

Translator::Translator(VocabularyPtr vocabulary)
    : vocabulary_(vocabulary)
    , scanner_(std::move(vocabulary)) {}

std::vector<Token> Translator::scan(std::string_view raw, Context& context) const {
    return scanner_.scan(raw, context);
}

std::optional<std::string> Translator::resolve(std::string_view token, Lang lang, const Context& context) const {
    return scanner_.resolver().resolve(token, lang, context);
}

std::vector<Interpretation> Translator::interpret(std::string_view raw, Context& context) const {
    std::vector<Interpretation> items;
    const Resolver& resolver = scanner_.resolver();

    scanner_.scan(raw, context, [&](const Token& token, const Context& current) {
        Interpretation item{token, std::nullopt};
        if (!token.is_block()) {
            item.meaning = resolver.resolve(token.text, current);
        }
        items.push_back(std::move(item));
    });
    return items;
}

std::string Translator::render(std::string_view raw, Lang lang, Context& context) const {
    return renderer_.render(interpret(raw, context), lang);
}

std::string Translator::to_english(std::string_view raw) const {
    Context context;
    return render(raw, Lang::EN, context);
}

std::string Translator::to_chinese(std::string_view raw) const {
    Context context;
    return render(raw, Lang::ZH, context);
}

} // namespace lambdalang
