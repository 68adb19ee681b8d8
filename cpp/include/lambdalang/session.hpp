#pragma once

#include <string>
#include <string_view>

#include "lambdalang/context.hpp"
#include "lambdalang/translator.hpp"

namespace lambdalang {

/**
 * Session - interactive translation state
 *
 * Keeps one Context alive across inputs so namespace activations and
 * definitions persist from line to line. A ':' followed only by letters
 * is a session command (:en, :zh, :ctx, :reset, :quit); anything else,
 * including notation such as ":)", is rendered in the current language.
 */
class Session {
public:
    explicit Session(const Translator& translator, Lang lang = Lang::EN);

    // Process one input line and return the text to print
    std::string handle(std::string_view line);

    bool finished() const noexcept { return finished_; }
    Lang language() const noexcept { return lang_; }
    const Context& context() const noexcept { return context_; }

    std::string describe_context() const;

private:
    std::string command(std::string_view name);

    const Translator& translator_;
    Context context_;
    Lang lang_;
    bool finished_ = false;
};

} // namespace lambdalang
