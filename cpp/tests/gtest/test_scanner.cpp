// =============================================================================
// Scanner Tests - tokenization rules, totality and context sensitivity
// =============================================================================

#include <gtest/gtest.h>
#include "lambdalang/logging.hpp"
#include "lambdalang/scanner.hpp"
#include "lambdalang/util/utf8.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace lambdalang;

class ScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scanner = std::make_unique<Scanner>(test::shipped_vocabulary());
    }

    std::vector<std::string> texts(std::string_view raw) {
        Context fresh;
        return texts(raw, fresh);
    }

    std::vector<std::string> texts(std::string_view raw, Context& ctx) {
        std::vector<std::string> out;
        for (const auto& token : scanner->scan(raw, ctx)) out.push_back(token.text);
        return out;
    }

    std::vector<TokenKind> kinds(std::string_view raw) {
        Context fresh;
        std::vector<TokenKind> out;
        for (const auto& token : scanner->scan(raw, fresh)) out.push_back(token.kind);
        return out;
    }

    // Every non-whitespace byte is covered by exactly one token, in order
    void expect_coverage(std::string_view raw) {
        Context ctx;
        auto tokens = scanner->scan(raw, ctx);

        size_t pos = 0;
        for (const auto& token : tokens) {
            ASSERT_GE(token.offset, pos) << "overlapping tokens in '" << raw << "'";
            for (const auto& c : util::split_utf8(raw.substr(pos, token.offset - pos))) {
                EXPECT_TRUE(util::is_space(c.codepoint)) << "uncovered text in '" << raw << "'";
            }
            EXPECT_EQ(raw.substr(token.offset, token.size), token.text);
            EXPECT_FALSE(token.text.empty());
            pos = token.offset + token.size;
        }
        for (const auto& c : util::split_utf8(raw.substr(pos))) {
            EXPECT_TRUE(util::is_space(c.codepoint)) << "uncovered tail in '" << raw << "'";
        }
    }

    std::unique_ptr<Scanner> scanner;
};

using Texts = std::vector<std::string>;

TEST_F(ScannerTest, BasicMessage) {
    EXPECT_EQ(texts("?Uk/co"), (Texts{"?", "U", "k", "/", "co"}));
    EXPECT_EQ(texts("  ? U  k "), (Texts{"?", "U", "k"}));
}

TEST_F(ScannerTest, EmptyInputs) {
    EXPECT_TRUE(texts("").empty());
    EXPECT_TRUE(texts("   \t\n").empty());
    EXPECT_TRUE(texts("\xE3\x80\x80").empty());  // ideographic space
}

TEST_F(ScannerTest, DisambiguatedAtoms) {
    EXPECT_EQ(texts("!Ide'E"), (Texts{"!", "I", "de'E"}));
    EXPECT_EQ(texts("!Ilo-"), (Texts{"!", "I", "lo-"}));
    EXPECT_EQ(kinds("de'E"), (std::vector<TokenKind>{TokenKind::Disambiguated}));

    // Q is not a marker: the pair stands alone and the rest is unknown
    EXPECT_EQ(texts("de'Q"), (Texts{"de", "'Q"}));
}

TEST_F(ScannerTest, DomainPrefixedAtoms) {
    EXPECT_EQ(texts("!Ucd:fx"), (Texts{"!", "U", "cd:fx"}));
    EXPECT_EQ(texts("phi:ex"), (Texts{"phi:ex"}));
    EXPECT_EQ(kinds("cd:bg"), (std::vector<TokenKind>{TokenKind::DomainAtom}));
}

TEST_F(ScannerTest, DiscourseAndEmotionPairs) {
    EXPECT_EQ(texts("!Ibcw"), (Texts{"!", "I", "bc", "w"}));
    EXPECT_EQ(texts("!I:)"), (Texts{"!", "I", ":)"}));
    EXPECT_EQ(texts("!Ik->Uk"), (Texts{"!", "I", "k", "->", "U", "k"}));
}

TEST_F(ScannerTest, Brackets) {
    EXPECT_EQ(texts("(Ik)[Uw]"), (Texts{"(", "I", "k", ")", "[", "U", "w", "]"}));
    auto k = kinds("()");
    EXPECT_EQ(k, (std::vector<TokenKind>{TokenKind::Bracket, TokenKind::Bracket}));
}

TEST_F(ScannerTest, ControlBlocksMutateContext) {
    Context ctx;
    EXPECT_EQ(texts("{ns:cd}!If/bg", ctx), (Texts{"{ns:cd}", "!", "I", "f", "/", "bg"}));
    ASSERT_EQ(ctx.active_domains().size(), 1u);
    EXPECT_EQ(ctx.active_domains()[0], "cd");

    Context defs;
    EXPECT_EQ(texts("{def:fe=custom}!Ife", defs), (Texts{"{def:fe=custom}", "!", "I", "fe"}));
    ASSERT_NE(defs.definition("fe"), nullptr);
    EXPECT_EQ(*defs.definition("fe"), "custom");
}

TEST_F(ScannerTest, UnknownBlocksAreTokensWithoutEffect) {
    Context ctx;
    auto tokens = scanner->scan("{xyz}{}", ctx);
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_TRUE(tokens[0].is_block());
    EXPECT_EQ(tokens[1].text, "{}");
    EXPECT_TRUE(ctx.empty());
}

TEST_F(ScannerTest, UnterminatedBlockIsLiteral) {
    Context ctx;
    auto tokens = scanner->scan("!I{ns:cd", ctx);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].kind, TokenKind::Literal);
    EXPECT_EQ(tokens[2].text, "{ns:cd");
    EXPECT_TRUE(ctx.empty());
}

TEST_F(ScannerTest, TokenizationDependsOnContextSoFar) {
    EXPECT_EQ(texts("!Ifx"), (Texts{"!", "I", "f", "x"}));
    EXPECT_EQ(texts("{ns:cd}!Ifx"), (Texts{"{ns:cd}", "!", "I", "fx"}));

    // A block only affects what follows it
    EXPECT_EQ(texts("!Ifx{ns:cd}fx"), (Texts{"!", "I", "f", "x", "{ns:cd}", "fx"}));
}

TEST_F(ScannerTest, UnknownRuns) {
    EXPECT_EQ(texts("qqq"), (Texts{"qqq"}));
    EXPECT_EQ(texts("qqIk"), (Texts{"qq", "I", "k"}));
    EXPECT_EQ(texts("q}k"), (Texts{"q", "}", "k"}));
    EXPECT_EQ(texts("\xE4\xBD\xA0\xE5\xA5\xBD ?U"), (Texts{"\xE4\xBD\xA0\xE5\xA5\xBD", "?", "U"}));
    EXPECT_EQ(kinds("qqq"), (std::vector<TokenKind>{TokenKind::Literal}));
}

TEST_F(ScannerTest, OffsetsAreByteOffsets) {
    Context ctx;
    auto tokens = scanner->scan("\xE4\xBD\xA0 de'E", ctx);
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].offset, 0u);
    EXPECT_EQ(tokens[0].size, 3u);
    EXPECT_EQ(tokens[1].offset, 4u);
    EXPECT_EQ(tokens[1].size, 4u);
}

TEST_F(ScannerTest, EveryInputIsCovered) {
    const char* inputs[] = {
        "?Uk/co",
        "{ns:cd}!If/bg fx",
        "{def:a=\"x, y\"}a",
        "!I{ns:cd",
        "}}{{",
        "q}k'",
        "de'Q lo- ->:) :(",
        "\xE4\xBD\xA0\xE5\xA5\xBD\xE3\x80\x80?U",
        "a\xFF" "b",
        "(([[]]))",
    };
    for (const char* raw : inputs) {
        expect_coverage(raw);
    }
}

TEST_F(ScannerTest, ScanningIsDeterministic) {
    const std::string raw = "{ns:ai}?Ume'E{def:x=y}x tk cd:bg";
    Context a;
    Context b;
    EXPECT_EQ(scanner->scan(raw, a), scanner->scan(raw, b));
    EXPECT_EQ(a.active_domains(), b.active_domains());
    EXPECT_EQ(a.definitions(), b.definitions());
}

TEST_F(ScannerTest, CallbackSeesContextAtEachToken) {
    Context ctx;
    std::vector<bool> active;
    scanner->scan("!I{ns:cd}bg", ctx, [&](const Token&, const Context& current) {
        active.push_back(current.is_active("cd"));
    });
    EXPECT_EQ(active, (std::vector<bool>{false, false, true, true}));
}

TEST_F(ScannerTest, UnknownDomainActivationIsLoggedAndRecorded) {
    const auto log_file = std::filesystem::temp_directory_path() / "lambdalang_scanner_test.log";
    std::filesystem::remove(log_file);

    Logger& logger = Logger::getInstance();
    logger.set_output_file(log_file.string());
    logger.set_level(LogLevel::WARNING);

    Context ctx;
    auto tokens = scanner->scan("{ns:zz}{ns:cd}!I", ctx);
    logger.flush();

    logger.set_level(LogLevel::OFF);
    logger.reset_output();

    EXPECT_EQ(tokens.size(), 4u);
    EXPECT_TRUE(ctx.is_active("zz"));
    EXPECT_TRUE(ctx.is_active("cd"));

    std::ifstream in(log_file);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("unknown domain 'zz'"), std::string::npos);
    EXPECT_EQ(contents.find("'cd'"), std::string::npos);

    std::filesystem::remove(log_file);
}
