// =============================================================================
// Translator, Renderer and Session Tests - end-to-end rendering
// =============================================================================

#include <gtest/gtest.h>
#include "lambdalang/session.hpp"
#include "lambdalang/translator.hpp"
#include "test_support.hpp"

using namespace lambdalang;

class TranslatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        translator = std::make_unique<Translator>(test::shipped_vocabulary());
    }

    void TearDown() override {
        translator.reset();
    }

    std::unique_ptr<Translator> translator;
};

TEST_F(TranslatorTest, QuestionInEnglish) {
    EXPECT_EQ(translator->to_english("?Uk/co"), "(question) you know about consciousness");
}

TEST_F(TranslatorTest, QuestionInChinese) {
    EXPECT_EQ(translator->to_chinese("?Uk/co"), "(问题) 你知道关于意识");
    EXPECT_EQ(translator->to_chinese("!Ik"), "(陈述) 我知道");
}

TEST_F(TranslatorTest, DisambiguationInSentences) {
    std::string death = translator->to_english("!Ide'E");
    EXPECT_EQ(death, "(statement) I/self death");
    EXPECT_EQ(death.find("decide"), std::string::npos);

    std::string lose = translator->to_english("!Ilo-");
    EXPECT_EQ(lose, "(statement) I/self lose");
    EXPECT_EQ(lose.find("love"), std::string::npos);
}

TEST_F(TranslatorTest, NamespaceActivation) {
    Context context;
    EXPECT_EQ(translator->render("{ns:cd}!If/bg", Lang::EN, context), "(statement) I/self find about bug");
    EXPECT_TRUE(context.is_active("cd"));
}

TEST_F(TranslatorTest, LocalDefinitions) {
    EXPECT_EQ(translator->to_english("{def:fe=custom}!Ife"), "(statement) I/self custom");
    EXPECT_EQ(translator->to_chinese("{def:fe=custom}!Ife"), "(陈述) 我custom");
}

TEST_F(TranslatorTest, LaterBlocksDoNotAffectEarlierTokens) {
    EXPECT_EQ(translator->to_english("!Ife{def:fe=custom}fe"), "(statement) I/self feel custom");
}

TEST_F(TranslatorTest, UnresolvedTokensAreBracketed) {
    EXPECT_EQ(translator->to_english("!Iqq"), "(statement) I/self [qq]");
    EXPECT_EQ(translator->to_english("!I{ns:cd"), "(statement) I/self [{ns:cd]");
}

TEST_F(TranslatorTest, TypePrefixEdgeCases) {
    EXPECT_EQ(translator->to_english(""), "");
    EXPECT_EQ(translator->to_english("{ns:cd}"), "");
    EXPECT_EQ(translator->to_english("?"), "(question)");
    EXPECT_EQ(translator->to_english("Uk"), "you know");
    // Only the first type marker becomes the prefix
    EXPECT_EQ(translator->to_english("?U?"), "(question) you question");
}

TEST_F(TranslatorTest, BracketsPassThrough) {
    EXPECT_EQ(translator->to_english("!(Ik)"), "(statement) ( I/self know )");
}

TEST_F(TranslatorTest, ContextPersistsAcrossRenders) {
    Context context;
    EXPECT_EQ(translator->render("{ns:cd}", Lang::EN, context), "");
    EXPECT_EQ(translator->render("!Ibg", Lang::EN, context), "(statement) I/self bug");

    // A fresh context does not know the domain
    EXPECT_EQ(translator->to_english("!Ibg"), "(statement) I/self become give");
}

TEST_F(TranslatorTest, InterpretReportsSources) {
    Context context;
    auto items = translator->interpret("{ns:cd}?Ubg", context);
    ASSERT_EQ(items.size(), 4u);

    EXPECT_TRUE(items[0].token.is_block());
    EXPECT_FALSE(items[0].resolved());

    ASSERT_TRUE(items[1].resolved());
    EXPECT_EQ(items[1].meaning->source, ResolutionSource::Core);

    ASSERT_TRUE(items[3].resolved());
    EXPECT_EQ(items[3].meaning->source, ResolutionSource::ActiveDomain);
    EXPECT_EQ(items[3].meaning->domain, "cd");
}

TEST_F(TranslatorTest, ResolveSingleToken) {
    Context context;
    EXPECT_EQ(translator->resolve("co", Lang::ZH, context).value_or(""), "意识");
    EXPECT_FALSE(translator->resolve("zz", Lang::EN, context).has_value());
}

// =============================================================================
// Interactive session
// =============================================================================

class SessionTest : public TranslatorTest {};

TEST_F(SessionTest, KeepsContextBetweenLines) {
    Session session(*translator);
    EXPECT_EQ(session.handle("{ns:cd}"), "");
    EXPECT_EQ(session.handle("!Ibg"), "(statement) I/self bug");
    EXPECT_EQ(session.describe_context(), "domains: cd\ndefinitions: (none)");
}

TEST_F(SessionTest, SwitchesLanguage) {
    Session session(*translator);
    EXPECT_EQ(session.handle(":zh"), "language: zh");
    EXPECT_EQ(session.language(), Lang::ZH);
    EXPECT_EQ(session.handle("  ?Uk/co  "), "(问题) 你知道关于意识");
    EXPECT_EQ(session.handle(":en"), "language: en");
}

TEST_F(SessionTest, ResetClearsContext) {
    Session session(*translator);
    session.handle("{def:fe=custom}");
    EXPECT_EQ(session.handle(":ctx"), "domains: (none)\ndefinitions: fe=custom");

    EXPECT_EQ(session.handle(":reset"), "context cleared");
    EXPECT_TRUE(session.context().empty());
    EXPECT_EQ(session.handle("fe"), "feel");
}

TEST_F(SessionTest, EmotionAtomsAreNotCommands) {
    Session session(*translator);
    EXPECT_EQ(session.handle(":)"), "happy");
    EXPECT_EQ(session.handle(":(Uk"), "unhappy you know");
    EXPECT_FALSE(session.finished());
    EXPECT_EQ(translator->to_english(":(Uk"), "unhappy you know");
}

TEST_F(SessionTest, Commands) {
    Session session(*translator);
    EXPECT_EQ(session.handle("   "), "");
    EXPECT_EQ(session.handle(":bogus"), "unknown command ':bogus' (try :en :zh :ctx :reset :quit)");
    EXPECT_FALSE(session.finished());
    EXPECT_EQ(session.handle(":quit"), "");
    EXPECT_TRUE(session.finished());
}
