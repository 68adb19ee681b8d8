// =============================================================================
// Context and Control Block Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lambdalang/context.hpp"
#include "lambdalang/control_block.hpp"
#include "lambdalang/error.hpp"

using namespace lambdalang;

class ContextTest : public ::testing::Test {
protected:
    Context context;
};

TEST_F(ContextTest, StartsEmpty) {
    EXPECT_TRUE(context.empty());
    EXPECT_TRUE(context.active_domains().empty());
    EXPECT_EQ(context.definition("fe"), nullptr);
}

TEST_F(ContextTest, DomainActivationIsIdempotent) {
    EXPECT_TRUE(activate_domain(context, "cd"));
    EXPECT_FALSE(activate_domain(context, "cd"));

    ASSERT_EQ(context.active_domains().size(), 1u);
    EXPECT_TRUE(context.is_active("cd"));
    EXPECT_FALSE(context.is_active("ai"));
}

TEST_F(ContextTest, ActivationOrderIsPreserved) {
    activate_domain(context, "ai");
    activate_domain(context, "cd");
    activate_domain(context, "ai");

    ASSERT_EQ(context.active_domains().size(), 2u);
    EXPECT_EQ(context.active_domains()[0], "ai");
    EXPECT_EQ(context.active_domains()[1], "cd");
}

TEST_F(ContextTest, LaterDefinitionReplacesEarlier) {
    define_local(context, "fe", "first");
    define_local(context, "fe", "second");

    ASSERT_NE(context.definition("fe"), nullptr);
    EXPECT_EQ(*context.definition("fe"), "second");
    EXPECT_EQ(context.definitions().size(), 1u);
}

TEST_F(ContextTest, EmptyKeysAreRejected) {
    EXPECT_THROW(context.define("", "x"), InvalidArgumentError);
    EXPECT_THROW(context.activate_domain(""), InvalidArgumentError);
}

TEST_F(ContextTest, ClearForgetsEverything) {
    activate_domain(context, "cd");
    define_local(context, "x", "y");
    context.clear();
    EXPECT_TRUE(context.empty());
}

// =============================================================================
// Control block parsing
// =============================================================================

TEST(ControlBlockTest, ParsesNamespaceActivation) {
    auto block = parse_control_block("ns:cd");
    ASSERT_TRUE(std::holds_alternative<NamespaceActivation>(block));
    const auto& codes = std::get<NamespaceActivation>(block).codes;
    ASSERT_EQ(codes.size(), 1u);
    EXPECT_EQ(codes[0], "cd");
}

TEST(ControlBlockTest, NamespaceListsAreCommaSeparated) {
    auto block = parse_control_block(" ns: cd, ai ");
    ASSERT_TRUE(std::holds_alternative<NamespaceActivation>(block));
    const auto& codes = std::get<NamespaceActivation>(block).codes;
    ASSERT_EQ(codes.size(), 2u);
    EXPECT_EQ(codes[0], "cd");
    EXPECT_EQ(codes[1], "ai");
}

TEST(ControlBlockTest, ParsesDefinitions) {
    auto block = parse_control_block("def:fe=custom");
    ASSERT_TRUE(std::holds_alternative<DefinitionBlock>(block));
    const auto& entries = std::get<DefinitionBlock>(block).entries;
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, "fe");
    EXPECT_EQ(entries[0].second, "custom");
}

TEST(ControlBlockTest, QuotedValuesMayContainCommas) {
    auto block = parse_control_block("def:a=\"hello, world\",b=x");
    const auto& entries = std::get<DefinitionBlock>(block).entries;
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, "a");
    EXPECT_EQ(entries[0].second, "hello, world");
    EXPECT_EQ(entries[1].first, "b");
    EXPECT_EQ(entries[1].second, "x");
}

TEST(ControlBlockTest, MalformedPairsAreDropped) {
    auto block = parse_control_block("def:noequals,=v,k=v");
    const auto& entries = std::get<DefinitionBlock>(block).entries;
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, "k");
}

TEST(ControlBlockTest, UnrecognizedBodiesAreKept) {
    auto block = parse_control_block("xyz");
    ASSERT_TRUE(std::holds_alternative<UnknownBlock>(block));
    EXPECT_EQ(std::get<UnknownBlock>(block).body, "xyz");

    EXPECT_TRUE(std::holds_alternative<UnknownBlock>(parse_control_block("")));
}

TEST(ControlBlockTest, ApplyMutatesContext) {
    Context context;
    apply_control_block(parse_control_block("ns:cd"), context);
    apply_control_block(parse_control_block("def:fe=custom"), context);
    apply_control_block(parse_control_block("xyz"), context);

    EXPECT_TRUE(context.is_active("cd"));
    ASSERT_NE(context.definition("fe"), nullptr);
    EXPECT_EQ(*context.definition("fe"), "custom");
    EXPECT_EQ(context.active_domains().size(), 1u);
}
