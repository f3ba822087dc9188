#include <gtest/gtest.h>
#include "cli/cli.hpp"

using namespace atlas;

class CliTest : public ::testing::Test {
protected:
    Command search;

    void SetUp() override {
        search.name = "search";
        search.description = "Semantic search";
        search.args = {
            {"query", "q", "Query text", "", true, false},
            {"k", "k", "Number of results", "5", false, false},
            {"filter", "f", "field=value constraint", "", false, false, {}, true},
            {"json", "j", "Print JSON", "", false, true},
            {"backend", "b", "Storage backend", "", false, false, {"local", "remote"}}
        };
    }
};

// ==========================================
// Parsing Tests
// ==========================================

TEST_F(CliTest, ParsesLongShortAndInlineForms) {
    auto args = parse_command_args(search, {"--query", "bioelectric signals", "-k", "3", "--json",
                                            "--backend=remote"});

    EXPECT_EQ(args.require("query"), "bioelectric signals");
    EXPECT_EQ(args.get("k").as_size(), 3u);
    EXPECT_TRUE(args.has("json"));
    EXPECT_EQ(args.get("backend").value(), "remote");
}

TEST_F(CliTest, DefaultsApplyWhenAbsent) {
    auto args = parse_command_args(search, {"-q", "x"});
    EXPECT_EQ(args.get("k").as_int(), 5);
    EXPECT_FALSE(args.has("json"));
    EXPECT_FALSE(args.has("filter"));
    EXPECT_TRUE(args.get("filter").as_list().empty());
}

TEST_F(CliTest, RepeatableOptionKeepsEveryOccurrence) {
    auto args = parse_command_args(search, {"-q", "x", "-f", "year=2021", "--filter",
                                            "document_title=Cells, Tissues"});
    ASSERT_EQ(args.get("filter").values.size(), 2u);
    EXPECT_EQ(args.get("filter").values[1], "document_title=Cells, Tissues");
}

TEST_F(CliTest, LaterOccurrenceReplacesSingleOption) {
    auto args = parse_command_args(search, {"-q", "first", "-q", "second"});
    EXPECT_EQ(args.require("query"), "second");
    EXPECT_EQ(args.get("query").values.size(), 1u);
}

TEST_F(CliTest, DoubleDashEndsOptions) {
    auto args = parse_command_args(search, {"-q", "x", "--", "--json", "extra"});
    EXPECT_FALSE(args.has("json"));
    EXPECT_EQ(args.positional, (std::vector<std::string>{"--json", "extra"}));
}

// ==========================================
// Error Tests
// ==========================================

TEST_F(CliTest, RejectsBadCommandLines) {
    EXPECT_THROW(parse_command_args(search, {"-k", "3"}), UsageError);
    EXPECT_THROW(parse_command_args(search, {"-q", "x", "--colour"}), UsageError);
    EXPECT_THROW(parse_command_args(search, {"-q"}), UsageError);
    EXPECT_THROW(parse_command_args(search, {"-q", "x", "--json=yes"}), UsageError);
    EXPECT_THROW(parse_command_args(search, {"-q", "x", "-b", "cloud"}), UsageError);
}

TEST_F(CliTest, NumericConversionsAreStrict) {
    auto args = parse_command_args(search, {"-q", "x", "-k", "3abc"});
    EXPECT_THROW(args.get("k").as_int(), UsageError);

    args = parse_command_args(search, {"-q", "x", "-k", "-2"});
    EXPECT_EQ(args.get("k").as_int(), -2);
    EXPECT_THROW(args.get("k").as_size(), UsageError);

    ArgValue threshold("0.93", true);
    EXPECT_DOUBLE_EQ(threshold.as_double(), 0.93);
    EXPECT_THROW(ArgValue("high", true).as_double(), UsageError);
    EXPECT_DOUBLE_EQ(ArgValue().as_double(0.5), 0.5);
}
