#include <gtest/gtest.h>
#include "doc_chunker_utils.hpp"
#include "duckdb/common/exception.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace duckdb::doc_chunker;

namespace {

const SplitRule &RuleNamed(const std::string &name) {
    for (const auto &rule : DefaultSplitRules()) {
        if (name == rule.name) {
            return rule;
        }
    }
    throw std::runtime_error("no rule named " + name);
}

std::string RuleName(const SplitPoint &point) {
    return point.rule ? point.rule->name : "hard";
}

} // namespace

//===--------------------------------------------------------------------===//
// Rule table
//===--------------------------------------------------------------------===//

TEST(SplitRulesTest, PriorityOrderAndThresholds) {
    const auto &rules = DefaultSplitRules();

    ASSERT_EQ(rules.size(), 5u);
    EXPECT_STREQ(rules[0].name, "fence");
    EXPECT_STREQ(rules[1].name, "paragraph");
    EXPECT_STREQ(rules[2].name, "sentence");
    EXPECT_STREQ(rules[3].name, "line");
    EXPECT_STREQ(rules[4].name, "space");

    EXPECT_DOUBLE_EQ(rules[0].min_fraction, 0.3);
    EXPECT_DOUBLE_EQ(rules[1].min_fraction, 0.3);
    EXPECT_DOUBLE_EQ(rules[2].min_fraction, 0.3);
    EXPECT_DOUBLE_EQ(rules[3].min_fraction, 0.3);
    EXPECT_DOUBLE_EQ(rules[4].min_fraction, 0.1);
}

//===--------------------------------------------------------------------===//
// FindSplitPoint
//===--------------------------------------------------------------------===//

TEST(FindSplitPointTest, FenceWinsOverLaterParagraphBreak) {
    // Fence at 40% of a 500 budget, paragraph break at 60%
    const std::string window = std::string(200, 'a') + "```" + std::string(97, 'b') + "\n\n" + std::string(198, 'c');
    ASSERT_EQ(window.size(), 500u);

    auto point = FindSplitPoint(window, 500);

    EXPECT_EQ(RuleName(point), "fence");
    EXPECT_EQ(point.offset, 200u);
}

TEST(FindSplitPointTest, ParagraphBreak) {
    const std::string window = std::string(50, 'a') + "\n\n" + std::string(48, 'b');

    auto point = FindSplitPoint(window, 100);

    EXPECT_EQ(RuleName(point), "paragraph");
    EXPECT_EQ(point.offset, 50u);
}

TEST(FindSplitPointTest, SentenceKeepsPeriodInFirstChunk) {
    const std::string window = std::string(50, 'a') + ". " + std::string(48, 'b');

    auto point = FindSplitPoint(window, 100);

    EXPECT_EQ(RuleName(point), "sentence");
    EXPECT_EQ(point.offset, 51u);
}

TEST(FindSplitPointTest, LineBreak) {
    const std::string window = std::string(50, 'a') + "\n" + std::string(49, 'b');

    auto point = FindSplitPoint(window, 100);

    EXPECT_EQ(RuleName(point), "line");
    EXPECT_EQ(point.offset, 50u);
}

TEST(FindSplitPointTest, SpaceUsesLowerThreshold) {
    const std::string window = std::string(11, 'a') + " " + std::string(88, 'b');

    auto point = FindSplitPoint(window, 100);

    EXPECT_EQ(RuleName(point), "space");
    EXPECT_EQ(point.offset, 11u);
}

TEST(FindSplitPointTest, HardCutWithoutBoundaries) {
    auto point = FindSplitPoint(std::string(100, 'x'), 100);

    EXPECT_EQ(point.rule, nullptr);
    EXPECT_EQ(point.offset, 100u);
}

TEST(FindSplitPointTest, ThresholdIsStrict) {
    const std::vector<SplitRule> paragraph_only = {RuleNamed("paragraph")};

    // Exactly 30% of the budget is rejected
    auto at_threshold = FindSplitPoint(std::string(30, 'a') + "\n\n" + std::string(68, 'b'), 100, paragraph_only);
    EXPECT_EQ(at_threshold.rule, nullptr);
    EXPECT_EQ(at_threshold.offset, 100u);

    auto past_threshold = FindSplitPoint(std::string(31, 'a') + "\n\n" + std::string(67, 'b'), 100, paragraph_only);
    ASSERT_NE(past_threshold.rule, nullptr);
    EXPECT_EQ(past_threshold.offset, 31u);

    const std::vector<SplitRule> space_only = {RuleNamed("space")};
    auto space_at_threshold = FindSplitPoint(std::string(10, 'a') + " " + std::string(89, 'b'), 100, space_only);
    EXPECT_EQ(space_at_threshold.rule, nullptr);
}

TEST(FindSplitPointTest, RejectedRuleFallsThroughToLowerPriority) {
    // The paragraph break is too early; the single newline after it is not
    auto point = FindSplitPoint(std::string(30, 'a') + "\n\n" + std::string(68, 'b'), 100);

    EXPECT_EQ(RuleName(point), "line");
    EXPECT_EQ(point.offset, 31u);
}

TEST(FindSplitPointTest, UsesLastOccurrenceOfPattern) {
    const std::string window = std::string(40, 'a') + "\n\n" + std::string(30, 'b') + "\n\n" + std::string(26, 'c');

    auto point = FindSplitPoint(window, 100);

    EXPECT_EQ(RuleName(point), "paragraph");
    EXPECT_EQ(point.offset, 72u);
}

TEST(FindSplitPointTest, OffsetsCountCodePoints) {
    // 50 two-byte characters before the break
    std::string window;
    for (int i = 0; i < 50; i++) {
        window += "\xC3\xA9";
    }
    window += "\n\n" + std::string(48, 'b');

    auto point = FindSplitPoint(window, 100);

    EXPECT_EQ(RuleName(point), "paragraph");
    EXPECT_EQ(point.offset, 50u);
}

//===--------------------------------------------------------------------===//
// Budget and header re-injection
//===--------------------------------------------------------------------===//

TEST(ComputeBodyBudgetTest, ReservesHeaderLine) {
    EXPECT_EQ(ComputeBodyBudget(500, "# Title"), 492u);
    EXPECT_EQ(ComputeBodyBudget(100, ""), 100u);
}

TEST(ComputeBodyBudgetTest, FallsBackWhenHeaderFillsBudget) {
    EXPECT_EQ(ComputeBodyBudget(8, "# Title"), 8u);
    EXPECT_EQ(ComputeBodyBudget(5, "# A rather long header"), 5u);
}

TEST(InjectHeaderTest, PrefixesContinuationsOnly) {
    auto chunks = InjectHeader({"# H\nfirst", "second", "# H already"}, "# H");

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0], "# H\nfirst");
    EXPECT_EQ(chunks[1], "# H\nsecond");
    EXPECT_EQ(chunks[2], "# H already");
}

TEST(InjectHeaderTest, NoHeaderLeavesChunksAlone) {
    auto chunks = InjectHeader({"one", "two"}, "");

    EXPECT_EQ(chunks, (std::vector<std::string> {"one", "two"}));
}

//===--------------------------------------------------------------------===//
// SplitWithinBudget / BoundSection
//===--------------------------------------------------------------------===//

TEST(SplitWithinBudgetTest, PiecesAreTrimmedAndNonEmpty) {
    const std::string text = "alpha beta gamma delta epsilon zeta eta theta iota kappa lambda mu";
    auto pieces = SplitWithinBudget(text, 20);

    ASSERT_GT(pieces.size(), 1u);
    for (const auto &piece : pieces) {
        EXPECT_FALSE(piece.empty());
        EXPECT_LE(CodepointLength(piece), 20u);
        EXPECT_NE(piece.front(), ' ');
        EXPECT_NE(piece.back(), ' ');
    }
}

TEST(SplitWithinBudgetTest, ZeroBudgetThrows) {
    EXPECT_THROW(SplitWithinBudget("text", 0), duckdb::InvalidInputException);
}

TEST(BoundSectionTest, FastPathReturnsSectionUnchanged) {
    auto chunks = BoundSection("abc", "# H", 3);

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], "abc");
}

TEST(BoundSectionTest, ZeroChunkSizeThrows) {
    EXPECT_THROW(BoundSection("abc", "", 0), duckdb::InvalidInputException);
}

TEST(BoundSectionTest, ContinuationsStartWithHeader) {
    std::string section = "## Setup\n";
    for (int i = 0; i < 40; i++) {
        section += "Install the package and configure it. ";
    }

    auto chunks = BoundSection(section, "## Setup", 200);

    ASSERT_GT(chunks.size(), 1u);
    for (size_t i = 0; i < chunks.size(); i++) {
        EXPECT_EQ(chunks[i].rfind("## Setup", 0), 0u) << "chunk " << i;
        EXPECT_LE(CodepointLength(chunks[i]), 200u) << "chunk " << i;
    }
}

TEST(BoundSectionTest, FenceIsDeferredToNextChunk) {
    const std::string code = std::string(100, 'b');
    const std::string section = "# H\n" + std::string(200, 'a') + "\n```\n" + code + "\n```";

    auto chunks = BoundSection(section, "# H", 250);

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], "# H\n" + std::string(200, 'a'));
    EXPECT_EQ(chunks[0].find("```"), std::string::npos);
    EXPECT_EQ(chunks[1], "# H\n```\n" + code + "\n```");
}

TEST(BoundSectionTest, HardCutsOnCodePointBoundaries) {
    std::string section;
    for (int i = 0; i < 600; i++) {
        section += "\xC3\xA9";
    }

    auto chunks = BoundSection(section, "", 500);

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(CodepointLength(chunks[0]), 500u);
    EXPECT_EQ(chunks[0].size(), 1000u);
    EXPECT_EQ(CodepointLength(chunks[1]), 100u);
}

TEST(BoundSectionTest, OversizedHeaderStillSplits) {
    const std::string header = "# " + std::string(30, 'h');
    const std::string section = header + "\n" + std::string(60, 'x');

    auto chunks = BoundSection(section, header, 20);

    ASSERT_GT(chunks.size(), 1u);
    for (size_t i = 1; i < chunks.size(); i++) {
        EXPECT_EQ(chunks[i].rfind(header, 0), 0u);
    }
}
