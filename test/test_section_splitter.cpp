#include <gtest/gtest.h>
#include "doc_chunker_utils.hpp"

#include <string>
#include <vector>

using namespace duckdb::doc_chunker;

TEST(AtxHeaderLevelTest, RecognizesOneToSixHashes) {
    EXPECT_EQ(AtxHeaderLevel("# Title"), 1);
    EXPECT_EQ(AtxHeaderLevel("### Third"), 3);
    EXPECT_EQ(AtxHeaderLevel("###### Sixth"), 6);
    EXPECT_EQ(AtxHeaderLevel("#\tTabbed"), 1);
}

TEST(AtxHeaderLevelTest, RejectsNonHeaders) {
    EXPECT_EQ(AtxHeaderLevel("####### Seven"), 0);
    EXPECT_EQ(AtxHeaderLevel("#NoSpace"), 0);
    EXPECT_EQ(AtxHeaderLevel("#"), 0);
    EXPECT_EQ(AtxHeaderLevel(" # Indented"), 0);
    EXPECT_EQ(AtxHeaderLevel("plain text"), 0);
    EXPECT_EQ(AtxHeaderLevel(""), 0);
}

TEST(IsFenceLineTest, MatchesTrimmedTripleBacktick) {
    EXPECT_TRUE(IsFenceLine("```"));
    EXPECT_TRUE(IsFenceLine("```python"));
    EXPECT_TRUE(IsFenceLine("   ```  "));
    EXPECT_FALSE(IsFenceLine("``"));
    EXPECT_FALSE(IsFenceLine("text ```"));
}

TEST(SectionSplitterTest, EmptyInputHasNoSections) {
    EXPECT_TRUE(SplitIntoSections("").empty());
    EXPECT_TRUE(SplitIntoSections("\n\n   \n").empty());
}

TEST(SectionSplitterTest, SplitsAtHeadersAndKeepsPreamble) {
    auto sections = SplitIntoSections("Intro\n# A\ntext a\n## B\ntext b");

    ASSERT_EQ(sections.size(), 3u);

    EXPECT_EQ(sections[0].header, "");
    EXPECT_EQ(sections[0].level, 0);
    EXPECT_EQ(sections[0].content, "Intro");
    EXPECT_EQ(sections[0].start_line, 1u);
    EXPECT_EQ(sections[0].end_line, 1u);

    EXPECT_EQ(sections[1].header, "# A");
    EXPECT_EQ(sections[1].level, 1);
    EXPECT_EQ(sections[1].content, "# A\ntext a");
    EXPECT_EQ(sections[1].start_line, 2u);
    EXPECT_EQ(sections[1].end_line, 3u);

    EXPECT_EQ(sections[2].header, "## B");
    EXPECT_EQ(sections[2].level, 2);
    EXPECT_EQ(sections[2].content, "## B\ntext b");
    EXPECT_EQ(sections[2].start_line, 4u);
    EXPECT_EQ(sections[2].end_line, 5u);
}

TEST(SectionSplitterTest, WhitespaceOnlyPreambleIsDropped) {
    auto sections = SplitIntoSections("\n\n# A\nbody");

    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].header, "# A");
    EXPECT_EQ(sections[0].start_line, 3u);
}

TEST(SectionSplitterTest, HeaderOnlySectionsAreKept) {
    auto sections = SplitIntoSections("# A\n# B");

    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0].content, "# A");
    EXPECT_EQ(sections[1].content, "# B");
}

TEST(SectionSplitterTest, HeaderInsideFenceIsCode) {
    const std::string doc = "# A\n```bash\n# not a header\necho hi\n```\nafter";
    auto sections = SplitIntoSections(doc);

    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].header, "# A");
    EXPECT_EQ(sections[0].content, doc);
}

TEST(SectionSplitterTest, HeadersResumeAfterFenceCloses) {
    auto sections = SplitIntoSections("# A\n```\n# code\n```\n# B\ntext");

    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0].content, "# A\n```\n# code\n```");
    EXPECT_EQ(sections[1].header, "# B");
}

TEST(SectionSplitterTest, UnclosedFenceSwallowsRemainingHeaders) {
    auto sections = SplitIntoSections("# A\n```\n# B\ntext");

    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].header, "# A");
}

TEST(SectionSplitterTest, HeaderIsTrimmed) {
    auto sections = SplitIntoSections("# Spaced   \nbody");

    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0].header, "# Spaced");
}

TEST(SectionSplitterTest, SectionsCoverDocumentInOrder) {
    const std::string doc = "Lead paragraph.\n\n# One\nfirst\n\n## Two\nsecond\n### Three\nthird";
    auto sections = SplitIntoSections(doc);

    ASSERT_EQ(sections.size(), 4u);
    size_t search_from = 0;
    for (const auto &section : sections) {
        auto pos = doc.find(section.content, search_from);
        ASSERT_NE(pos, std::string::npos) << section.content;
        search_from = pos + section.content.size();
    }
}
