#include "source/source.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace vydoc;
using namespace vydoc::source;
namespace fs = std::filesystem;

TEST(SourceTest, SplitsLinesWithOffsets) {
    auto source = Source::from_string("a: uint256\n  b\n");
    const auto& lines = source.lines();
    ASSERT_EQ(lines.size(), 3u);

    EXPECT_EQ(lines[0].text, "a: uint256");
    EXPECT_EQ(lines[0].offset, 0u);
    EXPECT_EQ(lines[0].number, 1u);

    EXPECT_EQ(lines[1].text, "  b");
    EXPECT_EQ(lines[1].offset, 11u);
    EXPECT_EQ(lines[1].indent, 2u);
    EXPECT_EQ(lines[1].stripped(), "b");

    EXPECT_TRUE(lines[2].is_blank());
}

TEST(SourceTest, StripsCarriageReturns) {
    auto source = Source::from_string("owner: address\r\nx\r\n");
    EXPECT_EQ(source.lines()[0].text, "owner: address");
}

TEST(SourceTest, ClassifiesCodeLines) {
    auto source = Source::from_string("# @version 0.3.10\n\nowner: address\n   # note\n");
    const auto& lines = source.lines();
    EXPECT_FALSE(lines[0].is_code());
    EXPECT_FALSE(lines[1].is_code());
    EXPECT_TRUE(lines[2].is_code());
    EXPECT_FALSE(lines[3].is_code());
}

TEST(SourceTest, TracksTripleQuotedStrings) {
    auto source = Source::from_string("x: uint256\n"
                                      "\"\"\"\n"
                                      "struct Fake:\n"
                                      "\"\"\"\n"
                                      "y: uint256\n");
    const auto& lines = source.lines();
    EXPECT_FALSE(lines[0].in_string);
    EXPECT_FALSE(lines[1].in_string);
    EXPECT_TRUE(lines[2].in_string);
    EXPECT_TRUE(lines[3].in_string);
    EXPECT_FALSE(lines[4].in_string);
    EXPECT_FALSE(lines[2].is_code());
}

TEST(SourceTest, SingleLineDocstringDoesNotOpenString) {
    auto source = Source::from_string("'''One line.'''\nx: uint256\n");
    EXPECT_FALSE(source.lines()[1].in_string);
}

TEST(SourceTest, QuotesInCommentsAreIgnored) {
    auto source = Source::from_string("# a \"\"\" in a comment\nstruct A:\n");
    EXPECT_FALSE(source.lines()[1].in_string);
}

TEST(SourceTest, QuotesInsideStringLiteralsAreIgnored) {
    auto source = Source::from_string("NAME: constant(String[8]) = \"'''\"\nowner: address\n");
    EXPECT_FALSE(source.lines()[1].in_string);
}

TEST(SourceTest, LineOfOffset) {
    auto source = Source::from_string("ab\ncd\nef");
    EXPECT_EQ(source.line_of(0), 1u);
    EXPECT_EQ(source.line_of(2), 1u);
    EXPECT_EQ(source.line_of(3), 2u);
    EXPECT_EQ(source.line_of(7), 3u);
}

TEST(SourceTest, BaseIndentIgnoresBlankAndComments) {
    auto source = Source::from_string("\n    struct A:\n        x: uint256\n  # c\n");
    EXPECT_EQ(source.base_indent(), 4u);
    EXPECT_EQ(Source::from_string("").base_indent(), 0u);
}

TEST(SourceTest, MoveKeepsLineViewsValid) {
    auto first = Source::from_string("owner: address\nbalance: uint256\n", "token.vy");
    Source moved = std::move(first);
    ASSERT_EQ(moved.lines().size(), 3u);
    EXPECT_EQ(moved.lines()[1].text, "balance: uint256");
    EXPECT_EQ(moved.lines()[1].text.data(), moved.content().data() + 15);
    EXPECT_EQ(moved.filename(), "token.vy");
}

TEST(SourceTest, FromFileReadsContent) {
    auto path = fs::temp_directory_path() / "vydoc_source_test.vy";
    {
        std::ofstream out(path);
        out << "owner: address\n";
    }

    auto loaded = Source::from_file(path.string());
    ASSERT_TRUE(is_ok(loaded));
    EXPECT_EQ(unwrap(loaded).content(), "owner: address\n");
    EXPECT_EQ(unwrap(loaded).lines()[0].text, "owner: address");

    fs::remove(path);
}

TEST(SourceTest, FromFileMissing) {
    auto loaded = Source::from_file("/nonexistent/vydoc/missing.vy");
    ASSERT_TRUE(is_err(loaded));
    EXPECT_TRUE(unwrap_err(loaded).starts_with("failed to open file"));
}
