//! # Scanner Primitive Tests
//!
//! Bracket-aware splitting and matching, keyword recognition, identifier
//! reading and docstring cleaning.

#include "source/scanner.hpp"

#include <gtest/gtest.h>

using namespace vydoc::source;

// ============================================================================
// Trimming and Classification
// ============================================================================

TEST(ScannerTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(trim("  uint256\t\r\n"), "uint256");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim(" \t "), "");
}

TEST(ScannerTest, Identifiers) {
    EXPECT_TRUE(is_identifier("owner"));
    EXPECT_TRUE(is_identifier("_balance2"));
    EXPECT_TRUE(is_identifier("MAX_OWNERS"));
    EXPECT_FALSE(is_identifier(""));
    EXPECT_FALSE(is_identifier("2fast"));
    EXPECT_FALSE(is_identifier("a-b"));
    EXPECT_FALSE(is_identifier("A = 1"));
}

TEST(ScannerTest, DecimalLiterals) {
    EXPECT_TRUE(is_decimal("10"));
    EXPECT_TRUE(is_decimal("0"));
    EXPECT_FALSE(is_decimal(""));
    EXPECT_FALSE(is_decimal("1a"));
    EXPECT_FALSE(is_decimal("-1"));
}

// ============================================================================
// Brackets
// ============================================================================

TEST(ScannerTest, BalancedBrackets) {
    EXPECT_TRUE(is_balanced("DynArray[uint256, 10]"));
    EXPECT_TRUE(is_balanced("(uint256, (bool, address))"));
    EXPECT_TRUE(is_balanced("uint256"));
    EXPECT_FALSE(is_balanced("DynArray[uint256, 10"));
    EXPECT_FALSE(is_balanced("(uint256, bool"));
    EXPECT_FALSE(is_balanced("(]"));
    EXPECT_FALSE(is_balanced("uint256)"));
}

TEST(ScannerTest, SplitIgnoresNestedCommas) {
    auto parts = split_top_level("uint256, DynArray[uint256, 10], (bool, address)");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "uint256");
    EXPECT_EQ(parts[1], "DynArray[uint256, 10]");
    EXPECT_EQ(parts[2], "(bool, address)");
}

TEST(ScannerTest, SplitDropsEmptySegments) {
    auto parts = split_top_level("a, b,");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[1], "b");

    EXPECT_TRUE(split_top_level("").empty());
    EXPECT_TRUE(split_top_level("  ,  ").empty());
}

TEST(ScannerTest, SplitOnCustomSeparator) {
    auto parts = split_top_level("x = f(a = 1)", '=');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "x");
    EXPECT_EQ(parts[1], "f(a = 1)");
}

TEST(ScannerTest, SplitSurvivesStrayCloser) {
    auto parts = split_top_level("a], b");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "a]");
}

TEST(ScannerTest, FindMatchingBracket) {
    EXPECT_EQ(find_matching("f(a(b)c)", 1), 7u);
    EXPECT_EQ(find_matching("[x, [y]]", 0), 7u);
    EXPECT_EQ(find_matching("{ a: b }", 0), 7u);
    EXPECT_EQ(find_matching("(a", 0), std::string_view::npos);
    EXPECT_EQ(find_matching("abc", 1), std::string_view::npos);
}

TEST(ScannerTest, FindMatchingSkipsCommentsAndLiterals) {
    EXPECT_EQ(find_matching("(a, # )\nb)", 0), 9u);
    EXPECT_EQ(find_matching(R"x(f(")", x))x", 1), 8u);
    EXPECT_EQ(find_matching("{ a: uint256,  # } closes\n b: address }", 0), 38u);
    EXPECT_EQ(find_matching("(\"\"\" ) \"\"\")", 0), 10u);
}

TEST(ScannerTest, BracketsInCommentsAndLiteralsAreIgnored) {
    EXPECT_TRUE(is_balanced("HashMap[address, uint256]  # ]"));
    EXPECT_TRUE(is_balanced("x = '['"));
    EXPECT_FALSE(is_balanced("HashMap[  # ]"));
}

TEST(ScannerTest, SplitKeepsQuotedSeparators) {
    auto parts = split_top_level(R"(s: String[10] = "a,b", n: uint256)");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], R"(s: String[10] = "a,b")");
    EXPECT_EQ(parts[1], "n: uint256");
}

// ============================================================================
// Keywords and Identifiers
// ============================================================================

TEST(ScannerTest, KeywordNeedsBoundary) {
    EXPECT_TRUE(starts_with_keyword("struct Point:", "struct"));
    EXPECT_TRUE(starts_with_keyword("def(", "def"));
    EXPECT_TRUE(starts_with_keyword("enum", "enum"));
    EXPECT_TRUE(starts_with_keyword("event\tTransfer:", "event"));
    EXPECT_FALSE(starts_with_keyword("structure: uint256", "struct"));
    EXPECT_FALSE(starts_with_keyword("event_count: uint256", "event"));
    EXPECT_FALSE(starts_with_keyword("default_value: uint256", "def"));
}

TEST(ScannerTest, ReadIdentifierAdvancesPosition) {
    size_t pos = 0;
    EXPECT_EQ(read_identifier("  owner: address", pos), "owner");
    EXPECT_EQ(pos, 7u);

    pos = 6;
    EXPECT_EQ(read_identifier("struct Point:", pos), "Point");
    EXPECT_EQ(pos, 12u);
}

TEST(ScannerTest, ReadIdentifierLeavesPositionOnFailure) {
    size_t pos = 0;
    EXPECT_EQ(read_identifier("  :x", pos), "");
    EXPECT_EQ(pos, 0u);
}

// ============================================================================
// Docstrings
// ============================================================================

TEST(ScannerTest, CleanDocstringStripsCommonIndent) {
    auto cleaned = clean_docstring("\n    Transfer tokens.\n\n    Returns success.\n    ");
    EXPECT_EQ(cleaned, "Transfer tokens.\n\nReturns success.");
}

TEST(ScannerTest, CleanDocstringKeepsRelativeIndent) {
    auto cleaned = clean_docstring("Summary line.\n        detail\n            nested\n        ");
    EXPECT_EQ(cleaned, "Summary line.\ndetail\n    nested");
}

TEST(ScannerTest, CleanDocstringSingleLine) {
    EXPECT_EQ(clean_docstring(" Mint tokens. "), "Mint tokens.");
    EXPECT_EQ(clean_docstring(""), "");
}
