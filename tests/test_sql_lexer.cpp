// ---------------------------------------------------------------------------
// test_sql_lexer.cpp
//
// scan_sql 상태 머신 단위 테스트.
//
// [테스트 범위]
// - 리터럴 / 주석 밖 세미콜론 탐지
// - 주석 탐지 (--, #, /* */)
// - '' / 백슬래시 이스케이프
// - masked 사본: 리터럴 내용과 주석을 가리고 줄바꿈은 유지
// - 종료 상태 (닫히지 않은 리터럴 / 줄 주석 / 블록 주석)
// ---------------------------------------------------------------------------

#include "guard/sql_lexer.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(SqlLexer, PlainStatementHasNothingToReport) {
    const auto scan = scan_sql("SELECT id FROM users WHERE id = 1");
    EXPECT_FALSE(scan.has_comment);
    EXPECT_FALSE(scan.has_semicolon);
    EXPECT_EQ(scan.end_state, SqlScanEnd::kNormal);
    EXPECT_EQ(scan.masked, "SELECT id FROM users WHERE id = 1");
}

TEST(SqlLexer, SemicolonOutsideLiteral) {
    const auto scan = scan_sql("SELECT 1; SELECT 2");
    EXPECT_TRUE(scan.has_semicolon);
}

TEST(SqlLexer, SemicolonInsideLiteralIsIgnored) {
    const auto scan = scan_sql("SELECT ';' AS sep");
    EXPECT_FALSE(scan.has_semicolon);
    EXPECT_EQ(scan.end_state, SqlScanEnd::kNormal);
}

TEST(SqlLexer, SemicolonInsideCommentIsIgnored) {
    const auto scan = scan_sql("SELECT 1 /* ; */");
    EXPECT_FALSE(scan.has_semicolon);
    EXPECT_TRUE(scan.has_comment);
}

TEST(SqlLexer, DetectsAllCommentStyles) {
    EXPECT_TRUE(scan_sql("SELECT 1 -- note").has_comment);
    EXPECT_TRUE(scan_sql("SELECT 1 # note").has_comment);
    EXPECT_TRUE(scan_sql("SELECT /* x */ 1").has_comment);
    EXPECT_FALSE(scan_sql("SELECT '-- not a comment'").has_comment);
    EXPECT_FALSE(scan_sql("SELECT 5 - 3").has_comment);
}

TEST(SqlLexer, DoubledQuoteStaysInsideLiteral) {
    const auto scan = scan_sql("SELECT 'it''s; fine'");
    EXPECT_FALSE(scan.has_semicolon);
    EXPECT_EQ(scan.end_state, SqlScanEnd::kNormal);
}

TEST(SqlLexer, BackslashEscapeStaysInsideLiteral) {
    const auto scan = scan_sql(R"(SELECT 'a\'b; c')");
    EXPECT_FALSE(scan.has_semicolon);
    EXPECT_EQ(scan.end_state, SqlScanEnd::kNormal);
}

TEST(SqlLexer, MaskedBlanksLiteralContents) {
    const auto scan = scan_sql("SELECT 'LIMIT 5' FROM t");
    EXPECT_EQ(scan.masked, "SELECT '       ' FROM t");
    EXPECT_EQ(scan.masked.size(), std::string("SELECT 'LIMIT 5' FROM t").size());
}

TEST(SqlLexer, MaskedBlanksCommentsButKeepsNewlines) {
    const auto scan = scan_sql("SELECT 1 -- LIMIT 9\nFROM t");
    EXPECT_EQ(scan.masked, "SELECT 1           \nFROM t");
    EXPECT_EQ(scan.end_state, SqlScanEnd::kNormal);
}

TEST(SqlLexer, MaskedKeepsQuotedIdentifiers) {
    const auto scan = scan_sql(R"(SELECT * FROM "sqlite_master")");
    EXPECT_EQ(scan.masked, R"(SELECT * FROM "sqlite_master")");
}

TEST(SqlLexer, EndStates) {
    EXPECT_EQ(scan_sql("SELECT 'open").end_state, SqlScanEnd::kInLiteral);
    EXPECT_EQ(scan_sql("SELECT \"open").end_state, SqlScanEnd::kInLiteral);
    EXPECT_EQ(scan_sql("SELECT `open").end_state, SqlScanEnd::kInLiteral);
    EXPECT_EQ(scan_sql("SELECT 1 -- tail").end_state, SqlScanEnd::kInLineComment);
    EXPECT_EQ(scan_sql("SELECT 1 # tail").end_state, SqlScanEnd::kInLineComment);
    EXPECT_EQ(scan_sql("SELECT 1 /* open").end_state, SqlScanEnd::kInBlockComment);
    EXPECT_EQ(scan_sql("").end_state, SqlScanEnd::kNormal);
}
