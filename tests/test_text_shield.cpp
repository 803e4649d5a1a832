// ---------------------------------------------------------------------------
// test_text_shield.cpp
//
// TextShield (리터럴/주석 제거기) 단위 테스트.
//
// [테스트 범위]
// - 작은/큰따옴표 리터럴 제거, 백슬래시 이스케이프
// - 리터럴 안의 "//" (URL) 을 주석으로 오인하지 않음
// - 라인/블록 주석 제거, "--" 는 관계 패턴으로 보존
// - 주석 안의 따옴표가 리터럴을 열지 않음
// - 백틱 식별자 치환 (같은 이름 → 같은 치환값)
// - 닫히지 않은 리터럴/주석: 나머지 텍스트 보존 + 플래그
// - mask_query 길이 보존
// ---------------------------------------------------------------------------

#include "parser/text_shield.hpp"

#include <gtest/gtest.h>
#include <string>

// ---- StripsSingleQuotedLiteral
TEST(TextShield, StripsSingleQuotedLiteral) {
    const auto out = strip_string_literals("MATCH (n) WHERE n.name = 'Alice' RETURN n");
    EXPECT_EQ(out.text, "MATCH (n) WHERE n.name = '' RETURN n");
    EXPECT_FALSE(out.unterminated_literal);
}

// ---- StripsDoubleQuotedLiteral
TEST(TextShield, StripsDoubleQuotedLiteral) {
    const auto out = strip_string_literals(R"(RETURN "DELETE everything" AS s)");
    EXPECT_EQ(out.text, R"(RETURN "" AS s)");
}

// ---- EscapedQuoteStaysInsideLiteral
// 'it\'s' 는 하나의 리터럴이다.
TEST(TextShield, EscapedQuoteStaysInsideLiteral) {
    const auto out = strip_string_literals(R"(RETURN 'it\'s' AS x)");
    EXPECT_EQ(out.text, "RETURN '' AS x");
    EXPECT_FALSE(out.unterminated_literal);
}

// ---- UrlInsideLiteralIsNotComment
// 회귀: 'https://...' 의 // 를 주석으로 보면 RETURN 이하가 사라진다.
TEST(TextShield, UrlInsideLiteralIsNotComment) {
    const auto out = shield_query("MATCH (n) WHERE n.url = 'https://example.com/a' RETURN n LIMIT 5");
    EXPECT_EQ(out.text, "MATCH (n) WHERE n.url = '' RETURN n LIMIT 5");
}

// ---- LineCommentRemovedNewlineKept
TEST(TextShield, LineCommentRemovedNewlineKept) {
    const auto out = strip_comments("MATCH (n) // find all\nRETURN n");
    EXPECT_EQ(out.text, "MATCH (n) \nRETURN n");
}

// ---- BlockCommentLeavesSpace
// DE/**/LETE 가 DELETE 로 붙지 않아야 한다.
TEST(TextShield, BlockCommentLeavesSpace) {
    const auto out = strip_comments("MATCH (n) DE/**/LETE n");
    EXPECT_EQ(out.text, "MATCH (n) DE LETE n");
}

// ---- DoubleDashIsRelationshipNotComment
TEST(TextShield, DoubleDashIsRelationshipNotComment) {
    const std::string query = "MATCH (a)--(b) RETURN a, b";
    EXPECT_EQ(shield_query(query).text, query);
}

// ---- QuoteInsideCommentDoesNotOpenLiteral
TEST(TextShield, QuoteInsideCommentDoesNotOpenLiteral) {
    const std::string query = "MATCH (n) // don't\nRETURN n";
    const auto literals     = strip_string_literals(query);
    EXPECT_EQ(literals.text, query);
    EXPECT_FALSE(literals.unterminated_literal);

    const auto shielded = shield_query(query);
    EXPECT_EQ(shielded.text, "MATCH (n) \nRETURN n");
}

// ---- BacktickIdentifiersShareId
TEST(TextShield, BacktickIdentifiersShareId) {
    const auto out = strip_string_literals("MATCH (`my node`)-->(`other`) RETURN `my node`");
    EXPECT_EQ(out.text, "MATCH (`_bt0`)-->(`_bt1`) RETURN `_bt0`");
}

// ---- UnterminatedLiteralKeepsRest
TEST(TextShield, UnterminatedLiteralKeepsRest) {
    const std::string query = "MATCH (n) WHERE n.x = 'abc DETACH DELETE n";
    const auto out          = shield_query(query);
    EXPECT_TRUE(out.unterminated_literal);
    EXPECT_NE(out.text.find("DETACH DELETE"), std::string::npos);
}

// ---- UnterminatedBlockComment
TEST(TextShield, UnterminatedBlockComment) {
    const auto out = strip_comments("MATCH (n) /* open RETURN n");
    EXPECT_TRUE(out.unterminated_comment);
    EXPECT_EQ(out.text, "MATCH (n) /* open RETURN n");
}

// ---- MaskPreservesLength
TEST(TextShield, MaskPreservesLength) {
    const std::string query = "RETURN 'LIMIT 5' AS s /* LIMIT 3 */ // LIMIT 2";
    const auto out          = mask_query(query);
    ASSERT_EQ(out.text.size(), query.size());
    EXPECT_EQ(out.text.find("LIMIT"), std::string::npos);
    EXPECT_EQ(out.text.substr(0, 6), "RETURN");
}
