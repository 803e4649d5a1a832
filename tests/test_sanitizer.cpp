// ---------------------------------------------------------------------------
// test_sanitizer.cpp
//
// Sanitizer / PatternCatalog 단위 테스트.
//
// [테스트 범위]
// - 1 단계: 길이 초과, 빈 쿼리
// - 2 단계: 유니코드 공격 (리터럴/주석 안에 숨긴 경우 포함)
// - 3~4 단계 회귀: 리터럴 안 URL 의 "//", 리터럴/주석 안 위험 키워드
// - 5 단계: 쓰기(공백 변형), 파일 접근, 동적 실행, 관리 프로시저, 체이닝,
//           거대 반복, 이스케이프 인젝션, 괄호 균형
// - 6 단계: 의심 패턴 경고, strict_mode 거부, allow_* 토글
// - 7 단계: 파라미터 이름/개수/길이/유니코드/인젝션
// - 순수성: 같은 입력 → 같은 결과
// - PatternCatalog: 모든 패턴 컴파일 가능
//
// [회귀 규칙]
// 발견된 우회 사례는 이 파일에 영구 테스트로 추가한다.
// ---------------------------------------------------------------------------

#include "parser/pattern_catalog.hpp"
#include "parser/sanitizer.hpp"

#include <gtest/gtest.h>
#include <regex>
#include <string>

namespace {

SanitizerConfig writes_allowed() {
    SanitizerConfig cfg;
    cfg.allow_write_operations = true;
    return cfg;
}

}  // namespace

// ===========================================================================
// PatternCatalog
// ===========================================================================

// ---- AllPatternsCompile
TEST(PatternCatalog, AllPatternsCompile) {
    const auto flags = std::regex_constants::icase | std::regex_constants::ECMAScript;
    for (const auto* list : {&dangerous_patterns(), &suspicious_patterns(), &parameter_patterns()}) {
        for (const auto& spec : *list) {
            EXPECT_NO_THROW({
                const std::regex compiled(std::string(spec.regex), flags);
                (void)compiled;
            }) << spec.regex;
            EXPECT_FALSE(spec.description.empty());
        }
    }
    EXPECT_GT(kPatternCatalogVersion, 0u);
    EXPECT_FALSE(Sanitizer{}.fail_close_active());
}

// ===========================================================================
// 1 단계: 길이 / 빈 쿼리
// ===========================================================================

// ---- SafeMatchHasNoWarnings
TEST(Sanitizer, SafeMatchHasNoWarnings) {
    const Sanitizer sanitizer;
    const auto result = sanitizer.sanitize("MATCH (p:Person) WHERE p.name = 'Alice' RETURN p");
    EXPECT_TRUE(result.is_safe);
    EXPECT_EQ(result.code, SanitizeErrorCode::kNone);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_TRUE(result.warnings.empty());
}

// ---- RejectsQueryOverMaxLength
TEST(Sanitizer, RejectsQueryOverMaxLength) {
    SanitizerConfig cfg;
    cfg.max_query_length = 20;
    const Sanitizer sanitizer{cfg};

    const auto result = sanitizer.sanitize("MATCH (n) RETURN n LIMIT 10");
    EXPECT_FALSE(result.is_safe);
    EXPECT_EQ(result.code, SanitizeErrorCode::kQueryTooLong);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("exceeds maximum length"), std::string::npos);

    EXPECT_TRUE(sanitizer.sanitize("MATCH (n) RETURN n").is_safe);
}

// ---- RejectsEmptyAndWhitespaceQuery
TEST(Sanitizer, RejectsEmptyAndWhitespaceQuery) {
    const Sanitizer sanitizer;
    EXPECT_EQ(sanitizer.sanitize("").code, SanitizeErrorCode::kEmptyQuery);
    EXPECT_EQ(sanitizer.sanitize(" \n\t ").code, SanitizeErrorCode::kEmptyQuery);
}

// ===========================================================================
// 2 단계: 유니코드
// ===========================================================================

// ---- RejectsBidiOverrideAnywhere
TEST(Sanitizer, RejectsBidiOverrideAnywhere) {
    const Sanitizer sanitizer;
    const std::string bidi = "\xE2\x80\xAE";
    for (const std::string& query : {
             "MATCH (n) " + bidi + "RETURN n",
             "MATCH (n) WHERE n.name = 'x" + bidi + "y' RETURN n",
             "MATCH (n) // " + bidi + "\nRETURN n",
         }) {
        const auto result = sanitizer.sanitize(query);
        EXPECT_FALSE(result.is_safe);
        EXPECT_EQ(result.code, SanitizeErrorCode::kUnicodeAttack) << query;
    }
}

// ---- RejectsHomoglyphKeyword
TEST(Sanitizer, RejectsHomoglyphKeyword) {
    const Sanitizer sanitizer;
    EXPECT_EQ(sanitizer.sanitize("MATCH (n) RETURN n LIМIT 5").code, SanitizeErrorCode::kUnicodeAttack);
}

// ===========================================================================
// 3~4 단계: 리터럴 / 주석 제거 회귀
// ===========================================================================

// ---- UrlInStringIsNotComment
TEST(Sanitizer, UrlInStringIsNotComment) {
    const Sanitizer sanitizer;
    const auto result = sanitizer.sanitize("MATCH (w:Site) WHERE w.url = 'https://example.com/a?b=1' RETURN w");
    EXPECT_TRUE(result.is_safe) << result.error.value_or("");
    EXPECT_TRUE(result.warnings.empty());
}

// ---- KeywordsInsideLiteralsAndCommentsIgnored
TEST(Sanitizer, KeywordsInsideLiteralsAndCommentsIgnored) {
    const Sanitizer sanitizer;
    EXPECT_TRUE(sanitizer.sanitize("MATCH (m:Msg) WHERE m.body = 'DROP everything; LOAD CSV' RETURN m").is_safe);
    EXPECT_TRUE(sanitizer.sanitize("MATCH (n) /* DETACH DELETE n */ RETURN n").is_safe);
    EXPECT_TRUE(sanitizer.sanitize("MATCH (n) WHERE n.x = ')' RETURN n").is_safe);
}

// ---- DoubleDashIsRelationship
TEST(Sanitizer, DoubleDashIsRelationship) {
    const Sanitizer sanitizer;
    const auto result = sanitizer.sanitize("MATCH (a)--(b) RETURN a, b LIMIT 10");
    EXPECT_TRUE(result.is_safe);
    EXPECT_TRUE(result.warnings.empty());
}

// ---- UnterminatedLiteralWarns
TEST(Sanitizer, UnterminatedLiteralWarns) {
    const Sanitizer sanitizer;
    const auto result = sanitizer.sanitize("MATCH (n) WHERE n.name = 'abc RETURN n");
    EXPECT_TRUE(result.is_safe);
    ASSERT_FALSE(result.warnings.empty());
    EXPECT_NE(result.warnings.front().find("unterminated"), std::string::npos);
}

// ===========================================================================
// 5 단계: 위험 패턴
// ===========================================================================

// ---- RejectsDetachDelete
TEST(Sanitizer, RejectsDetachDelete) {
    const Sanitizer sanitizer;
    const auto result = sanitizer.sanitize("MATCH (n) DETACH DELETE n");
    EXPECT_FALSE(result.is_safe);
    EXPECT_EQ(result.code, SanitizeErrorCode::kWriteOperation);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("write operation"), std::string::npos);
}

// ---- RejectsWriteAcrossNewlineAndTab
TEST(Sanitizer, RejectsWriteAcrossNewlineAndTab) {
    const Sanitizer sanitizer;
    EXPECT_EQ(sanitizer.sanitize("MATCH (n)\nDETACH\tDELETE\nn").code, SanitizeErrorCode::kWriteOperation);
    EXPECT_EQ(sanitizer.sanitize("MATCH (n)\tSET\tn.admin = true").code, SanitizeErrorCode::kWriteOperation);
}

// ---- MapKeyNamedSetIsNotWrite
TEST(Sanitizer, MapKeyNamedSetIsNotWrite) {
    const Sanitizer sanitizer;
    const auto result = sanitizer.sanitize("MATCH (n) WHERE n.props = {set: 1} RETURN n");
    EXPECT_TRUE(result.is_safe) << result.error.value_or("");
    EXPECT_EQ(result.code, SanitizeErrorCode::kNone);
}

// ---- AllowsWritesWhenConfigured
TEST(Sanitizer, AllowsWritesWhenConfigured) {
    const Sanitizer sanitizer{writes_allowed()};
    EXPECT_TRUE(sanitizer.sanitize("CREATE (n:Test {name: 'x'}) RETURN n").is_safe);
}

// ---- RejectsFilesystemAccess
TEST(Sanitizer, RejectsFilesystemAccess) {
    const Sanitizer sanitizer{writes_allowed()};
    const auto load_csv = sanitizer.sanitize("LOAD CSV FROM 'file:///etc/passwd' AS row RETURN row");
    EXPECT_EQ(load_csv.code, SanitizeErrorCode::kDangerousPattern);

    const auto apoc_load = sanitizer.sanitize("CALL apoc.load.json('http://internal/x') YIELD value RETURN value");
    EXPECT_EQ(apoc_load.code, SanitizeErrorCode::kDangerousPattern);
    ASSERT_TRUE(apoc_load.error.has_value());
    EXPECT_NE(apoc_load.error->find("dangerous pattern"), std::string::npos);

    // 기본(read-only) 설정에서는 LOAD CSV 가 쓰기 검사에서 먼저 걸린다.
    EXPECT_FALSE(Sanitizer{}.sanitize("LOAD CSV FROM 'x' AS row RETURN row").is_safe);
}

// ---- RejectsDynamicExecution
TEST(Sanitizer, RejectsDynamicExecution) {
    const Sanitizer sanitizer;
    EXPECT_EQ(sanitizer.sanitize("CALL apoc.cypher.run('MATCH (n) RETURN n', {}) YIELD value RETURN value").code,
              SanitizeErrorCode::kDangerousPattern);
    EXPECT_EQ(sanitizer.sanitize("CALL apoc.periodic.iterate('a', 'b', {})").code,
              SanitizeErrorCode::kDangerousPattern);
}

// ---- AdminProceduresToggle
TEST(Sanitizer, AdminProceduresToggle) {
    const std::string query = "CALL dbms.security.listUsers() YIELD username RETURN username";
    EXPECT_EQ(Sanitizer{}.sanitize(query).code, SanitizeErrorCode::kDangerousPattern);

    SanitizerConfig cfg;
    cfg.allow_admin_procedures = true;
    const auto result = Sanitizer{cfg}.sanitize(query);
    EXPECT_TRUE(result.is_safe);
    EXPECT_TRUE(result.warnings.empty());
}

// ---- RejectsStatementChaining
TEST(Sanitizer, RejectsStatementChaining) {
    const Sanitizer sanitizer;
    EXPECT_EQ(sanitizer.sanitize("MATCH (n) RETURN n; MATCH (m) RETURN m").code,
              SanitizeErrorCode::kDangerousPattern);
    EXPECT_TRUE(sanitizer.sanitize("MATCH (n) RETURN n;").is_safe);
}

// ---- RejectsHugeRange
TEST(Sanitizer, RejectsHugeRange) {
    const Sanitizer sanitizer;
    EXPECT_EQ(sanitizer.sanitize("UNWIND range(1, 1000000) AS i RETURN i").code,
              SanitizeErrorCode::kDangerousPattern);
    EXPECT_TRUE(sanitizer.sanitize("UNWIND range(1, 10) AS i RETURN i").is_safe);
}

// ---- RejectsEscapeInjection
TEST(Sanitizer, RejectsEscapeInjection) {
    const Sanitizer sanitizer;
    EXPECT_EQ(sanitizer.sanitize(R"(MATCH (u) WHERE u.name = '\x41dmin' RETURN u)").code,
              SanitizeErrorCode::kStringInjection);
    EXPECT_EQ(sanitizer.sanitize(R"(MATCH (u) WHERE u.name = '\u0041dmin' RETURN u)").code,
              SanitizeErrorCode::kStringInjection);
    EXPECT_EQ(sanitizer.sanitize("MATCH (u) WHERE u.name = 'ad' + 'min' RETURN u").code,
              SanitizeErrorCode::kStringInjection);
}

// ---- RejectsUnbalancedDelimiters
TEST(Sanitizer, RejectsUnbalancedDelimiters) {
    const Sanitizer sanitizer;
    EXPECT_EQ(sanitizer.sanitize("MATCH (n WHERE n.x = 1 RETURN n").code,
              SanitizeErrorCode::kUnbalancedDelimiters);
    EXPECT_EQ(sanitizer.sanitize("MATCH (n {a: [1, 2}) RETURN n").code,
              SanitizeErrorCode::kUnbalancedDelimiters);
}

// ===========================================================================
// 6 단계: 의심 패턴
// ===========================================================================

// ---- ApocCallIsWarning
TEST(Sanitizer, ApocCallIsWarning) {
    const Sanitizer sanitizer;
    const auto result = sanitizer.sanitize("CALL apoc.meta.schema() YIELD value RETURN value");
    EXPECT_TRUE(result.is_safe);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("CALL apoc procedure"), std::string::npos);
}

// ---- StrictModeRejectsSuspicious
TEST(Sanitizer, StrictModeRejectsSuspicious) {
    SanitizerConfig cfg;
    cfg.strict_mode = true;
    const auto result = Sanitizer{cfg}.sanitize("CALL apoc.meta.schema() YIELD value RETURN value");
    EXPECT_FALSE(result.is_safe);
    EXPECT_EQ(result.code, SanitizeErrorCode::kSuspiciousPattern);
}

// ---- SchemaChangeToggle
TEST(Sanitizer, SchemaChangeToggle) {
    const std::string query = "CREATE INDEX person_name FOR (n:Person) ON (n.name)";

    const auto warned = Sanitizer{writes_allowed()}.sanitize(query);
    EXPECT_TRUE(warned.is_safe);
    ASSERT_EQ(warned.warnings.size(), 1u);
    EXPECT_NE(warned.warnings[0].find("index schema change"), std::string::npos);

    SanitizerConfig cfg        = writes_allowed();
    cfg.allow_schema_changes   = true;
    const auto allowed         = Sanitizer{cfg}.sanitize(query);
    EXPECT_TRUE(allowed.is_safe);
    EXPECT_TRUE(allowed.warnings.empty());
}

// ===========================================================================
// 7 단계: 파라미터
// ===========================================================================

// ---- ValidParametersPass
TEST(Sanitizer, ValidParametersPass) {
    const Sanitizer sanitizer;
    const auto result = sanitizer.sanitize("MATCH (p:Person) WHERE p.name = $name RETURN p",
                                           {{"name", "Alice"}, {"_limit", "10"}});
    EXPECT_TRUE(result.is_safe);
}

// ---- RejectsInvalidParameterName
TEST(Sanitizer, RejectsInvalidParameterName) {
    const Sanitizer sanitizer;
    EXPECT_EQ(sanitizer.sanitize_parameters({{"1abc", "x"}}).code, SanitizeErrorCode::kInvalidParameterName);
    EXPECT_EQ(sanitizer.sanitize_parameters({{"na-me", "x"}}).code, SanitizeErrorCode::kInvalidParameterName);
    EXPECT_EQ(sanitizer.sanitize_parameters({{"", "x"}}).code, SanitizeErrorCode::kInvalidParameterName);
}

// ---- RejectsTooManyParameters
TEST(Sanitizer, RejectsTooManyParameters) {
    SanitizerConfig cfg;
    cfg.max_parameters = 2;
    const Sanitizer sanitizer{cfg};
    EXPECT_EQ(sanitizer.sanitize_parameters({{"a", "1"}, {"b", "2"}, {"c", "3"}}).code,
              SanitizeErrorCode::kTooManyParameters);
    EXPECT_TRUE(sanitizer.sanitize_parameters({{"a", "1"}, {"b", "2"}}).is_safe);
}

// ---- RejectsParameterTooLong
TEST(Sanitizer, RejectsParameterTooLong) {
    SanitizerConfig cfg;
    cfg.max_parameter_length = 8;
    const Sanitizer sanitizer{cfg};
    EXPECT_EQ(sanitizer.sanitize_parameters({{"v", std::string(9, 'a')}}).code,
              SanitizeErrorCode::kParameterTooLong);
}

// ---- RejectsParameterInjection
TEST(Sanitizer, RejectsParameterInjection) {
    const Sanitizer sanitizer;
    for (const std::string value : {"x; DROP", "a' MATCH (n) DETACH DELETE n", "abc -- tail", "abc /* x",
                                    R"(\x41)", "a' + 'b"}) {
        EXPECT_EQ(sanitizer.sanitize_parameters({{"v", value}}).code, SanitizeErrorCode::kParameterInjection)
            << value;
    }
}

// ---- RejectsUnicodeInParameter
TEST(Sanitizer, RejectsUnicodeInParameter) {
    const Sanitizer sanitizer;
    const auto result = sanitizer.sanitize("MATCH (n) WHERE n.name = $name RETURN n",
                                           {{"name", "adm\xE2\x80\x8B" "in"}});
    EXPECT_EQ(result.code, SanitizeErrorCode::kUnicodeAttack);
}

// ===========================================================================
// 순수성
// ===========================================================================

// ---- SanitizeIsPure
TEST(Sanitizer, SanitizeIsPure) {
    const Sanitizer sanitizer;
    const ParameterMap params = {{"name", "Bob"}};
    for (const std::string query : {"MATCH (n) RETURN n", "CALL apoc.meta.schema()", "MATCH (n) DELETE n"}) {
        EXPECT_EQ(sanitizer.sanitize(query, params), sanitizer.sanitize(query, params));
    }
}

// ---- ErrorNames
TEST(Sanitizer, ErrorNames) {
    EXPECT_EQ(sanitize_error_name(SanitizeErrorCode::kWriteOperation), "write_operation");
    EXPECT_EQ(sanitize_error_name(SanitizeErrorCode::kUnicodeAttack), "unicode_attack");
}
