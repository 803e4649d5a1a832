#pragma once

// ---------------------------------------------------------------------------
// pattern_catalog.hpp
//
// Sanitizer 가 사용하는 정규식 패턴 목록 (버전 관리되는 데이터).
// 제어 흐름이 아닌 데이터로 유지하여 패턴 단위로 전수 테스트한다.
// 우회 사례가 발견되면 패턴을 추가하고 kPatternCatalogVersion 을 올린 뒤
// tests/test_sanitizer.cpp 에 회귀 테스트를 영구 추가한다.
//
// [매칭 대상]
// - MatchTarget::kShielded: 리터럴/주석 제거 후 텍스트 (오탐 방지)
// - MatchTarget::kRaw:      원문 (리터럴 내부 이스케이프 시퀀스 탐지)
//
// 모든 패턴은 icase | ECMAScript 로 컴파일된다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string_view>
#include <vector>

inline constexpr std::uint32_t kPatternCatalogVersion = 3;

// ---------------------------------------------------------------------------
// PatternCategory
// ---------------------------------------------------------------------------
enum class PatternCategory : std::uint8_t {
    kFilesystemAccess   = 0,  // LOAD CSV, apoc.load.*, apoc.export.*
    kDynamicExecution   = 1,  // apoc.cypher.run*, apoc.periodic.*
    kAdminProcedure     = 2,  // dbms.security.*, dbms.cluster.*
    kMutatingProcedure  = 3,  // apoc.refactor.*
    kStatementChaining  = 4,  // ; 뒤에 다른 구문
    kHugeIteration      = 5,  // FOREACH/UNWIND range(a, >= 100000)
    kEscapeInjection    = 6,  // \xHH, \uHHHH, \NNN, 문자열 연결
    kSchemaChange       = 7,  // CREATE/DROP INDEX|CONSTRAINT (suspicious)
    kProcedureCall      = 8,  // CALL apoc.* / CALL dbms.* (suspicious)
    kParameterInjection = 9,  // 파라미터 값 내 구문 조각
};

enum class MatchTarget : std::uint8_t {
    kShielded = 0,
    kRaw      = 1,
};

// ---------------------------------------------------------------------------
// PatternSpec
// ---------------------------------------------------------------------------
struct PatternSpec {
    PatternCategory  category;
    MatchTarget      target;
    std::string_view regex;
    std::string_view description;
};

// 발견 즉시 거부하는 패턴.
[[nodiscard]] const std::vector<PatternSpec>& dangerous_patterns();

// 경고로 기록하는 패턴 (strict_mode 에서는 거부).
[[nodiscard]] const std::vector<PatternSpec>& suspicious_patterns();

// 파라미터 값 검사 패턴 (값 원문에 적용).
[[nodiscard]] const std::vector<PatternSpec>& parameter_patterns();

[[nodiscard]] std::string_view category_name(PatternCategory category) noexcept;
