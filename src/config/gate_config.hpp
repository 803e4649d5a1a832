#pragma once

// ---------------------------------------------------------------------------
// gate_config.hpp
//
// 게이트 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/graphgate.yaml 에서 로드된다 (ConfigLoader).
//
// [설계 원칙]
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. YAML 에 없는 키는 기본값을 유지한다.
// - 기본값은 보수적이다: 쓰기 차단, 복잡도 초과 시 차단, 감사 로그 + PII 마스킹 활성.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// SanitizerConfig
//   allow_admin_procedures: CALL apoc.* / CALL dbms.* 경고 및 dbms.security/cluster 차단 해제
//   allow_schema_changes:   CREATE/DROP INDEX|CONSTRAINT 경고 해제
//   allow_write_operations: false 이면 쓰기 키워드/쓰기 프로시저 차단 (read-only 게이트)
//   strict_mode:            suspicious 패턴을 경고 대신 거부
// ---------------------------------------------------------------------------
struct SanitizerConfig {
    bool          enabled{true};
    bool          strict_mode{false};
    bool          allow_admin_procedures{false};
    bool          allow_schema_changes{false};
    bool          allow_write_operations{false};
    bool          block_non_ascii{false};
    std::uint32_t max_query_length{10000};
    std::uint32_t max_parameters{100};
    std::uint32_t max_parameter_length{5000};
};

// ---------------------------------------------------------------------------
// ComplexityWeights
//   요인별 점수와 상한. 수치는 휴리스틱 기본값이며 측정 기반 비용 모델이 아니다.
// ---------------------------------------------------------------------------
struct ComplexityWeights {
    int match_clause{5};
    int match_cap{50};

    int varlength_short{10};      // 최대 홉 <= 3
    int varlength_long{20};       // 최대 홉 <= max_variable_path_length
    int varlength_excessive{30};  // 최대 홉 > max_variable_path_length
    int varlength_unbounded{50};  // 상한 없음 ([*], [*2..])
    int varlength_cap{200};

    int cartesian_product{50};
    int cartesian_cap{150};

    int aggregation{3};
    int aggregation_cap{30};

    int subquery{15};
    int subquery_cap{60};

    int union_clause{10};
    int union_cap{50};

    int optional_match{5};
    int optional_match_cap{30};

    int with_clause{5};
    int with_cap{30};

    int missing_limit{20};

    int missing_index{25};
    int missing_index_cap{75};
};

// ---------------------------------------------------------------------------
// ComplexityConfig
//   위험 등급: total < moderate → SAFE, < high → MODERATE, < critical → HIGH, 이상 → CRITICAL
//   total > max_complexity 이면 block_on_exceed 에 따라 차단 또는 경고.
// ---------------------------------------------------------------------------
struct ComplexityConfig {
    bool              enabled{true};
    int               max_complexity{100};
    bool              block_on_exceed{true};
    int               max_variable_path_length{10};
    int               moderate_threshold{25};
    int               high_threshold{50};
    int               critical_threshold{100};
    ComplexityWeights weights{};
};

// ---------------------------------------------------------------------------
// LimitConfig
//   투영(RETURN/WITH) 으로 끝나는 쿼리에 LIMIT 가 없으면 max_rows 를 자동 추가.
// ---------------------------------------------------------------------------
struct LimitConfig {
    bool          auto_inject{true};
    std::uint32_t max_rows{1000};
};

// ---------------------------------------------------------------------------
// RateLimitRule
//   rate 회 / per_seconds 초. burst 미지정 시 rate * 2.
// ---------------------------------------------------------------------------
struct RateLimitRule {
    double                rate{10.0};
    double                per_seconds{60.0};
    std::optional<double> burst{};

    [[nodiscard]] double capacity() const noexcept { return burst.value_or(rate * 2.0); }
    [[nodiscard]] double refill_rate() const noexcept { return rate / per_seconds; }
};

// ---------------------------------------------------------------------------
// RateLimitConfig
//   tools: 오퍼레이션 이름별 버킷. global 이 있으면 모든 오퍼레이션에 추가 적용.
//   sweep_interval_seconds: check() 가 가득 찬 버킷을 레지스트리에서 정리하는 주기 (0 이면 끔).
// ---------------------------------------------------------------------------
struct RateLimitConfig {
    bool                                 enabled{true};
    std::uint32_t                        sweep_interval_seconds{60};
    std::optional<RateLimitRule>         global{};
    std::map<std::string, RateLimitRule> tools{
        {"query_graph",    RateLimitRule{10.0, 60.0, std::nullopt}},
        {"execute_cypher", RateLimitRule{10.0, 60.0, std::nullopt}},
        {"refresh_schema", RateLimitRule{5.0, 120.0, std::nullopt}},
        {"analyze_query",  RateLimitRule{15.0, 60.0, std::nullopt}},
        {"resources",      RateLimitRule{20.0, 60.0, std::nullopt}},
    };
};

// ---------------------------------------------------------------------------
// AuditConfig
//   format:   json (한 줄 JSON) | text (사람이 읽는 한 줄)
//   rotation: daily (audit_YYYY-MM-DD.log) | weekly (audit_YYYY-Www.log)
//             | size (audit_current.log, max_size_mb 초과 시 회전)
// ---------------------------------------------------------------------------
enum class AuditFormat : std::uint8_t {
    kJson = 0,
    kText = 1,
};

enum class AuditRotation : std::uint8_t {
    kDaily  = 0,
    kWeekly = 1,
    kSize   = 2,
};

struct AuditConfig {
    bool          enabled{true};
    std::string   directory{"logs/audit"};
    AuditFormat   format{AuditFormat::kJson};
    AuditRotation rotation{AuditRotation::kDaily};
    std::uint32_t max_size_mb{100};
    std::uint32_t retention_days{90};
    bool          pii_redaction{true};
    std::uint32_t max_response_length{10000};
};

// ---------------------------------------------------------------------------
// EngineConfig
//   DB 드라이버 호출 타임아웃 및 실행 스레드 수 (boost::asio::thread_pool).
// ---------------------------------------------------------------------------
struct EngineConfig {
    std::uint32_t timeout_ms{30000};
    std::uint32_t worker_threads{4};
};

// ---------------------------------------------------------------------------
// PlanConfig
//   가변 길이 확장 연산자의 허용 홉 상한 (병목 심각도 판단 기준).
// ---------------------------------------------------------------------------
struct PlanConfig {
    int max_hop_bound{10};
};

// ---------------------------------------------------------------------------
// GateConfig
//   전체 설정의 루트 구조체. ConfigLoader::load 가 반환하는 최종 결과물.
//
//   environment 가 "production"/"prod" 이면 debug_mode 는 허용되지 않는다
//   (ConfigLoader 가 로드 오류로 처리).
// ---------------------------------------------------------------------------
struct GateConfig {
    std::string      environment{"development"};
    bool             debug_mode{false};
    SanitizerConfig  sanitizer{};
    ComplexityConfig complexity{};
    LimitConfig      limits{};
    RateLimitConfig  rate_limit{};
    AuditConfig      audit{};
    EngineConfig     engine{};
    PlanConfig       plan{};
};
