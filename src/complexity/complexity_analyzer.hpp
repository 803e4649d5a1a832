#pragma once

// ---------------------------------------------------------------------------
// complexity_analyzer.hpp
//
// 구조적 위험 점수 계산 (DoS 방지) + 결과 크기 제한 재작성.
// 보안 게이트의 세 번째 단계 (Sanitizer 통과 후).
//
// [점수 요인] 요인별 상한 적용 후 합산, 전체는 [0, 1000] 으로 clamp.
//   match_clauses          MATCH 절 수
//   variable_length_paths  가변 길이 관계, 최대 홉 버킷별 (무제한이 최상위)
//   cartesian_product      변수/조인 술어를 공유하지 않는 분리된 패턴
//   aggregations           집계 함수 호출 수
//   subqueries             CALL { } / EXISTS { }
//   unions                 UNION
//   optional_matches       OPTIONAL MATCH
//   with_clauses           중간 투영 WITH
//   missing_limit          LIMIT 없는 투영 (순수 집계 제외)
//   missing_index          플랜에 전체 스캔 연산자 (score_with_plan 전용)
//
// [불변식] sum(breakdown) == total, 0 <= total <= 1000.
//
// 가중치는 측정 기반 비용 모델이 아닌 휴리스틱 기본값 (ComplexityWeights 로 조정).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "complexity/limit_injector.hpp"
#include "config/gate_config.hpp"

inline constexpr int kMaxComplexityScore = 1000;

enum class RiskLevel : std::uint8_t {
    kSafe     = 0,
    kModerate = 1,
    kHigh     = 2,
    kCritical = 3,
};

[[nodiscard]] std::string_view risk_level_name(RiskLevel level) noexcept;

// ---------------------------------------------------------------------------
// ComplexityScore
// ---------------------------------------------------------------------------
struct ComplexityScore {
    int                        total{0};
    RiskLevel                  risk_level{RiskLevel::kSafe};
    std::map<std::string, int> breakdown{};     // 0 이 아닌 요인만 포함
    std::vector<std::string>   bottlenecks{};
};

// ---------------------------------------------------------------------------
// ComplexityReport
//   score_and_maybe_rewrite 결과.
//   blocked == true 이면 error 에 기여 병목 목록이 포함되고 query 는 원문이다.
// ---------------------------------------------------------------------------
struct ComplexityReport {
    ComplexityScore            score{};
    std::string                query{};
    bool                       was_injected{false};
    bool                       blocked{false};
    std::optional<std::string> error{};
    std::vector<std::string>   warnings{};
};

class ComplexityAnalyzer {
public:
    explicit ComplexityAnalyzer(ComplexityConfig config = {}, LimitConfig limits = {});

    [[nodiscard]] ComplexityScore score(std::string_view query) const;

    // 플랜 연산자 이름 목록이 있을 때 missing_index 요인까지 포함한 점수.
    [[nodiscard]] ComplexityScore score_with_plan(std::string_view query,
                                                  const std::vector<std::string>& plan_operators) const;

    [[nodiscard]] LimitInjection maybe_inject_limit(std::string_view query, std::uint32_t max_rows) const {
        return ::maybe_inject_limit(query, max_rows);
    }

    // 점수 → 차단/경고 판정 → (설정 시) LIMIT 삽입.
    [[nodiscard]] ComplexityReport score_and_maybe_rewrite(std::string_view query) const;

    [[nodiscard]] RiskLevel risk_for(int total) const noexcept;

    [[nodiscard]] const ComplexityConfig& config() const noexcept { return config_; }

private:
    ComplexityConfig config_;
    LimitConfig      limits_;
};
