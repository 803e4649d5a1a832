#pragma once

// ---------------------------------------------------------------------------
// plan_types.hpp
//
// 실행 계획 분석 타입 정의 (헤더만).
//
// [흐름]
//   GraphDriver::run("EXPLAIN ..."/"PROFILE ...") → ResultHandle::consume() → PlanSummary
//   PlanSummary::plan (PlanNode 트리) → flatten_plan() → ExecutionPlan (pre-order 목록)
//   ExecutionPlan → BottleneckDetector → RecommendationEngine / CostEstimator → AnalysisResult
//
// 모든 타입은 분석 호출 한 번 동안만 유효하다 (요청마다 재구성).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// PlanMode
//   kExplain: 실행하지 않고 계획만 조회 (기본값)
//   kProfile: 쿼리를 실제로 실행하며 연산자별 런타임 통계를 함께 받는다
// ---------------------------------------------------------------------------
enum class PlanMode : std::uint8_t {
    kExplain = 0,
    kProfile = 1,
};

[[nodiscard]] inline std::string_view plan_mode_name(PlanMode mode) noexcept {
    return mode == PlanMode::kProfile ? "PROFILE" : "EXPLAIN";
}

// ---------------------------------------------------------------------------
// PlanNode
//   엔진 고유 계획 트리의 한 노드. 런타임 통계는 PROFILE 에서만 채워진다.
//   arguments: 엔진이 제공하는 연산자 인자 ("Details", "LabelName" 등)
// ---------------------------------------------------------------------------
struct PlanNode {
    std::string                        operator_type{};
    std::map<std::string, std::string> arguments{};
    std::vector<std::string>           identifiers{};
    double                             estimated_rows{0.0};
    std::optional<std::int64_t>        db_hits{};
    std::optional<std::int64_t>        rows{};
    std::optional<double>              time_ms{};
    std::optional<std::int64_t>        memory_bytes{};
    std::vector<PlanNode>              children{};
};

// ResultHandle::consume() 결과. plan 이 비어 있으면 엔진이 계획을 주지 않은 것.
struct PlanSummary {
    std::optional<PlanNode> plan{};
    std::string             query_type{};  // "r", "rw", "w", "s" (엔진 보고값)
};

// ---------------------------------------------------------------------------
// FlatOperator
//   pre-order 평탄화 결과. depth 0 이 루트.
//   work_units: db_hits (PROFILE) 또는 0 (EXPLAIN)
// ---------------------------------------------------------------------------
struct FlatOperator {
    std::string                        operator_type{};
    int                                depth{0};
    double                             estimated_rows{0.0};
    std::int64_t                       work_units{0};
    std::optional<std::int64_t>        rows{};
    std::optional<double>              time_ms{};
    std::optional<std::int64_t>        memory_bytes{};
    std::map<std::string, std::string> arguments{};
    std::string                        parent_type{};  // 루트는 빈 문자열
};

struct ExecutionPlan {
    PlanMode                  mode{PlanMode::kExplain};
    std::vector<FlatOperator> operators{};
    double                    total_estimated_rows{0.0};
    std::int64_t              total_db_hits{0};
    std::int64_t              total_rows{0};
    double                    total_time_ms{0.0};
    std::int64_t              total_memory_bytes{0};
    bool                      has_runtime_stats{false};
};

// ---------------------------------------------------------------------------
// BottleneckType
//   기본 심각도 (1-10): cartesian 9, missing_index 8, unbounded_varlength 7,
//   expensive_procedure 6, inefficient_pattern 5, missing_limit 4, redundant_operation 3
// ---------------------------------------------------------------------------
enum class BottleneckType : std::uint8_t {
    kCartesianProduct   = 0,
    kMissingIndex       = 1,
    kUnboundedVarLength = 2,
    kExpensiveProcedure = 3,
    kInefficientPattern = 4,
    kMissingLimit       = 5,
    kRedundantOperation = 6,
};

[[nodiscard]] inline std::string_view bottleneck_type_name(BottleneckType type) noexcept {
    switch (type) {
        case BottleneckType::kCartesianProduct:   return "cartesian_product";
        case BottleneckType::kMissingIndex:       return "missing_index";
        case BottleneckType::kUnboundedVarLength: return "unbounded_varlength";
        case BottleneckType::kExpensiveProcedure: return "expensive_procedure";
        case BottleneckType::kInefficientPattern: return "inefficient_pattern";
        case BottleneckType::kMissingLimit:       return "missing_limit";
        case BottleneckType::kRedundantOperation: return "redundant_operation";
    }
    return "inefficient_pattern";
}

struct Bottleneck {
    BottleneckType type{BottleneckType::kInefficientPattern};
    int            severity{0};
    std::string    operator_type{};  // 계획 기반이 아니면 빈 문자열
    std::string    location{};       // 중복 제거 키 (type, location)
    std::string    description{};
    std::string    impact{};
};

struct Recommendation {
    std::string    title{};
    std::string    category{};
    int            severity{0};
    std::string    priority{};           // "high" | "medium" | "low"
    std::string    effort{};             // "high" | "medium" | "low"
    std::string    description{};
    std::string    example_remediation{};
    std::string    expected_impact{};
    BottleneckType bottleneck{BottleneckType::kInefficientPattern};
    std::string    location{};
};

struct CostEstimate {
    std::int64_t             total_cost{0};
    int                      cost_score{1};      // 1..10
    std::string              risk_level{"low"};  // "low" | "medium" | "high"
    std::string              confidence{"low"};
    double                   estimated_rows{0.0};
    std::int64_t             estimated_time_ms{1};    // 1..60000
    std::int64_t             estimated_memory_mb{1};  // 1..1000
    std::vector<std::string> risk_factors{};
};

struct AnalysisSummary {
    int         overall_severity{0};
    std::size_t bottleneck_count{0};
    std::size_t recommendation_count{0};
    std::size_t critical_issues{0};        // severity >= 8
    std::string estimated_impact{"low"};   // 평균 심각도 >= 7 high, >= 4 medium
    std::int64_t estimated_cost{0};
};

struct AnalysisResult {
    std::string                 query{};
    PlanMode                    mode{PlanMode::kExplain};
    ExecutionPlan               plan{};
    std::vector<Bottleneck>     bottlenecks{};
    std::vector<Recommendation> recommendations{};
    CostEstimate                cost{};
    AnalysisSummary             summary{};
};
