#pragma once

// ---------------------------------------------------------------------------
// plan_analyzer.hpp
//
// 실행 계획 분석기. 메인 실행 경로와 분리된 "analyze" 오퍼레이션에서만 호출된다.
//
// [모드]
// - EXPLAIN (기본): "EXPLAIN " 접두어. 쿼리를 실행하지 않는다.
// - PROFILE: "PROFILE " 접두어. 쿼리를 실제로 실행한다.
//   allow_write_queries == false 이면 WriteDetector 로 쓰기를 탐지해 kWriteBlocked 반환.
//
// [행 미조회 불변식]
// 어떤 모드에서도 ResultHandle::consume() 만 호출한다. materialize() 는 호출하지 않는다.
//
// 호출자 파라미터는 두 모드 모두 그대로 드라이버에 전달한다.
// 드라이버 예외는 kEngine 오류로 변환된다 (detail 에 원본 메시지).
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "config/gate_config.hpp"
#include "engine/graph_driver.hpp"
#include "parser/write_detector.hpp"
#include "plan/bottleneck_detector.hpp"
#include "plan/cost_estimator.hpp"
#include "plan/plan_types.hpp"
#include "plan/recommendation_engine.hpp"

// 계획 트리를 pre-order 로 평탄화하고 합계를 계산한다.
// 런타임 통계는 mode == kProfile 일 때만 반영한다.
[[nodiscard]] ExecutionPlan flatten_plan(const PlanNode& root, PlanMode mode);

// overall_severity: 평균 심각도 (정수 내림, 최대 10)
[[nodiscard]] AnalysisSummary summarize(const std::vector<Bottleneck>&     bottlenecks,
                                        const std::vector<Recommendation>& recommendations,
                                        const CostEstimate&                cost);

// 사람이 읽는 텍스트 리포트.
[[nodiscard]] std::string format_report(const AnalysisResult& result);

class PlanAnalyzer {
public:
    explicit PlanAnalyzer(GraphDriver& driver, PlanConfig config = {});

    [[nodiscard]] std::expected<AnalysisResult, GateError> analyze(
        std::string_view    query,
        const ParameterMap& params              = {},
        PlanMode            mode                = PlanMode::kExplain,
        bool                allow_write_queries = false) const;

private:
    GraphDriver&         driver_;
    PlanConfig           config_;
    WriteDetector        write_detector_;
    BottleneckDetector   bottleneck_detector_;
    RecommendationEngine recommendation_engine_;
    CostEstimator        cost_estimator_;
};
