#pragma once

// ---------------------------------------------------------------------------
// cost_estimator.hpp
//
// 연산자 비용표 기반 상대 비용 추정.
//
//   operator_cost = base_cost(operator) * max(1, estimated_rows / 100)
//   total_cost    = sum(operator_cost)
//   cost_score    = total_cost 구간별 1..10
//   risk_level    = total > 10000 high, > 5000 medium, 그 외 low
//                   (상한 없는 가변 길이 패턴 / CartesianProduct 는 high 로 상향)
//   time_ms       = clamp(total_cost * 0.1  + max_rows * 0.01,  1, 60000)
//   memory_mb     = clamp(total_cost * 0.01 + max_rows * 0.001, 1, 1000)
//
// 비용 단위는 상대값이며 실행 시간과 직접 대응하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string_view>

#include "plan/plan_types.hpp"

class CostEstimator {
public:
    [[nodiscard]] CostEstimate estimate(std::string_view query, const ExecutionPlan& plan) const;

    // 표에 없는 연산자는 50.
    [[nodiscard]] static int base_cost(std::string_view operator_type) noexcept;

    [[nodiscard]] static int cost_score(double total_cost) noexcept;

    [[nodiscard]] static std::int64_t estimate_time_ms(double total_cost, double rows) noexcept;
    [[nodiscard]] static std::int64_t estimate_memory_mb(double total_cost, double rows) noexcept;
};
