#pragma once

// ---------------------------------------------------------------------------
// recommendation_engine.hpp
//
// 병목마다 구체적인 개선 예시를 가진 Recommendation 하나를 만든다.
//
// [우선순위] 규칙 기본값에서 시작해 심각도로만 올린다 (내리지 않음).
//   severity >= 8 → high,  severity >= 6 이고 기본값 low → medium
// [정렬] priority, expected impact 내림차순. 동률은 입력 순서 유지.
// ---------------------------------------------------------------------------

#include <vector>

#include "plan/plan_types.hpp"

class RecommendationEngine {
public:
    [[nodiscard]] std::vector<Recommendation> generate(const std::vector<Bottleneck>& bottlenecks) const;

    [[nodiscard]] Recommendation recommend(const Bottleneck& bottleneck) const;
};
