#pragma once

// ---------------------------------------------------------------------------
// bottleneck_detector.hpp
//
// 평탄화된 실행 계획(+ 쿼리 원문)에서 성능 병목을 찾는다.
//
// [계획 기반 규칙]
//   NodeByLabelScan / AllNodesScan      → missing_index (8)
//   CartesianProduct                     → cartesian_product (9)
//   VarLengthExpand*  상한 없음 / > max_hop_bound   → unbounded_varlength (7)
//                     > max_hop_bound / 2          → unbounded_varlength (5)
//   Eager, Limit/Top 없는 Sort           → inefficient_pattern (5)
//   같은 종류 연산자의 부모-자식 연속 (Filter→Filter 등) → redundant_operation (3)
//   ProcedureCall 의 경로/알고리즘 프로시저 → expensive_procedure (6)
// [쿼리 기반 규칙] (리터럴/주석 제거 후)
//   apoc.path. / apoc.algo. / algo. / gds. / apoc.periodic.  → expensive_procedure (6)
//   LIMIT 없는 투영 (순수 집계 제외)                          → missing_limit (4)
//
// 결과는 (type, location) 으로 중복 제거 후 심각도 내림차순 정렬 (동률은 발견 순서).
// ---------------------------------------------------------------------------

#include <string_view>
#include <vector>

#include "config/gate_config.hpp"
#include "plan/plan_types.hpp"

class BottleneckDetector {
public:
    explicit BottleneckDetector(PlanConfig config = {});

    [[nodiscard]] std::vector<Bottleneck> detect(const ExecutionPlan& plan, std::string_view query) const;

    [[nodiscard]] static int default_severity(BottleneckType type) noexcept;

private:
    void detect_plan(const ExecutionPlan& plan, std::vector<Bottleneck>& out) const;
    void detect_query(std::string_view query, std::vector<Bottleneck>& out) const;

    PlanConfig config_;
};
