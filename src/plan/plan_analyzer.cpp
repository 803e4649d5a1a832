// ---------------------------------------------------------------------------
// plan_analyzer.cpp
// ---------------------------------------------------------------------------

#include "plan/plan_analyzer.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/string_util.hpp"

namespace {

void flatten_into(const PlanNode& node, int depth, const std::string& parent_type,
                  PlanMode mode, ExecutionPlan& plan) {
    FlatOperator op;
    op.operator_type  = node.operator_type;
    op.depth          = depth;
    op.estimated_rows = node.estimated_rows;
    op.arguments      = node.arguments;
    op.parent_type    = parent_type;

    plan.total_estimated_rows += node.estimated_rows;

    if (mode == PlanMode::kProfile) {
        op.work_units   = node.db_hits.value_or(0);
        op.rows         = node.rows;
        op.time_ms      = node.time_ms;
        op.memory_bytes = node.memory_bytes;

        plan.total_db_hits      += node.db_hits.value_or(0);
        plan.total_rows         += node.rows.value_or(0);
        plan.total_time_ms      += node.time_ms.value_or(0.0);
        plan.total_memory_bytes += node.memory_bytes.value_or(0);
        if (node.db_hits || node.rows || node.time_ms || node.memory_bytes) {
            plan.has_runtime_stats = true;
        }
    }

    plan.operators.push_back(std::move(op));
    for (const auto& child : node.children) {
        flatten_into(child, depth + 1, node.operator_type, mode, plan);
    }
}

// EXPLAIN/PROFILE 를 이미 붙인 쿼리는 이중 접두어가 되므로 거부한다.
bool has_plan_prefix(std::string_view query) {
    static const std::regex prefix_re(R"(^\s*(EXPLAIN|PROFILE)\b)",
                                      std::regex_constants::icase | std::regex_constants::ECMAScript);
    const std::string s(query);
    return std::regex_search(s, prefix_re);
}

}  // namespace

ExecutionPlan flatten_plan(const PlanNode& root, PlanMode mode) {
    ExecutionPlan plan;
    plan.mode = mode;
    flatten_into(root, 0, std::string{}, mode, plan);
    return plan;
}

AnalysisSummary summarize(const std::vector<Bottleneck>&     bottlenecks,
                          const std::vector<Recommendation>& recommendations,
                          const CostEstimate&                cost) {
    AnalysisSummary summary;
    summary.bottleneck_count     = bottlenecks.size();
    summary.recommendation_count = recommendations.size();
    summary.estimated_cost       = cost.total_cost;

    if (bottlenecks.empty()) {
        return summary;
    }

    double sum = 0.0;
    for (const auto& b : bottlenecks) {
        sum += b.severity;
        if (b.severity >= 8) {
            ++summary.critical_issues;
        }
    }
    const double average = sum / static_cast<double>(bottlenecks.size());

    summary.overall_severity = std::min(10, static_cast<int>(average));
    if (average >= 7.0) {
        summary.estimated_impact = "high";
    } else if (average >= 4.0) {
        summary.estimated_impact = "medium";
    }
    return summary;
}

std::string format_report(const AnalysisResult& result) {
    std::ostringstream out;
    out << "Query Performance Analysis Report\n"
        << "=================================\n\n"
        << "Query: " << result.query << '\n'
        << "Mode: " << plan_mode_name(result.mode) << '\n'
        << "Overall Severity: " << result.summary.overall_severity << "/10\n"
        << "Estimated Impact: " << result.summary.estimated_impact << '\n'
        << "Cost Score: " << result.cost.cost_score << "/10 (risk " << result.cost.risk_level << ")\n"
        << "Estimated Time: " << result.cost.estimated_time_ms << " ms, Memory: "
        << result.cost.estimated_memory_mb << " MB\n"
        << "Operators: " << result.plan.operators.size() << '\n';

    if (result.plan.has_runtime_stats) {
        out << fmt::format("Runtime: {} db hits, {} rows, {:.1f} ms, {} bytes\n",
                           result.plan.total_db_hits, result.plan.total_rows,
                           result.plan.total_time_ms, result.plan.total_memory_bytes);
    }

    out << "\nBottlenecks Detected: " << result.bottlenecks.size() << '\n';
    int i = 1;
    for (const auto& b : result.bottlenecks) {
        out << i++ << ". " << bottleneck_type_name(b.type) << ": " << b.description << '\n'
            << "   Severity: " << b.severity << "/10\n";
        if (!b.impact.empty()) {
            out << "   Impact: " << b.impact << '\n';
        }
    }

    out << "\nRecommendations: " << result.recommendations.size() << '\n';
    i = 1;
    for (const auto& r : result.recommendations) {
        out << i++ << ". " << r.title << " [" << r.priority << "]\n"
            << "   " << r.description << '\n'
            << "   Example: " << r.example_remediation << '\n';
    }

    std::string report = out.str();
    while (!report.empty() && report.back() == '\n') {
        report.pop_back();
    }
    return report;
}

PlanAnalyzer::PlanAnalyzer(GraphDriver& driver, PlanConfig config)
    : driver_(driver)
    , config_(config)
    , bottleneck_detector_(config)
{}

// ---------------------------------------------------------------------------
// analyze
//   1. 입력 검사 (빈 쿼리, 이중 접두어)
//   2. PROFILE 쓰기 안전장치
//   3. 드라이버 호출 → consume() 로 요약만 수신
//   4. 평탄화 → 병목 → 추천 → 비용 → 요약
// ---------------------------------------------------------------------------
std::expected<AnalysisResult, GateError> PlanAnalyzer::analyze(std::string_view    query,
                                                               const ParameterMap& params,
                                                               PlanMode            mode,
                                                               bool                allow_write_queries) const {
    const std::string_view trimmed = trim(query);
    if (trimmed.empty()) {
        return std::unexpected(GateError{ErrorKind::kValidation, "Empty query not allowed", {}, std::nullopt});
    }
    if (has_plan_prefix(trimmed)) {
        return std::unexpected(GateError{
            ErrorKind::kValidation, "Query must not start with EXPLAIN or PROFILE", {}, std::nullopt});
    }

    if (mode == PlanMode::kProfile && !allow_write_queries) {
        const WriteDetection write = write_detector_.detect(trimmed);
        if (write.detected) {
            spdlog::warn("plan_analyzer: PROFILE blocked, write operation {}", write.keyword);
            return std::unexpected(GateError{
                ErrorKind::kWriteBlocked,
                fmt::format("PROFILE executes the query; write operation {} is not allowed "
                            "without allow_write_queries", write.keyword),
                {}, std::nullopt});
        }
    }

    const std::string prefixed = fmt::format("{} {}", plan_mode_name(mode), trimmed);

    PlanSummary summary;
    try {
        std::unique_ptr<ResultHandle> handle = driver_.run(prefixed, params);
        if (!handle) {
            return std::unexpected(GateError{
                ErrorKind::kEngine, "Plan retrieval failed", "driver returned no result handle", std::nullopt});
        }
        summary = handle->consume();
    } catch (const std::exception& e) {
        spdlog::error("plan_analyzer: {} failed: {}", plan_mode_name(mode), e.what());
        return std::unexpected(GateError{ErrorKind::kEngine, "Plan retrieval failed", e.what(), std::nullopt});
    }

    if (!summary.plan) {
        return std::unexpected(GateError{
            ErrorKind::kEngine, "Engine returned no execution plan", {}, std::nullopt});
    }

    AnalysisResult result;
    result.query           = std::string(trimmed);
    result.mode            = mode;
    result.plan            = flatten_plan(*summary.plan, mode);
    result.bottlenecks     = bottleneck_detector_.detect(result.plan, trimmed);
    result.recommendations = recommendation_engine_.generate(result.bottlenecks);
    result.cost            = cost_estimator_.estimate(trimmed, result.plan);
    result.summary         = summarize(result.bottlenecks, result.recommendations, result.cost);

    spdlog::info("plan_analyzer: {} analyzed, {} operators, {} bottlenecks, cost_score={}",
                 plan_mode_name(mode), result.plan.operators.size(),
                 result.bottlenecks.size(), result.cost.cost_score);
    return result;
}
