#include "plan/cost_estimator.hpp"

#include <algorithm>
#include <regex>
#include <utility>

#include "parser/text_shield.hpp"

namespace {

constexpr std::pair<std::string_view, int> kOperatorCosts[] = {
    {"NodeByLabelScan", 100},
    {"AllNodesScan", 100},
    {"NodeIndexSeek", 10},
    {"NodeIndexScan", 50},
    {"NodeUniqueIndexSeek", 5},
    {"ExpandAll", 80},
    {"ExpandInto", 40},
    {"VarLengthExpand", 200},
    {"NodeHashJoin", 150},
    {"NodeNestedLoopJoin", 300},
    {"CartesianProduct", 1000},
    {"Filter", 20},
    {"Projection", 15},
    {"Sort", 60},
    {"Limit", 5},
    {"Skip", 10},
    {"Aggregation", 70},
    {"Distinct", 50},
    {"EagerAggregation", 90},
    {"Apply", 120},
    {"SemiApply", 100},
    {"AntiSemiApply", 100},
    {"LetSemiApply", 110},
    {"LetAntiSemiApply", 110},
};

constexpr int kDefaultOperatorCost = 50;

}  // namespace

int CostEstimator::base_cost(std::string_view operator_type) noexcept {
    // VarLengthExpand(All), VarLengthExpand(Pruning) 등 변형은 접두어로 매칭
    if (operator_type.substr(0, 15) == "VarLengthExpand") {
        return 200;
    }
    for (const auto& [name, cost] : kOperatorCosts) {
        if (name == operator_type) {
            return cost;
        }
    }
    return kDefaultOperatorCost;
}

int CostEstimator::cost_score(double total_cost) noexcept {
    constexpr std::pair<double, int> kBands[] = {
        {100, 1}, {500, 2}, {1000, 3}, {2000, 4}, {5000, 5},
        {8000, 6}, {12000, 7}, {20000, 8}, {30000, 9},
    };
    for (const auto& [upper, score] : kBands) {
        if (total_cost < upper) {
            return score;
        }
    }
    return 10;
}

std::int64_t CostEstimator::estimate_time_ms(double total_cost, double rows) noexcept {
    const auto ms = static_cast<std::int64_t>(total_cost * 0.1 + rows * 0.01);
    return std::clamp<std::int64_t>(ms, 1, 60000);
}

std::int64_t CostEstimator::estimate_memory_mb(double total_cost, double rows) noexcept {
    const auto mb = static_cast<std::int64_t>(total_cost * 0.01 + rows * 0.001);
    return std::clamp<std::int64_t>(mb, 1, 1000);
}

CostEstimate CostEstimator::estimate(std::string_view query, const ExecutionPlan& plan) const {
    CostEstimate est;

    double total = 0.0;
    double max_rows = 0.0;
    bool has_cartesian = false;
    for (const auto& op : plan.operators) {
        total += base_cost(op.operator_type) * std::max(1.0, op.estimated_rows / 100.0);
        max_rows = std::max(max_rows, op.estimated_rows);
        has_cartesian = has_cartesian || op.operator_type == "CartesianProduct";
    }

    est.total_cost     = static_cast<std::int64_t>(total);
    est.cost_score     = cost_score(total);
    est.estimated_rows = max_rows;
    est.estimated_time_ms   = estimate_time_ms(total, max_rows);
    est.estimated_memory_mb = estimate_memory_mb(total, max_rows);

    if (total > 10000) {
        est.risk_level = "high";
        est.risk_factors.emplace_back("Very high estimated cost");
    } else if (total > 5000) {
        est.risk_level = "medium";
        est.risk_factors.emplace_back("High estimated cost");
    }

    static const std::regex unbounded_re(R"(\[[^\]]*\*\s*\])");
    if (std::regex_search(shield_query(query).text, unbounded_re)) {
        est.risk_level = "high";
        est.risk_factors.emplace_back("Unbounded variable-length pattern");
    }
    if (has_cartesian) {
        est.risk_level = "high";
        est.risk_factors.emplace_back("Cartesian product in plan");
    }

    if (plan.operators.size() > 5) {
        est.confidence = "high";
    } else if (plan.operators.size() > 2) {
        est.confidence = "medium";
    }
    return est;
}
