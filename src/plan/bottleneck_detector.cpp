#include "plan/bottleneck_detector.hpp"

#include <algorithm>
#include <regex>
#include <set>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/string_util.hpp"
#include "complexity/limit_injector.hpp"
#include "parser/text_shield.hpp"

namespace {

constexpr auto kRegexFlags = std::regex_constants::icase | std::regex_constants::ECMAScript;

std::string describe_operator(const FlatOperator& op) {
    for (const char* key : {"Details", "LabelName", "Procedure"}) {
        const auto it = op.arguments.find(key);
        if (it != op.arguments.end() && !it->second.empty()) {
            return fmt::format("{}({})", op.operator_type, it->second);
        }
    }
    return op.operator_type;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

// VarLengthExpand 인자에서 최대 홉 수 추출. 상한 없음/정보 없음은 nullopt.
std::optional<int> max_hops_of(const FlatOperator& op) {
    static const std::regex star_re(R"(\*\s*(\d*)\s*(\.\.\s*(\d*))?)", kRegexFlags);
    for (const auto& [key, value] : op.arguments) {
        std::smatch sm;
        if (!std::regex_search(value, sm, star_re)) {
            continue;
        }
        const std::string lower = sm[1].str();
        const std::string upper = sm[3].str();
        const bool has_range = sm[2].matched;
        const std::string& bound = has_range ? upper : lower;
        if (bound.empty() || bound.size() > 6) {
            return std::nullopt;
        }
        return std::stoi(bound);
    }
    return std::nullopt;
}

struct ProcedureRule {
    const char* pattern;
    const char* description;
};

constexpr ProcedureRule kExpensiveProcedures[] = {
    {R"(\bapoc\s*\.\s*path\s*\.)",     "APOC path procedures can be expensive on large graphs"},
    {R"(\bapoc\s*\.\s*algo\s*\.)",     "APOC algorithm procedures can be computationally intensive"},
    {R"(\bapoc\s*\.\s*periodic\s*\.)", "Periodic procedures run batch operations"},
    {R"((^|[^.\w])algo\s*\.)",         "Graph algorithm procedures can be expensive"},
    {R"(\bgds\s*\.)",                  "Graph data science procedures can be expensive"},
};

}  // namespace

BottleneckDetector::BottleneckDetector(PlanConfig config)
    : config_(config)
{}

int BottleneckDetector::default_severity(BottleneckType type) noexcept {
    switch (type) {
        case BottleneckType::kCartesianProduct:   return 9;
        case BottleneckType::kMissingIndex:       return 8;
        case BottleneckType::kUnboundedVarLength: return 7;
        case BottleneckType::kExpensiveProcedure: return 6;
        case BottleneckType::kInefficientPattern: return 5;
        case BottleneckType::kMissingLimit:       return 4;
        case BottleneckType::kRedundantOperation: return 3;
    }
    return 5;
}

std::vector<Bottleneck> BottleneckDetector::detect(const ExecutionPlan& plan, std::string_view query) const {
    std::vector<Bottleneck> found;
    detect_plan(plan, found);
    detect_query(query, found);

    std::vector<Bottleneck> unique;
    std::set<std::pair<BottleneckType, std::string>> seen;
    for (auto& b : found) {
        if (seen.emplace(b.type, b.location).second) {
            unique.push_back(std::move(b));
        }
    }
    std::stable_sort(unique.begin(), unique.end(),
                     [](const Bottleneck& a, const Bottleneck& b) { return a.severity > b.severity; });

    spdlog::debug("bottleneck_detector: {} bottlenecks", unique.size());
    return unique;
}

// ---------------------------------------------------------------------------
// detect_plan
// ---------------------------------------------------------------------------
void BottleneckDetector::detect_plan(const ExecutionPlan& plan, std::vector<Bottleneck>& out) const {
    const bool has_limit = std::any_of(plan.operators.begin(), plan.operators.end(), [](const FlatOperator& op) {
        return op.operator_type == "Limit" || op.operator_type == "Top" || op.operator_type == "PartialTop";
    });

    for (const auto& op : plan.operators) {
        const std::string& name = op.operator_type;
        const std::string location = describe_operator(op);

        if (name == "NodeByLabelScan" || name == "AllNodesScan") {
            out.push_back(Bottleneck{
                BottleneckType::kMissingIndex, default_severity(BottleneckType::kMissingIndex), name, location,
                fmt::format("{} without index ({:.0f} estimated rows)", location, op.estimated_rows),
                fmt::format("High: full scan of ~{:.0f} nodes", op.estimated_rows)});
        } else if (name == "CartesianProduct") {
            out.push_back(Bottleneck{
                BottleneckType::kCartesianProduct, default_severity(BottleneckType::kCartesianProduct), name, location,
                "Cartesian product detected in execution plan",
                fmt::format("Very high: estimated {:.0f} row combinations", op.estimated_rows)});
        } else if (starts_with(name, "VarLengthExpand")) {
            const std::optional<int> hops = max_hops_of(op);
            if (!hops || *hops > config_.max_hop_bound) {
                out.push_back(Bottleneck{
                    BottleneckType::kUnboundedVarLength, 7, name, location,
                    hops ? fmt::format("Variable-length expand up to {} hops exceeds bound {}", *hops, config_.max_hop_bound)
                         : std::string("Completely unbounded variable-length expand"),
                    "Very high: can explore the entire graph"});
            } else if (*hops > config_.max_hop_bound / 2) {
                out.push_back(Bottleneck{
                    BottleneckType::kUnboundedVarLength, 5, name, location,
                    fmt::format("Large variable-length bounds: up to {} hops", *hops),
                    "Medium: path count grows exponentially with hop count"});
            }
        } else if (name == "Eager") {
            out.push_back(Bottleneck{
                BottleneckType::kInefficientPattern, default_severity(BottleneckType::kInefficientPattern), name, location,
                "Eager operator materializes all intermediate rows",
                "Medium: increases memory use and breaks streaming"});
        } else if (name == "Sort" && !has_limit) {
            out.push_back(Bottleneck{
                BottleneckType::kInefficientPattern, default_severity(BottleneckType::kInefficientPattern), name, location,
                "Sort without Limit sorts the full result set",
                "Medium: full sort instead of a bounded top-n"});
        } else if (name == "ProcedureCall") {
            for (const auto& rule : kExpensiveProcedures) {
                const std::regex re(rule.pattern, kRegexFlags);
                if (std::regex_search(location, re)) {
                    out.push_back(Bottleneck{
                        BottleneckType::kExpensiveProcedure, default_severity(BottleneckType::kExpensiveProcedure),
                        name, location, rule.description, "Variable: depends on data size and procedure"});
                    break;
                }
            }
        }

        if (!op.parent_type.empty() && op.parent_type == name &&
            (name == "Filter" || name == "Projection" || name == "Distinct" || name == "Sort")) {
            out.push_back(Bottleneck{
                BottleneckType::kRedundantOperation, default_severity(BottleneckType::kRedundantOperation), name,
                fmt::format("{}>{} at depth {}", name, name, op.depth),
                fmt::format("Consecutive {} operators", name),
                "Low: minor overhead"});
        }
    }
}

// ---------------------------------------------------------------------------
// detect_query
// ---------------------------------------------------------------------------
void BottleneckDetector::detect_query(std::string_view query, std::vector<Bottleneck>& out) const {
    const std::string shielded = shield_query(query).text;

    for (const auto& rule : kExpensiveProcedures) {
        const std::regex re(rule.pattern, kRegexFlags);
        std::smatch sm;
        if (std::regex_search(shielded, sm, re)) {
            out.push_back(Bottleneck{
                BottleneckType::kExpensiveProcedure, default_severity(BottleneckType::kExpensiveProcedure), "",
                std::string(trim(sm.str())), rule.description, "Variable: depends on data size and procedure"});
        }
    }

    if (has_projection(query) && !has_limit_clause(query) && !is_pure_aggregation(query)) {
        out.push_back(Bottleneck{
            BottleneckType::kMissingLimit, default_severity(BottleneckType::kMissingLimit), "", "RETURN clause",
            "Query with RETURN but no LIMIT clause",
            "Medium: can return large result sets"});
    }
}
