#include "plan/recommendation_engine.hpp"

#include <algorithm>
#include <regex>

#include <fmt/format.h>

namespace {

int priority_score(const std::string& priority) {
    if (priority == "high") {
        return 3;
    }
    return priority == "low" ? 1 : 2;
}

std::string adjust_priority(const std::string& base, int severity) {
    if (severity >= 8) {
        return "high";
    }
    if (severity >= 6 && base == "low") {
        return "medium";
    }
    return base;
}

// "NodeByLabelScan(n:Person)" → "Person"
std::string label_of(const std::string& location) {
    static const std::regex label_re(R"(:\s*`?([A-Za-z_]\w*))");
    std::smatch sm;
    if (std::regex_search(location, sm, label_re)) {
        return sm[1].str();
    }
    return "Label";
}

}  // namespace

Recommendation RecommendationEngine::recommend(const Bottleneck& b) const {
    Recommendation r;
    r.severity   = b.severity;
    r.bottleneck = b.type;
    r.location   = b.location;

    std::string base_priority = "medium";

    switch (b.type) {
        case BottleneckType::kMissingIndex:
            base_priority         = "high";
            r.title               = "Create index on frequently queried property";
            r.category            = "indexing";
            r.effort              = "low";
            r.description         = "Add an index so lookups use an index seek instead of a full scan";
            r.example_remediation = fmt::format("CREATE INDEX index_name FOR (n:{}) ON (n.property)", label_of(b.location));
            r.expected_impact     = "high: index seek replaces full label scan";
            break;

        case BottleneckType::kCartesianProduct:
            base_priority         = "high";
            r.title               = "Break complex MATCH into smaller parts";
            r.category            = "query_structure";
            r.effort              = "medium";
            r.description         = "Connect the disjoint patterns with a relationship or a join predicate";
            r.example_remediation = "Instead of: MATCH (a), (b) RETURN a, b\n"
                                    "Use: MATCH (a)-[:REL]->(b) RETURN a, b or MATCH (a) WITH a MATCH (b) WHERE b.key = a.key ...";
            r.expected_impact     = "high: removes multiplicative row growth";
            break;

        case BottleneckType::kUnboundedVarLength:
            base_priority         = "high";
            r.title               = "Add reasonable bounds to variable-length pattern";
            r.category            = "pattern_optimization";
            r.effort              = "low";
            r.description         = "Unbounded or large hop ranges can explore the entire graph";
            r.example_remediation = "Instead of: (a)-[*]->(b)\nUse: (a)-[*1..4]->(b) or shortestPath((a)-[*]->(b))";
            r.expected_impact     = "high: bounds path enumeration";
            break;

        case BottleneckType::kExpensiveProcedure:
            r.category = "procedure_optimization";
            r.effort   = "medium";
            if (b.location.find("path") != std::string::npos || b.description.find("path") != std::string::npos) {
                r.title               = "Consider alternatives to APOC path procedures";
                r.description         = "Native Cypher patterns are often faster than path expander procedures";
                r.example_remediation = "Instead of: apoc.path.expand()\nUse: (a)-[*1..3]->(b) pattern";
                r.expected_impact     = "medium: planner can optimize native patterns";
            } else {
                r.title               = "Use graph algorithms on appropriately sized subgraphs";
                r.description         = "Restrict the input of expensive procedures to the relevant nodes";
                r.example_remediation = "MATCH (n:Label {category: 'specific'}) WITH collect(n) AS nodes CALL ... YIELD ...";
                r.expected_impact     = "high: smaller procedure input";
            }
            break;

        case BottleneckType::kInefficientPattern:
            r.category = "operation_optimization";
            r.effort   = "medium";
            if (b.operator_type == "Sort") {
                r.title               = "Add LIMIT after ORDER BY";
                r.description         = "A bounded sort lets the planner use a top-n operator";
                r.example_remediation = "ORDER BY n.name LIMIT 100";
                r.effort              = "low";
            } else {
                r.title               = "Avoid Eager materialization";
                r.description         = "Restructure the query so reads and projections can stream";
                r.example_remediation = "Split the query with WITH and aggregate before expanding further";
            }
            r.expected_impact = "medium: lower memory use";
            break;

        case BottleneckType::kMissingLimit:
            r.title               = "Add LIMIT clause to control result set size";
            r.category            = "result_optimization";
            r.effort              = "low";
            r.description         = "LIMIT prevents excessive memory use and improves response time";
            r.example_remediation = "RETURN n LIMIT 100";
            r.expected_impact     = "medium: bounded result size";
            break;

        case BottleneckType::kRedundantOperation:
            base_priority         = "low";
            r.title               = "Remove redundant operations";
            r.category            = "operation_optimization";
            r.effort              = "low";
            r.description         = fmt::format("Merge the consecutive {} steps", b.operator_type);
            r.example_remediation = "Combine predicates into one WHERE clause and compute values once with WITH";
            r.expected_impact     = "low: minor CPU savings";
            break;
    }

    r.priority = adjust_priority(base_priority, b.severity);
    return r;
}

std::vector<Recommendation> RecommendationEngine::generate(const std::vector<Bottleneck>& bottlenecks) const {
    std::vector<Recommendation> out;
    out.reserve(bottlenecks.size());
    for (const auto& b : bottlenecks) {
        out.push_back(recommend(b));
    }

    const auto impact_score = [](const Recommendation& r) {
        return priority_score(r.expected_impact.substr(0, r.expected_impact.find(':')));
    };
    std::stable_sort(out.begin(), out.end(), [&](const Recommendation& a, const Recommendation& b) {
        const int pa = priority_score(a.priority);
        const int pb = priority_score(b.priority);
        if (pa != pb) {
            return pa > pb;
        }
        return impact_score(a) > impact_score(b);
    });
    return out;
}
