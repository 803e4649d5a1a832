// ---------------------------------------------------------------------------
// complexity_analyzer.cpp
//
// 모든 패턴은 TextShield::shield_query() 결과에 적용한다 (리터럴 내 'MATCH' 오탐 방지).
//
// [Cartesian product 판정]
// 최상위 절을 WITH / RETURN / UNION 경계로 나눈 "세그먼트" 단위로:
//   1. (OPTIONAL 이 아닌) MATCH 절의 패턴을 최상위 ',' 로 분할 → 패턴 조각
//   2. 조각마다 노드/관계/경로 변수 수집
//   3. 변수를 공유하는 조각끼리 union-find 로 연결
//   4. WHERE 의 AND/OR 항 중 서로 다른 조각의 변수를 함께 참조하는 항(조인 술어)도 연결
//   5. 이전 WITH 에서 넘어온 식별자 변수는 별도 노드로 취급
// 연결 요소가 k 개이면 k-1 개의 cartesian product 로 계산한다.
//
// [알려진 한계]
// - WITH count(a) AS c 처럼 식으로 투영된 값은 넘어온 변수로 보지 않는다.
// - 속성 맵 안의 함수 인자 (n {id: toInteger(x)}) 는 변수로 오인될 수 있다.
// ---------------------------------------------------------------------------

#include "complexity/complexity_analyzer.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <regex>
#include <set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/string_util.hpp"
#include "complexity/clause_scanner.hpp"
#include "parser/text_shield.hpp"

namespace {

constexpr auto kRegexFlags = std::regex_constants::icase | std::regex_constants::ECMAScript;

std::size_t count_matches(const std::string& text, const std::regex& re) {
    return static_cast<std::size_t>(
        std::distance(std::sregex_iterator(text.begin(), text.end(), re), std::sregex_iterator()));
}

std::size_t count_keyword(const std::vector<ClauseKeyword>& keywords, std::string_view kw) {
    return static_cast<std::size_t>(std::count_if(
        keywords.begin(), keywords.end(), [kw](const ClauseKeyword& k) { return k.keyword == kw; }));
}

int capped(std::size_t count, int weight, int cap) {
    const long long raw = static_cast<long long>(count) * weight;
    return static_cast<int>(std::min<long long>(raw, cap));
}

// 홉 수 문자열 → 정수. 비정상적으로 긴 숫자는 사실상 무제한으로 본다.
int parse_hops(const std::string& digits) {
    if (digits.size() > 6) {
        return 1000000;
    }
    return std::stoi(digits);
}

// ---------------------------------------------------------------------------
// 가변 길이 관계
// ---------------------------------------------------------------------------
struct VarLengthHit {
    std::string        text;
    std::optional<int> max_hops;  // nullopt = 무제한
};

std::vector<VarLengthHit> find_variable_length(const std::string& text) {
    static const std::regex rel_re(R"(-\s*\[([^\[\]]*)\])", kRegexFlags);
    static const std::regex star_re(R"(\*\s*(\d*)\s*(\.\.\s*(\d*))?)", kRegexFlags);

    std::vector<VarLengthHit> hits;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), rel_re); it != std::sregex_iterator(); ++it) {
        const std::string content = (*it)[1].str();
        std::smatch sm;
        if (!std::regex_search(content, sm, star_re)) {
            continue;
        }

        VarLengthHit hit{"[" + content + "]", std::nullopt};
        const std::string lower = sm[1].str();
        const bool has_range    = sm[2].matched;
        const std::string upper = sm[3].str();

        if (!has_range && !lower.empty()) {
            hit.max_hops = parse_hops(lower);
        } else if (has_range && !upper.empty()) {
            hit.max_hops = parse_hops(upper);
        }
        hits.push_back(std::move(hit));
    }
    return hits;
}

// ---------------------------------------------------------------------------
// Cartesian product
// ---------------------------------------------------------------------------
struct PatternPart {
    std::string           text;
    std::set<std::string> vars;
};

std::set<std::string> identifiers_in(std::string_view text) {
    static const std::regex ident_re(R"([A-Za-z_]\w*)", kRegexFlags);
    std::set<std::string> out;
    const std::string s(text);
    for (auto it = std::sregex_iterator(s.begin(), s.end(), ident_re); it != std::sregex_iterator(); ++it) {
        out.insert(it->str());
    }
    return out;
}

std::set<std::string> pattern_variables(const std::string& part) {
    static const std::regex node_re(R"(\(\s*([A-Za-z_]\w*))", kRegexFlags);
    static const std::regex rel_re(R"(\[\s*([A-Za-z_]\w*))", kRegexFlags);
    static const std::regex path_re(R"(^\s*([A-Za-z_]\w*)\s*=)", kRegexFlags);

    std::set<std::string> vars;
    for (const auto* re : {&node_re, &rel_re}) {
        for (auto it = std::sregex_iterator(part.begin(), part.end(), *re); it != std::sregex_iterator(); ++it) {
            vars.insert((*it)[1].str());
        }
    }
    std::smatch sm;
    if (std::regex_search(part, sm, path_re)) {
        vars.insert(sm[1].str());
    }
    return vars;
}

// text[begin, end) 를 최상위 구분자 sep 로 분할. top 은 같은 길이의 최상위 뷰.
std::vector<std::string> split_top_level(const std::string& text, const std::string& top,
                                         std::size_t begin, std::size_t end, char sep) {
    std::vector<std::string> out;
    std::size_t start = begin;
    for (std::size_t i = begin; i <= end; ++i) {
        if (i == end || top[i] == sep) {
            const std::string piece(trim(std::string_view(text).substr(start, i - start)));
            if (!piece.empty()) {
                out.push_back(piece);
            }
            start = i + 1;
        }
    }
    return out;
}

std::vector<std::string> split_conjuncts(const std::string& where_body) {
    static const std::regex bool_op_re(R"(\b(AND|OR|XOR)\b)", kRegexFlags);
    std::vector<std::string> out;
    std::sregex_token_iterator it(where_body.begin(), where_body.end(), bool_op_re, -1);
    for (; it != std::sregex_token_iterator(); ++it) {
        const std::string piece(trim(it->str()));
        if (!piece.empty()) {
            out.push_back(piece);
        }
    }
    return out;
}

// WITH 항목 중 식별자 그대로 (또는 식별자 AS 별칭) 투영된 변수.
std::set<std::string> projected_identifiers(const std::vector<std::string>& items,
                                            const std::set<std::string>& scope) {
    static const std::regex plain_re(
        R"(^(DISTINCT\s+)?([A-Za-z_]\w*)(\s+AS\s+([A-Za-z_]\w*))?$)", kRegexFlags);
    std::set<std::string> out;
    for (const auto& item : items) {
        if (item == "*") {
            out.insert(scope.begin(), scope.end());
            continue;
        }
        std::smatch sm;
        if (std::regex_match(item, sm, plain_re)) {
            out.insert(sm[4].matched ? sm[4].str() : sm[2].str());
        }
    }
    return out;
}

class DisjointSet {
public:
    explicit DisjointSet(std::size_t n) : parent_(n) { std::iota(parent_.begin(), parent_.end(), 0); }

    std::size_t find(std::size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(std::size_t a, std::size_t b) { parent_[find(a)] = find(b); }

private:
    std::vector<std::size_t> parent_;
};

struct CartesianFinding {
    std::size_t              extra_components{0};
    std::vector<std::string> descriptions;
};

bool intersects(const std::set<std::string>& a, const std::set<std::string>& b) {
    return std::any_of(a.begin(), a.end(), [&b](const std::string& v) { return b.count(v) > 0; });
}

void evaluate_segment(const std::vector<PatternPart>& parts,
                      const std::vector<std::string>& conjuncts,
                      const std::set<std::string>& imported,
                      CartesianFinding& finding) {
    if (parts.empty()) {
        return;
    }

    const bool has_imported = !imported.empty();
    const std::size_t n = parts.size() + (has_imported ? 1 : 0);
    const std::size_t imported_node = parts.size();
    DisjointSet ds(n);

    for (std::size_t i = 0; i < parts.size(); ++i) {
        for (std::size_t j = i + 1; j < parts.size(); ++j) {
            if (intersects(parts[i].vars, parts[j].vars)) {
                ds.unite(i, j);
            }
        }
        if (has_imported && intersects(parts[i].vars, imported)) {
            ds.unite(i, imported_node);
        }
    }

    for (const auto& conjunct : conjuncts) {
        const std::set<std::string> refs = identifiers_in(conjunct);
        std::vector<std::size_t> referenced;
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (intersects(parts[i].vars, refs)) {
                referenced.push_back(i);
            }
        }
        if (has_imported && intersects(imported, refs)) {
            referenced.push_back(imported_node);
        }
        for (std::size_t k = 1; k < referenced.size(); ++k) {
            ds.unite(referenced[0], referenced[k]);
        }
    }

    std::set<std::size_t> roots;
    std::vector<std::string> representatives;
    for (std::size_t i = 0; i < n; ++i) {
        if (roots.insert(ds.find(i)).second) {
            representatives.push_back(i < parts.size() ? parts[i].text : "<previous WITH>");
        }
    }

    if (roots.size() > 1) {
        finding.extra_components += roots.size() - 1;
        std::string joined;
        for (const auto& r : representatives) {
            if (!joined.empty()) {
                joined += ", ";
            }
            joined += r;
        }
        finding.descriptions.push_back(
            fmt::format("Cartesian product between disconnected patterns: {}", joined));
    }
}

CartesianFinding find_cartesian_products(const std::string& shielded) {
    CartesianFinding finding;

    const std::string top = top_level_only(shielded);
    const std::vector<ClauseKeyword> keywords = scan_clauses(shielded, /*top_level=*/true);

    std::vector<PatternPart> parts;
    std::vector<std::string> conjuncts;
    std::set<std::string>    imported;
    std::set<std::string>    scope;

    for (std::size_t idx = 0; idx < keywords.size(); ++idx) {
        const ClauseKeyword& kw = keywords[idx];
        const std::size_t body_begin = kw.position + kw.keyword.size();
        const std::size_t body_end   = idx + 1 < keywords.size() ? keywords[idx + 1].position : shielded.size();

        if (kw.keyword == "MATCH") {
            const bool optional = idx > 0 && keywords[idx - 1].keyword == "OPTIONAL";
            for (auto& piece : split_top_level(shielded, top, body_begin, body_end, ',')) {
                PatternPart part{piece, pattern_variables(piece)};
                scope.insert(part.vars.begin(), part.vars.end());
                if (!optional) {
                    parts.push_back(std::move(part));
                }
            }
        } else if (kw.keyword == "WHERE") {
            const std::string body = shielded.substr(body_begin, body_end - body_begin);
            for (auto& c : split_conjuncts(body)) {
                conjuncts.push_back(std::move(c));
            }
        } else if (kw.keyword == "WITH" || kw.keyword == "RETURN" || kw.keyword == "UNION") {
            evaluate_segment(parts, conjuncts, imported, finding);
            parts.clear();
            conjuncts.clear();

            if (kw.keyword == "WITH") {
                imported = projected_identifiers(
                    split_top_level(shielded, top, body_begin, body_end, ','), scope);
                scope = imported;
            } else {
                imported.clear();
                scope.clear();
            }
        }
    }
    evaluate_segment(parts, conjuncts, imported, finding);
    return finding;
}

}  // namespace

std::string_view risk_level_name(RiskLevel level) noexcept {
    switch (level) {
        case RiskLevel::kSafe:     return "SAFE";
        case RiskLevel::kModerate: return "MODERATE";
        case RiskLevel::kHigh:     return "HIGH";
        case RiskLevel::kCritical: return "CRITICAL";
    }
    return "CRITICAL";
}

ComplexityAnalyzer::ComplexityAnalyzer(ComplexityConfig config, LimitConfig limits)
    : config_(std::move(config))
    , limits_(limits)
{}

RiskLevel ComplexityAnalyzer::risk_for(int total) const noexcept {
    if (total >= config_.critical_threshold) {
        return RiskLevel::kCritical;
    }
    if (total >= config_.high_threshold) {
        return RiskLevel::kHigh;
    }
    if (total >= config_.moderate_threshold) {
        return RiskLevel::kModerate;
    }
    return RiskLevel::kSafe;
}

ComplexityScore ComplexityAnalyzer::score(std::string_view query) const {
    return score_with_plan(query, {});
}

ComplexityScore ComplexityAnalyzer::score_with_plan(std::string_view query,
                                                    const std::vector<std::string>& plan_operators) const {
    const ComplexityWeights& w = config_.weights;
    const std::string shielded = shield_query(query).text;
    const std::vector<ClauseKeyword> all_keywords = scan_clauses(shielded, /*top_level=*/false);

    ComplexityScore result;
    std::vector<std::pair<std::string, int>> factors;

    // cartesian product
    const CartesianFinding cartesian = find_cartesian_products(shielded);
    factors.emplace_back("cartesian_product",
                         capped(cartesian.extra_components, w.cartesian_product, w.cartesian_cap));
    result.bottlenecks.insert(result.bottlenecks.end(),
                              cartesian.descriptions.begin(), cartesian.descriptions.end());

    // 가변 길이 관계
    long long varlength = 0;
    for (const auto& hit : find_variable_length(shielded)) {
        if (!hit.max_hops) {
            varlength += w.varlength_unbounded;
            result.bottlenecks.push_back(fmt::format("Unbounded variable-length path: {}", hit.text));
        } else if (*hit.max_hops > config_.max_variable_path_length) {
            varlength += w.varlength_excessive;
            result.bottlenecks.push_back(fmt::format(
                "Variable-length path exceeds {} hops: {}", config_.max_variable_path_length, hit.text));
        } else if (*hit.max_hops > 3) {
            varlength += w.varlength_long;
        } else {
            varlength += w.varlength_short;
        }
    }
    factors.emplace_back("variable_length_paths",
                         static_cast<int>(std::min<long long>(varlength, w.varlength_cap)));

    // 플랜 기반 인덱스 누락
    std::size_t scans = 0;
    for (const auto& op : plan_operators) {
        if (op == "NodeByLabelScan" || op == "AllNodesScan") {
            ++scans;
            result.bottlenecks.push_back(fmt::format("Full scan without index: {}", op));
        }
    }
    factors.emplace_back("missing_index", capped(scans, w.missing_index, w.missing_index_cap));

    // 절 개수
    static const std::regex subquery_re(R"(\b(CALL|EXISTS|COUNT|COLLECT)\s*\{)", kRegexFlags);
    static const std::regex aggregate_re(
        R"((^|[^.\w])(count|sum|avg|min|max|collect|stdev|stdevp|percentileCont|percentileDisc)\s*\()",
        kRegexFlags);

    factors.emplace_back("match_clauses",
                         capped(count_keyword(all_keywords, "MATCH"), w.match_clause, w.match_cap));
    factors.emplace_back("subqueries",
                         capped(count_matches(shielded, subquery_re), w.subquery, w.subquery_cap));
    factors.emplace_back("unions",
                         capped(count_keyword(all_keywords, "UNION"), w.union_clause, w.union_cap));
    factors.emplace_back("optional_matches",
                         capped(count_keyword(all_keywords, "OPTIONAL"), w.optional_match, w.optional_match_cap));
    factors.emplace_back("with_clauses",
                         capped(count_keyword(all_keywords, "WITH"), w.with_clause, w.with_cap));
    factors.emplace_back("aggregations",
                         capped(count_matches(shielded, aggregate_re), w.aggregation, w.aggregation_cap));

    // LIMIT 누락
    const bool missing_limit =
        has_projection(query) && !has_limit_clause(query) && !is_pure_aggregation(query);
    if (missing_limit) {
        result.bottlenecks.emplace_back("Missing LIMIT on a projected result");
    }
    factors.emplace_back("missing_limit", missing_limit ? w.missing_limit : 0);

    // 합산 + clamp: 앞선 요인부터 남은 여유만큼만 반영하여 sum(breakdown) == total 유지
    int running = 0;
    for (const auto& [name, value] : factors) {
        const int contribution = std::clamp(value, 0, kMaxComplexityScore - running);
        if (contribution > 0) {
            result.breakdown[name] = contribution;
            running += contribution;
        }
    }
    result.total      = running;
    result.risk_level = risk_for(running);
    return result;
}

ComplexityReport ComplexityAnalyzer::score_and_maybe_rewrite(std::string_view query) const {
    ComplexityReport report;
    report.query = std::string(query);

    if (config_.enabled) {
        report.score = score(query);
        const ComplexityScore& s = report.score;

        std::string contributors;
        for (const auto& b : s.bottlenecks) {
            contributors += contributors.empty() ? b : "; " + b;
        }
        if (contributors.empty()) {
            for (const auto& [name, value] : s.breakdown) {
                contributors += fmt::format("{}{}={}", contributors.empty() ? "" : ", ", name, value);
            }
        }

        if (s.total > config_.max_complexity) {
            const std::string message = fmt::format(
                "Query complexity score {} exceeds maximum allowed {} (risk {}). Bottlenecks: {}",
                s.total, config_.max_complexity, risk_level_name(s.risk_level), contributors);
            if (config_.block_on_exceed) {
                report.blocked = true;
                report.error   = message;
                spdlog::info("complexity_analyzer: blocked query (score={})", s.total);
                return report;
            }
            report.warnings.push_back(message);
        } else if (s.risk_level >= RiskLevel::kHigh) {
            report.warnings.push_back(fmt::format(
                "Query complexity risk {} (score {}): {}", risk_level_name(s.risk_level), s.total, contributors));
        }
    }

    if (limits_.auto_inject) {
        LimitInjection injection = ::maybe_inject_limit(query, limits_.max_rows);
        if (injection.was_injected) {
            report.query        = std::move(injection.query);
            report.was_injected = true;
            if (injection.warning) {
                report.warnings.push_back(std::move(*injection.warning));
            }
        }
    }
    return report;
}
