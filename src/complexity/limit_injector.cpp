// ---------------------------------------------------------------------------
// limit_injector.cpp
//
// 마스킹된 텍스트(원문과 같은 길이)를 괄호 깊이 기준으로 한 번 더 덮어
// "최상위 뷰" 를 만든 뒤, 절 키워드 위치를 수집하여 판정한다.
// 원문과 인덱스가 정렬되어 있으므로 삽입 위치를 그대로 원문에 적용할 수 있다.
// ---------------------------------------------------------------------------

#include "complexity/limit_injector.hpp"

#include <regex>
#include <vector>

#include <fmt/format.h>

#include "common/string_util.hpp"
#include "complexity/clause_scanner.hpp"
#include "parser/text_shield.hpp"

namespace {

struct TopLevelView {
    std::string                masked;    // mask_query 결과
    std::string                top;       // 괄호 안쪽까지 덮은 결과
    std::vector<ClauseKeyword> keywords;  // 최상위 절 키워드
    bool                       unterminated{false};
};

TopLevelView build_view(std::string_view query) {
    TopLevelView view;
    ShieldedText masked = mask_query(query);
    view.unterminated = masked.unterminated_literal || masked.unterminated_comment;
    view.masked = std::move(masked.text);
    view.top = top_level_only(view.masked);

    view.keywords = scan_clauses(view.masked, /*top_level_only=*/true);
    return view;
}

bool view_has_limit(const TopLevelView& view) {
    static const std::regex re(R"((^|[^.:$\w`])LIMIT\s+[^\s;])",
                               std::regex_constants::icase | std::regex_constants::ECMAScript);
    return std::regex_search(view.top, re);
}

bool view_has_keyword(const TopLevelView& view, std::string_view kw) {
    for (const auto& k : view.keywords) {
        if (k.keyword == kw) {
            return true;
        }
    }
    return false;
}

const ClauseKeyword* last_major_clause(const TopLevelView& view) {
    for (auto it = view.keywords.rbegin(); it != view.keywords.rend(); ++it) {
        if (!is_projection_modifier(it->keyword)) {
            return &*it;
        }
    }
    return nullptr;
}

bool view_is_pure_aggregation(const TopLevelView& view) {
    const ClauseKeyword* last_return = nullptr;
    for (const auto& k : view.keywords) {
        if (k.keyword == "RETURN") {
            last_return = &k;
        }
    }
    if (last_return == nullptr) {
        return false;
    }

    std::size_t items_begin = last_return->position + 6;
    std::size_t items_end   = view.top.size();
    for (const auto& k : view.keywords) {
        if (k.position > last_return->position && is_projection_modifier(k.keyword)) {
            items_end = k.position;
            break;
        }
    }
    if (items_begin >= items_end) {
        return false;
    }

    std::string_view items(view.top);
    items = items.substr(items_begin, items_end - items_begin);

    static const std::regex distinct_re(R"(^\s*DISTINCT\s+)",
                                        std::regex_constants::icase | std::regex_constants::ECMAScript);
    static const std::regex aggregate_re(
        R"(^(count|sum|avg|min|max|collect|stdev|stdevp|percentilecont|percentiledisc)\s*\()",
        std::regex_constants::icase | std::regex_constants::ECMAScript);

    std::string list = std::regex_replace(std::string(items), distinct_re, "");
    std::size_t start = 0;
    std::size_t count = 0;
    while (start <= list.size()) {
        std::size_t comma = list.find(',', start);
        if (comma == std::string::npos) {
            comma = list.size();
        }
        const std::string item(trim(std::string_view(list).substr(start, comma - start)));
        if (item.empty() || !std::regex_search(item, aggregate_re)) {
            return false;
        }
        ++count;
        start = comma + 1;
    }
    return count > 0;
}

bool only_whitespace_or_semicolon(std::string_view s) {
    return s.find_first_not_of(" \t\r\n\f\v;") == std::string_view::npos;
}

}  // namespace

bool has_limit_clause(std::string_view query) {
    return view_has_limit(build_view(query));
}

bool has_projection(std::string_view query) {
    return view_has_keyword(build_view(query), "RETURN");
}

bool is_pure_aggregation(std::string_view query) {
    return view_is_pure_aggregation(build_view(query));
}

LimitInjection maybe_inject_limit(std::string_view query, std::uint32_t max_rows) {
    LimitInjection out{std::string(query), false, std::nullopt};

    const TopLevelView view = build_view(query);
    if (view.unterminated || view_has_limit(view)) {
        return out;
    }
    if (!view_has_keyword(view, "RETURN") || view_has_keyword(view, "UNION")) {
        return out;
    }

    const ClauseKeyword* last = last_major_clause(view);
    if (last == nullptr || (last->keyword != "RETURN" && last->keyword != "WITH")) {
        return out;
    }
    if (view_is_pure_aggregation(view)) {
        return out;
    }

    const std::size_t end = view.masked.find_last_not_of(" \t\r\n\f\v;");
    if (end == std::string::npos) {
        return out;
    }

    const std::string_view tail = query.substr(end + 1);
    std::string rewritten(query.substr(0, end + 1));
    rewritten += fmt::format(" LIMIT {}", max_rows);
    if (!only_whitespace_or_semicolon(tail)) {
        rewritten.append(tail);
    }

    out.query        = std::move(rewritten);
    out.was_injected = true;
    out.warning      = fmt::format(
        "Query was automatically limited to {} rows (LIMIT {} appended)", max_rows, max_rows);
    return out;
}
