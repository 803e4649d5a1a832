// ---------------------------------------------------------------------------
// clause_scanner.cpp
// ---------------------------------------------------------------------------

#include "complexity/clause_scanner.hpp"

#include <cctype>
#include <regex>

#include "common/string_util.hpp"

namespace {

const std::regex& clause_regex() {
    static const std::regex re(
        R"((^|[^.:$\w`])(RETURN|WITH|MATCH|WHERE|UNION|UNWIND|CREATE|MERGE|DELETE|DETACH|SET|REMOVE|CALL|FOREACH|LOAD|USE|OPTIONAL|YIELD|FINISH|LIMIT|ORDER|SKIP|OFFSET)\b)",
        std::regex_constants::icase | std::regex_constants::ECMAScript);
    return re;
}

// pos 바로 앞의 단어가 STARTS / ENDS 인지 (공백 건너뜀).
bool preceded_by_string_predicate(const std::string& text, std::size_t pos) {
    std::size_t end = pos;
    while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    std::size_t begin = end;
    while (begin > 0 && std::isalpha(static_cast<unsigned char>(text[begin - 1])) != 0) {
        --begin;
    }
    const std::string word = to_upper(std::string_view(text).substr(begin, end - begin));
    return word == "STARTS" || word == "ENDS";
}

}  // namespace

std::string top_level_only(std::string_view text) {
    std::string out(text);
    int depth = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '(' || c == '[' || c == '{') {
            if (depth > 0) {
                out[i] = ' ';
            }
            ++depth;
            continue;
        }
        if (c == ')' || c == ']' || c == '}') {
            if (depth > 0) {
                --depth;
            }
            if (depth > 0) {
                out[i] = ' ';
            }
            continue;
        }
        if (depth > 0 && c != '\n') {
            out[i] = ' ';
        }
    }
    return out;
}

std::vector<ClauseKeyword> scan_clauses(std::string_view text, bool top_level) {
    const std::string view = top_level ? top_level_only(text) : std::string(text);

    std::vector<ClauseKeyword> keywords;
    const auto begin = std::sregex_iterator(view.begin(), view.end(), clause_regex());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const auto pos = static_cast<std::size_t>(it->position(2));
        std::string kw = to_upper(it->str(2));
        if (kw == "WITH" && preceded_by_string_predicate(view, pos)) {
            continue;
        }
        keywords.push_back(ClauseKeyword{std::move(kw), pos});
    }
    return keywords;
}

bool is_projection_modifier(std::string_view keyword) noexcept {
    return keyword == "ORDER" || keyword == "SKIP" || keyword == "OFFSET" || keyword == "LIMIT";
}
