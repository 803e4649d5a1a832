// ---------------------------------------------------------------------------
// write_detector.cpp
// ---------------------------------------------------------------------------

#include "parser/write_detector.hpp"

#include <memory>
#include <regex>

#include "common/string_util.hpp"
#include "parser/text_shield.hpp"

struct WriteDetector::CompiledPattern {
    std::shared_ptr<std::regex> compiled;
    int                         keyword_group{0};  // 키워드를 담은 캡처 그룹 번호
};

namespace {

// ECMAScript 에는 lookbehind 가 없으므로 선행 문자를 그룹 1 로 소비한다.
// 뒤에 ':' 가 오면 맵 키 ({set: 1}) 이므로 제외한다.
constexpr const char* kKeywordPattern =
    R"((^|[^.:$\w])(CREATE|MERGE|DELETE|DETACH|SET|REMOVE|DROP|FOREACH)\b(?!\s*:))";

constexpr const char* kLoadCsvPattern = R"(\b(LOAD\s+CSV)\b)";

constexpr const char* kProcedurePattern =
    R"(\b((db\s*\.\s*(schema|create))|(apoc\s*\.\s*(write|create|merge|refactor)))\s*\.)";

}  // namespace

WriteDetector::WriteDetector() {
    const auto flags = std::regex_constants::icase | std::regex_constants::ECMAScript;
    patterns_.push_back(CompiledPattern{std::make_shared<std::regex>(kKeywordPattern, flags), 2});
    patterns_.push_back(CompiledPattern{std::make_shared<std::regex>(kLoadCsvPattern, flags), 1});
    patterns_.push_back(CompiledPattern{std::make_shared<std::regex>(kProcedurePattern, flags), 1});
}

WriteDetector::~WriteDetector()                                     = default;
WriteDetector::WriteDetector(const WriteDetector&)                  = default;
WriteDetector& WriteDetector::operator=(const WriteDetector&)       = default;
WriteDetector::WriteDetector(WriteDetector&&) noexcept              = default;
WriteDetector& WriteDetector::operator=(WriteDetector&&) noexcept   = default;

WriteDetection WriteDetector::detect(std::string_view query) const {
    const ShieldedText shielded = shield_query(query);
    return detect_shielded(shielded.text);
}

WriteDetection WriteDetector::detect_shielded(std::string_view shielded) const {
    const std::string normalized = collapse_whitespace(shielded);

    for (const auto& pattern : patterns_) {
        std::smatch match;
        if (std::regex_search(normalized, match, *pattern.compiled)) {
            return WriteDetection{true, to_upper(collapse_whitespace(match[pattern.keyword_group].str()))};
        }
    }
    return WriteDetection{};
}
