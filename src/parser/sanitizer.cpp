// ---------------------------------------------------------------------------
// sanitizer.cpp
//
// [CompiledPattern]
// InjectionDetector 와 같은 방식: std::regex 를 shared_ptr 로 보관하고,
// 잘못된 정규식은 spdlog::warn 후 건너뛴다.
//
// [알려진 한계]
// - 휴리스틱 패턴 매칭이므로 완전한 파서가 아니다. 새로운 우회는
//   pattern_catalog.cpp 에 패턴을 추가하는 방식으로 대응한다.
// - 이스케이프 시퀀스(\uHHHH) 검사는 원문에 적용되므로 리터럴 안의
//   정상적인 유니코드 이스케이프도 거부된다.
// ---------------------------------------------------------------------------

#include "parser/sanitizer.hpp"

#include <cctype>
#include <memory>
#include <regex>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/string_util.hpp"
#include "parser/pattern_catalog.hpp"
#include "parser/text_shield.hpp"

struct Sanitizer::CompiledPattern {
    PatternSpec                 spec;
    std::shared_ptr<std::regex> compiled;
};

namespace {

template <typename Pattern>
std::vector<Pattern> compile_patterns(const std::vector<PatternSpec>& specs, std::string_view list_name) {
    std::vector<Pattern> compiled;
    compiled.reserve(specs.size());

    for (const auto& spec : specs) {
        try {
            auto re = std::make_shared<std::regex>(
                std::string(spec.regex),
                std::regex_constants::icase | std::regex_constants::ECMAScript
            );
            compiled.push_back(Pattern{spec, std::move(re)});
        } catch (const std::regex_error& e) {
            spdlog::warn("sanitizer: invalid {} pattern '{}', skipping: {}",
                         list_name, spec.regex, e.what());
        }
    }
    return compiled;
}

// 리터럴이 이미 '' 로 비워진 텍스트에서 (), {}, [] 균형 검사.
bool delimiters_balanced(std::string_view text) {
    std::vector<char> stack;
    for (char ch : text) {
        switch (ch) {
            case '(':
            case '{':
            case '[':
                stack.push_back(ch);
                break;
            case ')':
            case '}':
            case ']': {
                const char open = ch == ')' ? '(' : (ch == '}' ? '{' : '[');
                if (stack.empty() || stack.back() != open) {
                    return false;
                }
                stack.pop_back();
                break;
            }
            default:
                break;
        }
    }
    return stack.empty();
}

// ^[A-Za-z_][A-Za-z0-9_]*$
bool valid_parameter_name(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    const auto head = static_cast<unsigned char>(name.front());
    if (std::isalpha(head) == 0 && head != '_') {
        return false;
    }
    for (unsigned char ch : name.substr(1)) {
        if (std::isalnum(ch) == 0 && ch != '_') {
            return false;
        }
    }
    return true;
}

void reject(SanitizationResult& result, SanitizeErrorCode code, std::string message) {
    result.is_safe = false;
    result.code    = code;
    result.error   = std::move(message);
}

}  // namespace

Sanitizer::Sanitizer(SanitizerConfig config)
    : config_(std::move(config))
    , unicode_(config_.block_non_ascii)
{
    dangerous_  = compile_patterns<CompiledPattern>(dangerous_patterns(), "dangerous");
    suspicious_ = compile_patterns<CompiledPattern>(suspicious_patterns(), "suspicious");
    parameter_  = compile_patterns<CompiledPattern>(parameter_patterns(), "parameter");

    if (dangerous_.empty()) {
        fail_close_active_ = true;
        spdlog::error(
            "sanitizer: no valid dangerous patterns loaded (catalog v{}), "
            "fail-close active, all queries will be rejected",
            kPatternCatalogVersion
        );
    }
}

Sanitizer::~Sanitizer()                                  = default;
Sanitizer::Sanitizer(const Sanitizer&)                   = default;
Sanitizer& Sanitizer::operator=(const Sanitizer&)        = default;
Sanitizer::Sanitizer(Sanitizer&&) noexcept               = default;
Sanitizer& Sanitizer::operator=(Sanitizer&&) noexcept    = default;

// ---------------------------------------------------------------------------
// Sanitizer::sanitize
// ---------------------------------------------------------------------------
SanitizationResult Sanitizer::sanitize(std::string_view query, const ParameterMap& parameters) const {
    SanitizationResult result;

    // 1. 길이 / 빈 쿼리
    if (query.size() > config_.max_query_length) {
        reject(result, SanitizeErrorCode::kQueryTooLong,
               fmt::format("Query exceeds maximum length ({} characters)", config_.max_query_length));
        return result;
    }
    if (trim(query).empty()) {
        reject(result, SanitizeErrorCode::kEmptyQuery, "Empty query not allowed");
        return result;
    }

    // 2. 유니코드 공격 (원문)
    if (const auto finding = unicode_.inspect(query)) {
        reject(result, SanitizeErrorCode::kUnicodeAttack,
               fmt::format("Unicode attack detected: {}", finding->description));
        return result;
    }

    // 3. 문자열 리터럴 제거
    const ShieldedText literals = strip_string_literals(query);
    if (literals.unterminated_literal) {
        result.warnings.emplace_back("Query contains an unterminated string literal or identifier");
    }

    // 4. 주석 제거
    const ShieldedText shielded = strip_comments(literals.text);
    if (shielded.unterminated_comment) {
        result.warnings.emplace_back("Query contains an unterminated block comment");
    }

    // 5. 위험 패턴
    if (fail_close_active_) {
        reject(result, SanitizeErrorCode::kCatalogUnavailable,
               "Blocked: query contains dangerous pattern (pattern catalog unavailable)");
        return result;
    }

    if (!config_.allow_write_operations) {
        const WriteDetection write = write_detector_.detect_shielded(shielded.text);
        if (write.detected) {
            reject(result, SanitizeErrorCode::kWriteOperation,
                   fmt::format("Blocked: Query contains write operation: {}", write.keyword));
            return result;
        }
    }

    const std::string raw(query);
    for (const auto& cp : dangerous_) {
        const PatternCategory cat = cp.spec.category;
        if (cat == PatternCategory::kAdminProcedure && config_.allow_admin_procedures) {
            continue;
        }
        if (cat == PatternCategory::kMutatingProcedure && config_.allow_write_operations) {
            continue;
        }

        const std::string& target = cp.spec.target == MatchTarget::kRaw ? raw : shielded.text;
        if (!std::regex_search(target, *cp.compiled)) {
            continue;
        }

        if (cat == PatternCategory::kEscapeInjection) {
            reject(result, SanitizeErrorCode::kStringInjection,
                   fmt::format("Potential string injection detected: {}", cp.spec.description));
        } else {
            reject(result, SanitizeErrorCode::kDangerousPattern,
                   fmt::format("Blocked: Query contains dangerous pattern: {}", cp.spec.description));
        }
        spdlog::debug("sanitizer: rejected ({}) by pattern '{}'",
                      category_name(cat), cp.spec.regex);
        return result;
    }

    if (!delimiters_balanced(shielded.text)) {
        reject(result, SanitizeErrorCode::kUnbalancedDelimiters,
               "Unbalanced parentheses, braces, or brackets detected");
        return result;
    }

    // 6. 의심 패턴
    for (const auto& cp : suspicious_) {
        const PatternCategory cat = cp.spec.category;
        if (cat == PatternCategory::kProcedureCall && config_.allow_admin_procedures) {
            continue;
        }
        if (cat == PatternCategory::kSchemaChange && config_.allow_schema_changes) {
            continue;
        }
        if (!std::regex_search(shielded.text, *cp.compiled)) {
            continue;
        }

        if (config_.strict_mode) {
            reject(result, SanitizeErrorCode::kSuspiciousPattern,
                   fmt::format("Blocked in strict mode: Query contains suspicious pattern: {}",
                               cp.spec.description));
            return result;
        }
        result.warnings.push_back(
            fmt::format("Query contains pattern that may need review: {}", cp.spec.description));
    }

    // 7. 파라미터
    check_parameters(parameters, result);
    return result;
}

SanitizationResult Sanitizer::sanitize_parameters(const ParameterMap& parameters) const {
    SanitizationResult result;
    check_parameters(parameters, result);
    return result;
}

void Sanitizer::check_parameters(const ParameterMap& parameters, SanitizationResult& result) const {
    if (parameters.size() > config_.max_parameters) {
        reject(result, SanitizeErrorCode::kTooManyParameters,
               fmt::format("Too many parameters ({}), maximum is {}",
                           parameters.size(), config_.max_parameters));
        return;
    }

    for (const auto& [name, value] : parameters) {
        if (!valid_parameter_name(name)) {
            reject(result, SanitizeErrorCode::kInvalidParameterName,
                   fmt::format("Invalid parameter name: '{}'", name));
            return;
        }
        if (value.size() > config_.max_parameter_length) {
            reject(result, SanitizeErrorCode::kParameterTooLong,
                   fmt::format("Parameter '{}' exceeds maximum length ({} characters)",
                               name, config_.max_parameter_length));
            return;
        }
        if (const auto finding = unicode_.inspect(value)) {
            reject(result, SanitizeErrorCode::kUnicodeAttack,
                   fmt::format("Unicode attack detected in parameter '{}': {}",
                               name, finding->description));
            return;
        }
        for (const auto& cp : parameter_) {
            if (std::regex_search(value, *cp.compiled)) {
                reject(result, SanitizeErrorCode::kParameterInjection,
                       fmt::format("Parameter '{}' contains potential injection: {}",
                                   name, cp.spec.description));
                return;
            }
        }
    }
}

std::string_view sanitize_error_name(SanitizeErrorCode code) noexcept {
    switch (code) {
        case SanitizeErrorCode::kNone:                 return "none";
        case SanitizeErrorCode::kEmptyQuery:           return "empty_query";
        case SanitizeErrorCode::kQueryTooLong:         return "query_too_long";
        case SanitizeErrorCode::kUnicodeAttack:        return "unicode_attack";
        case SanitizeErrorCode::kWriteOperation:       return "write_operation";
        case SanitizeErrorCode::kDangerousPattern:     return "dangerous_pattern";
        case SanitizeErrorCode::kStringInjection:      return "string_injection";
        case SanitizeErrorCode::kUnbalancedDelimiters: return "unbalanced_delimiters";
        case SanitizeErrorCode::kSuspiciousPattern:    return "suspicious_pattern";
        case SanitizeErrorCode::kInvalidParameterName: return "invalid_parameter_name";
        case SanitizeErrorCode::kTooManyParameters:    return "too_many_parameters";
        case SanitizeErrorCode::kParameterTooLong:     return "parameter_too_long";
        case SanitizeErrorCode::kParameterInjection:   return "parameter_injection";
        case SanitizeErrorCode::kCatalogUnavailable:   return "catalog_unavailable";
    }
    return "unknown";
}
