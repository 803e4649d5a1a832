#pragma once

// ---------------------------------------------------------------------------
// pii_redactor.hpp
//
// 감사 로그 기록 전 개인정보 패턴 마스킹.
//
// [적용 순서] 긴 숫자열이 짧은 패턴에 부분 매칭되지 않도록 카드 → SSN → 이메일 → 전화 순.
//   카드 번호    4111 1111 1111 1111, 4111-1111-1111-1111  → [CARD_REDACTED]
//   SSN         123-45-6789                               → [SSN_REDACTED]
//   이메일       alice@example.com                         → [EMAIL_REDACTED]
//   전화번호     555-123-4567, 555.123.4567, +1 555 123 4567 → [PHONE_REDACTED]
//
// AuditLogger 가 레코드 직렬화 직전에 정확히 한 번 적용한다.
// ---------------------------------------------------------------------------

#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

class PiiRedactor {
public:
    PiiRedactor();

    [[nodiscard]] std::string redact(std::string_view text) const;

    // 파라미터 값만 마스킹한다 (이름은 유지).
    [[nodiscard]] ParameterMap redact(const ParameterMap& params) const;

private:
    struct Rule {
        std::regex  pattern;
        std::string replacement;
    };

    std::vector<Rule> rules_;
};
