#pragma once

// ---------------------------------------------------------------------------
// audit_types.hpp
//
// 감사 로그 레코드 타입 정의.
//
// [불변성]
// AuditEntry 는 AuditLogger 에 전달되는 순간 소유권이 로거로 넘어간다.
// 로거는 마스킹된 사본을 직렬화하며, 기록된 줄은 수정되지 않는다 (append-only).
//
// [민감정보 취급 주의]
// - query / params / error / response_excerpt 는 pii_redaction 설정 시에만 마스킹된다.
// - GateError::detail 은 호출자에게 노출되지 않지만 감사 로그에는 기록된다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// AuditEvent
//   레코드 종류. 같은 요청의 query / response / error 레코드는 session_id 를 공유한다.
// ---------------------------------------------------------------------------
enum class AuditEvent : std::uint8_t {
    kQuery    = 0,
    kResponse = 1,
    kError    = 2,
    kOutcome  = 3,
};

// ---------------------------------------------------------------------------
// AuditOutcome
//   파이프라인 단계 결과.
// ---------------------------------------------------------------------------
enum class AuditOutcome : std::uint8_t {
    kAllowed     = 0,  // 게이트 통과 (실행 전)
    kBlocked     = 1,  // sanitizer / complexity / write 게이트 거부
    kRateLimited = 2,
    kExecuted    = 3,
    kFailed      = 4,  // 엔진 오류 / 타임아웃
    kAnalyzed    = 5,  // 플랜 분석 완료
};

enum class AuditSeverity : std::uint8_t {
    kInfo    = 0,
    kWarning = 1,
    kError   = 2,
};

[[nodiscard]] inline std::string_view audit_event_name(AuditEvent event) noexcept {
    switch (event) {
        case AuditEvent::kQuery:    return "query";
        case AuditEvent::kResponse: return "response";
        case AuditEvent::kError:    return "error";
        case AuditEvent::kOutcome:  return "outcome";
    }
    return "outcome";
}

[[nodiscard]] inline std::string_view audit_outcome_name(AuditOutcome outcome) noexcept {
    switch (outcome) {
        case AuditOutcome::kAllowed:     return "allowed";
        case AuditOutcome::kBlocked:     return "blocked";
        case AuditOutcome::kRateLimited: return "rate_limited";
        case AuditOutcome::kExecuted:    return "executed";
        case AuditOutcome::kFailed:      return "failed";
        case AuditOutcome::kAnalyzed:    return "analyzed";
    }
    return "failed";
}

[[nodiscard]] inline std::string_view audit_severity_name(AuditSeverity severity) noexcept {
    switch (severity) {
        case AuditSeverity::kInfo:    return "info";
        case AuditSeverity::kWarning: return "warning";
        case AuditSeverity::kError:   return "error";
    }
    return "error";
}

// 결과에 따른 기본 심각도.
[[nodiscard]] inline AuditSeverity severity_for(AuditOutcome outcome) noexcept {
    switch (outcome) {
        case AuditOutcome::kBlocked:
        case AuditOutcome::kRateLimited:
            return AuditSeverity::kWarning;
        case AuditOutcome::kFailed:
            return AuditSeverity::kError;
        default:
            return AuditSeverity::kInfo;
    }
}

// ---------------------------------------------------------------------------
// AuditEntry
// ---------------------------------------------------------------------------
struct AuditEntry {
    AuditEvent                            event{AuditEvent::kOutcome};
    std::chrono::system_clock::time_point timestamp{};
    std::string                           session_id{};
    std::string                           client_id{};
    std::string                           operation{};
    std::string                           query{};
    ParameterMap                          params{};
    AuditOutcome                          outcome{AuditOutcome::kAllowed};
    AuditSeverity                         severity{AuditSeverity::kInfo};
    std::optional<std::string>            error{};
    std::optional<std::string>            error_kind{};        // "ValidationError" ...
    std::optional<std::string>            response_excerpt{};  // max_response_length 로 잘림
    std::optional<double>                 execution_time_ms{};
};
