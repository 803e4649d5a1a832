#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ParameterMap
//   쿼리 파라미터 (이름 → 값). 전송 레이어 경계에서 값은 문자열로 전달된다.
//   std::map 을 사용하여 감사 로그 직렬화 순서를 결정적으로 유지한다.
// ---------------------------------------------------------------------------
using ParameterMap = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// RequestContext
//   요청 하나를 식별하는 불변 컨텍스트.
//   전송 레이어가 생성하고 pipeline/ratelimit/logger 레이어에 const-ref 로 전달한다.
// ---------------------------------------------------------------------------
struct RequestContext {
    std::string session_id{};   // 감사 로그 상관관계 ID
    std::string client_id{};    // rate limit 키 (사용자/토큰/IP 등)
    std::string operation{};    // "execute_cypher", "query_graph", "analyze_query" ...
    std::chrono::system_clock::time_point received_at{};
};

// ---------------------------------------------------------------------------
// ErrorKind
//   파이프라인 오류 분류.
//   kValidation ~ kWriteBlocked 는 예상된 결과(값으로 반환),
//   kEngine 은 경계에서 정제 후 반환, kInternal 은 호출자에게 절대 노출되지 않는다.
// ---------------------------------------------------------------------------
enum class ErrorKind : std::uint8_t {
    kValidation   = 0,  // Sanitizer 거부 (사용자가 수정 가능)
    kComplexity   = 1,  // 복잡도 초과 (breakdown 동반)
    kRateLimit    = 2,  // 일시적, retry_after 동반
    kWriteBlocked = 3,  // PROFILE 안전장치 / read-only 게이트
    kEngine       = 4,  // DB 실행 실패 또는 타임아웃
    kInternal     = 5,  // 로깅 등 내부 실패
};

[[nodiscard]] inline std::string_view error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::kValidation:   return "ValidationError";
        case ErrorKind::kComplexity:   return "ComplexityError";
        case ErrorKind::kRateLimit:    return "RateLimitError";
        case ErrorKind::kWriteBlocked: return "WriteBlockedError";
        case ErrorKind::kEngine:       return "EngineError";
        case ErrorKind::kInternal:     return "InternalError";
    }
    return "InternalError";
}

// ---------------------------------------------------------------------------
// GateError
//   게이트 단계 실패 시 반환되는 오류 정보.
//   std::expected<T, GateError> 패턴과 함께 사용한다.
//
//   message 는 호출자 노출 후보 (production 모드에서는 ErrorSanitizer 를 거친다).
//   detail  은 감사 로그 전용 (내부 경로, 드라이버 메시지 등).
// ---------------------------------------------------------------------------
struct GateError {
    ErrorKind             kind{ErrorKind::kInternal};
    std::string           message{};
    std::string           detail{};
    std::optional<double> retry_after_seconds{};  // kRateLimit 전용
};
