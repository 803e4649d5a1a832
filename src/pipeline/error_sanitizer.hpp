#pragma once

// ---------------------------------------------------------------------------
// error_sanitizer.hpp
//
// 호출자에게 반환되는 오류 메시지 정제 정책.
//
// - debug_mode == true  : 원본 메시지 그대로.
// - debug_mode == false : 안전 부분 문자열(대소문자 무시)을 포함한 메시지만 그대로,
//                         나머지는 "<Kind>: An error occurred. Enable debug_mode for details."
//
// 원본 메시지/상세는 감사 로그에만 남긴다 (QueryPipeline 책임).
// ---------------------------------------------------------------------------

#include <array>
#include <string>
#include <string_view>

#include "common/types.hpp"

inline constexpr std::array<std::string_view, 8> kSafeErrorSubstrings = {
    "query exceeds maximum length",
    "empty query not allowed",
    "blocked: query contains dangerous pattern",
    "authentication failed",
    "connection refused",
    "timeout",
    "not found",
    "unauthorized",
};

class ErrorSanitizer {
public:
    explicit ErrorSanitizer(bool debug_mode = false) noexcept : debug_mode_(debug_mode) {}

    [[nodiscard]] std::string sanitize(ErrorKind kind, std::string_view message) const;

    [[nodiscard]] static bool is_safe_message(std::string_view message);

    [[nodiscard]] static std::string generic_message(ErrorKind kind);

    [[nodiscard]] bool debug_mode() const noexcept { return debug_mode_; }

private:
    bool debug_mode_;
};
