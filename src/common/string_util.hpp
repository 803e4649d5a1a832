#pragma once

// ---------------------------------------------------------------------------
// string_util.hpp
//
// 모듈 공용 문자열 헬퍼 (ASCII 기준).
// 감사 로그 / CLI 출력의 수동 JSON 직렬화에 사용하는 escape_json_string,
// format_iso8601 을 함께 제공한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <string>
#include <string_view>

// 문자열을 대문자로 변환한다 (ASCII only).
[[nodiscard]] std::string to_upper(std::string_view s);

// 문자열을 소문자로 변환한다 (ASCII only).
[[nodiscard]] std::string to_lower(std::string_view s);

// 앞뒤 공백(스페이스, 탭, 개행 포함)을 제거한다.
[[nodiscard]] std::string_view trim(std::string_view s);

// 연속된 공백 문자(스페이스/탭/CR/LF/VT/FF)를 스페이스 하나로 접는다.
[[nodiscard]] std::string collapse_whitespace(std::string_view s);

// JSON 문자열 값으로 쓸 수 있도록 이스케이프한다 (따옴표는 붙이지 않음).
[[nodiscard]] std::string escape_json_string(std::string_view str);

// UTC ISO8601 밀리초 타임스탬프. 예: 2024-05-01T12:00:00.123Z
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
