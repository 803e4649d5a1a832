#pragma once

// ---------------------------------------------------------------------------
// clause_scanner.hpp
//
// 리터럴/주석이 제거된 텍스트에서 Cypher 절 키워드 위치를 수집한다.
// LimitInjector 와 ComplexityAnalyzer 가 공유한다.
//
// - 키워드 앞 글자가 '.', ':', '$', '`', 식별자 문자이면 키워드가 아니다 (n.limit, :Return).
// - STARTS WITH / ENDS WITH 의 WITH 는 문자열 술어이므로 제외한다.
// - top_level_only == true 이면 괄호 깊이 0 의 키워드만 수집한다
//   (CALL { ... } / EXISTS { ... } 내부 절 제외).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

struct ClauseKeyword {
    std::string keyword;    // 대문자 정규화
    std::size_t position;   // 입력 텍스트 기준 오프셋
};

// 괄호 깊이 > 0 인 문자를 공백으로 덮는다 (길이 보존, 최외곽 괄호 문자는 유지).
[[nodiscard]] std::string top_level_only(std::string_view text);

[[nodiscard]] std::vector<ClauseKeyword> scan_clauses(std::string_view text, bool top_level);

// ORDER / SKIP / OFFSET / LIMIT: 투영 절의 수식어.
[[nodiscard]] bool is_projection_modifier(std::string_view keyword) noexcept;
