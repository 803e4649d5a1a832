#pragma once

// ---------------------------------------------------------------------------
// limit_injector.hpp
//
// 결과 크기 제한 (LIMIT 자동 삽입).
//
// [판정 규칙] 모두 TextShield::mask_query() 결과의 최상위(괄호 깊이 0) 텍스트에서 수행.
// - has_limit_clause:   최상위 LIMIT 뒤에 값이 있으면 제한됨.
//                       LIMIT 10, LIMIT $n, LIMIT {n}, LIMIT toInteger($n) 모두 인정.
//                       문자열/주석/서브쿼리 안의 LIMIT 는 무시.
// - has_projection:     최상위 RETURN 이 있는지.
// - 마지막 주요 절:      RETURN 또는 WITH 여야 삽입 가능 (ORDER BY/SKIP 은 수식어로 무시).
// - 순수 집계:          마지막 RETURN 의 모든 항목이 집계 함수 호출이면 삽입하지 않음.
// - UNION:             마지막 분기에만 적용되어 의미가 없으므로 삽입하지 않음.
//
// [삽입 방식]
// 마지막 유효 토큰 뒤에 " LIMIT <max_rows>" 를 넣는다.
// 뒤따르는 텍스트가 공백/';' 뿐이면 제거하고, 주석이 있으면 주석을 보존한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LimitInjection
// ---------------------------------------------------------------------------
struct LimitInjection {
    std::string                query{};
    bool                       was_injected{false};
    std::optional<std::string> warning{};
};

[[nodiscard]] bool has_limit_clause(std::string_view query);

[[nodiscard]] bool has_projection(std::string_view query);

[[nodiscard]] bool is_pure_aggregation(std::string_view query);

[[nodiscard]] LimitInjection maybe_inject_limit(std::string_view query, std::uint32_t max_rows);
