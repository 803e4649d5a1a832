#pragma once

// ---------------------------------------------------------------------------
// text_shield.hpp
//
// Cypher 문자열 리터럴 / 주석 제거기.
// Sanitizer, ComplexityAnalyzer, WriteDetector, LimitInjector 가 공유하는 리프 모듈.
//
// [렉서 규칙]
// - 문자열 리터럴: '...' 와 "..." (백슬래시 이스케이프 인식).
//   내용을 비우고 따옴표만 남긴다 → 'https://x' 는 '' 가 된다.
// - 백틱 식별자: `...` 내용을 `_bt<N>` 로 치환한다 (N = 고유 내용 순번).
//   같은 식별자는 같은 치환값을 가지므로 변수 공유 판정이 유지된다.
// - 주석: // (줄 끝까지) 와 /* ... */ (블록).
//   블록 주석 자리에는 공백 하나를 남긴다 (DE/**/LETE 가 붙지 않도록).
// - "--" 는 Cypher 에서 무방향 관계 (a)--(b) 이므로 주석으로 취급하지 않는다.
//
// [닫히지 않은 리터럴/주석]
// 여는 기호 이후 나머지 텍스트는 제거하지 않고 그대로 둔다.
// 닫히지 않은 따옴표 뒤에 위험 구문을 숨기는 우회를 막기 위함이며,
// 결과 구조체의 플래그로 호출자에게 알린다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ShieldedText
//   제거 결과. text 는 항상 유효하며, 플래그는 진단/경고용이다.
// ---------------------------------------------------------------------------
struct ShieldedText {
    std::string text{};
    bool        unterminated_literal{false};
    bool        unterminated_comment{false};
};

// 문자열 리터럴 내용과 백틱 식별자만 무력화한다. 주석은 그대로 통과시킨다.
// 주석 안의 따옴표(// don't) 가 리터럴을 열지 않도록 주석 경계는 인식한다.
[[nodiscard]] ShieldedText strip_string_literals(std::string_view query);

// 주석만 제거한다. 리터럴 안의 // (URL 등) 는 주석으로 보지 않는다.
[[nodiscard]] ShieldedText strip_comments(std::string_view text);

// strip_string_literals → strip_comments 순서로 적용한 결과.
[[nodiscard]] ShieldedText shield_query(std::string_view query);

// 길이 보존 마스킹: 리터럴 내용과 주석을 공백으로, 백틱 식별자 내용을 '_' 로 덮는다.
// 결과의 i 번째 문자는 원문의 i 번째 문자에 대응한다 (LIMIT 삽입 위치 계산용).
[[nodiscard]] ShieldedText mask_query(std::string_view query);
