#pragma once

// ---------------------------------------------------------------------------
// unicode_inspector.hpp
//
// 원본 쿼리 텍스트의 유니코드/인코딩 공격 탐지기.
// 리터럴/주석 제거 "이전"의 원문에 적용해야 한다 (리터럴 안에 숨긴 공격 포함).
//
// [탐지 대상]
// - 잘못된 UTF-8 (overlong, surrogate, 잘린 시퀀스): 엄격한 재인코딩 검사
// - NUL 바이트
// - zero-width 문자 (U+200B~U+200D, U+2060, U+FEFF)
// - 양방향 제어 문자 (U+200E/F, U+061C, U+202A~U+202E, U+2066~U+2069)
// - 결합 분음 부호 (U+0300~U+036F 외 결합 블록)
// - 수학 영숫자 (U+1D400~U+1D7FF), 전각 ASCII (U+FF01~U+FF5E)
// - 동형 문자(homoglyph):
//     (a) 한 토큰 안에서 라틴 + 키릴/그리스 문자 혼용
//     (b) 라틴 문자가 있는 텍스트에서 "라틴과 혼동되는 문자만으로" 이루어진
//         키릴/그리스 토큰 (예: 키릴 МАТСН)
// - block_non_ascii 옵션: 타이포그래피 따옴표(U+2018/2019/201C/201D) 외 비ASCII 전부
//
// [오탐 트레이드오프]
// - 순수 러시아어/그리스어 단어는 대부분 비혼동 문자를 포함하므로 통과한다.
//   혼동 문자만으로 된 짧은 단어("сор")는 라틴 텍스트와 섞이면 차단될 수 있다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// UnicodeThreat
// ---------------------------------------------------------------------------
enum class UnicodeThreat : std::uint8_t {
    kInvalidEncoding  = 0,
    kNullByte         = 1,
    kZeroWidth        = 2,
    kBidiControl      = 3,
    kCombiningMark    = 4,
    kMathAlphanumeric = 5,
    kFullwidthForm    = 6,
    kHomoglyph        = 7,
    kNonAscii         = 8,
};

// ---------------------------------------------------------------------------
// UnicodeFinding
//   첫 번째로 발견된 위협. byte_offset 은 원문 기준.
// ---------------------------------------------------------------------------
struct UnicodeFinding {
    UnicodeThreat threat{UnicodeThreat::kInvalidEncoding};
    char32_t      code_point{0};
    std::size_t   byte_offset{0};
    std::string   description{};
};

// 엄격한 UTF-8 디코딩. 실패 시 잘못된 시퀀스의 바이트 오프셋을 반환한다.
[[nodiscard]] std::expected<std::u32string, std::size_t> decode_utf8_strict(std::string_view text);

// ---------------------------------------------------------------------------
// UnicodeInspector
//   상태 없는 검사기. 여러 스레드에서 동시에 inspect() 호출 가능.
// ---------------------------------------------------------------------------
class UnicodeInspector {
public:
    explicit UnicodeInspector(bool block_non_ascii = false)
        : block_non_ascii_(block_non_ascii) {}

    // 위협이 없으면 std::nullopt.
    [[nodiscard]] std::optional<UnicodeFinding> inspect(std::string_view text) const;

private:
    bool block_non_ascii_{false};
};
