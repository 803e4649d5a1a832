// ---------------------------------------------------------------------------
// unicode_inspector.cpp
//
// 2-패스 구현:
//   1) 코드 포인트 단위 위협 (NUL, zero-width, bidi, 결합 부호, 수학 영숫자, 전각, 비ASCII)
//   2) 토큰 단위 동형 문자 검사 (스크립트 혼용 / 혼동 문자 전용 토큰)
// 인코딩 오류는 두 패스 이전에 디코딩 단계에서 거부된다.
// ---------------------------------------------------------------------------

#include "parser/unicode_inspector.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

#include <fmt/format.h>

namespace {

struct DecodedChar {
    char32_t    cp{0};
    std::size_t offset{0};
};

// 연속 바이트(10xxxxxx)가 [lo, hi] 범위인지 확인.
bool in_range(unsigned char b, unsigned char lo, unsigned char hi) {
    return b >= lo && b <= hi;
}

// pos 위치의 코드 포인트 하나를 디코딩한다. 소비한 바이트 수, 실패 시 0.
std::size_t decode_next(std::string_view s, std::size_t pos, char32_t& cp) {
    const auto b0 = static_cast<unsigned char>(s[pos]);
    const std::size_t remain = s.size() - pos;

    if (b0 < 0x80) {
        cp = b0;
        return 1;
    }

    auto cont = [&](std::size_t k) { return static_cast<unsigned char>(s[pos + k]); };

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        if (remain < 2 || !in_range(cont(1), 0x80, 0xBF)) {
            return 0;
        }
        cp = (static_cast<char32_t>(b0 & 0x1F) << 6) | (cont(1) & 0x3F);
        return 2;
    }

    if (b0 >= 0xE0 && b0 <= 0xEF) {
        if (remain < 3) {
            return 0;
        }
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (b0 == 0xE0) {
            lo = 0xA0;  // overlong 방지
        } else if (b0 == 0xED) {
            hi = 0x9F;  // surrogate(U+D800~U+DFFF) 방지
        }
        if (!in_range(cont(1), lo, hi) || !in_range(cont(2), 0x80, 0xBF)) {
            return 0;
        }
        cp = (static_cast<char32_t>(b0 & 0x0F) << 12) |
             (static_cast<char32_t>(cont(1) & 0x3F) << 6) | (cont(2) & 0x3F);
        return 3;
    }

    if (b0 >= 0xF0 && b0 <= 0xF4) {
        if (remain < 4) {
            return 0;
        }
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (b0 == 0xF0) {
            lo = 0x90;
        } else if (b0 == 0xF4) {
            hi = 0x8F;  // U+10FFFF 상한
        }
        if (!in_range(cont(1), lo, hi) || !in_range(cont(2), 0x80, 0xBF) ||
            !in_range(cont(3), 0x80, 0xBF)) {
            return 0;
        }
        cp = (static_cast<char32_t>(b0 & 0x07) << 18) |
             (static_cast<char32_t>(cont(1) & 0x3F) << 12) |
             (static_cast<char32_t>(cont(2) & 0x3F) << 6) | (cont(3) & 0x3F);
        return 4;
    }

    return 0;
}

std::expected<std::vector<DecodedChar>, std::size_t> decode_with_offsets(std::string_view text) {
    std::vector<DecodedChar> chars;
    chars.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        char32_t cp = 0;
        const std::size_t used = decode_next(text, pos, cp);
        if (used == 0) {
            return std::unexpected(pos);
        }
        chars.push_back(DecodedChar{cp, pos});
        pos += used;
    }
    return chars;
}

bool is_zero_width(char32_t cp) {
    return (cp >= 0x200B && cp <= 0x200D) || cp == 0x2060 || cp == 0xFEFF;
}

bool is_bidi_control(char32_t cp) {
    return cp == 0x200E || cp == 0x200F || cp == 0x061C ||
           (cp >= 0x202A && cp <= 0x202E) || (cp >= 0x2066 && cp <= 0x2069);
}

bool is_combining_mark(char32_t cp) {
    return (cp >= 0x0300 && cp <= 0x036F) || (cp >= 0x1AB0 && cp <= 0x1AFF) ||
           (cp >= 0x1DC0 && cp <= 0x1DFF) || (cp >= 0x20D0 && cp <= 0x20FF) ||
           (cp >= 0xFE20 && cp <= 0xFE2F);
}

bool is_math_alphanumeric(char32_t cp) {
    return cp >= 0x1D400 && cp <= 0x1D7FF;
}

bool is_fullwidth_form(char32_t cp) {
    return cp >= 0xFF01 && cp <= 0xFF5E;
}

bool is_typographic_quote(char32_t cp) {
    return cp == 0x2018 || cp == 0x2019 || cp == 0x201C || cp == 0x201D;
}

// ---------------------------------------------------------------------------
// 스크립트 분류 (동형 문자 검사 전용)
// ---------------------------------------------------------------------------
enum class Script : std::uint8_t {
    kNone     = 0,  // 토큰 경계
    kNeutral  = 1,  // 숫자, '_'. 토큰에 포함되나 스크립트 없음
    kLatin    = 2,
    kCyrillic = 3,
    kGreek    = 4,
};

Script classify(char32_t cp) {
    if ((cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z')) {
        return Script::kLatin;
    }
    if ((cp >= '0' && cp <= '9') || cp == '_') {
        return Script::kNeutral;
    }
    if ((cp >= 0x00C0 && cp <= 0x024F) && cp != 0x00D7 && cp != 0x00F7) {
        return Script::kLatin;
    }
    if (cp >= 0x0400 && cp <= 0x052F) {
        return Script::kCyrillic;
    }
    if (cp >= 0x0370 && cp <= 0x03FF) {
        return Script::kGreek;
    }
    return Script::kNone;
}

// 라틴 문자와 시각적으로 구분이 어려운 키릴/그리스 문자.
constexpr char32_t kLatinConfusables[] = {
    // 키릴 소문자: а е о р с у х ѕ і ј һ ԁ
    0x0430, 0x0435, 0x043E, 0x0440, 0x0441, 0x0443, 0x0445, 0x0455, 0x0456, 0x0458, 0x04BB, 0x0501,
    // 키릴 대문자: А В Е К М Н О Р С Т Х Ѕ І Ј
    0x0410, 0x0412, 0x0415, 0x041A, 0x041C, 0x041D, 0x041E, 0x0420, 0x0421, 0x0422, 0x0425,
    0x0405, 0x0406, 0x0408,
    // 그리스 소문자: ο ρ ν α ι
    0x03BF, 0x03C1, 0x03BD, 0x03B1, 0x03B9,
    // 그리스 대문자: Α Β Ε Ζ Η Ι Κ Μ Ν Ο Ρ Τ Υ Χ
    0x0391, 0x0392, 0x0395, 0x0396, 0x0397, 0x0399, 0x039A, 0x039C, 0x039D, 0x039F, 0x03A1,
    0x03A4, 0x03A5, 0x03A7,
};

bool is_latin_confusable(char32_t cp) {
    return std::find(std::begin(kLatinConfusables), std::end(kLatinConfusables), cp) != std::end(kLatinConfusables);
}

UnicodeFinding make_finding(UnicodeThreat threat, const DecodedChar& dc, std::string_view what) {
    return UnicodeFinding{
        threat, dc.cp, dc.offset,
        fmt::format("{} U+{:04X} at byte {}", what, static_cast<std::uint32_t>(dc.cp), dc.offset)
    };
}

std::optional<UnicodeFinding> check_code_point(const DecodedChar& dc, bool block_non_ascii) {
    const char32_t cp = dc.cp;
    if (cp == 0) {
        return make_finding(UnicodeThreat::kNullByte, dc, "null byte");
    }
    if (cp < 0x80) {
        return std::nullopt;
    }
    if (is_zero_width(cp)) {
        return make_finding(UnicodeThreat::kZeroWidth, dc, "zero-width character");
    }
    if (is_bidi_control(cp)) {
        return make_finding(UnicodeThreat::kBidiControl, dc, "bidirectional control character");
    }
    if (is_combining_mark(cp)) {
        return make_finding(UnicodeThreat::kCombiningMark, dc, "combining diacritical mark");
    }
    if (is_math_alphanumeric(cp)) {
        return make_finding(UnicodeThreat::kMathAlphanumeric, dc, "mathematical alphanumeric symbol");
    }
    if (is_fullwidth_form(cp)) {
        return make_finding(UnicodeThreat::kFullwidthForm, dc, "fullwidth form");
    }
    if (block_non_ascii && !is_typographic_quote(cp)) {
        return make_finding(UnicodeThreat::kNonAscii, dc, "non-ASCII character");
    }
    return std::nullopt;
}

std::optional<UnicodeFinding> check_homoglyphs(const std::vector<DecodedChar>& chars) {
    const bool text_has_latin = std::any_of(chars.begin(), chars.end(), [](const DecodedChar& dc) {
        return classify(dc.cp) == Script::kLatin;
    });

    std::size_t i = 0;
    while (i < chars.size()) {
        if (classify(chars[i].cp) == Script::kNone) {
            ++i;
            continue;
        }

        bool latin = false;
        bool cyrillic = false;
        bool greek = false;
        bool all_foreign_confusable = true;
        std::size_t first_foreign = chars.size();

        while (i < chars.size()) {
            const Script sc = classify(chars[i].cp);
            if (sc == Script::kNone) {
                break;
            }
            if (sc == Script::kLatin) {
                latin = true;
            } else if (sc == Script::kCyrillic || sc == Script::kGreek) {
                (sc == Script::kCyrillic ? cyrillic : greek) = true;
                if (first_foreign == chars.size()) {
                    first_foreign = i;
                }
                if (!is_latin_confusable(chars[i].cp)) {
                    all_foreign_confusable = false;
                }
            }
            ++i;
        }

        if (first_foreign == chars.size()) {
            continue;
        }

        const DecodedChar& at = chars[first_foreign];
        if (latin || (cyrillic && greek)) {
            return make_finding(UnicodeThreat::kHomoglyph, at, "mixed-script token with confusable character");
        }
        if (text_has_latin && all_foreign_confusable) {
            return make_finding(UnicodeThreat::kHomoglyph, at, "token made only of Latin-confusable characters");
        }
    }
    return std::nullopt;
}

}  // namespace

std::expected<std::u32string, std::size_t> decode_utf8_strict(std::string_view text) {
    auto decoded = decode_with_offsets(text);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    std::u32string out;
    out.reserve(decoded->size());
    for (const auto& dc : *decoded) {
        out.push_back(dc.cp);
    }
    return out;
}

std::optional<UnicodeFinding> UnicodeInspector::inspect(std::string_view text) const {
    auto decoded = decode_with_offsets(text);
    if (!decoded) {
        return UnicodeFinding{
            UnicodeThreat::kInvalidEncoding, 0, decoded.error(),
            fmt::format("invalid UTF-8 sequence at byte {}", decoded.error())
        };
    }

    for (const auto& dc : *decoded) {
        if (auto finding = check_code_point(dc, block_non_ascii_)) {
            return finding;
        }
    }

    return check_homoglyphs(*decoded);
}
