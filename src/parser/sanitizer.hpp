#pragma once

// ---------------------------------------------------------------------------
// sanitizer.hpp
//
// Cypher 쿼리/파라미터 검증기. 보안 게이트의 두 번째 단계.
//
// [검사 순서, 변경 금지]
//  1. 길이 / 빈 쿼리        (가장 저렴한 검사)
//  2. 유니코드 공격         (원문 그대로: 리터럴/주석 안에 숨긴 공격 포함)
//  3. 문자열 리터럴 제거     (URL, 마크다운 등 리터럴 내용 오탐 방지)
//  4. 주석 제거             (3 의 결과에 적용: "https://" 의 // 를 주석으로 오인하지 않음)
//  5. 위험 패턴             (쓰기, 파일 접근, 동적 실행, 관리 프로시저, 체이닝,
//                            거대 반복, 이스케이프 인젝션, 괄호 균형)
//  6. 의심 패턴             (경고, strict_mode 에서는 거부)
//  7. 파라미터 검증         (이름, 개수, 길이, 유니코드, 인젝션 조각)
//
// 유니코드 검사를 제거 이전에 두는 이유: 제거 단계가 공격 문자를 지워버리면
// 이후 단계에서 탐지할 수 없다.
//
// [실패 의미]
// 거부는 예외가 아니라 반환값 (is_safe=false + SanitizeErrorCode).
// 경고는 통과/거부와 무관하게 누적된다.
// sanitize() 는 (query, parameters, config) 에 대한 순수 함수다.
//
// [Fail-close]
// 위험 패턴이 하나도 컴파일되지 않으면 모든 쿼리를 거부한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "config/gate_config.hpp"
#include "parser/unicode_inspector.hpp"
#include "parser/write_detector.hpp"

// ---------------------------------------------------------------------------
// SanitizeErrorCode
//   거부 사유 (열거 가능). kNone 이면 통과.
// ---------------------------------------------------------------------------
enum class SanitizeErrorCode : std::uint8_t {
    kNone                  = 0,
    kEmptyQuery            = 1,
    kQueryTooLong          = 2,
    kUnicodeAttack         = 3,
    kWriteOperation        = 4,
    kDangerousPattern      = 5,
    kStringInjection       = 6,
    kUnbalancedDelimiters  = 7,
    kSuspiciousPattern     = 8,
    kInvalidParameterName  = 9,
    kTooManyParameters     = 10,
    kParameterTooLong      = 11,
    kParameterInjection    = 12,
    kCatalogUnavailable    = 13,
};

// ---------------------------------------------------------------------------
// SanitizationResult
//   생성 후 불변. error 는 is_safe == false 일 때만 값이 있다.
// ---------------------------------------------------------------------------
struct SanitizationResult {
    bool                       is_safe{true};
    SanitizeErrorCode          code{SanitizeErrorCode::kNone};
    std::optional<std::string> error{};
    std::vector<std::string>   warnings{};

    bool operator==(const SanitizationResult&) const = default;
};

class Sanitizer {
public:
    explicit Sanitizer(SanitizerConfig config = {});

    ~Sanitizer();
    Sanitizer(const Sanitizer&);
    Sanitizer& operator=(const Sanitizer&);
    Sanitizer(Sanitizer&&) noexcept;
    Sanitizer& operator=(Sanitizer&&) noexcept;

    // 쿼리 + 파라미터 전체 검증 (1~7 단계).
    [[nodiscard]] SanitizationResult sanitize(std::string_view query,
                                              const ParameterMap& parameters = {}) const;

    // 7 단계만 단독 실행.
    [[nodiscard]] SanitizationResult sanitize_parameters(const ParameterMap& parameters) const;

    [[nodiscard]] const SanitizerConfig& config() const noexcept { return config_; }

    // 위험 패턴이 하나도 로드되지 않아 모든 쿼리를 거부하는 상태인지.
    [[nodiscard]] bool fail_close_active() const noexcept { return fail_close_active_; }

private:
    struct CompiledPattern;

    void check_parameters(const ParameterMap& parameters, SanitizationResult& result) const;

    SanitizerConfig              config_;
    UnicodeInspector             unicode_;
    WriteDetector                write_detector_;
    std::vector<CompiledPattern> dangerous_;
    std::vector<CompiledPattern> suspicious_;
    std::vector<CompiledPattern> parameter_;
    bool                         fail_close_active_{false};
};

[[nodiscard]] std::string_view sanitize_error_name(SanitizeErrorCode code) noexcept;
