#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 로드하여 GateConfig 로 파싱한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 부분 설정을 반환하지 않는다.
// - 키가 없으면 구조체 기본값을 유지한다.
// - 알 수 없는 enum 문자열 (audit.format / audit.rotation), 범위를 벗어난 값,
//   production 환경의 debug_mode 는 로드 오류다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [보안 고려사항]
// 설정 파일 경로는 환경 변수(GRAPHGATE_CONFIG) 또는 호출자 코드에서만 받는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "config/gate_config.hpp"

class ConfigLoader {
public:
    [[nodiscard]] static std::expected<GateConfig, std::string>
    load(const std::filesystem::path& config_path);

    // 파일 대신 YAML 문자열에서 로드 (테스트, 임베디드 기본 설정용).
    [[nodiscard]] static std::expected<GateConfig, std::string>
    load_from_string(std::string_view yaml_text);

    // "production" / "prod" (대소문자 무시)
    [[nodiscard]] static bool is_production(std::string_view environment);
};
