#include "common/string_util.hpp"
#include "complexity/complexity_analyzer.hpp"
#include "config/config_loader.hpp"
#include "parser/sanitizer.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// graphgate_check
//   stdin 의 각 줄을 하나의 Cypher 쿼리로 보고 보안 게이트(sanitize → complexity)를 적용한다.
//   결과는 쿼리당 한 줄 JSON 으로 stdout 에 출력하고, 진단 로그는 stderr 로 보낸다.
//
//   종료 코드: 0 모두 통과, 1 하나 이상 거부, 2 설정 로드 실패
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

std::uint32_t env_u32(const char* name, std::uint32_t default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    try {
        const long parsed = std::stol(val);
        if (parsed <= 0) {
            spdlog::warn("env {}: non-positive value {}, using default {}", name, parsed, default_val);
            return default_val;
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    }
}

std::string json_string_array(const std::vector<std::string>& items) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        oss << '"' << escape_json_string(items[i]) << '"';
    }
    oss << ']';
    return oss.str();
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 로깅 초기화 (stdout 은 결과 전용) ────────────────────────────────
    spdlog::set_default_logger(spdlog::stderr_color_mt("graphgate"));
    spdlog::set_level(spdlog::level::from_str(env_str("GRAPHGATE_LOG_LEVEL", "warn")));

    // ── 설정 로드 ───────────────────────────────────────────────────────
    GateConfig config;
    const std::string config_path = env_str("GRAPHGATE_CONFIG", "");
    if (!config_path.empty()) {
        auto loaded = ConfigLoader::load(config_path);
        if (!loaded) {
            std::cerr << loaded.error() << '\n';
            return 2;
        }
        config = std::move(*loaded);
    }
    config.limits.max_rows = env_u32("GRAPHGATE_MAX_ROWS", config.limits.max_rows);

    const Sanitizer          sanitizer{config.sanitizer};
    const ComplexityAnalyzer complexity{config.complexity, config.limits};

    // ── stdin 쿼리 검사 ─────────────────────────────────────────────────
    std::uint64_t line_no  = 0;
    std::uint64_t rejected = 0;
    std::string   line;
    while (std::getline(std::cin, line)) {
        ++line_no;
        if (trim(line).empty()) {
            continue;
        }

        std::ostringstream out;
        out << "{\"line\":" << line_no;

        const SanitizationResult sanitized = sanitizer.sanitize(line);
        std::vector<std::string> warnings  = sanitized.warnings;

        if (!sanitized.is_safe) {
            ++rejected;
            out << ",\"allowed\":false"
                << ",\"stage\":\"sanitizer\""
                << ",\"code\":\"" << sanitize_error_name(sanitized.code) << '"'
                << ",\"error\":\"" << escape_json_string(sanitized.error.value_or("")) << '"'
                << ",\"warnings\":" << json_string_array(warnings) << '}';
            std::cout << out.str() << '\n';
            continue;
        }

        const ComplexityReport report = complexity.score_and_maybe_rewrite(line);
        warnings.insert(warnings.end(), report.warnings.begin(), report.warnings.end());

        out << ",\"allowed\":" << (report.blocked ? "false" : "true");
        if (report.blocked) {
            ++rejected;
            out << ",\"stage\":\"complexity\""
                << ",\"error\":\"" << escape_json_string(report.error.value_or("")) << '"';
        }
        out << ",\"score\":" << report.score.total
            << ",\"risk\":\"" << risk_level_name(report.score.risk_level) << '"'
            << ",\"limit_injected\":" << (report.was_injected ? "true" : "false")
            << ",\"query\":\"" << escape_json_string(report.query) << '"'
            << ",\"warnings\":" << json_string_array(warnings) << '}';
        std::cout << out.str() << '\n';
    }

    spdlog::info("graphgate_check: {} line(s) read, {} rejected", line_no, rejected);
    return rejected == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
