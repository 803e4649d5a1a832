// ---------------------------------------------------------------------------
// config_loader.cpp
//
// [섹션]
//   environment, debug_mode
//   sanitizer:  enabled strict_mode allow_admin_procedures allow_schema_changes
//               block_non_ascii allow_write_operations
//               max_query_length max_parameters max_parameter_length
//   complexity: enabled max_complexity block_on_exceed max_variable_path_length
//               thresholds {moderate high critical} weights {...}
//   limits:     auto_inject max_rows
//   rate_limit: enabled sweep_interval_seconds global {rate per_seconds burst} tools {name: {...}}
//   audit:      enabled directory format rotation max_size_mb retention_days
//               pii_redaction max_response_length
//   engine:     timeout_ms worker_threads
//   plan:       max_hop_bound
//
// 섹션마다 try-catch 로 yaml-cpp 예외를 잡아 섹션 이름과 위치를 포함한 오류로 변환한다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <functional>
#include <optional>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "common/string_util.hpp"

namespace {

// 섹션 파서 내부 검증 실패. load() 에서 std::unexpected 로 변환된다.
struct ConfigError {
    std::string message;
};

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스칼라 읽기. 노드가 없으면 fallback, 타입이 맞지 않으면 오류.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] std::expected<T, ConfigError> read_scalar(const YAML::Node& node, const T& fallback,
                                                        std::string_view key) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    if (!node.IsScalar()) {
        return std::unexpected(ConfigError{fmt::format("'{}' must be a scalar (line {})", key, node.Mark().line + 1)});
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::unexpected(ConfigError{fmt::format(
            "'{}' has invalid value '{}' (line {}, col {})",
            key, node.Scalar(), node.Mark().line + 1, node.Mark().column + 1)});
    }
}

// 필드 하나를 읽어 target 에 반영한다. 오류는 errors 에 누적하지 않고 첫 오류에서 중단.
template <typename T>
void read_into(const YAML::Node& section, const char* key, T& target, std::optional<ConfigError>& error,
               std::string_view section_name) {
    if (error) {
        return;
    }
    auto value = read_scalar<T>(section[key], target, fmt::format("{}.{}", section_name, key));
    if (!value) {
        error = value.error();
        return;
    }
    target = *value;
}

[[nodiscard]] std::optional<ConfigError> require_map(const YAML::Node& node, std::string_view name) {
    if (node && !node.IsNull() && !node.IsMap()) {
        return ConfigError{fmt::format("'{}' must be a map (line {})", name, node.Mark().line + 1)};
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// 섹션 파서
// ---------------------------------------------------------------------------
std::optional<ConfigError> parse_sanitizer(const YAML::Node& node, SanitizerConfig& cfg) {
    if (auto e = require_map(node, "sanitizer")) {
        return e;
    }
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    std::optional<ConfigError> error;
    read_into(node, "enabled", cfg.enabled, error, "sanitizer");
    read_into(node, "strict_mode", cfg.strict_mode, error, "sanitizer");
    read_into(node, "allow_admin_procedures", cfg.allow_admin_procedures, error, "sanitizer");
    read_into(node, "allow_schema_changes", cfg.allow_schema_changes, error, "sanitizer");
    read_into(node, "allow_write_operations", cfg.allow_write_operations, error, "sanitizer");
    read_into(node, "block_non_ascii", cfg.block_non_ascii, error, "sanitizer");
    read_into(node, "max_query_length", cfg.max_query_length, error, "sanitizer");
    read_into(node, "max_parameters", cfg.max_parameters, error, "sanitizer");
    read_into(node, "max_parameter_length", cfg.max_parameter_length, error, "sanitizer");
    if (!error && cfg.max_query_length == 0) {
        error = ConfigError{"sanitizer.max_query_length must be positive"};
    }
    return error;
}

std::optional<ConfigError> parse_weights(const YAML::Node& node, ComplexityWeights& w) {
    if (auto e = require_map(node, "complexity.weights")) {
        return e;
    }
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    constexpr std::string_view kSection = "complexity.weights";
    std::optional<ConfigError> error;
    read_into(node, "match_clause", w.match_clause, error, kSection);
    read_into(node, "match_cap", w.match_cap, error, kSection);
    read_into(node, "varlength_short", w.varlength_short, error, kSection);
    read_into(node, "varlength_long", w.varlength_long, error, kSection);
    read_into(node, "varlength_excessive", w.varlength_excessive, error, kSection);
    read_into(node, "varlength_unbounded", w.varlength_unbounded, error, kSection);
    read_into(node, "varlength_cap", w.varlength_cap, error, kSection);
    read_into(node, "cartesian_product", w.cartesian_product, error, kSection);
    read_into(node, "cartesian_cap", w.cartesian_cap, error, kSection);
    read_into(node, "aggregation", w.aggregation, error, kSection);
    read_into(node, "aggregation_cap", w.aggregation_cap, error, kSection);
    read_into(node, "subquery", w.subquery, error, kSection);
    read_into(node, "subquery_cap", w.subquery_cap, error, kSection);
    read_into(node, "union_clause", w.union_clause, error, kSection);
    read_into(node, "union_cap", w.union_cap, error, kSection);
    read_into(node, "optional_match", w.optional_match, error, kSection);
    read_into(node, "optional_match_cap", w.optional_match_cap, error, kSection);
    read_into(node, "with_clause", w.with_clause, error, kSection);
    read_into(node, "with_cap", w.with_cap, error, kSection);
    read_into(node, "missing_limit", w.missing_limit, error, kSection);
    read_into(node, "missing_index", w.missing_index, error, kSection);
    read_into(node, "missing_index_cap", w.missing_index_cap, error, kSection);
    return error;
}

std::optional<ConfigError> parse_complexity(const YAML::Node& node, ComplexityConfig& cfg) {
    if (auto e = require_map(node, "complexity")) {
        return e;
    }
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    std::optional<ConfigError> error;
    read_into(node, "enabled", cfg.enabled, error, "complexity");
    read_into(node, "max_complexity", cfg.max_complexity, error, "complexity");
    read_into(node, "block_on_exceed", cfg.block_on_exceed, error, "complexity");
    read_into(node, "max_variable_path_length", cfg.max_variable_path_length, error, "complexity");
    if (error) {
        return error;
    }

    const YAML::Node thresholds = node["thresholds"];
    if (auto e = require_map(thresholds, "complexity.thresholds")) {
        return e;
    }
    if (thresholds && thresholds.IsMap()) {
        read_into(thresholds, "moderate", cfg.moderate_threshold, error, "complexity.thresholds");
        read_into(thresholds, "high", cfg.high_threshold, error, "complexity.thresholds");
        read_into(thresholds, "critical", cfg.critical_threshold, error, "complexity.thresholds");
        if (error) {
            return error;
        }
    }
    if (!(0 < cfg.moderate_threshold && cfg.moderate_threshold < cfg.high_threshold &&
          cfg.high_threshold < cfg.critical_threshold)) {
        return ConfigError{fmt::format(
            "complexity.thresholds must be increasing and positive (got {}/{}/{})",
            cfg.moderate_threshold, cfg.high_threshold, cfg.critical_threshold)};
    }
    if (cfg.max_complexity <= 0) {
        return ConfigError{"complexity.max_complexity must be positive"};
    }
    return parse_weights(node["weights"], cfg.weights);
}

std::optional<ConfigError> parse_limits(const YAML::Node& node, LimitConfig& cfg) {
    if (auto e = require_map(node, "limits")) {
        return e;
    }
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    std::optional<ConfigError> error;
    read_into(node, "auto_inject", cfg.auto_inject, error, "limits");
    read_into(node, "max_rows", cfg.max_rows, error, "limits");
    if (!error && cfg.max_rows == 0) {
        error = ConfigError{"limits.max_rows must be positive"};
    }
    return error;
}

std::expected<RateLimitRule, ConfigError> parse_rule(const YAML::Node& node, std::string_view name) {
    const std::string section = fmt::format("rate_limit.{}", name);
    if (!node.IsMap()) {
        return std::unexpected(ConfigError{fmt::format("'{}' must be a map", section)});
    }
    RateLimitRule rule{};
    std::optional<ConfigError> error;
    read_into(node, "rate", rule.rate, error, section);
    read_into(node, "per_seconds", rule.per_seconds, error, section);
    if (!error && node["burst"] && !node["burst"].IsNull()) {
        double burst = 0.0;
        read_into(node, "burst", burst, error, section);
        if (!error && burst < 1.0) {
            error = ConfigError{fmt::format("{}.burst must be at least 1", section)};
        }
        rule.burst = burst;
    }
    if (!error && (rule.rate <= 0.0 || rule.per_seconds <= 0.0)) {
        error = ConfigError{fmt::format("{}: rate and per_seconds must be positive", section)};
    }
    if (error) {
        return std::unexpected(*error);
    }
    return rule;
}

std::optional<ConfigError> parse_rate_limit(const YAML::Node& node, RateLimitConfig& cfg) {
    if (auto e = require_map(node, "rate_limit")) {
        return e;
    }
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    std::optional<ConfigError> error;
    read_into(node, "enabled", cfg.enabled, error, "rate_limit");
    read_into(node, "sweep_interval_seconds", cfg.sweep_interval_seconds, error, "rate_limit");
    if (error) {
        return error;
    }

    if (const YAML::Node global = node["global"]; global && !global.IsNull()) {
        auto rule = parse_rule(global, "global");
        if (!rule) {
            return rule.error();
        }
        cfg.global = *rule;
    }

    const YAML::Node tools = node["tools"];
    if (auto e = require_map(tools, "rate_limit.tools")) {
        return e;
    }
    if (tools && tools.IsMap()) {
        for (const auto& item : tools) {
            const std::string name = item.first.as<std::string>();
            auto rule = parse_rule(item.second, fmt::format("tools.{}", name));
            if (!rule) {
                return rule.error();
            }
            cfg.tools[name] = *rule;
        }
    }
    return std::nullopt;
}

std::optional<ConfigError> parse_audit(const YAML::Node& node, AuditConfig& cfg) {
    if (auto e = require_map(node, "audit")) {
        return e;
    }
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    std::optional<ConfigError> error;
    std::string format   = cfg.format == AuditFormat::kText ? "text" : "json";
    std::string rotation = "daily";

    read_into(node, "enabled", cfg.enabled, error, "audit");
    read_into(node, "directory", cfg.directory, error, "audit");
    read_into(node, "format", format, error, "audit");
    read_into(node, "rotation", rotation, error, "audit");
    read_into(node, "max_size_mb", cfg.max_size_mb, error, "audit");
    read_into(node, "retention_days", cfg.retention_days, error, "audit");
    read_into(node, "pii_redaction", cfg.pii_redaction, error, "audit");
    read_into(node, "max_response_length", cfg.max_response_length, error, "audit");
    if (error) {
        return error;
    }

    const std::string fmt_lower = to_lower(format);
    if (fmt_lower == "json") {
        cfg.format = AuditFormat::kJson;
    } else if (fmt_lower == "text") {
        cfg.format = AuditFormat::kText;
    } else {
        return ConfigError{fmt::format("audit.format '{}' is not 'json' or 'text'", format)};
    }

    const std::string rot_lower = to_lower(rotation);
    if (rot_lower == "daily") {
        cfg.rotation = AuditRotation::kDaily;
    } else if (rot_lower == "weekly") {
        cfg.rotation = AuditRotation::kWeekly;
    } else if (rot_lower == "size") {
        cfg.rotation = AuditRotation::kSize;
    } else {
        return ConfigError{fmt::format("audit.rotation '{}' is not 'daily', 'weekly' or 'size'", rotation)};
    }

    if (cfg.directory.empty()) {
        return ConfigError{"audit.directory must not be empty"};
    }
    return std::nullopt;
}

std::optional<ConfigError> parse_engine(const YAML::Node& node, EngineConfig& cfg) {
    if (auto e = require_map(node, "engine")) {
        return e;
    }
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    std::optional<ConfigError> error;
    read_into(node, "timeout_ms", cfg.timeout_ms, error, "engine");
    read_into(node, "worker_threads", cfg.worker_threads, error, "engine");
    if (!error && (cfg.timeout_ms == 0 || cfg.worker_threads == 0)) {
        error = ConfigError{"engine.timeout_ms and engine.worker_threads must be positive"};
    }
    return error;
}

std::optional<ConfigError> parse_plan(const YAML::Node& node, PlanConfig& cfg) {
    if (auto e = require_map(node, "plan")) {
        return e;
    }
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    std::optional<ConfigError> error;
    read_into(node, "max_hop_bound", cfg.max_hop_bound, error, "plan");
    if (!error && cfg.max_hop_bound <= 0) {
        error = ConfigError{"plan.max_hop_bound must be positive"};
    }
    return error;
}

// ---------------------------------------------------------------------------
// parse_root: 파싱된 YAML 루트 → GateConfig
// ---------------------------------------------------------------------------
std::expected<GateConfig, std::string> parse_root(const YAML::Node& root, std::string_view origin) {
    if (!root || !root.IsMap()) {
        const std::string err = fmt::format("config_loader: '{}' is not a valid YAML map (top-level)", origin);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    GateConfig cfg{};

    using SectionParser = std::function<std::optional<ConfigError>()>;
    const std::pair<const char*, SectionParser> sections[] = {
        {"environment", [&]() -> std::optional<ConfigError> {
             std::optional<ConfigError> error;
             read_into(root, "environment", cfg.environment, error, "root");
             read_into(root, "debug_mode", cfg.debug_mode, error, "root");
             return error;
         }},
        {"sanitizer",  [&] { return parse_sanitizer(root["sanitizer"], cfg.sanitizer); }},
        {"complexity", [&] { return parse_complexity(root["complexity"], cfg.complexity); }},
        {"limits",     [&] { return parse_limits(root["limits"], cfg.limits); }},
        {"rate_limit", [&] { return parse_rate_limit(root["rate_limit"], cfg.rate_limit); }},
        {"audit",      [&] { return parse_audit(root["audit"], cfg.audit); }},
        {"engine",     [&] { return parse_engine(root["engine"], cfg.engine); }},
        {"plan",       [&] { return parse_plan(root["plan"], cfg.plan); }},
    };

    for (const auto& [name, parse] : sections) {
        try {
            if (auto error = parse()) {
                const std::string err = fmt::format("config_loader: {}: {}", origin, error->message);
                spdlog::error("{}", err);
                return std::unexpected(err);
            }
        } catch (const YAML::Exception& e) {
            const std::string err = fmt::format(
                "config_loader: error parsing '{}' section in '{}' at line {}, col {}: {}",
                name, origin, e.mark.line + 1, e.mark.column + 1, e.what());
            spdlog::error("{}", err);
            return std::unexpected(err);
        }
    }

    // production 환경에서 debug_mode 금지 (내부 오류 상세 노출 방지)
    if (cfg.debug_mode && ConfigLoader::is_production(cfg.environment)) {
        const std::string err = fmt::format(
            "config_loader: debug_mode must not be enabled when environment is '{}'", cfg.environment);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loaded '{}' (environment={}, rate_limit tools={}, audit={})",
                 origin, cfg.environment, cfg.rate_limit.tools.size(),
                 cfg.audit.enabled ? cfg.audit.directory : std::string("disabled"));
    return cfg;
}

}  // namespace

bool ConfigLoader::is_production(std::string_view environment) {
    const std::string env = to_lower(trim(environment));
    return env == "production" || env == "prod";
}

std::expected<GateConfig, std::string> ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}", config_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading config from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, canonical_path.string());
}

std::expected<GateConfig, std::string> ConfigLoader::load_from_string(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error at line {}, col {}: {}", e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("config_loader: YAML error: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return parse_root(root, "<string>");
}
