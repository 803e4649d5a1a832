#pragma once

// ---------------------------------------------------------------------------
// audit_logger.hpp
//
// spdlog 기반 감사 로거.
//
// [설계 원칙]
// - 싱글턴 금지: QueryPipeline 이 소유하고 생성자 주입으로 설정을 받는다.
// - 요청 경로를 절대 실패시키지 않는다. 모든 public 메서드는 noexcept 이며,
//   내부 실패(파일 열기/쓰기/포맷)는 spdlog 기본 로거(fallback 채널)로 보고한다.
// - PII 마스킹은 직렬화 직전에 정확히 한 번 적용한다.
// - 전용 spdlog::logger("graphgate_audit") 는 레지스트리에 등록하지 않는다
//   (인스턴스별 독립 싱크).
//
// [레코드 포맷]
//   json: 한 줄 JSON 객체 (snake_case 키)
//   text: 사람이 읽는 한 줄 ([ts] EVENT key=value ...)
// ---------------------------------------------------------------------------

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "config/gate_config.hpp"
#include "logger/audit_file_sink.hpp"
#include "logger/audit_types.hpp"
#include "logger/pii_redactor.hpp"

namespace spdlog {
class logger;
}

class AuditLogger {
public:
    explicit AuditLogger(AuditConfig config, AuditFileSink::Clock clock = {});
    ~AuditLogger();

    AuditLogger(const AuditLogger&)            = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    // log_outcome
    //   단계 결과 한 건을 기록한다. error 가 있으면 kind / message / detail 을 함께 남긴다.
    void log_outcome(const RequestContext&           ctx,
                     std::string_view                query,
                     const ParameterMap&             params,
                     AuditOutcome                    outcome,
                     const std::optional<GateError>& error = std::nullopt) noexcept;

    void log_query(const RequestContext& ctx, std::string_view query, const ParameterMap& params) noexcept;

    // response_excerpt 는 max_response_length 를 넘으면 잘린다.
    void log_response(const RequestContext& ctx,
                      std::string_view      query,
                      std::string_view      response_excerpt,
                      double                execution_time_ms) noexcept;

    void log_error(const RequestContext& ctx, std::string_view query, const GateError& error) noexcept;

    void log(AuditEntry entry) noexcept;

    void flush() noexcept;

    // 마스킹/잘라내기 적용 후의 레코드 (직렬화 직전 상태).
    [[nodiscard]] AuditEntry prepare(AuditEntry entry) const;

    // config.format 에 따른 한 줄 직렬화 (마스킹은 하지 않음).
    [[nodiscard]] std::string format_entry(const AuditEntry& entry) const;

    // 파일 싱크가 정상 동작 중인지 (비활성 또는 초기화 실패 시 false).
    [[nodiscard]] bool active() const noexcept { return logger_ != nullptr; }

    [[nodiscard]] std::optional<std::filesystem::path> current_file() const;

    [[nodiscard]] const std::string& instance_session_id() const noexcept { return instance_session_id_; }

private:
    [[nodiscard]] AuditEntry make_entry(const RequestContext& ctx, AuditEvent event, std::string_view query) const;

    AuditConfig                     config_;
    PiiRedactor                     redactor_;
    std::string                     instance_session_id_;
    std::shared_ptr<AuditFileSink>  sink_;
    std::shared_ptr<spdlog::logger> logger_;
};
