// ---------------------------------------------------------------------------
// audit_logger.cpp
// ---------------------------------------------------------------------------

#include "logger/audit_logger.hpp"

#include <random>
#include <sstream>

#include <fmt/format.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include "common/string_util.hpp"

namespace {

constexpr const char* kAuditLoggerName = "graphgate_audit";
constexpr const char* kTruncatedMarker = "... [truncated]";

std::string new_session_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return fmt::format("{:016x}", gen());
}

// fallback 채널: 프로세스 기본 로거
void report_fallback(std::string_view what) {
    if (auto fallback = spdlog::default_logger_raw()) {
        fallback->error("audit_logger: {}", what);
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// 생성자
//   싱크 생성 실패는 예외로 전파하지 않는다. logger_ 가 비어 있으면
//   이후 레코드는 fallback 채널로 전달된다.
// ---------------------------------------------------------------------------
AuditLogger::AuditLogger(AuditConfig config, AuditFileSink::Clock clock)
    : config_(std::move(config))
    , instance_session_id_(new_session_id())
{
    if (!config_.enabled) {
        return;
    }

    try {
        sink_ = std::make_shared<AuditFileSink>(
            config_.directory,
            config_.rotation,
            static_cast<std::uint64_t>(config_.max_size_mb) * 1024 * 1024,
            config_.retention_days,
            std::move(clock));

        logger_ = std::make_shared<spdlog::logger>(kAuditLoggerName, sink_);
        logger_->set_pattern("%v");
        logger_->set_level(spdlog::level::info);
        logger_->flush_on(spdlog::level::trace);
        logger_->set_error_handler([](const std::string& msg) { report_fallback(msg); });

        spdlog::debug("audit_logger: writing to {}", sink_->current_file().string());
    } catch (const std::exception& e) {
        sink_.reset();
        logger_.reset();
        report_fallback(fmt::format("initialization failed ({}): {}", config_.directory, e.what()));
    }
}

AuditLogger::~AuditLogger() {
    flush();
}

std::optional<std::filesystem::path> AuditLogger::current_file() const {
    if (!sink_) {
        return std::nullopt;
    }
    return sink_->current_file();
}

AuditEntry AuditLogger::make_entry(const RequestContext& ctx, AuditEvent event, std::string_view query) const {
    AuditEntry entry;
    entry.event      = event;
    entry.timestamp  = std::chrono::system_clock::now();
    entry.session_id = ctx.session_id.empty() ? instance_session_id_ : ctx.session_id;
    entry.client_id  = ctx.client_id;
    entry.operation  = ctx.operation;
    entry.query      = std::string(query);
    return entry;
}

// ---------------------------------------------------------------------------
// 편의 메서드
// ---------------------------------------------------------------------------
void AuditLogger::log_outcome(const RequestContext&           ctx,
                              std::string_view                query,
                              const ParameterMap&             params,
                              AuditOutcome                    outcome,
                              const std::optional<GateError>& error) noexcept {
    try {
        AuditEntry entry = make_entry(ctx, AuditEvent::kOutcome, query);
        entry.params   = params;
        entry.outcome  = outcome;
        entry.severity = severity_for(outcome);
        if (error) {
            entry.error_kind = std::string(error_kind_name(error->kind));
            entry.error      = error->detail.empty() ? error->message
                                                     : fmt::format("{} ({})", error->message, error->detail);
        }
        log(std::move(entry));
    } catch (const std::exception& e) {
        report_fallback(e.what());
    }
}

void AuditLogger::log_query(const RequestContext& ctx, std::string_view query, const ParameterMap& params) noexcept {
    try {
        AuditEntry entry = make_entry(ctx, AuditEvent::kQuery, query);
        entry.params = params;
        log(std::move(entry));
    } catch (const std::exception& e) {
        report_fallback(e.what());
    }
}

void AuditLogger::log_response(const RequestContext& ctx,
                               std::string_view      query,
                               std::string_view      response_excerpt,
                               double                execution_time_ms) noexcept {
    try {
        AuditEntry entry = make_entry(ctx, AuditEvent::kResponse, query);
        entry.outcome           = AuditOutcome::kExecuted;
        entry.response_excerpt  = std::string(response_excerpt);
        entry.execution_time_ms = execution_time_ms;
        log(std::move(entry));
    } catch (const std::exception& e) {
        report_fallback(e.what());
    }
}

void AuditLogger::log_error(const RequestContext& ctx, std::string_view query, const GateError& error) noexcept {
    try {
        AuditEntry entry = make_entry(ctx, AuditEvent::kError, query);
        entry.outcome    = (error.kind == ErrorKind::kEngine || error.kind == ErrorKind::kInternal)
                               ? AuditOutcome::kFailed
                               : AuditOutcome::kBlocked;
        entry.severity   = AuditSeverity::kError;
        entry.error_kind = std::string(error_kind_name(error.kind));
        entry.error      = error.detail.empty() ? error.message
                                                : fmt::format("{} ({})", error.message, error.detail);
        log(std::move(entry));
    } catch (const std::exception& e) {
        report_fallback(e.what());
    }
}

// ---------------------------------------------------------------------------
// log
//   마스킹 → 직렬화 → 싱크. 싱크가 없으면 fallback 으로 한 줄을 넘긴다.
// ---------------------------------------------------------------------------
void AuditLogger::log(AuditEntry entry) noexcept {
    if (!config_.enabled) {
        return;
    }
    try {
        const std::string line = format_entry(prepare(std::move(entry)));
        if (logger_) {
            logger_->info(line);
        } else {
            report_fallback(fmt::format("sink unavailable, record: {}", line));
        }
    } catch (const std::exception& e) {
        report_fallback(e.what());
    } catch (...) {
        report_fallback("unknown failure while writing audit record");
    }
}

void AuditLogger::flush() noexcept {
    if (!logger_) {
        return;
    }
    try {
        logger_->flush();
    } catch (const std::exception& e) {
        report_fallback(e.what());
    }
}

AuditEntry AuditLogger::prepare(AuditEntry entry) const {
    if (entry.response_excerpt && entry.response_excerpt->size() > config_.max_response_length) {
        entry.response_excerpt->resize(config_.max_response_length);
        entry.response_excerpt->append(kTruncatedMarker);
    }

    if (config_.pii_redaction) {
        entry.query  = redactor_.redact(entry.query);
        entry.params = redactor_.redact(entry.params);
        if (entry.error) {
            entry.error = redactor_.redact(*entry.error);
        }
        if (entry.response_excerpt) {
            entry.response_excerpt = redactor_.redact(*entry.response_excerpt);
        }
    }
    return entry;
}

// ---------------------------------------------------------------------------
// format_entry: JSON / text 직렬화
// ---------------------------------------------------------------------------
std::string AuditLogger::format_entry(const AuditEntry& entry) const {
    std::ostringstream out;

    if (config_.format == AuditFormat::kText) {
        out << '[' << format_iso8601(entry.timestamp) << "] "
            << to_upper(audit_event_name(entry.event))
            << " operation=" << entry.operation
            << " session=" << entry.session_id
            << " client=" << entry.client_id
            << " outcome=" << audit_outcome_name(entry.outcome)
            << " severity=" << audit_severity_name(entry.severity)
            << " query=\"" << escape_json_string(entry.query) << '"';
        if (!entry.params.empty()) {
            out << " params={";
            bool first = true;
            for (const auto& [name, value] : entry.params) {
                out << (first ? "" : ", ") << name << "=\"" << escape_json_string(value) << '"';
                first = false;
            }
            out << '}';
        }
        if (entry.error_kind) {
            out << " error_kind=" << *entry.error_kind;
        }
        if (entry.error) {
            out << " error=\"" << escape_json_string(*entry.error) << '"';
        }
        if (entry.execution_time_ms) {
            out << fmt::format(" execution_time_ms={:.3f}", *entry.execution_time_ms);
        }
        if (entry.response_excerpt) {
            out << " response=\"" << escape_json_string(*entry.response_excerpt) << '"';
        }
        return out.str();
    }

    out << R"({"timestamp":")" << format_iso8601(entry.timestamp)
        << R"(","event_type":")" << audit_event_name(entry.event)
        << R"(","session_id":")" << escape_json_string(entry.session_id)
        << R"(","client_id":")" << escape_json_string(entry.client_id)
        << R"(","operation":")" << escape_json_string(entry.operation)
        << R"(","outcome":")" << audit_outcome_name(entry.outcome)
        << R"(","severity":")" << audit_severity_name(entry.severity)
        << R"(","query":")" << escape_json_string(entry.query)
        << R"(","parameters":{)";

    bool first = true;
    for (const auto& [name, value] : entry.params) {
        if (!first) {
            out << ',';
        }
        out << '"' << escape_json_string(name) << R"(":")" << escape_json_string(value) << '"';
        first = false;
    }
    out << '}';

    if (entry.error_kind) {
        out << R"(,"error_kind":")" << escape_json_string(*entry.error_kind) << '"';
    }
    if (entry.error) {
        out << R"(,"error":")" << escape_json_string(*entry.error) << '"';
    }
    if (entry.response_excerpt) {
        out << R"(,"response":")" << escape_json_string(*entry.response_excerpt) << '"';
    }
    if (entry.execution_time_ms) {
        out << fmt::format(R"(,"execution_time_ms":{:.3f})", *entry.execution_time_ms);
    }
    out << '}';
    return out.str();
}
