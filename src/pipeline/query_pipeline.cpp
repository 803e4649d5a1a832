#include "pipeline/query_pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <future>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <boost/asio/post.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/string_util.hpp"

namespace {

// ---------------------------------------------------------------------------
// run_bounded
//   fn 을 thread_pool 에서 실행하고 timeout_ms 동안 결과를 기다린다.
//   타임아웃 시 작업은 계속 실행되지만 결과는 버려진다.
//   fn 이 던진 std::exception 은 kEngine 으로 변환한다.
// ---------------------------------------------------------------------------
template <typename Fn>
auto run_bounded(boost::asio::thread_pool& pool, std::uint32_t timeout_ms, std::string_view what, Fn fn)
    -> std::expected<std::invoke_result_t<Fn>, GateError> {
    using Result = std::invoke_result_t<Fn>;

    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> future = task->get_future();
    boost::asio::post(pool, [task] { (*task)(); });

    if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        spdlog::warn("query_pipeline: {} exceeded {} ms", what, timeout_ms);
        return std::unexpected(GateError{
            ErrorKind::kEngine,
            fmt::format("Query execution timeout after {} ms", timeout_ms),
            fmt::format("{} still running, result discarded", what),
            std::nullopt,
        });
    }

    try {
        return std::expected<Result, GateError>(std::in_place, future.get());
    } catch (const std::exception& e) {
        spdlog::warn("query_pipeline: {} failed: {}", what, e.what());
        return std::unexpected(GateError{
            ErrorKind::kEngine, fmt::format("{} failed", what), e.what(), std::nullopt});
    }
}

[[nodiscard]] double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

void append_warnings(std::vector<std::string>& into, const std::vector<std::string>& from) {
    into.insert(into.end(), from.begin(), from.end());
}

}  // namespace

std::string retry_after_text(double seconds) {
    // 0.1초 단위 올림 (표현 오차 1e-6 이하는 무시)
    const double tenths = std::ceil(seconds * 10.0 - 1e-6);
    return fmt::format("{:.1f}", std::max(0.0, tenths) / 10.0);
}

std::string rows_to_json(const std::vector<ResultRow>& rows) {
    std::ostringstream oss;
    oss << '[';
    bool first_row = true;
    for (const auto& row : rows) {
        if (!first_row) {
            oss << ',';
        }
        first_row = false;
        oss << '{';
        bool first_col = true;
        for (const auto& [key, value] : row) {
            if (!first_col) {
                oss << ',';
            }
            first_col = false;
            oss << '"' << escape_json_string(key) << "\":\"" << escape_json_string(value) << '"';
        }
        oss << '}';
    }
    oss << ']';
    return oss.str();
}

// ---------------------------------------------------------------------------
// 생성자
// ---------------------------------------------------------------------------
QueryPipeline::QueryPipeline(GateConfig                       config,
                             std::shared_ptr<GraphDriver>     driver,
                             std::shared_ptr<RateLimiter>     rate_limiter,
                             std::shared_ptr<AuditLogger>     audit,
                             std::shared_ptr<StatsCollector>  stats,
                             std::shared_ptr<QueryTranslator> translator)
    : config_(std::move(config))
    , driver_(std::move(driver))
    , rate_limiter_(std::move(rate_limiter))
    , audit_(std::move(audit))
    , stats_(std::move(stats))
    , translator_(std::move(translator))
    , sanitizer_(config_.sanitizer)
    , analyze_sanitizer_([this] {
          SanitizerConfig cfg        = config_.sanitizer;
          cfg.allow_write_operations = true;
          return cfg;
      }())
    , complexity_(config_.complexity, config_.limits)
    , plan_analyzer_(*driver_, config_.plan)
    , error_sanitizer_(config_.debug_mode)
    , pool_(config_.engine.worker_threads)
{
    spdlog::info("query_pipeline: ready (environment={}, read_only={}, timeout={}ms, workers={})",
                 config_.environment, !config_.sanitizer.allow_write_operations,
                 config_.engine.timeout_ms, config_.engine.worker_threads);
}

QueryPipeline::~QueryPipeline() {
    pool_.join();
}

RequestContext QueryPipeline::make_context(const PipelineRequest& request, const char* default_op) const {
    return RequestContext{
        .session_id  = request.session_id,
        .client_id   = request.client_id.empty() ? std::string("anonymous") : request.client_id,
        .operation   = request.operation.empty() ? std::string(default_op) : request.operation,
        .received_at = std::chrono::system_clock::now(),
    };
}

// ---------------------------------------------------------------------------
// 1 단계: rate limit
// ---------------------------------------------------------------------------
std::optional<GateError> QueryPipeline::check_rate_limit(const RequestContext& ctx) {
    const RateLimitDecision decision = rate_limiter_->check(ctx.client_id, ctx.operation);
    if (decision.allowed) {
        return std::nullopt;
    }
    const double retry_after = decision.retry_after_seconds.value_or(0.0);
    return GateError{
        ErrorKind::kRateLimit,
        fmt::format("Rate limit exceeded for '{}'. Retry after {} seconds", ctx.operation,
                    retry_after_text(retry_after)),
        fmt::format("client={}", ctx.client_id),
        retry_after,
    };
}

// ---------------------------------------------------------------------------
// 2~3 단계: sanitize → complexity (+ LIMIT 삽입)
// ---------------------------------------------------------------------------
std::expected<QueryPipeline::GatedQuery, GateError> QueryPipeline::gate(std::string_view          query,
                                                                        const ParameterMap&       params,
                                                                        std::vector<std::string>& warnings) const {
    if (config_.sanitizer.enabled) {
        const SanitizationResult result = sanitizer_.sanitize(query, params);
        append_warnings(warnings, result.warnings);
        if (!result.is_safe) {
            const ErrorKind kind = result.code == SanitizeErrorCode::kWriteOperation
                                       ? ErrorKind::kWriteBlocked
                                       : ErrorKind::kValidation;
            return std::unexpected(GateError{
                kind, result.error.value_or("Query rejected by sanitizer"),
                std::string(sanitize_error_name(result.code)), std::nullopt});
        }
    }

    ComplexityReport report = complexity_.score_and_maybe_rewrite(query);
    append_warnings(warnings, report.warnings);
    if (report.blocked) {
        std::string breakdown;
        for (const auto& [factor, value] : report.score.breakdown) {
            breakdown += fmt::format("{}{}={}", breakdown.empty() ? "" : ", ", factor, value);
        }
        return std::unexpected(GateError{
            ErrorKind::kComplexity, report.error.value_or("Query too complex"), breakdown, std::nullopt});
    }

    return GatedQuery{
        .query        = std::move(report.query),
        .score        = std::move(report.score),
        .was_injected = report.was_injected,
    };
}

// ---------------------------------------------------------------------------
// 4 단계: 실행 (게이트 통과 후에만 materialize)
// ---------------------------------------------------------------------------
std::expected<std::vector<ResultRow>, GateError> QueryPipeline::run_query(const std::string&  query,
                                                                         const ParameterMap& params) {
    return run_bounded(pool_, config_.engine.timeout_ms, "Query execution",
                       [driver = driver_, query, params]() -> std::vector<ResultRow> {
                           std::unique_ptr<ResultHandle> handle = driver->run(query, params);
                           if (!handle) {
                               throw std::runtime_error("driver returned no result handle");
                           }
                           return handle->materialize();
                       });
}

PipelineResponse QueryPipeline::reject(const RequestContext&    ctx,
                                       std::string_view         query,
                                       const ParameterMap&      params,
                                       const GateError&         error,
                                       std::vector<std::string> warnings) {
    switch (error.kind) {
        case ErrorKind::kRateLimit:
            audit_->log_outcome(ctx, query, params, AuditOutcome::kRateLimited, error);
            break;
        case ErrorKind::kEngine:
        case ErrorKind::kInternal:
            audit_->log_error(ctx, query, error);
            break;
        default:
            audit_->log_outcome(ctx, query, params, AuditOutcome::kBlocked, error);
            break;
    }
    stats_->on_blocked(error.kind);

    PipelineResponse response;
    response.success             = false;
    response.error_kind          = error.kind;
    response.retry_after_seconds = error.retry_after_seconds;
    response.warnings            = std::move(warnings);
    response.metadata["operation"] = ctx.operation;

    if (error.kind == ErrorKind::kEngine || error.kind == ErrorKind::kInternal) {
        const std::string full = error.detail.empty() ? error.message
                                                      : fmt::format("{}: {}", error.message, error.detail);
        response.error = error_sanitizer_.sanitize(error.kind, error_sanitizer_.debug_mode() ? full : error.message);
    } else {
        response.error = error.message;
    }

    spdlog::info("query_pipeline: {} rejected ({}) client={} session={}",
                 ctx.operation, error_kind_name(error.kind), ctx.client_id, ctx.session_id);
    return response;
}

PipelineResponse QueryPipeline::execute_gated(const RequestContext&              ctx,
                                              const GatedQuery&                  gated,
                                              const ParameterMap&                params,
                                              std::vector<std::string>           warnings,
                                              std::map<std::string, std::string> metadata) {
    const auto start  = std::chrono::steady_clock::now();
    auto       result = run_query(gated.query, params);
    const double ms   = elapsed_ms(start);

    if (!result) {
        return reject(ctx, gated.query, params, result.error(), std::move(warnings));
    }

    // 5 단계: 감사
    audit_->log_response(ctx, gated.query, rows_to_json(*result), ms);
    stats_->on_executed(gated.was_injected);

    PipelineResponse response;
    response.success  = true;
    response.warnings = std::move(warnings);
    response.metadata = std::move(metadata);
    response.metadata["operation"]         = ctx.operation;
    response.metadata["executed_query"]    = gated.query;
    response.metadata["limit_injected"]    = gated.was_injected ? "true" : "false";
    response.metadata["complexity_score"]  = std::to_string(gated.score.total);
    response.metadata["risk_level"]        = std::string(risk_level_name(gated.score.risk_level));
    response.metadata["row_count"]         = std::to_string(result->size());
    response.metadata["execution_time_ms"] = fmt::format("{:.2f}", ms);
    response.rows = std::move(*result);
    return response;
}

// ---------------------------------------------------------------------------
// execute_cypher
// ---------------------------------------------------------------------------
PipelineResponse QueryPipeline::execute_cypher(const PipelineRequest& request) {
    const RequestContext ctx = make_context(request, kOpExecuteCypher);
    stats_->on_request();
    audit_->log_query(ctx, request.query, request.parameters);

    if (auto limited = check_rate_limit(ctx)) {
        return reject(ctx, request.query, request.parameters, *limited, {});
    }

    std::vector<std::string> warnings;
    auto gated = gate(request.query, request.parameters, warnings);
    if (!gated) {
        return reject(ctx, request.query, request.parameters, gated.error(), std::move(warnings));
    }

    return execute_gated(ctx, *gated, request.parameters, std::move(warnings), {});
}

// ---------------------------------------------------------------------------
// query_graph
//   번역기 출력은 신뢰하지 않는다: 생성된 쿼리는 execute_cypher 와 동일한 게이트를 통과해야 한다.
// ---------------------------------------------------------------------------
PipelineResponse QueryPipeline::query_graph(const PipelineRequest& request) {
    const RequestContext ctx = make_context(request, kOpQueryGraph);
    stats_->on_request();
    audit_->log_query(ctx, request.query, {});

    if (auto limited = check_rate_limit(ctx)) {
        return reject(ctx, request.query, {}, *limited, {});
    }

    if (!translator_) {
        return reject(ctx, request.query, {},
                      GateError{ErrorKind::kInternal, "Query translator not configured", {}, std::nullopt}, {});
    }

    auto generated = run_bounded(pool_, config_.engine.timeout_ms, "Query translation",
                                 [translator = translator_, question = request.query] {
                                     return translator->translate(question);
                                 });
    if (!generated) {
        return reject(ctx, request.query, {}, generated.error(), {});
    }

    std::vector<std::string> warnings;
    auto gated = gate(*generated, request.parameters, warnings);
    if (!gated) {
        PipelineResponse response =
            reject(ctx, *generated, request.parameters, gated.error(), std::move(warnings));
        response.metadata["generated_query"] = *generated;
        return response;
    }

    return execute_gated(ctx, *gated, request.parameters, std::move(warnings),
                         {{"question", request.query}, {"generated_query", *generated}});
}

// ---------------------------------------------------------------------------
// analyze_performance
//   rate limit → sanitize → PlanAnalyzer. LIMIT 삽입 / 복잡도 차단은 적용하지 않는다
//   (분석 대상은 호출자가 보낸 쿼리 그대로).
// ---------------------------------------------------------------------------
PipelineResponse QueryPipeline::analyze_performance(const PipelineRequest& request, PlanMode mode) {
    const RequestContext ctx = make_context(request, kOpAnalyzeQuery);
    stats_->on_request();
    audit_->log_query(ctx, request.query, request.parameters);

    if (auto limited = check_rate_limit(ctx)) {
        return reject(ctx, request.query, request.parameters, *limited, {});
    }

    std::vector<std::string> warnings;
    if (config_.sanitizer.enabled) {
        const SanitizationResult result = analyze_sanitizer_.sanitize(request.query, request.parameters);
        append_warnings(warnings, result.warnings);
        if (!result.is_safe) {
            return reject(ctx, request.query, request.parameters,
                          GateError{ErrorKind::kValidation, result.error.value_or("Query rejected by sanitizer"),
                                    std::string(sanitize_error_name(result.code)), std::nullopt},
                          std::move(warnings));
        }
    }

    const bool allow_write = config_.sanitizer.allow_write_operations;
    const auto start       = std::chrono::steady_clock::now();
    auto analysis = run_bounded(pool_, config_.engine.timeout_ms, "Plan analysis",
                                [this, query = request.query, params = request.parameters, mode, allow_write] {
                                    return plan_analyzer_.analyze(query, params, mode, allow_write);
                                });
    const double ms = elapsed_ms(start);

    if (!analysis) {
        return reject(ctx, request.query, request.parameters, analysis.error(), std::move(warnings));
    }
    if (!*analysis) {
        return reject(ctx, request.query, request.parameters, analysis->error(), std::move(warnings));
    }

    AnalysisResult& result = **analysis;
    audit_->log_outcome(ctx, request.query, request.parameters, AuditOutcome::kAnalyzed);
    stats_->on_analyzed();

    // 플랜이 있으므로 missing_index 요인까지 포함한 복잡도 점수를 함께 보고한다
    std::vector<std::string> operator_types;
    operator_types.reserve(result.plan.operators.size());
    for (const auto& op : result.plan.operators) {
        operator_types.push_back(op.operator_type);
    }
    const ComplexityScore plan_score = complexity_.score_with_plan(request.query, operator_types);

    PipelineResponse response;
    response.success  = true;
    response.warnings = std::move(warnings);
    response.metadata["operation"]         = ctx.operation;
    response.metadata["mode"]              = std::string(plan_mode_name(mode));
    response.metadata["bottleneck_count"]  = std::to_string(result.bottlenecks.size());
    response.metadata["overall_severity"]  = std::to_string(result.summary.overall_severity);
    response.metadata["complexity_score"]  = std::to_string(plan_score.total);
    response.metadata["risk_level"]        = std::string(risk_level_name(plan_score.risk_level));
    response.metadata["execution_time_ms"] = fmt::format("{:.2f}", ms);
    response.analysis = std::move(result);
    return response;
}
