#pragma once

// ---------------------------------------------------------------------------
// query_pipeline.hpp
//
// 보안 게이트의 조립 지점 (composition root). 전송 레이어가 호출하는 세 엔트리포인트를 제공한다.
//
//   execute_cypher      : 원시 Cypher 쿼리 실행
//   query_graph         : 자연어 질문 → QueryTranslator → 생성된 쿼리 실행
//   analyze_performance : EXPLAIN / PROFILE 플랜 분석 (메인 실행 경로와 분리)
//
// [단계 순서, 변경 금지]
//   rate limit → sanitize → complexity (+ LIMIT 삽입) → execute → audit
//   query_graph 는 rate limit 직후 번역하고, 생성된 쿼리를 원시 입력과 동일하게 게이트에 통과시킨다.
//
// [엔진 호출]
//   드라이버/번역기 호출은 boost::asio::thread_pool 에서 실행되며 engine.timeout_ms 로 제한된다.
//   타임아웃과 드라이버 예외는 kEngine 으로 분류한다 (게이트 거부와 구분).
//   materialize() 는 게이트를 모두 통과한 뒤에만 호출한다.
//
// [오류 노출]
//   게이트 거부 메시지(kValidation ~ kWriteBlocked)는 그대로 반환한다.
//   kEngine / kInternal 메시지는 ErrorSanitizer 를 거치고, 원본 상세는 감사 로그에만 남는다.
//
// [소유권]
//   RateLimiter / AuditLogger / StatsCollector / GraphDriver 는 shared 소유권으로 주입한다.
//   타임아웃된 엔진 작업이 파이프라인보다 오래 살아도 드라이버가 유효하게 유지된다.
// ---------------------------------------------------------------------------

#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "common/types.hpp"
#include "complexity/complexity_analyzer.hpp"
#include "config/gate_config.hpp"
#include "engine/graph_driver.hpp"
#include "logger/audit_logger.hpp"
#include "parser/sanitizer.hpp"
#include "pipeline/error_sanitizer.hpp"
#include "plan/plan_analyzer.hpp"
#include "ratelimit/rate_limiter.hpp"
#include "stats/stats_collector.hpp"

// ---------------------------------------------------------------------------
// PipelineRequest
//   operation 이 비어 있으면 엔트리포인트 기본 이름을 사용한다.
//   query_graph 에서는 query 가 자연어 질문이다.
// ---------------------------------------------------------------------------
struct PipelineRequest {
    std::string  operation{};
    std::string  query{};
    ParameterMap parameters{};
    std::string  session_id{};
    std::string  client_id{};
};

// ---------------------------------------------------------------------------
// PipelineResponse
//   success == true  : rows (execute/query_graph) 또는 analysis (analyze_performance)
//   success == false : error + error_kind (kRateLimit 이면 retry_after_seconds 포함)
//
//   metadata 키: operation, executed_query, generated_query, limit_injected,
//               complexity_score, risk_level, row_count, execution_time_ms
//   analyze_performance: operation, mode, bottleneck_count, overall_severity,
//               complexity_score / risk_level (플랜 연산자 기반 missing_index 포함)
// ---------------------------------------------------------------------------
struct PipelineResponse {
    bool                               success{false};
    std::vector<ResultRow>             rows{};
    std::optional<AnalysisResult>      analysis{};
    std::optional<std::string>         error{};
    std::optional<ErrorKind>           error_kind{};
    std::optional<double>              retry_after_seconds{};
    std::vector<std::string>           warnings{};
    std::map<std::string, std::string> metadata{};
};

inline constexpr const char* kOpExecuteCypher = "execute_cypher";
inline constexpr const char* kOpQueryGraph    = "query_graph";
inline constexpr const char* kOpAnalyzeQuery  = "analyze_query";

class QueryPipeline {
public:
    QueryPipeline(GateConfig                       config,
                  std::shared_ptr<GraphDriver>     driver,
                  std::shared_ptr<RateLimiter>     rate_limiter,
                  std::shared_ptr<AuditLogger>     audit,
                  std::shared_ptr<StatsCollector>  stats,
                  std::shared_ptr<QueryTranslator> translator = nullptr);

    // 대기 중인 엔진 작업이 끝날 때까지 스레드 풀을 join 한다.
    ~QueryPipeline();

    QueryPipeline(const QueryPipeline&)            = delete;
    QueryPipeline& operator=(const QueryPipeline&) = delete;

    [[nodiscard]] PipelineResponse execute_cypher(const PipelineRequest& request);

    [[nodiscard]] PipelineResponse query_graph(const PipelineRequest& request);

    [[nodiscard]] PipelineResponse analyze_performance(const PipelineRequest& request,
                                                       PlanMode               mode = PlanMode::kExplain);

    [[nodiscard]] const GateConfig& config() const noexcept { return config_; }

private:
    struct GatedQuery {
        std::string     query{};
        ComplexityScore score{};
        bool            was_injected{false};
    };

    [[nodiscard]] RequestContext make_context(const PipelineRequest& request, const char* default_op) const;

    [[nodiscard]] std::optional<GateError> check_rate_limit(const RequestContext& ctx);

    // sanitize + complexity. 경고는 warnings 에 누적한다.
    [[nodiscard]] std::expected<GatedQuery, GateError> gate(std::string_view          query,
                                                            const ParameterMap&       params,
                                                            std::vector<std::string>& warnings) const;

    // 게이트를 통과한 쿼리 실행 (run + materialize, 타임아웃 적용).
    [[nodiscard]] std::expected<std::vector<ResultRow>, GateError> run_query(const std::string&  query,
                                                                             const ParameterMap& params);

    // 실패 응답 생성 + 감사 기록 + 통계.
    [[nodiscard]] PipelineResponse reject(const RequestContext&    ctx,
                                          std::string_view         query,
                                          const ParameterMap&      params,
                                          const GateError&         error,
                                          std::vector<std::string> warnings);

    // 게이트 통과 이후 공통 경로: 실행 → 감사 → 응답.
    [[nodiscard]] PipelineResponse execute_gated(const RequestContext&              ctx,
                                                 const GatedQuery&                  gated,
                                                 const ParameterMap&                params,
                                                 std::vector<std::string>           warnings,
                                                 std::map<std::string, std::string> metadata);

    GateConfig                       config_;
    std::shared_ptr<GraphDriver>     driver_;
    std::shared_ptr<RateLimiter>     rate_limiter_;
    std::shared_ptr<AuditLogger>     audit_;
    std::shared_ptr<StatsCollector>  stats_;
    std::shared_ptr<QueryTranslator> translator_;

    Sanitizer          sanitizer_;
    Sanitizer          analyze_sanitizer_;  // 쓰기 허용 (PROFILE 쓰기는 PlanAnalyzer 가 차단)
    ComplexityAnalyzer complexity_;
    PlanAnalyzer       plan_analyzer_;
    ErrorSanitizer     error_sanitizer_;

    boost::asio::thread_pool pool_;
};

// 재시도 대기 시간 표기 (0.1초 단위 올림). 표시값만큼 기다리면 항상 충분하다.
[[nodiscard]] std::string retry_after_text(double seconds);

// 결과 행을 한 줄 JSON 배열로 직렬화 (감사 로그 응답 발췌용).
[[nodiscard]] std::string rows_to_json(const std::vector<ResultRow>& rows);
