// ---------------------------------------------------------------------------
// test_query_pipeline.cpp
//
// QueryPipeline 통합 테스트 (가짜 드라이버 / 번역기 사용).
//
// [테스트 범위]
// - execute_cypher: 정상 실행 + LIMIT 삽입 메타데이터, sanitizer / 쓰기 / 복잡도 거부
// - 거부된 쿼리는 드라이버까지 도달하지 않는다
// - rate limit 거부 + retry_after
// - 엔진 예외 / 타임아웃 → kEngine, production 정제 / debug 상세
// - query_graph: 번역기 출력 재검증, 번역기 미설정 → kInternal
// - analyze_performance: EXPLAIN 성공, PROFILE 쓰기 차단, 행 미조회
// - 통계 집계, 감사 로그 기록
//
// [알려진 한계]
// - 타임아웃 테스트는 파이프라인 소멸자가 느린 작업을 join 하므로 수백 ms 걸린다.
// ---------------------------------------------------------------------------

#include "pipeline/query_pipeline.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

// ---------------------------------------------------------------------------
// 가짜 드라이버: 실행된 쿼리와 materialize 호출 수를 기록한다.
// ---------------------------------------------------------------------------
struct DriverLog {
    std::mutex               mu;
    std::vector<std::string> queries;
    std::atomic<int>         materialized{0};

    std::vector<std::string> snapshot() {
        std::lock_guard lock(mu);
        return queries;
    }
};

class FakeHandle : public ResultHandle {
public:
    FakeHandle(std::shared_ptr<DriverLog> log, std::vector<ResultRow> rows)
        : log_(std::move(log)), rows_(std::move(rows)) {}

    PlanSummary consume() override {
        PlanNode scan;
        scan.operator_type        = "NodeByLabelScan";
        scan.estimated_rows       = 1000;
        scan.arguments["Details"] = "n:Person";
        PlanNode root;
        root.operator_type  = "ProduceResults";
        root.estimated_rows = 1000;
        root.children       = {scan};
        return PlanSummary{root, "r"};
    }

    std::vector<ResultRow> materialize() override {
        ++log_->materialized;
        return rows_;
    }

private:
    std::shared_ptr<DriverLog> log_;
    std::vector<ResultRow>     rows_;
};

class FakeDriver : public GraphDriver {
public:
    std::unique_ptr<ResultHandle> run(const std::string& query, const ParameterMap&) override {
        {
            std::lock_guard lock(log->mu);
            log->queries.push_back(query);
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (fail_with) {
            throw std::runtime_error(*fail_with);
        }
        return std::make_unique<FakeHandle>(log, std::vector<ResultRow>{{{"name", "Alice"}}, {{"name", "Bob"}}});
    }

    std::shared_ptr<DriverLog> log = std::make_shared<DriverLog>();
    std::optional<std::string> fail_with{};
    std::chrono::milliseconds  delay{0};
};

class FixedTranslator : public QueryTranslator {
public:
    explicit FixedTranslator(std::string output) : output_(std::move(output)) {}

    std::string translate(const std::string& question) override {
        last_question = question;
        return output_;
    }

    std::string last_question;

private:
    std::string output_;
};

GateConfig quiet_config() {
    GateConfig config;
    config.audit.enabled         = false;
    config.engine.timeout_ms     = 2000;
    config.engine.worker_threads = 2;
    return config;
}

struct Harness {
    explicit Harness(GateConfig config, std::shared_ptr<QueryTranslator> translator = nullptr)
        : driver(std::make_shared<FakeDriver>())
        , limiter(std::make_shared<RateLimiter>(config.rate_limit))
        , audit(std::make_shared<AuditLogger>(config.audit))
        , stats(std::make_shared<StatsCollector>())
        , pipeline(std::make_unique<QueryPipeline>(config, driver, limiter, audit, stats, std::move(translator))) {}

    std::shared_ptr<FakeDriver>     driver;
    std::shared_ptr<RateLimiter>    limiter;
    std::shared_ptr<AuditLogger>    audit;
    std::shared_ptr<StatsCollector> stats;
    std::unique_ptr<QueryPipeline>  pipeline;
};

PipelineRequest request(std::string query, std::string client = "client-1") {
    PipelineRequest req;
    req.query      = std::move(query);
    req.session_id = "sess-1";
    req.client_id  = std::move(client);
    return req;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ===========================================================================
// execute_cypher
// ===========================================================================

// ---- ExecuteReturnsRowsAndInjectsLimit
TEST(QueryPipeline, ExecuteReturnsRowsAndInjectsLimit) {
    Harness h(quiet_config());

    const auto resp = h.pipeline->execute_cypher(request("MATCH (n:Person) RETURN n"));
    ASSERT_TRUE(resp.success) << resp.error.value_or("");
    ASSERT_EQ(resp.rows.size(), 2U);
    EXPECT_EQ(resp.rows[0].at("name"), "Alice");
    EXPECT_FALSE(resp.error_kind.has_value());

    EXPECT_EQ(resp.metadata.at("operation"), "execute_cypher");
    EXPECT_EQ(resp.metadata.at("executed_query"), "MATCH (n:Person) RETURN n LIMIT 1000");
    EXPECT_EQ(resp.metadata.at("limit_injected"), "true");
    EXPECT_EQ(resp.metadata.at("complexity_score"), "25");
    EXPECT_EQ(resp.metadata.at("row_count"), "2");
    EXPECT_TRUE(resp.metadata.contains("execution_time_ms"));

    const auto queries = h.driver->log->snapshot();
    ASSERT_EQ(queries.size(), 1U);
    EXPECT_EQ(queries[0], "MATCH (n:Person) RETURN n LIMIT 1000");
    EXPECT_EQ(h.driver->log->materialized.load(), 1);
}

// ---- ExistingLimitIsKept
TEST(QueryPipeline, ExistingLimitIsKept) {
    Harness h(quiet_config());

    const auto resp = h.pipeline->execute_cypher(request("MATCH (n:Person) RETURN n LIMIT 5"));
    ASSERT_TRUE(resp.success);
    EXPECT_EQ(resp.metadata.at("executed_query"), "MATCH (n:Person) RETURN n LIMIT 5");
    EXPECT_EQ(resp.metadata.at("limit_injected"), "false");
}

// ---- DangerousQueryNeverReachesDriver
TEST(QueryPipeline, DangerousQueryNeverReachesDriver) {
    Harness h(quiet_config());

    const auto resp = h.pipeline->execute_cypher(
        request("LOAD CSV FROM 'file:///etc/passwd' AS line RETURN line"));
    ASSERT_FALSE(resp.success);
    ASSERT_TRUE(resp.error_kind.has_value());
    EXPECT_EQ(*resp.error_kind, ErrorKind::kValidation);
    EXPECT_EQ(resp.error.value_or(""), "Blocked: Query contains dangerous pattern: LOAD CSV file access");
    EXPECT_TRUE(h.driver->log->snapshot().empty());
    EXPECT_EQ(h.driver->log->materialized.load(), 0);
}

// ---- WriteQueryBlockedInReadOnlyMode
TEST(QueryPipeline, WriteQueryBlockedInReadOnlyMode) {
    Harness h(quiet_config());

    const auto resp = h.pipeline->execute_cypher(request("MATCH (n) DETACH DELETE n"));
    ASSERT_FALSE(resp.success);
    EXPECT_EQ(resp.error_kind, ErrorKind::kWriteBlocked);
    EXPECT_TRUE(contains(resp.error.value_or(""), "write operation"));
    EXPECT_TRUE(h.driver->log->snapshot().empty());
}

// ---- ComplexQueryBlocked
TEST(QueryPipeline, ComplexQueryBlocked) {
    GateConfig config = quiet_config();
    config.complexity.max_complexity = 30;
    Harness h(config);

    const auto resp = h.pipeline->execute_cypher(request("MATCH (a),(b) RETURN a,b"));
    ASSERT_FALSE(resp.success);
    EXPECT_EQ(resp.error_kind, ErrorKind::kComplexity);
    EXPECT_TRUE(h.driver->log->snapshot().empty());
}

// ---- RateLimitRejectsWithRetryAfter
TEST(QueryPipeline, RateLimitRejectsWithRetryAfter) {
    GateConfig config = quiet_config();
    config.rate_limit.tools["execute_cypher"] = RateLimitRule{1.0, 60.0, 1.0};
    Harness h(config);

    ASSERT_TRUE(h.pipeline->execute_cypher(request("MATCH (n) RETURN n LIMIT 1")).success);

    const auto resp = h.pipeline->execute_cypher(request("MATCH (n) RETURN n LIMIT 1"));
    ASSERT_FALSE(resp.success);
    EXPECT_EQ(resp.error_kind, ErrorKind::kRateLimit);
    ASSERT_TRUE(resp.retry_after_seconds.has_value());
    EXPECT_NEAR(*resp.retry_after_seconds, 60.0, 0.5);
    EXPECT_EQ(resp.error.value_or(""), "Rate limit exceeded for 'execute_cypher'. Retry after 60.0 seconds");
    EXPECT_EQ(h.driver->log->snapshot().size(), 1U);

    // 다른 클라이언트는 독립 버킷
    EXPECT_TRUE(h.pipeline->execute_cypher(request("MATCH (n) RETURN n LIMIT 1", "client-2")).success);
}

// ---- RetryAfterTextRoundsUp
TEST(QueryPipeline, RetryAfterTextRoundsUp) {
    EXPECT_EQ(retry_after_text(4.24), "4.3");
    EXPECT_EQ(retry_after_text(6.0), "6.0");
    EXPECT_EQ(retry_after_text(0.3), "0.3");
    EXPECT_EQ(retry_after_text(59.99998), "60.0");
    EXPECT_EQ(retry_after_text(0.0), "0.0");
}

// ---- EmptyClientIsAnonymous
TEST(QueryPipeline, EmptyClientIsAnonymous) {
    Harness h(quiet_config());

    ASSERT_TRUE(h.pipeline->execute_cypher(request("MATCH (n) RETURN n LIMIT 1", "")).success);
    EXPECT_FALSE(h.limiter->client_status("anonymous").empty());
}

// ===========================================================================
// 엔진 오류
// ===========================================================================

// ---- EngineFailureIsSanitizedInProduction
TEST(QueryPipeline, EngineFailureIsSanitizedInProduction) {
    Harness h(quiet_config());
    h.driver->fail_with = "Neo.DatabaseError.General.UnknownError at /var/lib/neo4j/data";

    const auto resp = h.pipeline->execute_cypher(request("MATCH (n) RETURN n LIMIT 1"));
    ASSERT_FALSE(resp.success);
    EXPECT_EQ(resp.error_kind, ErrorKind::kEngine);
    EXPECT_EQ(resp.error.value_or(""), "EngineError: An error occurred. Enable debug_mode for details.");
    EXPECT_EQ(h.driver->log->materialized.load(), 0);
}

// ---- EngineFailureShowsDetailInDebugMode
TEST(QueryPipeline, EngineFailureShowsDetailInDebugMode) {
    GateConfig config = quiet_config();
    config.debug_mode = true;
    Harness h(config);
    h.driver->fail_with = "Neo.DatabaseError.General.UnknownError";

    const auto resp = h.pipeline->execute_cypher(request("MATCH (n) RETURN n LIMIT 1"));
    ASSERT_FALSE(resp.success);
    EXPECT_EQ(resp.error.value_or(""), "Query execution failed: Neo.DatabaseError.General.UnknownError");
}

// ---- SlowEngineTimesOut
TEST(QueryPipeline, SlowEngineTimesOut) {
    GateConfig config = quiet_config();
    config.engine.timeout_ms = 50;
    Harness h(config);
    h.driver->delay = std::chrono::milliseconds(300);

    const auto resp = h.pipeline->execute_cypher(request("MATCH (n) RETURN n LIMIT 1"));
    ASSERT_FALSE(resp.success);
    EXPECT_EQ(resp.error_kind, ErrorKind::kEngine);
    EXPECT_EQ(resp.error.value_or(""), "Query execution timeout after 50 ms");
    EXPECT_EQ(h.stats->snapshot().engine_errors, 1U);
}

// ===========================================================================
// query_graph
// ===========================================================================

// ---- TranslatedQueryIsGatedAndLimited
TEST(QueryPipeline, TranslatedQueryIsGatedAndLimited) {
    auto translator = std::make_shared<FixedTranslator>("MATCH (p:Person) RETURN p.name");
    Harness h(quiet_config(), translator);

    const auto resp = h.pipeline->query_graph(request("who are the people?"));
    ASSERT_TRUE(resp.success) << resp.error.value_or("");
    EXPECT_EQ(translator->last_question, "who are the people?");
    EXPECT_EQ(resp.metadata.at("operation"), "query_graph");
    EXPECT_EQ(resp.metadata.at("question"), "who are the people?");
    EXPECT_EQ(resp.metadata.at("generated_query"), "MATCH (p:Person) RETURN p.name");
    EXPECT_EQ(resp.metadata.at("executed_query"), "MATCH (p:Person) RETURN p.name LIMIT 1000");
}

// ---- TranslatedWriteIsBlocked
TEST(QueryPipeline, TranslatedWriteIsBlocked) {
    auto translator = std::make_shared<FixedTranslator>("MATCH (n) DETACH DELETE n");
    Harness h(quiet_config(), translator);

    const auto resp = h.pipeline->query_graph(request("remove everything"));
    ASSERT_FALSE(resp.success);
    EXPECT_EQ(resp.error_kind, ErrorKind::kWriteBlocked);
    EXPECT_EQ(resp.metadata.at("generated_query"), "MATCH (n) DETACH DELETE n");
    EXPECT_TRUE(h.driver->log->snapshot().empty());
}

// ---- MissingTranslatorIsInternalError
TEST(QueryPipeline, MissingTranslatorIsInternalError) {
    Harness h(quiet_config());

    const auto resp = h.pipeline->query_graph(request("who are the people?"));
    ASSERT_FALSE(resp.success);
    EXPECT_EQ(resp.error_kind, ErrorKind::kInternal);
    EXPECT_EQ(resp.error.value_or(""), "InternalError: An error occurred. Enable debug_mode for details.");
}

// ===========================================================================
// analyze_performance
// ===========================================================================

// ---- ExplainAnalysisSucceeds
TEST(QueryPipeline, ExplainAnalysisSucceeds) {
    Harness h(quiet_config());

    PipelineRequest req = request("MATCH (n:Person) RETURN n LIMIT 10");
    const auto resp = h.pipeline->analyze_performance(req);
    ASSERT_TRUE(resp.success) << resp.error.value_or("");
    ASSERT_TRUE(resp.analysis.has_value());
    EXPECT_EQ(resp.metadata.at("operation"), "analyze_query");
    EXPECT_EQ(resp.metadata.at("mode"), "EXPLAIN");
    // match 5 + 인덱스 없는 NodeByLabelScan 25
    EXPECT_EQ(resp.metadata.at("complexity_score"), "30");
    EXPECT_EQ(resp.metadata.at("risk_level"), "MODERATE");
    EXPECT_FALSE(resp.analysis->bottlenecks.empty());

    const auto queries = h.driver->log->snapshot();
    ASSERT_EQ(queries.size(), 1U);
    EXPECT_EQ(queries[0], "EXPLAIN MATCH (n:Person) RETURN n LIMIT 10");
    EXPECT_EQ(h.driver->log->materialized.load(), 0);
    EXPECT_EQ(h.stats->snapshot().analyzed, 1U);
}

// ---- ProfileOfWriteIsBlocked
TEST(QueryPipeline, ProfileOfWriteIsBlocked) {
    Harness h(quiet_config());

    const auto resp = h.pipeline->analyze_performance(request("CREATE (n:Person)"), PlanMode::kProfile);
    ASSERT_FALSE(resp.success);
    EXPECT_EQ(resp.error_kind, ErrorKind::kWriteBlocked);
    EXPECT_TRUE(h.driver->log->snapshot().empty());
}

// ---- AnalysisStillSanitizes
TEST(QueryPipeline, AnalysisStillSanitizes) {
    Harness h(quiet_config());

    const auto resp = h.pipeline->analyze_performance(request("MATCH (n) RETURN n; MATCH (m) DELETE m"));
    ASSERT_FALSE(resp.success);
    EXPECT_EQ(resp.error_kind, ErrorKind::kValidation);
    EXPECT_TRUE(h.driver->log->snapshot().empty());
}

// ===========================================================================
// 통계 / 감사
// ===========================================================================

// ---- StatsTrackOutcomes
TEST(QueryPipeline, StatsTrackOutcomes) {
    Harness h(quiet_config());

    EXPECT_TRUE(h.pipeline->execute_cypher(request("MATCH (n) RETURN n")).success);
    EXPECT_TRUE(h.pipeline->execute_cypher(request("MATCH (n) RETURN n LIMIT 3")).success);
    EXPECT_FALSE(h.pipeline->execute_cypher(request("MATCH (n) DELETE n")).success);
    EXPECT_FALSE(h.pipeline->execute_cypher(request("")).success);

    const auto snap = h.stats->snapshot();
    EXPECT_EQ(snap.total_requests, 4U);
    EXPECT_EQ(snap.executed, 2U);
    EXPECT_EQ(snap.limits_injected, 1U);
    EXPECT_EQ(snap.blocked_write, 1U);
    EXPECT_EQ(snap.blocked_validation, 1U);
    EXPECT_NEAR(snap.block_rate, 0.5, 1e-9);
}

// ---- AuditRecordsQueryAndOutcome
TEST(QueryPipeline, AuditRecordsQueryAndOutcome) {
    const fs::path dir = fs::temp_directory_path() / "graphgate_test_pipeline_audit";
    fs::remove_all(dir);

    GateConfig config      = quiet_config();
    config.audit.enabled   = true;
    config.audit.directory = dir.string();
    {
        Harness h(config);
        EXPECT_TRUE(h.pipeline->execute_cypher(request("MATCH (n) RETURN n LIMIT 1")).success);
        EXPECT_FALSE(h.pipeline->execute_cypher(request("MATCH (n) DELETE n")).success);
        h.audit->flush();
    }

    std::string all;
    for (const auto& e : fs::directory_iterator(dir)) {
        std::ifstream file(e.path());
        std::ostringstream oss;
        oss << file.rdbuf();
        all += oss.str();
    }
    EXPECT_TRUE(contains(all, R"("event_type":"query")"));
    EXPECT_TRUE(contains(all, R"("event_type":"response")"));
    EXPECT_TRUE(contains(all, R"("outcome":"blocked")"));
    EXPECT_TRUE(contains(all, R"("session_id":"sess-1")"));

    fs::remove_all(dir);
}
