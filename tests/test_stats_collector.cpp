// ---------------------------------------------------------------------------
// test_stats_collector.cpp
//
// StatsCollector 단위 테스트.
//
// [테스트 범위]
// - 초기 상태 검증 (all-zero)
// - on_blocked: ErrorKind 별 카운터, kEngine / kInternal 은 engine_errors
// - on_executed: executed / limits_injected
// - snapshot(): blocked_total 합산 및 block_rate 계산
// - snapshot(): total == 0 시 block_rate == 0.0 (div-by-zero 방지)
// - ConcurrentAccess: 멀티스레드 동시성 (data race 미발생 확인)
//
// [알려진 한계]
// - qps 는 생성 이후 누적 평균이므로 양수 여부(> 0.0)만 검증한다.
// ---------------------------------------------------------------------------

#include "stats/stats_collector.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// InitialState_AllZero
// ---------------------------------------------------------------------------
TEST(StatsCollector, InitialState_AllZero) {
    StatsCollector stats;
    const auto snap = stats.snapshot();

    EXPECT_EQ(snap.total_requests, 0u);
    EXPECT_EQ(snap.executed,       0u);
    EXPECT_EQ(snap.analyzed,       0u);
    EXPECT_EQ(snap.blocked_total,  0u);
    EXPECT_EQ(snap.engine_errors,  0u);
    EXPECT_NEAR(snap.block_rate, 0.0, 1e-9) << "block_rate must be 0.0 at init";
}

// ---------------------------------------------------------------------------
// OnBlocked_CountsPerKind
//   게이트 거부는 단계별 카운터에, 엔진/내부 오류는 engine_errors 에 집계된다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnBlocked_CountsPerKind) {
    StatsCollector stats;

    stats.on_blocked(ErrorKind::kRateLimit);
    stats.on_blocked(ErrorKind::kValidation);
    stats.on_blocked(ErrorKind::kValidation);
    stats.on_blocked(ErrorKind::kComplexity);
    stats.on_blocked(ErrorKind::kWriteBlocked);
    stats.on_blocked(ErrorKind::kEngine);
    stats.on_blocked(ErrorKind::kInternal);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.blocked_rate_limit, 1u);
    EXPECT_EQ(snap.blocked_validation, 2u);
    EXPECT_EQ(snap.blocked_complexity, 1u);
    EXPECT_EQ(snap.blocked_write,      1u);
    EXPECT_EQ(snap.engine_errors,      2u);
    EXPECT_EQ(snap.blocked_total,      5u) << "engine errors are not gate blocks";
}

// ---------------------------------------------------------------------------
// OnExecuted_TracksLimitInjection
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnExecuted_TracksLimitInjection) {
    StatsCollector stats;

    stats.on_executed(true);
    stats.on_executed(false);
    stats.on_executed(true);
    stats.on_analyzed();

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.executed,        3u);
    EXPECT_EQ(snap.limits_injected, 2u);
    EXPECT_EQ(snap.analyzed,        1u);
}

// ---------------------------------------------------------------------------
// Snapshot_BlockRate_Calculation
//   요청 4건 중 1건 차단 → block_rate == 0.25
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_BlockRate_Calculation) {
    StatsCollector stats;

    for (int i = 0; i < 4; ++i) {
        stats.on_request();
    }
    stats.on_blocked(ErrorKind::kValidation);
    stats.on_executed(false);
    stats.on_executed(false);
    stats.on_executed(false);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_requests, 4u);
    EXPECT_NEAR(snap.block_rate, 0.25, 1e-9);
}

// ---------------------------------------------------------------------------
// Snapshot_BlockRate_ZeroTotal
//   요청 없이 차단만 기록되어도 total == 0 이면 block_rate 는 0.0.
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_BlockRate_ZeroTotal) {
    StatsCollector stats;
    stats.on_blocked(ErrorKind::kRateLimit);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_requests, 0u);
    EXPECT_NEAR(snap.block_rate, 0.0, 1e-9);
}

// ---------------------------------------------------------------------------
// Snapshot_CapturedAt_IsSet
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_CapturedAt_IsSet) {
    const auto before = std::chrono::system_clock::now();
    StatsCollector stats;
    const auto snap  = stats.snapshot();
    const auto after = std::chrono::system_clock::now();

    EXPECT_GE(snap.captured_at, before);
    EXPECT_LE(snap.captured_at, after);
}

// ---------------------------------------------------------------------------
// Snapshot_Qps_PositiveAfterRequest
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_Qps_PositiveAfterRequest) {
    StatsCollector stats;
    stats.on_request();
    std::this_thread::sleep_for(std::chrono::milliseconds(1));

    const auto snap = stats.snapshot();
    EXPECT_GT(snap.qps, 0.0) << "qps should be > 0 after at least one request";
}

// ---------------------------------------------------------------------------
// ConcurrentAccess_NoDataRace
//   writer 스레드 N 개가 on_request / on_blocked / on_executed 를 반복하는 동안
//   reader 스레드가 snapshot() 을 호출한다. 종료 후 합계를 검증한다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, ConcurrentAccess_NoDataRace) {
    StatsCollector stats;

    constexpr int kWriterThreads = 4;
    constexpr int kOpsPerThread  = 1000;

    std::vector<std::thread> writers;
    writers.reserve(static_cast<std::size_t>(kWriterThreads));

    for (int i = 0; i < kWriterThreads; ++i) {
        writers.emplace_back([&stats]() {
            for (int j = 0; j < kOpsPerThread; ++j) {
                stats.on_request();
                if (j % 2 == 0) {
                    stats.on_blocked(ErrorKind::kValidation);
                } else {
                    stats.on_executed(j % 3 == 0);
                }
            }
        });
    }

    std::atomic<bool> stop_reader{false};
    std::thread reader([&stats, &stop_reader]() {
        while (!stop_reader.load(std::memory_order_relaxed)) {
            [[maybe_unused]] const auto snap = stats.snapshot();
        }
    });

    for (auto& t : writers) {
        t.join();
    }
    stop_reader.store(true, std::memory_order_relaxed);
    reader.join();

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_requests, static_cast<std::uint64_t>(kWriterThreads * kOpsPerThread));
    EXPECT_EQ(snap.blocked_validation, static_cast<std::uint64_t>(kWriterThreads * kOpsPerThread / 2));
    EXPECT_EQ(snap.executed, static_cast<std::uint64_t>(kWriterThreads * kOpsPerThread / 2));
    EXPECT_NEAR(snap.block_rate, 0.5, 1e-9);
}
