#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 파이프라인 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_request / on_blocked / on_executed / on_analyzed:
//   요청 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 조회 경로. 갱신 경로와 mutex 없이 atomic 로드로 분리한다.
//
// [격리 원칙]
// - 통계 수집 실패가 요청 실패로 전파되지 않도록 모든 갱신 메서드는 noexcept.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   blocked_*  : 게이트 단계별 거부 수 (ErrorKind 기준)
//   block_rate : blocked_total / total_requests (total == 0 이면 0.0)
//   qps        : 수집기 생성 이후 평균 초당 요청 수
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                         total_requests{0};
    std::uint64_t                         executed{0};
    std::uint64_t                         analyzed{0};
    std::uint64_t                         limits_injected{0};
    std::uint64_t                         blocked_rate_limit{0};
    std::uint64_t                         blocked_validation{0};
    std::uint64_t                         blocked_complexity{0};
    std::uint64_t                         blocked_write{0};
    std::uint64_t                         engine_errors{0};
    std::uint64_t                         blocked_total{0};
    double                                qps{0.0};
    double                                block_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class StatsCollector {
public:
    StatsCollector() noexcept
        : window_start_(std::chrono::system_clock::now())
    {}

    ~StatsCollector() = default;

    // 복사/이동 금지 (atomic 소유권 명확화)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    // 엔트리포인트 진입 시 1회.
    void on_request() noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
    }

    // 단계 거부. kEngine / kInternal 은 engine_errors 로 집계한다 (blocked_total 제외).
    void on_blocked(ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::kRateLimit:
                blocked_rate_limit_.fetch_add(1, std::memory_order_relaxed);
                break;
            case ErrorKind::kValidation:
                blocked_validation_.fetch_add(1, std::memory_order_relaxed);
                break;
            case ErrorKind::kComplexity:
                blocked_complexity_.fetch_add(1, std::memory_order_relaxed);
                break;
            case ErrorKind::kWriteBlocked:
                blocked_write_.fetch_add(1, std::memory_order_relaxed);
                break;
            case ErrorKind::kEngine:
            case ErrorKind::kInternal:
                engine_errors_.fetch_add(1, std::memory_order_relaxed);
                break;
        }
    }

    void on_executed(bool limit_injected) noexcept {
        executed_.fetch_add(1, std::memory_order_relaxed);
        if (limit_injected) {
            limits_injected_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void on_analyzed() noexcept {
        analyzed_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now        = std::chrono::system_clock::now();
        const auto total      = total_requests_.load(std::memory_order_relaxed);
        const auto rate       = blocked_rate_limit_.load(std::memory_order_relaxed);
        const auto validation = blocked_validation_.load(std::memory_order_relaxed);
        const auto complexity = blocked_complexity_.load(std::memory_order_relaxed);
        const auto write      = blocked_write_.load(std::memory_order_relaxed);
        const auto blocked    = rate + validation + complexity + write;

        const double elapsed_sec = std::chrono::duration<double>(now - window_start_).count();

        double qps = 0.0;
        if (elapsed_sec > 0.0) {
            qps = static_cast<double>(total) / elapsed_sec;
        }

        double block_rate = 0.0;
        if (total > 0) {
            block_rate = static_cast<double>(blocked) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .total_requests     = total,
            .executed           = executed_.load(std::memory_order_relaxed),
            .analyzed           = analyzed_.load(std::memory_order_relaxed),
            .limits_injected    = limits_injected_.load(std::memory_order_relaxed),
            .blocked_rate_limit = rate,
            .blocked_validation = validation,
            .blocked_complexity = complexity,
            .blocked_write      = write,
            .engine_errors      = engine_errors_.load(std::memory_order_relaxed),
            .blocked_total      = blocked,
            .qps                = qps,
            .block_rate         = block_rate,
            .captured_at        = now,
        };
    }

private:
    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> executed_{0};
    std::atomic<std::uint64_t> analyzed_{0};
    std::atomic<std::uint64_t> limits_injected_{0};
    std::atomic<std::uint64_t> blocked_rate_limit_{0};
    std::atomic<std::uint64_t> blocked_validation_{0};
    std::atomic<std::uint64_t> blocked_complexity_{0};
    std::atomic<std::uint64_t> blocked_write_{0};
    std::atomic<std::uint64_t> engine_errors_{0};

    const std::chrono::system_clock::time_point window_start_;
};
