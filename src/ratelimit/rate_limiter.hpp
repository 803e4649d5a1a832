#pragma once

// ---------------------------------------------------------------------------
// rate_limiter.hpp
//
// 클라이언트별 토큰 버킷 admission gate.
//
// [버킷 구성]
// - 오퍼레이션 버킷: (client_id, operation) 쌍마다 하나. 규칙은 config.tools[operation],
//   등록되지 않은 오퍼레이션은 RateLimitRule 기본값 (10 / 60s, burst 20).
// - 전역 버킷: config.global 이 있으면 클라이언트마다 하나 추가 (모든 오퍼레이션 공유).
// 요청은 적용되는 모든 버킷을 통과해야 허용된다. 뒤의 버킷에서 거부되면
// 앞서 소비한 토큰은 되돌린다.
//
// [동시성]
// - 레지스트리(std::map) 는 std::shared_mutex 로 보호하며 조회/삽입 동안만 잡는다.
// - 토큰 보충/소비는 버킷 자체 mutex 로 동기화한다 (레지스트리 락 밖).
//
// [레지스트리 정리]
// check() 는 sweep_interval_seconds 마다 한 번, 가득 찬 버킷을 제거한다.
// 가득 찬 버킷은 새로 만든 버킷과 구별되지 않으므로 제거해도 한도가 바뀌지 않는다.
// 클라이언트 ID 가 계속 바뀌어도 레지스트리 크기는 최근 보충 구간의 활성 버킷 수로 제한된다.
//
// 소유권: QueryPipeline (또는 호출자) 가 소유하고 참조로 전달한다. 싱글턴이 아니다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "config/gate_config.hpp"
#include "ratelimit/token_bucket.hpp"

// ---------------------------------------------------------------------------
// RateLimitDecision
//   remaining: 검사한 버킷 중 가장 적은 잔여 토큰.
//   allowed == false 이면 retry_after_seconds 는 토큰 1개가 모든 버킷에 쌓일 때까지의 시간.
// ---------------------------------------------------------------------------
struct RateLimitDecision {
    bool                  allowed{true};
    std::optional<double> retry_after_seconds{};
    double                remaining{0.0};
};

// client_status 항목 (토큰 소비 없음).
struct BucketStatus {
    std::string operation{};
    double      tokens{0.0};
    double      capacity{0.0};
    double      refill_rate{0.0};
};

inline constexpr const char* kGlobalBucketName = "*";

class RateLimiter {
public:
    using Clock = std::function<BucketTimePoint()>;

    explicit RateLimiter(RateLimitConfig config, Clock clock = {});

    RateLimiter(const RateLimiter&)            = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    [[nodiscard]] RateLimitDecision check(const std::string& client_id, const std::string& operation);

    // 해당 클라이언트의 모든 버킷 제거 (다음 요청 시 가득 찬 상태로 재생성).
    void reset_client(const std::string& client_id);

    void reset_all();

    [[nodiscard]] std::vector<BucketStatus> client_status(const std::string& client_id) const;

    // 마지막 접근 후 max_idle 이상 지난 버킷 제거. 제거한 수를 반환한다.
    std::size_t prune_idle(std::chrono::steady_clock::duration max_idle);

    // 가득 찬 버킷 제거. 제거한 수를 반환한다.
    std::size_t sweep_full();

    [[nodiscard]] std::size_t bucket_count() const;

    [[nodiscard]] const RateLimitConfig& config() const noexcept { return config_; }

private:
    using BucketKey = std::pair<std::string, std::string>;  // (client_id, operation)

    [[nodiscard]] std::shared_ptr<TokenBucket> get_or_create(const std::string& client_id,
                                                             const std::string& operation,
                                                             const RateLimitRule& rule);

    [[nodiscard]] const RateLimitRule& rule_for(const std::string& operation) const;

    // 주기가 지났으면 한 스레드만 sweep_full() 을 수행한다.
    void maybe_sweep(BucketTimePoint now);

    RateLimitConfig config_;
    RateLimitRule   fallback_rule_{};
    Clock           clock_;

    std::map<BucketKey, std::shared_ptr<TokenBucket>> buckets_;
    mutable std::shared_mutex                         buckets_mutex_;

    std::atomic<BucketTimePoint::rep> last_sweep_;
};
