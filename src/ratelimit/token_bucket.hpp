#pragma once

// ---------------------------------------------------------------------------
// token_bucket.hpp
//
// 단일 토큰 버킷. (client, operation) 쌍마다 하나씩 RateLimiter 가 소유한다.
//
// [알고리즘]
//   tokens = min(capacity, tokens + elapsed * refill_rate)
//   tokens >= 1 이면 1 소비 후 허용, 아니면 거부 + retry_after = (1 - tokens) / refill_rate
//
// [부동소수점 허용 오차]
//   retry_after 는 마이크로초 단위로 올림하고, 토큰 비교는 kTokenEpsilon 만큼 관대하다.
//   보고된 retry_after 만큼 (ns 절삭 포함) 기다린 뒤의 요청은 반드시 허용된다.
//
// 시각은 호출자가 전달한다 (RateLimiter 의 주입 가능한 clock). 버킷마다 자체 mutex 로
// 동기화하며, 레지스트리 락과는 독립적이다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <mutex>
#include <optional>

using BucketTimePoint = std::chrono::steady_clock::time_point;

inline constexpr double kTokenEpsilon = 1e-6;

// 토큰 1 개가 쌓일 때까지의 대기 시간 (초, 마이크로초 올림). refill_rate <= 0 이면 0.
[[nodiscard]] double seconds_until_token(double tokens, double refill_rate) noexcept;

// ---------------------------------------------------------------------------
// TokenAcquire
//   try_acquire 결과. allowed == false 이면 retry_after_seconds 가 채워진다.
// ---------------------------------------------------------------------------
struct TokenAcquire {
    bool                  allowed{false};
    double                remaining{0.0};
    std::optional<double> retry_after_seconds{};
};

class TokenBucket {
public:
    // 생성 시점에 가득 찬 상태로 시작한다.
    TokenBucket(double capacity, double refill_rate, BucketTimePoint now);

    TokenBucket(const TokenBucket&)            = delete;
    TokenBucket& operator=(const TokenBucket&) = delete;

    [[nodiscard]] TokenAcquire try_acquire(BucketTimePoint now);

    // 다른 버킷에서 거부되어 소비를 되돌릴 때 사용 (capacity 초과 불가).
    void refund(double tokens = 1.0);

    // 소비 없이 보충 후 토큰 수를 조회한다.
    [[nodiscard]] double peek(BucketTimePoint now) const;

    void reset(BucketTimePoint now);

    [[nodiscard]] BucketTimePoint last_access() const;

    [[nodiscard]] double capacity() const noexcept { return capacity_; }
    [[nodiscard]] double refill_rate() const noexcept { return refill_rate_; }

private:
    [[nodiscard]] double refilled_locked(BucketTimePoint now) const;

    const double capacity_;
    const double refill_rate_;

    mutable std::mutex mutex_;
    double             tokens_;
    BucketTimePoint    last_refill_;
    BucketTimePoint    last_access_;
};
