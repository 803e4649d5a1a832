#include "ratelimit/token_bucket.hpp"

#include <algorithm>
#include <cmath>

double seconds_until_token(double tokens, double refill_rate) noexcept {
    if (refill_rate <= 0.0 || tokens >= 1.0 - kTokenEpsilon) {
        return 0.0;
    }
    // 1ns 미만의 표현 오차는 올림하지 않는다 (6.000000000000001 → 6.0)
    const double micros = (1.0 - tokens) / refill_rate * 1e6;
    return std::ceil(micros - 1e-3) / 1e6;
}

TokenBucket::TokenBucket(double capacity, double refill_rate, BucketTimePoint now)
    : capacity_(capacity)
    , refill_rate_(refill_rate)
    , tokens_(capacity)
    , last_refill_(now)
    , last_access_(now)
{}

double TokenBucket::refilled_locked(BucketTimePoint now) const {
    // 시계가 뒤로 가면 보충하지 않는다
    if (now <= last_refill_) {
        return tokens_;
    }
    const double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    return std::min(capacity_, tokens_ + elapsed * refill_rate_);
}

TokenAcquire TokenBucket::try_acquire(BucketTimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);

    tokens_ = refilled_locked(now);
    last_refill_ = std::max(last_refill_, now);
    last_access_ = now;

    TokenAcquire result;
    if (tokens_ >= 1.0 - kTokenEpsilon) {
        tokens_ = std::max(0.0, tokens_ - 1.0);
        result.allowed   = true;
        result.remaining = tokens_;
        return result;
    }

    result.allowed   = false;
    result.remaining = tokens_;
    result.retry_after_seconds = seconds_until_token(tokens_, refill_rate_);
    return result;
}

void TokenBucket::refund(double tokens) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = std::min(capacity_, tokens_ + tokens);
}

double TokenBucket::peek(BucketTimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return refilled_locked(now);
}

void TokenBucket::reset(BucketTimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_      = capacity_;
    last_refill_ = now;
    last_access_ = now;
}

BucketTimePoint TokenBucket::last_access() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_access_;
}
