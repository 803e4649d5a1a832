#include "ratelimit/rate_limiter.hpp"

#include <algorithm>
#include <limits>
#include <mutex>

#include <spdlog/spdlog.h>

RateLimiter::RateLimiter(RateLimitConfig config, Clock clock)
    : config_(std::move(config))
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
    , last_sweep_(clock_().time_since_epoch().count())
{}

const RateLimitRule& RateLimiter::rule_for(const std::string& operation) const {
    const auto it = config_.tools.find(operation);
    return it != config_.tools.end() ? it->second : fallback_rule_;
}

std::shared_ptr<TokenBucket> RateLimiter::get_or_create(const std::string& client_id,
                                                        const std::string& operation,
                                                        const RateLimitRule& rule) {
    BucketKey key{client_id, operation};
    {
        std::shared_lock<std::shared_mutex> lock(buckets_mutex_);
        const auto it = buckets_.find(key);
        if (it != buckets_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(buckets_mutex_);
    auto [it, inserted] = buckets_.try_emplace(std::move(key), nullptr);
    if (inserted) {
        it->second = std::make_shared<TokenBucket>(rule.capacity(), rule.refill_rate(), clock_());
    }
    return it->second;
}

RateLimitDecision RateLimiter::check(const std::string& client_id, const std::string& operation) {
    RateLimitDecision decision;
    if (!config_.enabled) {
        decision.remaining = std::numeric_limits<double>::infinity();
        return decision;
    }

    const auto now = clock_();
    maybe_sweep(now);

    auto op_bucket = get_or_create(client_id, operation, rule_for(operation));
    const TokenAcquire op_result = op_bucket->try_acquire(now);
    decision.remaining = op_result.remaining;

    if (!config_.global) {
        decision.allowed             = op_result.allowed;
        decision.retry_after_seconds = op_result.retry_after_seconds;
    } else {
        auto global_bucket = get_or_create(client_id, kGlobalBucketName, *config_.global);
        if (!op_result.allowed) {
            // 오퍼레이션 버킷에서 이미 거부: 전역 토큰은 건드리지 않고 대기 시간만 합친다
            decision.allowed = false;
            const double global_tokens = global_bucket->peek(now);
            double retry = op_result.retry_after_seconds.value_or(0.0);
            retry = std::max(retry, seconds_until_token(global_tokens, global_bucket->refill_rate()));
            decision.retry_after_seconds = retry;
            decision.remaining = std::min(decision.remaining, global_tokens);
        } else {
            const TokenAcquire global_result = global_bucket->try_acquire(now);
            decision.remaining = std::min(decision.remaining, global_result.remaining);
            if (!global_result.allowed) {
                op_bucket->refund(1.0);
                decision.allowed             = false;
                decision.retry_after_seconds = global_result.retry_after_seconds;
            }
        }
    }

    if (!decision.allowed) {
        spdlog::debug("rate_limiter: denied client={} operation={} retry_after={:.2f}s",
                      client_id, operation, decision.retry_after_seconds.value_or(0.0));
    }
    return decision;
}

void RateLimiter::reset_client(const std::string& client_id) {
    std::unique_lock<std::shared_mutex> lock(buckets_mutex_);
    auto it = buckets_.lower_bound(BucketKey{client_id, std::string{}});
    while (it != buckets_.end() && it->first.first == client_id) {
        it = buckets_.erase(it);
    }
}

void RateLimiter::reset_all() {
    std::unique_lock<std::shared_mutex> lock(buckets_mutex_);
    buckets_.clear();
    spdlog::info("rate_limiter: all buckets reset");
}

std::vector<BucketStatus> RateLimiter::client_status(const std::string& client_id) const {
    const auto now = clock_();
    std::vector<BucketStatus> out;

    std::shared_lock<std::shared_mutex> lock(buckets_mutex_);
    for (auto it = buckets_.lower_bound(BucketKey{client_id, std::string{}});
         it != buckets_.end() && it->first.first == client_id; ++it) {
        const auto& bucket = it->second;
        out.push_back(BucketStatus{it->first.second, bucket->peek(now), bucket->capacity(), bucket->refill_rate()});
    }
    return out;
}

std::size_t RateLimiter::prune_idle(std::chrono::steady_clock::duration max_idle) {
    const auto now = clock_();
    std::size_t evicted = 0;

    std::unique_lock<std::shared_mutex> lock(buckets_mutex_);
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if (now - it->second->last_access() > max_idle) {
            it = buckets_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    if (evicted > 0) {
        spdlog::debug("rate_limiter: pruned {} idle buckets", evicted);
    }
    return evicted;
}

std::size_t RateLimiter::sweep_full() {
    const auto now = clock_();
    std::size_t evicted = 0;

    std::unique_lock<std::shared_mutex> lock(buckets_mutex_);
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        const auto& bucket = it->second;
        if (bucket->peek(now) >= bucket->capacity() - kTokenEpsilon) {
            it = buckets_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    if (evicted > 0) {
        spdlog::debug("rate_limiter: swept {} full buckets ({} remain)", evicted, buckets_.size());
    }
    return evicted;
}

void RateLimiter::maybe_sweep(BucketTimePoint now) {
    if (config_.sweep_interval_seconds == 0) {
        return;
    }
    const auto interval = std::chrono::duration_cast<BucketTimePoint::duration>(
        std::chrono::seconds(config_.sweep_interval_seconds));
    const auto now_ticks = now.time_since_epoch().count();

    auto last = last_sweep_.load(std::memory_order_relaxed);
    if (now_ticks - last < interval.count()) {
        return;
    }
    if (!last_sweep_.compare_exchange_strong(last, now_ticks, std::memory_order_relaxed)) {
        return;  // 다른 스레드가 이미 정리 중
    }
    sweep_full();
}

std::size_t RateLimiter::bucket_count() const {
    std::shared_lock<std::shared_mutex> lock(buckets_mutex_);
    return buckets_.size();
}
