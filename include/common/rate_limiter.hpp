#ifndef DLR_RATE_LIMITER_HPP
#define DLR_RATE_LIMITER_HPP

#include <cstddef>
#include <chrono>
#include <mutex>

// Token bucket capping transfer bandwidth. A rate of 0 disables the limit.
class RateLimiter {
public:
    explicit RateLimiter(size_t max_rate_bytes_per_sec);

    // Try to consume bytes. Returns true if successful, false otherwise.
    bool try_consume(size_t bytes);

    // Blocks until the bytes can be consumed. Requests larger than the bucket
    // are granted once the bucket is full.
    void consume(size_t bytes);

    size_t get_max_rate() const;
    void set_max_rate(size_t new_max_rate);

    bool unlimited() const;

private:
    // Refill the token bucket based on elapsed time. Caller holds mutex_.
    void refill();

    size_t max_rate_bytes_per_sec_;
    size_t tokens_in_bucket_;
    std::chrono::steady_clock::time_point last_refill_time_;
    mutable std::mutex mutex_;
};

#endif // DLR_RATE_LIMITER_HPP
