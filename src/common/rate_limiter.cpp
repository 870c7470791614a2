#include "common/rate_limiter.hpp"
#include <algorithm> // For std::min
#include <thread>

RateLimiter::RateLimiter(size_t max_rate_bytes_per_sec)
    : max_rate_bytes_per_sec_(max_rate_bytes_per_sec),
      tokens_in_bucket_(max_rate_bytes_per_sec), // Start with a full bucket
      last_refill_time_(std::chrono::steady_clock::now()) {}

bool RateLimiter::try_consume(size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_rate_bytes_per_sec_ == 0) {
        return true;
    }
    refill();

    if (tokens_in_bucket_ >= bytes) {
        tokens_in_bucket_ -= bytes;
        return true;
    }
    return false;
}

void RateLimiter::consume(size_t bytes) {
    while (true) {
        std::chrono::microseconds wait{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (max_rate_bytes_per_sec_ == 0) {
                return;
            }
            refill();
            size_t needed = std::min(bytes, max_rate_bytes_per_sec_);
            if (tokens_in_bucket_ >= needed) {
                tokens_in_bucket_ -= needed;
                return;
            }
            double missing = static_cast<double>(needed - tokens_in_bucket_);
            wait = std::chrono::microseconds(
                static_cast<long long>(missing * 1e6 / static_cast<double>(max_rate_bytes_per_sec_)));
        }
        std::this_thread::sleep_for(std::max(wait, std::chrono::microseconds(1000)));
    }
}

void RateLimiter::refill() {
    auto now = std::chrono::steady_clock::now();
    std::chrono::duration<double> time_elapsed = now - last_refill_time_;
    double seconds_elapsed = time_elapsed.count();

    if (seconds_elapsed > 0) {
        size_t tokens_to_add = static_cast<size_t>(seconds_elapsed * max_rate_bytes_per_sec_);
        // Keep the fractional remainder for the next refill
        if (tokens_to_add > 0) {
            tokens_in_bucket_ = std::min(tokens_in_bucket_ + tokens_to_add, max_rate_bytes_per_sec_);
            last_refill_time_ = now;
        }
    }
}

size_t RateLimiter::get_max_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_rate_bytes_per_sec_;
}

void RateLimiter::set_max_rate(size_t new_max_rate) {
    std::lock_guard<std::mutex> lock(mutex_);
    refill();
    max_rate_bytes_per_sec_ = new_max_rate;
    tokens_in_bucket_ = std::min(tokens_in_bucket_, max_rate_bytes_per_sec_);
}

bool RateLimiter::unlimited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_rate_bytes_per_sec_ == 0;
}
