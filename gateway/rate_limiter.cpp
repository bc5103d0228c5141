#include "rate_limiter.H"
#include "gateway_error.H"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace predex::gateway {

// upper bound on a single wait so a stop request is noticed promptly
static constexpr std::chrono::milliseconds STOP_POLL_INTERVAL{50};

RateLimiter::RateLimiter(double capacity, double refill_per_second)
    : capacity(capacity), refill_per_second(refill_per_second), tokens(capacity), last_refill(clock::now()) {
    if (capacity <= 0 || refill_per_second <= 0) {
        throw std::invalid_argument("RateLimiter capacity and refill rate must be positive");
    }
}

RateLimiter::RateLimiter(const RateLimitConfig& config)
    : RateLimiter(config.capacity, config.refill_per_second) {}

void RateLimiter::refill(clock::time_point now) {
    if (now <= last_refill) {
        return;
    }
    double elapsed = std::chrono::duration<double>(now - last_refill).count();
    tokens = std::min(capacity, tokens + elapsed * refill_per_second);
    last_refill = now;
}

void RateLimiter::check_weight(double weight) const {
    if (weight <= 0 || weight > capacity) {
        throw std::invalid_argument("RateLimiter weight " + std::to_string(weight) +
                                    " outside (0, " + std::to_string(capacity) + "]");
    }
}

void RateLimiter::acquire(double weight, const StopToken& stop) {
    check_weight(weight);

    std::unique_lock<std::mutex> lock(mutex);
    while (true) {
        if (stop.stop_requested()) {
            throw GatewayError(GATEWAY_ERROR::CANCELLED, "rate limiter wait cancelled");
        }

        refill(clock::now());
        if (tokens >= weight) {
            tokens -= weight;
            return;
        }

        auto needed = std::chrono::duration<double>((weight - tokens) / refill_per_second);
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(needed) + std::chrono::milliseconds(1);
        cv.wait_for(lock, std::min(wait, STOP_POLL_INTERVAL));
    }
}

void RateLimiter::acquire(double weight) {
    acquire(weight, StopToken());
}

bool RateLimiter::try_acquire(double weight) {
    check_weight(weight);

    std::lock_guard<std::mutex> lock(mutex);
    refill(clock::now());
    if (tokens >= weight) {
        tokens -= weight;
        return true;
    }
    return false;
}

double RateLimiter::available() {
    std::lock_guard<std::mutex> lock(mutex);
    refill(clock::now());
    return tokens;
}

} // namespace predex::gateway
