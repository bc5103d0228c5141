#include "backoff.H"

#include <random>

namespace predex::gateway {

Backoff::Backoff(std::chrono::milliseconds base, std::chrono::milliseconds max, std::chrono::milliseconds jitter)
    : base(base), max(max), jitter(jitter) {}

std::chrono::milliseconds Backoff::base_delay(uint32_t attempt) const {
    // 2^31 ms is far beyond any sane max, stop doubling there
    if (attempt > 30) {
        attempt = 30;
    }
    int64_t delay = base.count() * (int64_t(1) << attempt);
    if (delay > max.count() || delay < 0) {
        delay = max.count();
    }
    return std::chrono::milliseconds(delay);
}

std::chrono::milliseconds Backoff::delay(uint32_t attempt) const {
    auto delay = base_delay(attempt);
    if (jitter.count() <= 0) {
        return delay;
    }
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<int64_t> dist(0, jitter.count());
    return delay + std::chrono::milliseconds(dist(gen));
}

} // namespace predex::gateway
