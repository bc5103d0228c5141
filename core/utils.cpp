#include "utils.H"

#include <ctime>
#include <cstdio>
#include <mutex>
#include <random>

namespace predex {

    uint64_t nanotime() {
        struct timespec ts;
        clock_gettime(CLOCK_REALTIME, &ts);
        return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL + static_cast<uint64_t>(ts.tv_nsec);
    }

    uint64_t monotime() {
        struct timespec ts;
        clock_gettime(CLOCK_MONOTONIC, &ts);
        return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL + static_cast<uint64_t>(ts.tv_nsec);
    }

    std::string format_timestamp(uint64_t nanos) {
        time_t secs = static_cast<time_t>(nanos / 1000000000ULL);
        uint64_t micros = (nanos % 1000000000ULL) / 1000;

        struct tm tm_utc;
        gmtime_r(&secs, &tm_utc);

        char buf[64];
        snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lluZ",
                 tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                 tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec,
                 static_cast<unsigned long long>(micros));
        return buf;
    }

    std::string generate_id(const std::string& prefix) {
        static std::mutex mutex;
        static std::mt19937_64 gen(std::random_device{}());

        uint64_t value;
        {
            std::lock_guard<std::mutex> lock(mutex);
            value = gen();
        }

        char buf[16];
        snprintf(buf, sizeof(buf), "%012llx", static_cast<unsigned long long>(value & 0xFFFFFFFFFFFFULL));
        return prefix + buf;
    }

} // namespace predex
