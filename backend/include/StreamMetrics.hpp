#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

namespace tickflow {

// Process-wide counters shared by dispatchers and the stats broadcaster.
struct StreamMetrics {
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
    std::atomic<uint64_t> data_points_sent{0};

    double uptime_seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    }
};

} // namespace tickflow
