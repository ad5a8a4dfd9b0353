#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

namespace coffer::transfer {

constexpr std::chrono::milliseconds THROUGHPUT_HISTORY_WINDOW{2500};

// Sliding-window transfer speed for a single transfer. Chunk threads report
// completed bytes; the concurrency controller and progress reports read it.
class ThroughputMonitor {
public:
    using Clock = std::chrono::steady_clock;
    
    explicit ThroughputMonitor(std::chrono::milliseconds history_window = THROUGHPUT_HISTORY_WINDOW);
    
    void start(Clock::time_point now = Clock::now());
    
    void on_bytes_transferred(std::uint64_t bytes, Clock::time_point now = Clock::now());
    
    std::uint64_t current_speed_bps(Clock::time_point now = Clock::now());
    std::uint64_t average_speed_bps(Clock::time_point now = Clock::now()) const;
    std::uint64_t total_bytes() const;

private:
    void cleanup_old_history(Clock::time_point now);
    
    std::chrono::milliseconds history_window_;
    Clock::time_point start_time_;
    std::uint64_t total_bytes_;
    std::deque<std::pair<Clock::time_point, std::uint64_t>> transfer_history_;
    std::uint64_t bytes_in_window_;
    mutable std::mutex mutex_;
};

} // namespace coffer::transfer
