#include "coffer/transfer/throughput_monitor.hpp"
#include <algorithm>

namespace coffer::transfer {

namespace {
    std::uint64_t bytes_per_second(std::uint64_t bytes, std::chrono::nanoseconds elapsed) {
        auto elapsed_ms = std::max<std::int64_t>(
            1, std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
        return bytes * 1000 / static_cast<std::uint64_t>(elapsed_ms);
    }
}

ThroughputMonitor::ThroughputMonitor(std::chrono::milliseconds history_window)
    : history_window_(history_window)
    , start_time_(Clock::now())
    , total_bytes_(0)
    , bytes_in_window_(0) {
}

void ThroughputMonitor::start(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    start_time_ = now;
    total_bytes_ = 0;
    bytes_in_window_ = 0;
    transfer_history_.clear();
}

void ThroughputMonitor::on_bytes_transferred(std::uint64_t bytes, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_bytes_ += bytes;
    bytes_in_window_ += bytes;
    transfer_history_.emplace_back(now, bytes);
    cleanup_old_history(now);
}

std::uint64_t ThroughputMonitor::current_speed_bps(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup_old_history(now);
    
    if (transfer_history_.empty()) {
        return 0;
    }
    
    // Early in a transfer the window is only as long as the transfer itself
    auto elapsed = std::min<Clock::duration>(now - start_time_, history_window_);
    return bytes_per_second(bytes_in_window_, elapsed);
}

std::uint64_t ThroughputMonitor::average_speed_bps(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_per_second(total_bytes_, now - start_time_);
}

std::uint64_t ThroughputMonitor::total_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_bytes_;
}

void ThroughputMonitor::cleanup_old_history(Clock::time_point now) {
    while (!transfer_history_.empty() && now - transfer_history_.front().first > history_window_) {
        bytes_in_window_ -= transfer_history_.front().second;
        transfer_history_.pop_front();
    }
}

} // namespace coffer::transfer
