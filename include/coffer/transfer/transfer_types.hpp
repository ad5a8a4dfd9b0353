#pragma once

#include "coffer/core/result.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace coffer::transfer {

enum class TransferType {
    UPLOAD,
    DOWNLOAD
};

enum class TransferStatus {
    WAITING,
    TRANSFERRING,
    FINISHED,
    FAILED,
    // User initiated; never reported as a failure
    CANCELLED
};

const char* transfer_status_name(TransferStatus status);

struct TransferProgress {
    TransferType type = TransferType::UPLOAD;
    TransferStatus status = TransferStatus::WAITING;
    std::string handle;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t speed_bps = 0;
    
    double percentage() const {
        return total_bytes > 0 ? static_cast<double>(bytes_transferred) / total_bytes * 100.0 : 100.0;
    }
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

// Polled before each chunk; may be called from worker threads
using CancelPredicate = std::function<bool()>;

} // namespace coffer::transfer
