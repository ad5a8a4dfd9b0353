#pragma once

#include "coffer/transfer/upload_orchestrator.hpp"
#include <boost/asio/thread_pool.hpp>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <atomic>

namespace coffer::transfer {

constexpr size_t DEFAULT_MAX_CONCURRENT_UPLOADS = 4;

using UploadId = std::uint64_t;
using UploadCompletion = std::function<void(UploadId, const UploadResult&)>;

// FIFO queue in front of UploadOrchestrator. At most max_concurrent uploads
// run at once; each completion starts the next queued request.
class UploadManager {
public:
    UploadManager(std::shared_ptr<UploadOrchestrator> orchestrator,
                  size_t max_concurrent = DEFAULT_MAX_CONCURRENT_UPLOADS);
    ~UploadManager();
    
    UploadManager(const UploadManager&) = delete;
    UploadManager& operator=(const UploadManager&) = delete;
    
    UploadId enqueue(UploadRequest request,
                     UploadCompletion on_complete = {},
                     ProgressCallback progress = {});
    
    // Queued uploads are dropped with a CANCELLED result; running ones stop
    // before their next chunk
    bool cancel(UploadId id);
    
    void wait_idle();
    
    size_t queued_count() const;
    size_t active_count() const;

private:
    struct Item {
        UploadId id = 0;
        UploadRequest request;
        UploadCompletion on_complete;
        ProgressCallback progress;
        std::shared_ptr<std::atomic<bool>> cancel_flag;
    };
    
    // Caller holds mutex_
    void start_next();
    void run(Item item);
    // Completes each dropped request as CANCELLED; called without mutex_
    void report_dropped(std::deque<Item>& dropped);
    
    std::shared_ptr<UploadOrchestrator> orchestrator_;
    size_t max_concurrent_;
    boost::asio::thread_pool pool_;
    
    std::deque<Item> queue_;
    std::unordered_map<UploadId, std::shared_ptr<std::atomic<bool>>> active_;
    UploadId next_id_;
    bool stopping_ = false;
    mutable std::mutex mutex_;
    std::condition_variable idle_;
};

} // namespace coffer::transfer
