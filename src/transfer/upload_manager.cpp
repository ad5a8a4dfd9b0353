#include "coffer/transfer/upload_manager.hpp"
#include "coffer/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>

namespace coffer::transfer {

UploadManager::UploadManager(std::shared_ptr<UploadOrchestrator> orchestrator, size_t max_concurrent)
    : orchestrator_(std::move(orchestrator))
    , max_concurrent_(std::max<size_t>(1, max_concurrent))
    , pool_(max_concurrent_)
    , next_id_(1) {
}

UploadManager::~UploadManager() {
    std::deque<Item> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        dropped.swap(queue_);
        for (auto& [id, flag] : active_) {
            flag->store(true);
        }
    }
    report_dropped(dropped);
    pool_.join();
    
    // Requests enqueued by completion callbacks while the pool drained
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(queue_);
    }
    report_dropped(dropped);
}

void UploadManager::report_dropped(std::deque<Item>& dropped) {
    if (!dropped.empty()) {
        LOG_DEBUG("Dropping {} queued uploads", dropped.size());
    }
    for (auto& item : dropped) {
        if (item.on_complete) {
            UploadResult result;
            result.status = TransferStatus::CANCELLED;
            item.on_complete(item.id, result);
        }
    }
    dropped.clear();
}

UploadId UploadManager::enqueue(UploadRequest request, UploadCompletion on_complete, ProgressCallback progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    Item item;
    item.id = next_id_++;
    item.request = std::move(request);
    item.on_complete = std::move(on_complete);
    item.progress = std::move(progress);
    item.cancel_flag = std::make_shared<std::atomic<bool>>(false);
    
    auto id = item.id;
    queue_.push_back(std::move(item));
    LOG_DEBUG("Queued upload {} ({} waiting)", id, queue_.size());
    
    start_next();
    return id;
}

void UploadManager::start_next() {
    while (!stopping_ && active_.size() < max_concurrent_ && !queue_.empty()) {
        auto item = std::move(queue_.front());
        queue_.pop_front();
        active_[item.id] = item.cancel_flag;
        
        boost::asio::post(pool_, [this, item = std::move(item)]() mutable {
            run(std::move(item));
        });
    }
}

void UploadManager::run(Item item) {
    auto flag = item.cancel_flag;
    auto result = orchestrator_->upload(item.request, [flag]() { return flag->load(); }, item.progress);
    
    if (item.on_complete) {
        item.on_complete(item.id, result);
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(item.id);
    start_next();
    if (active_.empty() && queue_.empty()) {
        idle_.notify_all();
    }
}

bool UploadManager::cancel(UploadId id) {
    Item dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto active = active_.find(id);
        if (active != active_.end()) {
            active->second->store(true);
            return true;
        }
        
        auto queued = std::find_if(queue_.begin(), queue_.end(), [id](const Item& item) {
            return item.id == id;
        });
        if (queued == queue_.end()) {
            return false;
        }
        dropped = std::move(*queued);
        queue_.erase(queued);
        if (active_.empty() && queue_.empty()) {
            idle_.notify_all();
        }
    }
    
    if (dropped.on_complete) {
        UploadResult result;
        result.status = TransferStatus::CANCELLED;
        dropped.on_complete(dropped.id, result);
    }
    return true;
}

void UploadManager::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this]() {
        return active_.empty() && queue_.empty();
    });
}

size_t UploadManager::queued_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t UploadManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

} // namespace coffer::transfer
