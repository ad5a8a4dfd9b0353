#pragma once

#include "coffer/core/result.hpp"
#include "coffer/storage/directory_service.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace coffer::server {

constexpr std::chrono::milliseconds DEFAULT_SESSION_EXPIRY{10000};

// Per-handle download sessions: the encrypted file is opened once, reads are
// serialized per session, and idle sessions close themselves.
class ChunkSessionStore {
public:
    // Invoked while the session read lock is held, before the file is read
    using ReadHook = std::function<void(const std::string& handle, std::int64_t chunk_id)>;
    
    explicit ChunkSessionStore(std::shared_ptr<storage::DirectoryService> directory,
                               std::chrono::milliseconds session_expiry = DEFAULT_SESSION_EXPIRY);
    ~ChunkSessionStore();
    
    ChunkSessionStore(const ChunkSessionStore&) = delete;
    ChunkSessionStore& operator=(const ChunkSessionStore&) = delete;
    
    bool start();
    void stop();
    bool is_running() const { return running_; }
    
    core::Result read_chunk(storage::UserId user_id,
                            const std::string& handle,
                            std::int64_t chunk_id,
                            std::vector<std::uint8_t>& out_chunk);
    
    bool has_session(const std::string& handle) const;
    size_t session_count() const;
    std::optional<std::uint64_t> session_file_size(const std::string& handle) const;
    
    void set_read_hook(ReadHook hook);

private:
    struct DownloadSession {
        DownloadSession(boost::asio::io_context& io, std::string h, storage::UserId owner, int descriptor,
                        std::uint64_t size)
            : handle(std::move(h))
            , owner_user_id(owner)
            , fd(descriptor)
            , encrypted_file_size(size)
            , expiry_timer(io)
            , timer_generation(0)
            , in_flight(0) {}
        
        const std::string handle;
        const storage::UserId owner_user_id;
        
        std::mutex read_mutex;
        int fd;
        const std::uint64_t encrypted_file_size;
        
        // Touched only on the io_context thread
        boost::asio::steady_timer expiry_timer;
        std::uint64_t timer_generation;
        
        // Guarded by sessions_mutex_
        int in_flight;
    };
    
    using SessionPtr = std::shared_ptr<DownloadSession>;
    
    core::Result acquire_session(storage::UserId user_id, const std::string& handle, SessionPtr& out_session);
    core::Result open_session(storage::UserId user_id, const std::string& handle, SessionPtr& out_session);
    void release_session(const SessionPtr& session);
    core::Result read_locked(DownloadSession& session, std::int64_t chunk_id,
                             std::uint64_t offset, size_t length,
                             std::vector<std::uint8_t>& out_chunk);
    
    void arm_expiry(const SessionPtr& session);
    void on_expiry(const std::weak_ptr<DownloadSession>& weak_session, std::uint64_t generation);
    static void close_session(DownloadSession& session);
    
    std::shared_ptr<storage::DirectoryService> directory_;
    std::chrono::milliseconds session_expiry_;
    
    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;
    std::atomic<bool> running_;
    
    std::unordered_map<std::string, SessionPtr> sessions_;
    mutable std::mutex sessions_mutex_;
    
    ReadHook read_hook_;
    std::mutex hook_mutex_;
};

} // namespace coffer::server
