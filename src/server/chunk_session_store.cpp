#include "coffer/server/chunk_session_store.hpp"
#include "coffer/storage/file_format.hpp"
#include "coffer/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace coffer::server {

using core::ErrorCode;
using core::Result;

namespace {
    Result pread_fully(int fd, std::uint8_t* buffer, size_t length, std::uint64_t offset) {
        size_t total = 0;
        while (total < length) {
            ssize_t n = ::pread(fd, buffer + total, length - total, static_cast<off_t>(offset + total));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return Result(ErrorCode::IO_ERROR, std::string("pread failed: ") + std::strerror(errno));
            }
            if (n == 0) {
                return Result(ErrorCode::IO_ERROR, "Unexpected end of file");
            }
            total += static_cast<size_t>(n);
        }
        return Result();
    }

    // Keeps a session marked in use for the duration of one request
    class InFlightGuard {
    public:
        explicit InFlightGuard(std::function<void()> release) : release_(std::move(release)) {}
        ~InFlightGuard() { release_(); }

        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;

    private:
        std::function<void()> release_;
    };
}

ChunkSessionStore::ChunkSessionStore(std::shared_ptr<storage::DirectoryService> directory,
                                     std::chrono::milliseconds session_expiry)
    : directory_(std::move(directory))
    , session_expiry_(session_expiry)
    , io_context_()
    , running_(false) {
}

ChunkSessionStore::~ChunkSessionStore() {
    stop();
}

bool ChunkSessionStore::start() {
    if (running_) {
        LOG_WARN("Chunk session store already running");
        return false;
    }

    io_context_.restart();
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    running_ = true;

    io_thread_ = std::thread([this]() {
        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("Session expiry loop error: {}", e.what());
                if (!running_) break;
                io_context_.restart();
            }
        }
    });

    LOG_DEBUG("Chunk session store started with {}ms session expiry", session_expiry_.count());
    return true;
}

void ChunkSessionStore::stop() {
    if (running_) {
        running_ = false;
        work_guard_.reset();
        io_context_.stop();

        if (io_thread_.joinable()) {
            io_thread_.join();
        }
    }

    std::unordered_map<std::string, SessionPtr> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }

    for (auto& [handle, session] : sessions) {
        close_session(*session);
    }

    if (!sessions.empty()) {
        LOG_DEBUG("Closed {} download sessions on shutdown", sessions.size());
    }
}

Result ChunkSessionStore::read_chunk(storage::UserId user_id,
                                     const std::string& handle,
                                     std::int64_t chunk_id,
                                     std::vector<std::uint8_t>& out_chunk) {
    if (chunk_id < 0) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Chunk id must not be negative");
    }

    SessionPtr session;
    auto result = acquire_session(user_id, handle, session);
    if (!result) {
        return result;
    }

    // Every request, failed or not, restarts the inactivity timer
    InFlightGuard guard([this, &session]() {
        release_session(session);
        arm_expiry(session);
    });

    // The session may have been created by a different requester
    if (session->owner_user_id != user_id) {
        LOG_WARN("User {} requested chunk {} of {} owned by another user", user_id, chunk_id, handle);
        return Result(ErrorCode::OWNERSHIP_MISMATCH, "Requester does not own " + handle);
    }

    // Bound the id before computing an offset so a huge id cannot wrap into the file
    std::uint64_t last_chunk_id =
        (session->encrypted_file_size - storage::ENCRYPTED_FILE_HEADER_SIZE) / crypto::ENCRYPTED_CHUNK_SIZE;
    if (static_cast<std::uint64_t>(chunk_id) > last_chunk_id) {
        return Result(ErrorCode::RANGE_NOT_SATISFIABLE,
            "Chunk " + std::to_string(chunk_id) + " is past the end of " + handle);
    }

    std::uint64_t offset = storage::encrypted_chunk_offset(static_cast<std::uint64_t>(chunk_id));
    if (offset > session->encrypted_file_size) {
        return Result(ErrorCode::RANGE_NOT_SATISFIABLE,
            "Chunk " + std::to_string(chunk_id) + " is past the end of " + handle);
    }

    size_t length = static_cast<size_t>(std::min<std::uint64_t>(
        crypto::ENCRYPTED_CHUNK_SIZE, session->encrypted_file_size - offset));

    result = read_locked(*session, chunk_id, offset, length, out_chunk);
    if (!result) {
        LOG_ERROR("Failed to read chunk {} of {}: {}", chunk_id, handle, result.message);
        return result;
    }

    return Result();
}

Result ChunkSessionStore::read_locked(DownloadSession& session, std::int64_t chunk_id,
                                      std::uint64_t offset, size_t length,
                                      std::vector<std::uint8_t>& out_chunk) {
    std::lock_guard<std::mutex> read_lock(session.read_mutex);

    ReadHook hook;
    {
        std::lock_guard<std::mutex> lock(hook_mutex_);
        hook = read_hook_;
    }
    if (hook) {
        hook(session.handle, chunk_id);
    }

    if (session.fd < 0) {
        return Result(ErrorCode::IO_ERROR, "Session file is closed");
    }

    out_chunk.resize(length);
    auto result = pread_fully(session.fd, out_chunk.data(), length, offset);
    if (!result) {
        out_chunk.clear();
    }
    return result;
}

Result ChunkSessionStore::acquire_session(storage::UserId user_id, const std::string& handle,
                                          SessionPtr& out_session) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(handle);
        if (it != sessions_.end()) {
            it->second->in_flight++;
            out_session = it->second;
            return Result();
        }
    }

    SessionPtr opened;
    auto result = open_session(user_id, handle, opened);
    if (!result) {
        return result;
    }

    bool inserted = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto [it, was_inserted] = sessions_.emplace(handle, opened);
        it->second->in_flight++;
        out_session = it->second;
        inserted = was_inserted;
    }

    if (inserted) {
        LOG_DEBUG("Opened download session for {} ({} bytes)", handle, opened->encrypted_file_size);
        arm_expiry(opened);
    } else {
        // Another request opened the same handle first
        close_session(*opened);
    }

    return Result();
}

Result ChunkSessionStore::open_session(storage::UserId user_id, const std::string& handle,
                                       SessionPtr& out_session) {
    if (!storage::is_valid_handle(handle) || storage::is_root_handle(handle)) {
        return Result(ErrorCode::NOT_FOUND, "No file for handle " + handle);
    }

    storage::LookupResult lookup;
    auto result = directory_->lookup(handle, lookup);
    if (!result) {
        if (result.error == ErrorCode::NOT_FOUND) {
            return result;
        }
        LOG_ERROR("Directory lookup for {} failed: {}", handle, result.message);
        return Result(ErrorCode::NOT_FOUND, "Directory lookup failed for " + handle);
    }

    if (lookup.record.is_folder || !lookup.physical_path) {
        return Result(ErrorCode::FOLDER_HAS_NO_PHYSICAL_FILE, handle + " is a folder");
    }

    if (lookup.record.owner_user_id != user_id) {
        LOG_WARN("User {} attempted to open {} owned by another user", user_id, handle);
        return Result(ErrorCode::OWNERSHIP_MISMATCH, "Requester does not own " + handle);
    }

    const auto& path = *lookup.physical_path;
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        LOG_ERROR("Stored file for {} cannot be opened at {}: {}", handle, path.string(), std::strerror(errno));
        return Result(ErrorCode::IO_ERROR, "Stored file for " + handle + " is missing");
    }

    std::array<std::uint8_t, storage::ENCRYPTED_FILE_HEADER_SIZE> magic{};
    result = pread_fully(fd, magic.data(), magic.size(), 0);
    if (!result || magic != storage::ENCRYPTED_FILE_MAGIC) {
        ::close(fd);
        LOG_ERROR("Stored file for {} has an invalid header", handle);
        return Result(ErrorCode::INVALID_FORMAT, "Stored file for " + handle + " has an invalid header");
    }

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        int error = errno;
        ::close(fd);
        return Result(ErrorCode::IO_ERROR, std::string("fstat failed: ") + std::strerror(error));
    }

    out_session = std::make_shared<DownloadSession>(
        io_context_, handle, lookup.record.owner_user_id, fd, static_cast<std::uint64_t>(st.st_size));
    return Result();
}

void ChunkSessionStore::release_session(const SessionPtr& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    session->in_flight--;
}

void ChunkSessionStore::arm_expiry(const SessionPtr& session) {
    std::weak_ptr<DownloadSession> weak_session = session;
    boost::asio::post(io_context_, [this, weak_session]() {
        auto session = weak_session.lock();
        if (!session) {
            return;
        }

        std::uint64_t generation = ++session->timer_generation;
        session->expiry_timer.expires_after(session_expiry_);
        session->expiry_timer.async_wait([this, weak_session, generation](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            on_expiry(weak_session, generation);
        });
    });
}

void ChunkSessionStore::on_expiry(const std::weak_ptr<DownloadSession>& weak_session, std::uint64_t generation) {
    auto session = weak_session.lock();
    if (!session || session->timer_generation != generation) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session->handle);
        if (it == sessions_.end() || it->second != session) {
            return;
        }

        // A request still holds the session and re-arms the timer when done
        if (session->in_flight > 0) {
            return;
        }

        sessions_.erase(it);
    }

    close_session(*session);
    LOG_DEBUG("Download session for {} expired", session->handle);
}

void ChunkSessionStore::close_session(DownloadSession& session) {
    std::lock_guard<std::mutex> read_lock(session.read_mutex);
    if (session.fd >= 0) {
        ::close(session.fd);
        session.fd = -1;
    }
}

bool ChunkSessionStore::has_session(const std::string& handle) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.find(handle) != sessions_.end();
}

size_t ChunkSessionStore::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

std::optional<std::uint64_t> ChunkSessionStore::session_file_size(const std::string& handle) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(handle);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second->encrypted_file_size;
}

void ChunkSessionStore::set_read_hook(ReadHook hook) {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    read_hook_ = std::move(hook);
}

} // namespace coffer::server
