#pragma once

#include "coffer/core/result.hpp"
#include "coffer/server/transfer_schemas.hpp"
#include "coffer/storage/directory_service.hpp"
#include "coffer/storage/storage_config.hpp"
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace coffer::server {

constexpr size_t DEFAULT_MAX_BUFFERED_CHUNKS = 4;

// Server-side writer for in-progress uploads. Chunks may arrive out of order;
// they are buffered and written to the encrypted file strictly in order.
class UploadSessionStore {
public:
    UploadSessionStore(std::shared_ptr<storage::DirectoryService> directory,
                       const storage::StorageConfig& config,
                       size_t max_buffered_chunks = DEFAULT_MAX_BUFFERED_CHUNKS);
    ~UploadSessionStore();

    UploadSessionStore(const UploadSessionStore&) = delete;
    UploadSessionStore& operator=(const UploadSessionStore&) = delete;

    core::Result start_upload(storage::UserId user_id, std::uint64_t file_size, std::string& out_handle);

    // RATE_LIMITED when the out-of-order buffer is full
    core::Result write_chunk(storage::UserId user_id,
                             const std::string& handle,
                             std::int64_t chunk_id,
                             std::span<const std::uint8_t> data);

    core::Result finalise_upload(storage::UserId user_id, const FinaliseUploadRequest& request);

    core::Result cancel_upload(storage::UserId user_id, const std::string& handle);

    // Unused by the directory and by any open upload. Throws std::runtime_error
    // when no free handle turns up.
    std::string generate_unique_handle();

    size_t active_upload_count() const;
    size_t buffered_chunk_count(const std::string& handle) const;

private:
    struct UploadSession {
        std::string handle;
        storage::UserId owner_user_id = 0;
        std::uint64_t file_size = 0;
        std::uint64_t chunk_count = 0;
        std::uint64_t expected_encrypted_size = 0;
        std::uint64_t bytes_written = 0;
        std::int64_t next_chunk_id = 0;
        std::map<std::int64_t, std::vector<std::uint8_t>> buffered_chunks;
        std::filesystem::path path;
        std::ofstream output;
        bool closed = false;
        std::mutex mutex;
    };

    using SessionPtr = std::shared_ptr<UploadSession>;

    core::Result find_session(storage::UserId user_id, const std::string& handle, SessionPtr& out_session) const;
    core::Result write_to_disk(UploadSession& session, const std::vector<std::uint8_t>& data);
    void discard(UploadSession& session);

    std::shared_ptr<storage::DirectoryService> directory_;
    storage::StorageConfig config_;
    size_t max_buffered_chunks_;

    std::unordered_map<std::string, SessionPtr> sessions_;
    mutable std::mutex sessions_mutex_;
};

} // namespace coffer::server
