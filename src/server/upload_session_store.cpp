#include "coffer/server/upload_session_store.hpp"
#include "coffer/crypto/chunk_codec.hpp"
#include "coffer/crypto/random.hpp"
#include "coffer/storage/file_format.hpp"
#include "coffer/core/logger.hpp"
#include <stdexcept>

namespace coffer::server {

using core::ErrorCode;
using core::Result;

UploadSessionStore::UploadSessionStore(std::shared_ptr<storage::DirectoryService> directory,
                                       const storage::StorageConfig& config,
                                       size_t max_buffered_chunks)
    : directory_(std::move(directory))
    , config_(config)
    , max_buffered_chunks_(max_buffered_chunks) {
}

UploadSessionStore::~UploadSessionStore() {
    std::unordered_map<std::string, SessionPtr> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }

    for (auto& [handle, session] : sessions) {
        std::lock_guard<std::mutex> lock(session->mutex);
        discard(*session);
    }

    if (!sessions.empty()) {
        LOG_INFO("Discarded {} unfinished uploads", sessions.size());
    }
}

std::string UploadSessionStore::generate_unique_handle() {
    for (int attempt = 0; attempt < 16; ++attempt) {
        auto handle = crypto::SecureRandom::generate_alphanumeric(storage::HANDLE_LENGTH);
        if (storage::is_root_handle(handle) || directory_->handle_exists(handle)) {
            continue;
        }

        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.find(handle) == sessions_.end()) {
            return handle;
        }
    }
    throw std::runtime_error("Failed to generate a unique file handle");
}

Result UploadSessionStore::start_upload(storage::UserId user_id, std::uint64_t file_size, std::string& out_handle) {
    if (file_size > storage::MAX_FILE_SIZE) {
        return Result(ErrorCode::INVALID_ARGUMENT, "File exceeds the maximum file size");
    }

    auto session = std::make_shared<UploadSession>();
    session->handle = generate_unique_handle();
    session->owner_user_id = user_id;
    session->file_size = file_size;
    session->chunk_count = storage::chunk_count(file_size);
    session->expected_encrypted_size = storage::encrypted_file_size(file_size);
    session->path = config_.get_upload_path(session->handle);

    std::error_code ec;
    std::filesystem::create_directories(config_.upload_directory, ec);

    session->output.open(session->path, std::ios::binary | std::ios::trunc);
    if (!session->output.is_open()) {
        LOG_ERROR("Cannot create upload file {}", session->path.string());
        return Result(ErrorCode::IO_ERROR, "Cannot create upload file");
    }

    auto result = write_to_disk(*session, std::vector<std::uint8_t>(
        storage::ENCRYPTED_FILE_MAGIC.begin(), storage::ENCRYPTED_FILE_MAGIC.end()));
    if (!result) {
        discard(*session);
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[session->handle] = session;
    }

    out_handle = session->handle;
    LOG_DEBUG("Started upload {} for user {} ({} bytes, {} chunks)",
              out_handle, user_id, file_size, session->chunk_count);
    return Result();
}

Result UploadSessionStore::find_session(storage::UserId user_id, const std::string& handle,
                                        SessionPtr& out_session) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(handle);
    if (it == sessions_.end()) {
        return Result(ErrorCode::NOT_FOUND, "No upload in progress for " + handle);
    }

    if (it->second->owner_user_id != user_id) {
        LOG_WARN("User {} attempted to access upload {} owned by another user", user_id, handle);
        return Result(ErrorCode::OWNERSHIP_MISMATCH, "Requester does not own upload " + handle);
    }

    out_session = it->second;
    return Result();
}

Result UploadSessionStore::write_to_disk(UploadSession& session, const std::vector<std::uint8_t>& data) {
    session.output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!session.output.good()) {
        LOG_ERROR("Write to upload file {} failed", session.path.string());
        return Result(ErrorCode::IO_ERROR, "Failed to write upload data");
    }
    session.bytes_written += data.size();
    return Result();
}

Result UploadSessionStore::write_chunk(storage::UserId user_id,
                                       const std::string& handle,
                                       std::int64_t chunk_id,
                                       std::span<const std::uint8_t> data) {
    SessionPtr session;
    auto result = find_session(user_id, handle, session);
    if (!result) {
        return result;
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->closed) {
        return Result(ErrorCode::NOT_FOUND, "No upload in progress for " + handle);
    }

    if (chunk_id < session->next_chunk_id ||
        static_cast<std::uint64_t>(chunk_id) >= session->chunk_count ||
        session->buffered_chunks.count(chunk_id) > 0) {
        return Result(ErrorCode::INVALID_ARGUMENT,
            "Chunk " + std::to_string(chunk_id) + " is out of range or already received");
    }

    std::uint64_t expected_size = storage::chunk_plaintext_size(session->file_size, chunk_id) +
                                  crypto::ENCRYPTED_CHUNK_EXTRA;
    if (data.size() != expected_size) {
        return Result(ErrorCode::INVALID_ARGUMENT,
            "Chunk " + std::to_string(chunk_id) + " should be " + std::to_string(expected_size) +
            " bytes, got " + std::to_string(data.size()));
    }

    if (chunk_id != session->next_chunk_id) {
        if (session->buffered_chunks.size() >= max_buffered_chunks_) {
            LOG_DEBUG("Upload {} is holding {} chunks, rejecting chunk {}",
                      handle, session->buffered_chunks.size(), chunk_id);
            return Result(ErrorCode::RATE_LIMITED, "Too many concurrent chunks");
        }
        session->buffered_chunks.emplace(chunk_id, std::vector<std::uint8_t>(data.begin(), data.end()));
        return Result();
    }

    result = write_to_disk(*session, std::vector<std::uint8_t>(data.begin(), data.end()));
    if (!result) {
        return result;
    }
    session->next_chunk_id++;

    // Drain buffered chunks that are now contiguous
    auto it = session->buffered_chunks.begin();
    while (it != session->buffered_chunks.end() && it->first == session->next_chunk_id) {
        result = write_to_disk(*session, it->second);
        if (!result) {
            return result;
        }
        session->next_chunk_id++;
        it = session->buffered_chunks.erase(it);
    }

    return Result();
}

Result UploadSessionStore::finalise_upload(storage::UserId user_id, const FinaliseUploadRequest& request) {
    if (request.encrypted_file_crypt_key.size() != crypto::ENCRYPTED_FILE_CRYPT_KEY_SIZE) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Encrypted file key has the wrong length");
    }
    if (request.signature.size() != crypto::ED25519_SIGNATURE_SIZE) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Signature has the wrong length");
    }
    if (request.encrypted_metadata.empty() ||
        request.encrypted_metadata.size() > crypto::ENCRYPTED_METADATA_MAX_SIZE) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Encrypted metadata has an invalid length");
    }

    SessionPtr session;
    auto result = find_session(user_id, request.handle, session);
    if (!result) {
        return result;
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->closed) {
        return Result(ErrorCode::NOT_FOUND, "No upload in progress for " + request.handle);
    }

    if (!session->buffered_chunks.empty() || session->bytes_written != session->expected_encrypted_size) {
        return Result(ErrorCode::INVALID_STATE,
            "Upload is incomplete: " + std::to_string(session->bytes_written) + " of " +
            std::to_string(session->expected_encrypted_size) + " bytes written");
    }

    result = storage::check_parent_folder(*directory_, user_id, request.parent_handle);
    if (!result) {
        return result;
    }

    session->output.close();
    if (session->output.fail()) {
        return Result(ErrorCode::IO_ERROR, "Failed to flush upload file");
    }

    auto destination = config_.get_file_path(request.handle);
    std::error_code ec;
    std::filesystem::create_directories(config_.user_files_directory, ec);
    std::filesystem::rename(session->path, destination, ec);
    if (ec) {
        LOG_ERROR("Failed to move {} to {}: {}", session->path.string(), destination.string(), ec.message());
        discard(*session);
        std::lock_guard<std::mutex> map_lock(sessions_mutex_);
        sessions_.erase(request.handle);
        return Result(ErrorCode::IO_ERROR, "Failed to store uploaded file");
    }
    session->path = destination;

    storage::FileRecord record;
    record.handle = request.handle;
    record.owner_user_id = user_id;
    record.parent_handle = request.parent_handle;
    record.is_folder = false;
    record.encrypted_metadata = request.encrypted_metadata;
    record.encrypted_file_crypt_key = request.encrypted_file_crypt_key;
    record.signature = request.signature;
    record.encrypted_file_size = session->expected_encrypted_size;

    result = directory_->register_file(record);
    if (!result) {
        LOG_ERROR("Failed to register upload {}: {}", request.handle, result.message);
        discard(*session);
    } else {
        session->closed = true;
        LOG_INFO("Finalized upload {} ({} encrypted bytes)", request.handle, record.encrypted_file_size);
    }

    std::lock_guard<std::mutex> map_lock(sessions_mutex_);
    sessions_.erase(request.handle);
    return result;
}

Result UploadSessionStore::cancel_upload(storage::UserId user_id, const std::string& handle) {
    SessionPtr session;
    auto result = find_session(user_id, handle, session);
    if (!result) {
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->closed) {
            return Result(ErrorCode::NOT_FOUND, "No upload in progress for " + handle);
        }
        discard(*session);
    }

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(handle);
    LOG_DEBUG("Cancelled upload {}", handle);
    return Result();
}

void UploadSessionStore::discard(UploadSession& session) {
    if (session.output.is_open()) {
        session.output.close();
    }
    session.buffered_chunks.clear();
    session.closed = true;

    std::error_code ec;
    std::filesystem::remove(session.path, ec);
    if (ec) {
        LOG_WARN("Failed to remove {}: {}", session.path.string(), ec.message());
    }
}

size_t UploadSessionStore::active_upload_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

size_t UploadSessionStore::buffered_chunk_count(const std::string& handle) const {
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(handle);
        if (it == sessions_.end()) {
            return 0;
        }
        session = it->second;
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    return session->buffered_chunks.size();
}

} // namespace coffer::server
