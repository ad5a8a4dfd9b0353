#include "coffer/server/filesystem_service.hpp"
#include "coffer/crypto/chunk_codec.hpp"
#include "coffer/storage/file_format.hpp"
#include "coffer/core/logger.hpp"
#include <stdexcept>

namespace coffer::server {

using core::ErrorCode;
using core::Result;

namespace {
    Result validate_metadata(const std::vector<std::uint8_t>& encrypted_metadata) {
        if (encrypted_metadata.empty() || encrypted_metadata.size() > crypto::ENCRYPTED_METADATA_MAX_SIZE) {
            return Result(ErrorCode::INVALID_ARGUMENT, "Encrypted metadata has an invalid size");
        }
        return Result();
    }
}

FilesystemService::FilesystemService(std::shared_ptr<storage::DirectoryService> directory,
                                     std::shared_ptr<UploadSessionStore> uploads)
    : directory_(std::move(directory))
    , uploads_(std::move(uploads)) {
}

Result FilesystemService::create_folder(storage::UserId user_id,
                                        const std::string& parent_handle,
                                        const std::vector<std::uint8_t>& encrypted_metadata,
                                        std::string& out_handle) {
    auto result = validate_metadata(encrypted_metadata);
    if (!result) {
        return result;
    }
    if (!storage::is_valid_handle(parent_handle)) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Invalid parent handle");
    }
    
    result = storage::check_parent_folder(*directory_, user_id, parent_handle);
    if (!result) {
        return result;
    }
    
    storage::FileRecord record;
    try {
        record.handle = uploads_->generate_unique_handle();
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Cannot create folder under {}: {}", parent_handle, e.what());
        return Result(ErrorCode::IO_ERROR, e.what());
    }
    record.owner_user_id = user_id;
    record.parent_handle = parent_handle;
    record.is_folder = true;
    record.encrypted_metadata = encrypted_metadata;
    
    result = directory_->register_folder(record);
    if (!result) {
        return result;
    }
    
    LOG_INFO("User {} created folder {} under {}", user_id, record.handle, parent_handle);
    out_handle = record.handle;
    return Result();
}

Result FilesystemService::update_metadata(storage::UserId user_id, const std::vector<storage::MetadataUpdate>& updates) {
    for (const auto& update : updates) {
        if (!storage::is_valid_handle(update.handle) || storage::is_root_handle(update.handle)) {
            return Result(ErrorCode::INVALID_ARGUMENT, "Invalid handle: " + update.handle);
        }
        auto result = validate_metadata(update.encrypted_metadata);
        if (!result) {
            return result;
        }
    }
    
    return directory_->update_metadata(user_id, updates);
}

Result FilesystemService::storage_used(storage::UserId user_id, std::uint64_t& out_bytes) {
    return directory_->storage_used(user_id, out_bytes);
}

} // namespace coffer::server
