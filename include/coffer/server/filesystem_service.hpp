#pragma once

#include "coffer/core/result.hpp"
#include "coffer/server/upload_session_store.hpp"
#include "coffer/storage/directory_service.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace coffer::server {

// Directory operations that move no file data: folders, renames and usage
class FilesystemService {
public:
    FilesystemService(std::shared_ptr<storage::DirectoryService> directory,
                      std::shared_ptr<UploadSessionStore> uploads);

    core::Result create_folder(storage::UserId user_id,
                               const std::string& parent_handle,
                               const std::vector<std::uint8_t>& encrypted_metadata,
                               std::string& out_handle);

    // Replaces the encrypted metadata of every listed record, or of none
    core::Result update_metadata(storage::UserId user_id, const std::vector<storage::MetadataUpdate>& updates);

    core::Result storage_used(storage::UserId user_id, std::uint64_t& out_bytes);

private:
    std::shared_ptr<storage::DirectoryService> directory_;
    // Folder handles share the namespace of pending uploads
    std::shared_ptr<UploadSessionStore> uploads_;
};

} // namespace coffer::server
