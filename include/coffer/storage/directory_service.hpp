#pragma once

#include "coffer/core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace coffer::storage {

using UserId = std::int64_t;

struct FileRecord {
    std::string handle;
    UserId owner_user_id = 0;
    std::string parent_handle;
    bool is_folder = false;
    std::vector<std::uint8_t> encrypted_metadata;
    std::vector<std::uint8_t> encrypted_file_crypt_key;
    std::vector<std::uint8_t> signature;
    std::uint64_t encrypted_file_size = 0;
};

struct MetadataUpdate {
    std::string handle;
    std::vector<std::uint8_t> encrypted_metadata;
};

struct LookupResult {
    FileRecord record;
    // Empty for folders
    std::optional<std::filesystem::path> physical_path;
};

// Maps a handle to its owner, parent and physical file
class DirectoryService {
public:
    virtual ~DirectoryService() = default;
    
    // NOT_FOUND when the handle is unknown
    virtual core::Result lookup(const std::string& handle, LookupResult& out_result) = 0;
    
    virtual bool handle_exists(const std::string& handle) = 0;
    
    virtual core::Result register_file(const FileRecord& record) = 0;
    virtual core::Result register_folder(const FileRecord& record) = 0;
    
    virtual core::Result list_children(UserId owner_user_id,
                                       const std::string& parent_handle,
                                       std::vector<FileRecord>& out_records) = 0;
    
    // All or nothing: NOT_FOUND, with no row changed, when any handle is
    // unknown or belongs to another user
    virtual core::Result update_metadata(UserId owner_user_id, const std::vector<MetadataUpdate>& updates) = 0;
    
    // Sum of the encrypted sizes of every file the user owns
    virtual core::Result storage_used(UserId owner_user_id, std::uint64_t& out_bytes) = 0;
};

// OK for the root handle or a folder the user owns. NOT_FOUND, INVALID_ARGUMENT
// (not a folder) or OWNERSHIP_MISMATCH otherwise.
core::Result check_parent_folder(DirectoryService& directory, UserId user_id, const std::string& parent_handle);

} // namespace coffer::storage
