#include "coffer/storage/directory_service.hpp"
#include "coffer/storage/file_format.hpp"

namespace coffer::storage {

using core::ErrorCode;
using core::Result;

Result check_parent_folder(DirectoryService& directory, UserId user_id, const std::string& parent_handle) {
    if (is_root_handle(parent_handle)) {
        return Result();
    }
    
    LookupResult parent;
    auto result = directory.lookup(parent_handle, parent);
    if (result.error == ErrorCode::NOT_FOUND) {
        return Result(ErrorCode::NOT_FOUND, "Parent folder does not exist");
    }
    if (!result) {
        return result;
    }
    
    if (!parent.record.is_folder) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Parent handle is not a folder");
    }
    if (parent.record.owner_user_id != user_id) {
        return Result(ErrorCode::OWNERSHIP_MISMATCH, "Requester does not own the parent folder");
    }
    
    return Result();
}

} // namespace coffer::storage
