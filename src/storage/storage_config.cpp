#include "coffer/storage/storage_config.hpp"
#include "coffer/storage/file_format.hpp"

namespace coffer::storage {

StorageConfig::StorageConfig(const std::filesystem::path& base_dir) {
    set_base_directory(base_dir);
}

bool StorageConfig::validate() const {
    if (user_files_directory.empty() || upload_directory.empty() || database_path.empty()) {
        return false;
    }
    
    // Finalizing moves files between these directories with a rename
    if (user_files_directory == upload_directory) {
        return false;
    }
    
    return true;
}

bool StorageConfig::create_directories() const {
    try {
        std::filesystem::create_directories(user_files_directory);
        std::filesystem::create_directories(upload_directory);
        
        auto db_dir = database_path.parent_path();
        if (!db_dir.empty()) {
            std::filesystem::create_directories(db_dir);
        }
        
        return true;
    } catch (const std::filesystem::filesystem_error&) {
        return false;
    }
}

std::filesystem::path StorageConfig::get_file_path(const std::string& handle) const {
    return user_files_directory / encrypted_file_name(handle);
}

std::filesystem::path StorageConfig::get_upload_path(const std::string& handle) const {
    return upload_directory / encrypted_file_name(handle);
}

void StorageConfig::set_base_directory(const std::filesystem::path& base_dir) {
    user_files_directory = base_dir / "files";
    upload_directory = base_dir / "uploads";
    database_path = base_dir / "coffer.db";
}

} // namespace coffer::storage
