#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace coffer::storage {

struct StorageConfig {
    std::filesystem::path user_files_directory;
    std::filesystem::path upload_directory;
    std::filesystem::path database_path;
    
    StorageConfig() = default;
    
    explicit StorageConfig(const std::filesystem::path& base_dir);
    
    bool validate() const;
    
    bool create_directories() const;
    
    // Finalized encrypted file for a handle
    std::filesystem::path get_file_path(const std::string& handle) const;
    
    // In-progress upload for a handle
    std::filesystem::path get_upload_path(const std::string& handle) const;
    
    void set_base_directory(const std::filesystem::path& base_dir);
};

} // namespace coffer::storage
