#pragma once

#include "coffer/storage/directory_service.hpp"
#include "coffer/storage/storage_config.hpp"
#include <mutex>

struct sqlite3;
struct sqlite3_stmt;

namespace coffer::storage {

// DirectoryService backed by a single sqlite table of file records
class SqliteDirectoryService : public DirectoryService {
public:
    explicit SqliteDirectoryService(const StorageConfig& config);
    ~SqliteDirectoryService() override;
    
    SqliteDirectoryService(const SqliteDirectoryService&) = delete;
    SqliteDirectoryService& operator=(const SqliteDirectoryService&) = delete;
    
    bool initialize();
    
    core::Result lookup(const std::string& handle, LookupResult& out_result) override;
    bool handle_exists(const std::string& handle) override;
    core::Result register_file(const FileRecord& record) override;
    core::Result register_folder(const FileRecord& record) override;
    core::Result list_children(UserId owner_user_id,
                               const std::string& parent_handle,
                               std::vector<FileRecord>& out_records) override;
    core::Result update_metadata(UserId owner_user_id, const std::vector<MetadataUpdate>& updates) override;
    core::Result storage_used(UserId owner_user_id, std::uint64_t& out_bytes) override;
    
    core::Result remove(const std::string& handle);
    
    size_t get_record_count();

private:
    bool create_tables();
    core::Result insert_record(const FileRecord& record);
    FileRecord read_record(sqlite3_stmt* stmt) const;
    bool execute(const char* sql);
    
    StorageConfig config_;
    sqlite3* db_;
    std::mutex db_mutex_;
};

} // namespace coffer::storage
