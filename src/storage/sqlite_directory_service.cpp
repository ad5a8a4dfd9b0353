#include "coffer/storage/sqlite_directory_service.hpp"
#include "coffer/storage/file_format.hpp"
#include "coffer/core/logger.hpp"
#include <sqlite3.h>

namespace coffer::storage {

using core::ErrorCode;
using core::Result;

namespace {
    const char* SELECT_COLUMNS =
        "SELECT handle, owner_user_id, parent_handle, is_folder, encrypted_metadata, "
        "encrypted_file_crypt_key, signature, encrypted_file_size FROM files ";
    
    std::vector<std::uint8_t> column_blob(sqlite3_stmt* stmt, int column) {
        auto data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, column));
        int size = sqlite3_column_bytes(stmt, column);
        if (!data || size <= 0) {
            return {};
        }
        return std::vector<std::uint8_t>(data, data + size);
    }
    
    std::string column_text(sqlite3_stmt* stmt, int column) {
        auto text = sqlite3_column_text(stmt, column);
        return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
    }
    
    void bind_blob(sqlite3_stmt* stmt, int index, const std::vector<std::uint8_t>& data) {
        if (data.empty()) {
            sqlite3_bind_null(stmt, index);
        } else {
            sqlite3_bind_blob(stmt, index, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT);
        }
    }
}

SqliteDirectoryService::SqliteDirectoryService(const StorageConfig& config)
    : config_(config), db_(nullptr) {
}

SqliteDirectoryService::~SqliteDirectoryService() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool SqliteDirectoryService::initialize() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    
    int result = sqlite3_open(config_.database_path.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open directory database {}: {}",
                  config_.database_path.string(), db_ ? sqlite3_errmsg(db_) : "out of memory");
        return false;
    }
    
    return create_tables();
}

bool SqliteDirectoryService::create_tables() {
    const char* create_files_table = R"(
        CREATE TABLE IF NOT EXISTS files (
            handle TEXT PRIMARY KEY,
            owner_user_id INTEGER NOT NULL,
            parent_handle TEXT NOT NULL,
            is_folder INTEGER NOT NULL DEFAULT 0,
            encrypted_metadata BLOB NOT NULL,
            encrypted_file_crypt_key BLOB,
            signature BLOB,
            encrypted_file_size INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_files_owner_parent ON files(owner_user_id, parent_handle);
    )";
    
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, create_files_table, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create directory tables: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }
    
    return true;
}

FileRecord SqliteDirectoryService::read_record(sqlite3_stmt* stmt) const {
    FileRecord record;
    record.handle = column_text(stmt, 0);
    record.owner_user_id = sqlite3_column_int64(stmt, 1);
    record.parent_handle = column_text(stmt, 2);
    record.is_folder = sqlite3_column_int(stmt, 3) != 0;
    record.encrypted_metadata = column_blob(stmt, 4);
    record.encrypted_file_crypt_key = column_blob(stmt, 5);
    record.signature = column_blob(stmt, 6);
    record.encrypted_file_size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 7));
    return record;
}

Result SqliteDirectoryService::lookup(const std::string& handle, LookupResult& out_result) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return Result(ErrorCode::INVALID_STATE, "Directory database is not open");
    }
    
    std::string sql = std::string(SELECT_COLUMNS) + "WHERE handle = ?;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return Result(ErrorCode::IO_ERROR, sqlite3_errmsg(db_));
    }
    
    sqlite3_bind_text(stmt, 1, handle.c_str(), -1, SQLITE_TRANSIENT);
    
    int step = sqlite3_step(stmt);
    if (step != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (step == SQLITE_DONE) {
            return Result(ErrorCode::NOT_FOUND, "No record for handle " + handle);
        }
        return Result(ErrorCode::IO_ERROR, sqlite3_errmsg(db_));
    }
    
    out_result.record = read_record(stmt);
    sqlite3_finalize(stmt);
    
    if (out_result.record.is_folder) {
        out_result.physical_path.reset();
    } else {
        out_result.physical_path = config_.get_file_path(handle);
    }
    
    return Result();
}

bool SqliteDirectoryService::handle_exists(const std::string& handle) {
    LookupResult ignored;
    return lookup(handle, ignored).success();
}

Result SqliteDirectoryService::insert_record(const FileRecord& record) {
    if (!is_valid_handle(record.handle) || is_root_handle(record.handle)) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Invalid handle: " + record.handle);
    }
    
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return Result(ErrorCode::INVALID_STATE, "Directory database is not open");
    }
    
    const char* insert_sql = R"(
        INSERT INTO files
        (handle, owner_user_id, parent_handle, is_folder, encrypted_metadata,
         encrypted_file_crypt_key, signature, encrypted_file_size)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )";
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return Result(ErrorCode::IO_ERROR, sqlite3_errmsg(db_));
    }
    
    sqlite3_bind_text(stmt, 1, record.handle.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, record.owner_user_id);
    sqlite3_bind_text(stmt, 3, record.parent_handle.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, record.is_folder ? 1 : 0);
    sqlite3_bind_blob(stmt, 5, record.encrypted_metadata.data(),
                      static_cast<int>(record.encrypted_metadata.size()), SQLITE_TRANSIENT);
    bind_blob(stmt, 6, record.encrypted_file_crypt_key);
    bind_blob(stmt, 7, record.signature);
    sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(record.encrypted_file_size));
    
    int step = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (step == SQLITE_CONSTRAINT) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Handle already registered: " + record.handle);
    }
    if (step != SQLITE_DONE) {
        return Result(ErrorCode::IO_ERROR, sqlite3_errmsg(db_));
    }
    
    LOG_DEBUG("Registered {} {} under {}", record.is_folder ? "folder" : "file",
              record.handle, record.parent_handle);
    return Result();
}

Result SqliteDirectoryService::register_file(const FileRecord& record) {
    if (record.is_folder) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Use register_folder for folders");
    }
    return insert_record(record);
}

Result SqliteDirectoryService::register_folder(const FileRecord& record) {
    if (!record.is_folder) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Record is not a folder");
    }
    return insert_record(record);
}

Result SqliteDirectoryService::list_children(UserId owner_user_id,
                                             const std::string& parent_handle,
                                             std::vector<FileRecord>& out_records) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return Result(ErrorCode::INVALID_STATE, "Directory database is not open");
    }
    
    std::string sql = std::string(SELECT_COLUMNS) +
        "WHERE owner_user_id = ? AND parent_handle = ? ORDER BY is_folder DESC, handle;";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return Result(ErrorCode::IO_ERROR, sqlite3_errmsg(db_));
    }
    
    sqlite3_bind_int64(stmt, 1, owner_user_id);
    sqlite3_bind_text(stmt, 2, parent_handle.c_str(), -1, SQLITE_TRANSIENT);
    
    out_records.clear();
    int step;
    while ((step = sqlite3_step(stmt)) == SQLITE_ROW) {
        out_records.push_back(read_record(stmt));
    }
    sqlite3_finalize(stmt);
    
    if (step != SQLITE_DONE) {
        return Result(ErrorCode::IO_ERROR, sqlite3_errmsg(db_));
    }
    
    return Result();
}

bool SqliteDirectoryService::execute(const char* sql) {
    char* error_msg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg) != SQLITE_OK) {
        LOG_ERROR("Directory statement '{}' failed: {}", sql, error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

Result SqliteDirectoryService::update_metadata(UserId owner_user_id, const std::vector<MetadataUpdate>& updates) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return Result(ErrorCode::INVALID_STATE, "Directory database is not open");
    }
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "UPDATE files SET encrypted_metadata = ? WHERE handle = ? AND owner_user_id = ?;",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return Result(ErrorCode::IO_ERROR, sqlite3_errmsg(db_));
    }
    
    if (!execute("BEGIN IMMEDIATE;")) {
        sqlite3_finalize(stmt);
        return Result(ErrorCode::IO_ERROR, "Failed to begin metadata transaction");
    }
    
    Result result;
    for (const auto& update : updates) {
        sqlite3_reset(stmt);
        sqlite3_bind_blob(stmt, 1, update.encrypted_metadata.data(),
                          static_cast<int>(update.encrypted_metadata.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, update.handle.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, owner_user_id);
        
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            result = Result(ErrorCode::IO_ERROR, sqlite3_errmsg(db_));
            break;
        }
        if (sqlite3_changes(db_) == 0) {
            result = Result(ErrorCode::NOT_FOUND, "No record owned by the user for handle " + update.handle);
            break;
        }
    }
    sqlite3_finalize(stmt);
    
    if (!result) {
        if (!execute("ROLLBACK;")) {
            LOG_ERROR("Metadata rollback failed for user {}", owner_user_id);
        }
        return result;
    }
    
    if (!execute("COMMIT;")) {
        if (!execute("ROLLBACK;")) {
            LOG_ERROR("Metadata rollback failed for user {}", owner_user_id);
        }
        return Result(ErrorCode::IO_ERROR, "Failed to commit metadata transaction");
    }
    
    LOG_DEBUG("Updated metadata of {} records for user {}", updates.size(), owner_user_id);
    return Result();
}

Result SqliteDirectoryService::storage_used(UserId owner_user_id, std::uint64_t& out_bytes) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return Result(ErrorCode::INVALID_STATE, "Directory database is not open");
    }
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COALESCE(SUM(encrypted_file_size), 0) FROM files WHERE owner_user_id = ?;",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return Result(ErrorCode::IO_ERROR, sqlite3_errmsg(db_));
    }
    
    sqlite3_bind_int64(stmt, 1, owner_user_id);
    int step = sqlite3_step(stmt);
    if (step == SQLITE_ROW) {
        out_bytes = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    
    if (step != SQLITE_ROW) {
        return Result(ErrorCode::IO_ERROR, sqlite3_errmsg(db_));
    }
    return Result();
}

Result SqliteDirectoryService::remove(const std::string& handle) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return Result(ErrorCode::INVALID_STATE, "Directory database is not open");
    }
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM files WHERE handle = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        return Result(ErrorCode::IO_ERROR, sqlite3_errmsg(db_));
    }
    
    sqlite3_bind_text(stmt, 1, handle.c_str(), -1, SQLITE_TRANSIENT);
    int step = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (step != SQLITE_DONE) {
        return Result(ErrorCode::IO_ERROR, sqlite3_errmsg(db_));
    }
    
    if (sqlite3_changes(db_) == 0) {
        return Result(ErrorCode::NOT_FOUND, "No record for handle " + handle);
    }
    
    return Result();
}

size_t SqliteDirectoryService::get_record_count() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return 0;
    }
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM files;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace coffer::storage
