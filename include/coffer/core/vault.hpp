#pragma once

#include "coffer/crypto/key_manager.hpp"
#include "coffer/server/chunk_session_store.hpp"
#include "coffer/server/transfer_endpoints.hpp"
#include "coffer/server/upload_session_store.hpp"
#include "coffer/storage/sqlite_directory_service.hpp"
#include "coffer/storage/storage_config.hpp"
#include "coffer/transfer/filesystem_cache.hpp"
#include "coffer/transfer/loopback_transfer_api.hpp"
#include "coffer/transfer/upload_orchestrator.hpp"
#include <memory>

namespace coffer::core {

class Config;

// Local vault used by the CLI: the server stores and the client side wired
// together through the loopback transport for one user.
class Vault {
public:
    explicit Vault(const Config& config);
    ~Vault();
    
    Vault(const Vault&) = delete;
    Vault& operator=(const Vault&) = delete;
    
    // Opens storage and loads the keys, generating them on first use
    Result open();
    void close();
    
    crypto::KeyManager& keys() { return keys_; }
    storage::SqliteDirectoryService& directory() { return *directory_; }
    std::shared_ptr<transfer::TransferApi> api() { return api_; }
    transfer::FilesystemCache& cache() { return cache_; }
    
    storage::UserId user_id() const { return user_id_; }
    const storage::StorageConfig& storage_config() const { return storage_config_; }
    const transfer::UploadOptions& upload_options() const { return upload_options_; }
    size_t max_concurrent_uploads() const { return max_concurrent_uploads_; }

private:
    storage::StorageConfig storage_config_;
    std::filesystem::path keys_dir_;
    storage::UserId user_id_;
    std::chrono::milliseconds session_expiry_;
    size_t max_buffered_chunks_;
    size_t max_concurrent_uploads_;
    transfer::UploadOptions upload_options_;
    
    crypto::KeyManager keys_;
    std::shared_ptr<storage::SqliteDirectoryService> directory_;
    std::shared_ptr<server::UploadSessionStore> uploads_;
    std::shared_ptr<server::ChunkSessionStore> downloads_;
    std::shared_ptr<server::TransferEndpoints> endpoints_;
    std::shared_ptr<transfer::TransferApi> api_;
    transfer::FilesystemCache cache_;
};

} // namespace coffer::core
