#pragma once

#include "coffer/crypto/chunk_codec.hpp"
#include "coffer/crypto/key_manager.hpp"
#include "coffer/storage/directory_service.hpp"
#include "coffer/storage/file_metadata.hpp"
#include "coffer/transfer/transfer_api.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace coffer::transfer {

// Client-side view of the decrypted directory tree, keyed by handle
class FilesystemCache {
public:
    FilesystemCache() = default;
    
    void insert(const storage::FilesystemEntry& entry);
    std::optional<storage::FilesystemEntry> find(const std::string& handle) const;
    
    // Folders first, then by name
    std::vector<storage::FilesystemEntry> children(const std::string& parent_handle) const;
    
    bool remove(const std::string& handle);
    void clear();
    size_t size() const;
    
    // Fetches the children of parent_handle and caches every record that decrypts.
    // Records that fail to decrypt are skipped.
    core::Result load_children(TransferApi& api,
                               const crypto::KeyManager& keys,
                               const std::string& parent_handle,
                               std::vector<storage::FilesystemEntry>* out_entries = nullptr);
    
    // Creates a folder on the server and caches it
    core::Result create_folder(TransferApi& api,
                               const crypto::KeyManager& keys,
                               const std::string& parent_handle,
                               const std::string& name,
                               storage::FilesystemEntry& out_entry);
    
    // Re-encrypts the metadata of a cached entry under a new name. The date
    // added and the folder flag are kept.
    core::Result rename(TransferApi& api,
                        const crypto::KeyManager& keys,
                        const std::string& handle,
                        const std::string& new_name);
    
    static core::Result decode_record(const storage::FileRecord& record,
                                      const crypto::MasterKey& master_key,
                                      const crypto::ChunkCodec& codec,
                                      storage::FilesystemEntry& out_entry);

private:
    std::unordered_map<std::string, storage::FilesystemEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace coffer::transfer
