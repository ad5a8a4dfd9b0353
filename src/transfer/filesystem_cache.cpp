#include "coffer/transfer/filesystem_cache.hpp"
#include "coffer/storage/file_format.hpp"
#include "coffer/core/logger.hpp"
#include "coffer/core/utils.hpp"
#include <algorithm>

namespace coffer::transfer {

using core::ErrorCode;
using core::Result;

void FilesystemCache::insert(const storage::FilesystemEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[entry.handle] = entry;
}

std::optional<storage::FilesystemEntry> FilesystemCache::find(const std::string& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<storage::FilesystemEntry> FilesystemCache::children(const std::string& parent_handle) const {
    std::vector<storage::FilesystemEntry> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [handle, entry] : entries_) {
            if (entry.parent_handle == parent_handle) {
                result.push_back(entry);
            }
        }
    }
    
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        if (a.is_folder != b.is_folder) {
            return a.is_folder;
        }
        return a.name < b.name;
    });
    return result;
}

bool FilesystemCache::remove(const std::string& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(handle) > 0;
}

void FilesystemCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t FilesystemCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

Result FilesystemCache::decode_record(const storage::FileRecord& record,
                                      const crypto::MasterKey& master_key,
                                      const crypto::ChunkCodec& codec,
                                      storage::FilesystemEntry& out_entry) {
    storage::FileMetadata metadata;
    auto result = codec.decrypt_file_metadata(record.encrypted_metadata, master_key, metadata);
    if (!result) {
        return result;
    }
    
    storage::FilesystemEntry entry;
    entry.handle = record.handle;
    entry.parent_handle = record.parent_handle;
    entry.name = metadata.file_name;
    entry.date_added = metadata.date_added;
    entry.is_folder = record.is_folder;
    
    if (!record.is_folder) {
        if (record.signature.size() != crypto::ED25519_SIGNATURE_SIZE) {
            return Result(ErrorCode::INVALID_FORMAT, "File record has a malformed signature");
        }
        std::copy(record.signature.begin(), record.signature.end(), entry.signature.begin());
        
        auto size = storage::plaintext_size_from_encrypted(record.encrypted_file_size);
        if (!size) {
            return Result(ErrorCode::INVALID_FORMAT,
                "Encrypted size " + std::to_string(record.encrypted_file_size) + " is not a valid file size");
        }
        entry.size = *size;
        entry.encrypted_file_size = record.encrypted_file_size;
        
        result = codec.decrypt_file_crypt_key(record.encrypted_file_crypt_key, master_key, entry.file_crypt_key);
        if (!result) {
            return result;
        }
    }
    
    out_entry = std::move(entry);
    return Result();
}

Result FilesystemCache::load_children(TransferApi& api,
                                      const crypto::KeyManager& keys,
                                      const std::string& parent_handle,
                                      std::vector<storage::FilesystemEntry>* out_entries) {
    std::vector<storage::FileRecord> records;
    auto result = api.list_children(parent_handle, records);
    if (!result) {
        LOG_WARN("Failed to list children of {}: {}", parent_handle, result.to_string());
        return result;
    }
    
    crypto::ChunkCodec codec;
    size_t skipped = 0;
    for (const auto& record : records) {
        storage::FilesystemEntry entry;
        auto decoded = decode_record(record, keys.master_key(), codec, entry);
        if (!decoded) {
            LOG_WARN("Skipping {}: {}", record.handle, decoded.to_string());
            ++skipped;
            continue;
        }
        
        insert(entry);
        if (out_entries) {
            out_entries->push_back(std::move(entry));
        }
    }
    
    LOG_DEBUG("Loaded {} children of {} ({} skipped)", records.size() - skipped, parent_handle, skipped);
    return Result();
}

Result FilesystemCache::create_folder(TransferApi& api,
                                      const crypto::KeyManager& keys,
                                      const std::string& parent_handle,
                                      const std::string& name,
                                      storage::FilesystemEntry& out_entry) {
    if (name.empty()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Folder name is empty");
    }
    
    storage::FileMetadata metadata{name, core::utils::TimeUtils::unix_seconds(), true};
    std::vector<std::uint8_t> encrypted_metadata;
    crypto::ChunkCodec codec;
    auto result = codec.encrypt_file_metadata(metadata, keys.master_key(), encrypted_metadata);
    if (!result) {
        return result;
    }
    
    std::string handle;
    result = api.create_folder(parent_handle, encrypted_metadata, handle);
    if (!result) {
        LOG_WARN("Failed to create folder under {}: {}", parent_handle, result.to_string());
        return result;
    }
    
    storage::FilesystemEntry entry;
    entry.handle = handle;
    entry.parent_handle = parent_handle;
    entry.name = name;
    entry.is_folder = true;
    entry.date_added = metadata.date_added;
    insert(entry);
    
    out_entry = std::move(entry);
    return Result();
}

Result FilesystemCache::rename(TransferApi& api,
                               const crypto::KeyManager& keys,
                               const std::string& handle,
                               const std::string& new_name) {
    if (new_name.empty()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "New name is empty");
    }
    
    auto entry = find(handle);
    if (!entry) {
        return Result(ErrorCode::NOT_FOUND, "Handle " + handle + " is not cached");
    }
    
    storage::FileMetadata metadata{new_name, entry->date_added, entry->is_folder};
    storage::MetadataUpdate update;
    update.handle = handle;
    crypto::ChunkCodec codec;
    auto result = codec.encrypt_file_metadata(metadata, keys.master_key(), update.encrypted_metadata);
    if (!result) {
        return result;
    }
    
    result = api.update_metadata({update});
    if (!result) {
        LOG_WARN("Failed to rename {}: {}", handle, result.to_string());
        return result;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    if (it != entries_.end()) {
        it->second.name = new_name;
    }
    return Result();
}

} // namespace coffer::transfer
