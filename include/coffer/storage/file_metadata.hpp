#pragma once

#include "coffer/crypto/crypto_types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace coffer::storage {

// Plaintext metadata, only ever stored encrypted under the owner's master key
struct FileMetadata {
    std::string file_name;
    std::int64_t date_added = 0; // UTC seconds
    bool is_folder = false;
    
    bool operator==(const FileMetadata& other) const = default;
};

// Compact keys keep the padded blob small
void to_json(nlohmann::json& j, const FileMetadata& metadata);
void from_json(const nlohmann::json& j, FileMetadata& metadata);

// Decrypted, typed view of a file or folder handed back to callers
struct FilesystemEntry {
    std::string handle;
    std::string parent_handle;
    std::string name;
    std::uint64_t size = 0;
    std::uint64_t encrypted_file_size = 0;
    crypto::FileCryptKey file_crypt_key{};
    bool is_folder = false;
    crypto::Ed25519Signature signature{};
    std::int64_t date_added = 0;
};

} // namespace coffer::storage
