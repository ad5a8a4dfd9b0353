#pragma once

#include "coffer/crypto/crypto_types.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace coffer::crypto {

// Holds the user's key material: the master key that wraps per-file keys and
// metadata, the Ed25519 pair that signs files, and the X25519 pair.
class KeyManager {
public:
    static constexpr const char* KEY_FILE_NAME = "user.keys";
    
    KeyManager();
    ~KeyManager();
    
    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;
    
    // Loads keys from the storage directory, generating and saving them if absent
    bool initialize(const std::optional<std::filesystem::path>& key_storage_path = std::nullopt);
    void cleanup();
    
    Result generate_keys();
    
    // Installs keys bootstrapped elsewhere (e.g. derived from a password)
    Result set_keys(const MasterKey& master_key,
                    const Ed25519KeyPair& signing_keys,
                    const X25519KeyPair& encryption_keys);
    
    Result load_keys(const std::filesystem::path& file_path);
    Result save_keys(const std::filesystem::path& file_path) const;
    
    bool has_keys() const { return has_keys_; }
    
    const MasterKey& master_key() const;
    const Ed25519KeyPair& signing_keys() const;
    const X25519KeyPair& encryption_keys() const;
    
    // Short hex identifier of the signing public key
    std::string fingerprint() const;

private:
    void require_keys() const;
    
    MasterKey master_key_;
    Ed25519KeyPair signing_keys_;
    X25519KeyPair encryption_keys_;
    bool has_keys_;
    std::optional<std::filesystem::path> storage_path_;
};

} // namespace coffer::crypto
