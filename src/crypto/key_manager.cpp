#include "coffer/crypto/key_manager.hpp"
#include "coffer/crypto/random.hpp"
#include "coffer/crypto/hash.hpp"
#include "coffer/crypto/encoding.hpp"
#include "coffer/core/logger.hpp"
#include <sodium.h>
#include <fstream>
#include <stdexcept>

namespace coffer::crypto {

namespace {
    constexpr size_t KEY_FILE_SIZE = XCHACHA20_KEY_SIZE +
                                     ED25519_PUBLIC_KEY_SIZE + ED25519_SECRET_KEY_SIZE +
                                     X25519_PUBLIC_KEY_SIZE + X25519_SECRET_KEY_SIZE;
    
    template<size_t N>
    void write_array(std::ofstream& file, const std::array<std::uint8_t, N>& data) {
        file.write(reinterpret_cast<const char*>(data.data()), data.size());
    }
    
    template<size_t N>
    void read_array(std::ifstream& file, std::array<std::uint8_t, N>& data) {
        file.read(reinterpret_cast<char*>(data.data()), data.size());
    }
}

KeyManager::KeyManager()
    : master_key_{}
    , signing_keys_{}
    , encryption_keys_{}
    , has_keys_(false) {
}

KeyManager::~KeyManager() {
    cleanup();
}

bool KeyManager::initialize(const std::optional<std::filesystem::path>& key_storage_path) {
    if (!SecureRandom::initialize()) {
        LOG_ERROR("Failed to initialize secure random generator");
        return false;
    }
    
    storage_path_ = key_storage_path;
    
    if (storage_path_) {
        auto key_file = *storage_path_ / KEY_FILE_NAME;
        if (std::filesystem::exists(key_file)) {
            auto result = load_keys(key_file);
            if (result.success()) {
                LOG_INFO("Loaded user keys from {}", key_file.string());
            } else {
                LOG_ERROR("Failed to load user keys from {}: {}", key_file.string(), result.message);
                return false;
            }
        }
    }
    
    if (!has_keys_) {
        auto result = generate_keys();
        if (!result.success()) {
            LOG_ERROR("Failed to generate user keys: {}", result.message);
            return false;
        }
        
        if (storage_path_) {
            std::error_code ec;
            std::filesystem::create_directories(*storage_path_, ec);
            auto key_file = *storage_path_ / KEY_FILE_NAME;
            auto save_result = save_keys(key_file);
            if (!save_result.success()) {
                LOG_ERROR("Failed to save user keys: {}", save_result.message);
                return false;
            }
            LOG_INFO("Saved new user keys to {}", key_file.string());
        }
    }
    
    LOG_DEBUG("Key manager initialized with fingerprint {}", fingerprint());
    return true;
}

void KeyManager::cleanup() {
    secure_zero(master_key_);
    secure_zero(signing_keys_.secret_key);
    secure_zero(encryption_keys_.secret_key);
    has_keys_ = false;
}

Result KeyManager::generate_keys() {
    if (!SecureRandom::initialize()) {
        return Result(ErrorCode::CRYPTO_FAILURE, "libsodium is not available");
    }
    
    master_key_ = SecureRandom::generate_key();
    
    if (crypto_sign_keypair(signing_keys_.public_key.data(), signing_keys_.secret_key.data()) != 0) {
        return Result(ErrorCode::CRYPTO_FAILURE, "Failed to generate Ed25519 key pair");
    }
    
    if (crypto_box_keypair(encryption_keys_.public_key.data(), encryption_keys_.secret_key.data()) != 0) {
        return Result(ErrorCode::CRYPTO_FAILURE, "Failed to generate X25519 key pair");
    }
    
    has_keys_ = true;
    LOG_DEBUG("Generated new master key, Ed25519 and X25519 key pairs");
    return Result();
}

Result KeyManager::set_keys(const MasterKey& master_key,
                            const Ed25519KeyPair& signing_keys,
                            const X25519KeyPair& encryption_keys) {
    Ed25519PublicKey derived_public;
    if (crypto_sign_ed25519_sk_to_pk(derived_public.data(), signing_keys.secret_key.data()) != 0 ||
        derived_public != signing_keys.public_key) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Signing key pair consistency check failed");
    }
    
    master_key_ = master_key;
    signing_keys_ = signing_keys;
    encryption_keys_ = encryption_keys;
    has_keys_ = true;
    return Result();
}

Result KeyManager::load_keys(const std::filesystem::path& file_path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(file_path, ec);
    if (ec || size != KEY_FILE_SIZE) {
        return Result(ErrorCode::INVALID_FORMAT, "Key file has an unexpected size");
    }
    
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return Result(ErrorCode::IO_ERROR, "Cannot open key file");
    }
    
    MasterKey master_key;
    Ed25519KeyPair signing_keys;
    X25519KeyPair encryption_keys;
    
    read_array(file, master_key);
    read_array(file, signing_keys.public_key);
    read_array(file, signing_keys.secret_key);
    read_array(file, encryption_keys.public_key);
    read_array(file, encryption_keys.secret_key);
    
    if (!file.good()) {
        return Result(ErrorCode::IO_ERROR, "Failed to read key file");
    }
    
    auto result = set_keys(master_key, signing_keys, encryption_keys);
    secure_zero(master_key);
    secure_zero(signing_keys.secret_key);
    secure_zero(encryption_keys.secret_key);
    return result;
}

Result KeyManager::save_keys(const std::filesystem::path& file_path) const {
    if (!has_keys_) {
        return Result(ErrorCode::INVALID_STATE, "No keys to save");
    }
    
    std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Result(ErrorCode::IO_ERROR, "Cannot create key file");
    }
    
    write_array(file, master_key_);
    write_array(file, signing_keys_.public_key);
    write_array(file, signing_keys_.secret_key);
    write_array(file, encryption_keys_.public_key);
    write_array(file, encryption_keys_.secret_key);
    file.close();
    
    if (!file.good()) {
        return Result(ErrorCode::IO_ERROR, "Failed to write key file");
    }
    
    std::error_code ec;
    std::filesystem::permissions(file_path,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, ec);
    if (ec) {
        LOG_WARN("Could not restrict permissions on {}: {}", file_path.string(), ec.message());
    }
    
    return Result();
}

void KeyManager::require_keys() const {
    if (!has_keys_) {
        throw std::runtime_error("No user keys available");
    }
}

const MasterKey& KeyManager::master_key() const {
    require_keys();
    return master_key_;
}

const Ed25519KeyPair& KeyManager::signing_keys() const {
    require_keys();
    return signing_keys_;
}

const X25519KeyPair& KeyManager::encryption_keys() const {
    require_keys();
    return encryption_keys_;
}

std::string KeyManager::fingerprint() const {
    if (!has_keys_) {
        return "<none>";
    }
    auto digest = hash_utils::hash(signing_keys_.public_key);
    return encoding::hex_encode(std::span(digest).first(8));
}

} // namespace coffer::crypto
