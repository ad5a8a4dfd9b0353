#include "coffer/crypto/chunk_codec.hpp"
#include "coffer/core/utils.hpp"
#include <sodium.h>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace coffer::crypto {

namespace chunk_utils {

void write_int32_be(std::uint8_t* out, std::int32_t value) {
    auto raw = static_cast<std::uint32_t>(value);
    out[0] = (raw >> 24) & 0xFF;
    out[1] = (raw >> 16) & 0xFF;
    out[2] = (raw >> 8) & 0xFF;
    out[3] = raw & 0xFF;
}

std::int32_t read_int32_be(const std::uint8_t* in) {
    std::uint32_t raw = (static_cast<std::uint32_t>(in[0]) << 24) |
                        (static_cast<std::uint32_t>(in[1]) << 16) |
                        (static_cast<std::uint32_t>(in[2]) << 8) |
                        static_cast<std::uint32_t>(in[3]);
    return static_cast<std::int32_t>(raw);
}

std::string pad_metadata_json(const std::string& json) {
    size_t remainder = json.size() % METADATA_PADDING_BLOCK;
    if (remainder == 0) {
        return json;
    }
    
    std::string padded = json;
    padded.append(METADATA_PADDING_BLOCK - remainder, METADATA_PADDING_CHAR);
    return padded;
}

} // namespace chunk_utils

struct ChunkCodec::Impl {
    Impl() {
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium for chunk codec");
        }
    }
    
    static Result check_key(std::span<const std::uint8_t> key) {
        if (key.size() != XCHACHA20_KEY_SIZE) {
            return Result(ErrorCode::INVALID_KEY_LENGTH,
                "Expected a " + std::to_string(XCHACHA20_KEY_SIZE) + " byte key, got " +
                std::to_string(key.size()));
        }
        return Result();
    }
};

ChunkCodec::ChunkCodec()
    : impl_(std::make_unique<Impl>()) {
}

ChunkCodec::~ChunkCodec() = default;

Result ChunkCodec::encrypt_buffer(
    std::span<const std::uint8_t> plaintext,
    std::span<const std::uint8_t> key,
    std::vector<std::uint8_t>& out_encrypted) const {
    
    auto key_status = Impl::check_key(key);
    if (!key_status) {
        return key_status;
    }
    
    out_encrypted.resize(XCHACHA20_NONCE_SIZE + plaintext.size() + AEAD_TAG_SIZE);
    std::uint8_t* nonce = out_encrypted.data();
    randombytes_buf(nonce, XCHACHA20_NONCE_SIZE);
    
    unsigned long long ciphertext_len = 0;
    
    int result = crypto_aead_xchacha20poly1305_ietf_encrypt(
        out_encrypted.data() + XCHACHA20_NONCE_SIZE,
        &ciphertext_len,
        plaintext.data(),
        plaintext.size(),
        nullptr,  // no additional data
        0,
        nullptr,  // nsec (not used)
        nonce,
        key.data()
    );
    
    if (result != 0 || ciphertext_len != plaintext.size() + AEAD_TAG_SIZE) {
        out_encrypted.clear();
        return Result(ErrorCode::CRYPTO_FAILURE, "XChaCha20-Poly1305 encryption failed");
    }
    
    return Result();
}

Result ChunkCodec::decrypt_buffer(
    std::span<const std::uint8_t> encrypted,
    std::span<const std::uint8_t> key,
    std::vector<std::uint8_t>& out_plaintext) const {
    
    auto key_status = Impl::check_key(key);
    if (!key_status) {
        return key_status;
    }
    
    if (encrypted.size() < AEAD_OVERHEAD) {
        out_plaintext.clear();
        return Result(ErrorCode::AUTHENTICATION_FAILED, "Encrypted buffer is truncated");
    }
    
    auto nonce = encrypted.first(XCHACHA20_NONCE_SIZE);
    auto ciphertext = encrypted.subspan(XCHACHA20_NONCE_SIZE);
    
    out_plaintext.resize(ciphertext.size() - AEAD_TAG_SIZE);
    unsigned long long plaintext_len = 0;
    
    int result = crypto_aead_xchacha20poly1305_ietf_decrypt(
        out_plaintext.data(),
        &plaintext_len,
        nullptr,  // nsec (not used)
        ciphertext.data(),
        ciphertext.size(),
        nullptr,
        0,
        nonce.data(),
        key.data()
    );
    
    if (result != 0) {
        out_plaintext.clear();
        return Result(ErrorCode::AUTHENTICATION_FAILED, "Authentication tag did not verify");
    }
    
    out_plaintext.resize(plaintext_len);
    return Result();
}

Result ChunkCodec::encrypt_file_chunk(
    std::int32_t chunk_id,
    std::span<const std::uint8_t> plaintext,
    std::span<const std::uint8_t> key,
    std::vector<std::uint8_t>& out_chunk) const {
    
    if (chunk_id < 0) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Chunk id must not be negative");
    }
    
    if (plaintext.size() > CHUNK_DATA_SIZE) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Chunk plaintext exceeds the chunk data size");
    }
    
    std::vector<std::uint8_t> payload(CHUNK_ID_SIZE + plaintext.size());
    chunk_utils::write_int32_be(payload.data(), chunk_id);
    std::copy(plaintext.begin(), plaintext.end(), payload.begin() + CHUNK_ID_SIZE);
    
    auto result = encrypt_buffer(payload, key, out_chunk);
    sodium_memzero(payload.data(), payload.size());
    return result;
}

Result ChunkCodec::decrypt_file_chunk(
    std::span<const std::uint8_t> encrypted_chunk,
    std::span<const std::uint8_t> key,
    DecryptedChunk& out_chunk) const {
    
    std::vector<std::uint8_t> payload;
    auto result = decrypt_buffer(encrypted_chunk, key, payload);
    if (!result) {
        return result;
    }
    
    if (payload.size() < CHUNK_ID_SIZE) {
        return Result(ErrorCode::AUTHENTICATION_FAILED, "Decrypted chunk is missing its id prefix");
    }
    
    out_chunk.chunk_id = chunk_utils::read_int32_be(payload.data());
    payload.erase(payload.begin(), payload.begin() + CHUNK_ID_SIZE);
    out_chunk.plaintext = std::move(payload);
    return Result();
}

Result ChunkCodec::encrypt_file_metadata(
    const storage::FileMetadata& metadata,
    std::span<const std::uint8_t> master_key,
    std::vector<std::uint8_t>& out_encrypted) const {
    
    std::string json;
    try {
        json = nlohmann::json(metadata).dump();
    } catch (const nlohmann::json::exception& e) {
        return Result(ErrorCode::INVALID_ARGUMENT, std::string("Metadata is not serializable: ") + e.what());
    }
    
    auto padded = chunk_utils::pad_metadata_json(json);
    if (padded.size() + AEAD_OVERHEAD > ENCRYPTED_METADATA_MAX_SIZE) {
        return Result(ErrorCode::METADATA_TOO_LARGE,
            "Encrypted metadata would be " + std::to_string(padded.size() + AEAD_OVERHEAD) +
            " bytes, limit is " + std::to_string(ENCRYPTED_METADATA_MAX_SIZE));
    }
    
    return encrypt_buffer(as_bytes(padded), master_key, out_encrypted);
}

Result ChunkCodec::decrypt_file_metadata(
    std::span<const std::uint8_t> encrypted,
    std::span<const std::uint8_t> master_key,
    storage::FileMetadata& out_metadata) const {
    
    std::vector<std::uint8_t> plaintext;
    auto result = decrypt_buffer(encrypted, master_key, plaintext);
    if (!result) {
        return result;
    }
    
    std::string padded(plaintext.begin(), plaintext.end());
    auto json = core::utils::StringUtils::trim_right(padded, METADATA_PADDING_CHAR);
    
    try {
        out_metadata = nlohmann::json::parse(json).get<storage::FileMetadata>();
    } catch (const nlohmann::json::exception& e) {
        return Result(ErrorCode::INVALID_FORMAT, std::string("Malformed metadata: ") + e.what());
    }
    
    return Result();
}

Result ChunkCodec::encrypt_file_crypt_key(
    const FileCryptKey& file_key,
    std::span<const std::uint8_t> master_key,
    std::vector<std::uint8_t>& out_encrypted) const {
    
    return encrypt_buffer(file_key, master_key, out_encrypted);
}

Result ChunkCodec::decrypt_file_crypt_key(
    std::span<const std::uint8_t> encrypted,
    std::span<const std::uint8_t> master_key,
    FileCryptKey& out_key) const {
    
    if (encrypted.size() != ENCRYPTED_FILE_CRYPT_KEY_SIZE) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Encrypted file key has the wrong length");
    }
    
    std::vector<std::uint8_t> plaintext;
    auto result = decrypt_buffer(encrypted, master_key, plaintext);
    if (!result) {
        return result;
    }
    
    std::copy(plaintext.begin(), plaintext.end(), out_key.begin());
    sodium_memzero(plaintext.data(), plaintext.size());
    return Result();
}

} // namespace coffer::crypto
