#pragma once

#include "coffer/crypto/crypto_types.hpp"
#include "coffer/storage/file_metadata.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace coffer::crypto {

// Chunk wire format: nonce(24) || AEAD(chunk_id(4, BE signed) || plaintext) || tag(16)
constexpr size_t CHUNK_ID_SIZE = 4;
constexpr size_t CHUNK_DATA_SIZE = 2 * 1024 * 1024;
constexpr size_t ENCRYPTED_CHUNK_EXTRA = CHUNK_ID_SIZE + AEAD_OVERHEAD;
constexpr size_t ENCRYPTED_CHUNK_SIZE = CHUNK_DATA_SIZE + ENCRYPTED_CHUNK_EXTRA;

// Metadata JSON is right-padded with spaces to a multiple of this many bytes
constexpr size_t METADATA_PADDING_BLOCK = 32;
constexpr char METADATA_PADDING_CHAR = ' ';
constexpr size_t ENCRYPTED_METADATA_MAX_SIZE = 1024;

constexpr size_t ENCRYPTED_FILE_CRYPT_KEY_SIZE = XCHACHA20_KEY_SIZE + AEAD_OVERHEAD;

struct DecryptedChunk {
    std::int32_t chunk_id = 0;
    std::vector<std::uint8_t> plaintext;
};

class ChunkCodec {
public:
    ChunkCodec();
    ~ChunkCodec();
    
    // XChaCha20-Poly1305 with a fresh random nonce per call
    Result encrypt_buffer(
        std::span<const std::uint8_t> plaintext,
        std::span<const std::uint8_t> key,
        std::vector<std::uint8_t>& out_encrypted
    ) const;
    
    Result decrypt_buffer(
        std::span<const std::uint8_t> encrypted,
        std::span<const std::uint8_t> key,
        std::vector<std::uint8_t>& out_plaintext
    ) const;
    
    Result encrypt_file_chunk(
        std::int32_t chunk_id,
        std::span<const std::uint8_t> plaintext,
        std::span<const std::uint8_t> key,
        std::vector<std::uint8_t>& out_chunk
    ) const;
    
    // The caller compares out_chunk.chunk_id against the id it asked for
    Result decrypt_file_chunk(
        std::span<const std::uint8_t> encrypted_chunk,
        std::span<const std::uint8_t> key,
        DecryptedChunk& out_chunk
    ) const;
    
    Result encrypt_file_metadata(
        const storage::FileMetadata& metadata,
        std::span<const std::uint8_t> master_key,
        std::vector<std::uint8_t>& out_encrypted
    ) const;
    
    Result decrypt_file_metadata(
        std::span<const std::uint8_t> encrypted,
        std::span<const std::uint8_t> master_key,
        storage::FileMetadata& out_metadata
    ) const;
    
    Result encrypt_file_crypt_key(
        const FileCryptKey& file_key,
        std::span<const std::uint8_t> master_key,
        std::vector<std::uint8_t>& out_encrypted
    ) const;
    
    Result decrypt_file_crypt_key(
        std::span<const std::uint8_t> encrypted,
        std::span<const std::uint8_t> master_key,
        FileCryptKey& out_key
    ) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

namespace chunk_utils {
    void write_int32_be(std::uint8_t* out, std::int32_t value);
    std::int32_t read_int32_be(const std::uint8_t* in);
    
    std::string pad_metadata_json(const std::string& json);
}

} // namespace coffer::crypto
