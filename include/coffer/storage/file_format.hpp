#pragma once

#include "coffer/crypto/chunk_codec.hpp"
#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace coffer::storage {

constexpr size_t HANDLE_LENGTH = 16;
constexpr std::string_view ROOT_HANDLE = "0000000000000000";

// ".TEF"
constexpr std::array<std::uint8_t, 4> ENCRYPTED_FILE_MAGIC = {0x2E, 0x54, 0x45, 0x46};
constexpr size_t ENCRYPTED_FILE_HEADER_SIZE = ENCRYPTED_FILE_MAGIC.size();
constexpr std::string_view ENCRYPTED_FILE_EXTENSION = ".tef";

constexpr std::uint64_t MAX_FILE_SIZE = 1024ULL * 1024 * 1024 * 1024; // 1 TiB

// Chunk ids travel as 4-byte signed integers
constexpr std::int64_t MAX_CHUNK_ID = std::numeric_limits<std::int32_t>::max();

bool is_valid_handle(std::string_view handle);
bool is_root_handle(std::string_view handle);

std::string encrypted_file_name(const std::string& handle);

// ceil(plaintext_size / CHUNK_DATA_SIZE); zero bytes means zero chunks
std::uint64_t chunk_count(std::uint64_t plaintext_size);

// header + chunk_count * ENCRYPTED_CHUNK_EXTRA + plaintext_size
std::uint64_t encrypted_file_size(std::uint64_t plaintext_size);

// Inverse of encrypted_file_size; nullopt when no plaintext size maps to it
std::optional<std::uint64_t> plaintext_size_from_encrypted(std::uint64_t encrypted_size);

// Plaintext bytes carried by chunk_id, or 0 when it lies past the end
std::uint64_t chunk_plaintext_size(std::uint64_t plaintext_size, std::uint64_t chunk_id);

// Byte offset of chunk_id within the encrypted file
std::uint64_t encrypted_chunk_offset(std::uint64_t chunk_id);

} // namespace coffer::storage
