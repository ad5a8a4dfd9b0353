#include "coffer/storage/file_format.hpp"
#include "coffer/core/utils.hpp"
#include <algorithm>

namespace coffer::storage {

using crypto::CHUNK_DATA_SIZE;
using crypto::ENCRYPTED_CHUNK_EXTRA;
using crypto::ENCRYPTED_CHUNK_SIZE;

bool is_valid_handle(std::string_view handle) {
    return handle.size() == HANDLE_LENGTH &&
           core::utils::StringUtils::is_alphanumeric(std::string(handle));
}

bool is_root_handle(std::string_view handle) {
    return handle == ROOT_HANDLE;
}

std::string encrypted_file_name(const std::string& handle) {
    return handle + std::string(ENCRYPTED_FILE_EXTENSION);
}

std::uint64_t chunk_count(std::uint64_t plaintext_size) {
    return (plaintext_size + CHUNK_DATA_SIZE - 1) / CHUNK_DATA_SIZE;
}

std::uint64_t encrypted_file_size(std::uint64_t plaintext_size) {
    return ENCRYPTED_FILE_HEADER_SIZE + chunk_count(plaintext_size) * ENCRYPTED_CHUNK_EXTRA + plaintext_size;
}

std::optional<std::uint64_t> plaintext_size_from_encrypted(std::uint64_t encrypted_size) {
    if (encrypted_size < ENCRYPTED_FILE_HEADER_SIZE) {
        return std::nullopt;
    }
    
    std::uint64_t body = encrypted_size - ENCRYPTED_FILE_HEADER_SIZE;
    std::uint64_t chunks = (body + ENCRYPTED_CHUNK_SIZE - 1) / ENCRYPTED_CHUNK_SIZE;
    if (body < chunks * ENCRYPTED_CHUNK_EXTRA) {
        return std::nullopt;
    }
    
    std::uint64_t plaintext_size = body - chunks * ENCRYPTED_CHUNK_EXTRA;
    if (encrypted_file_size(plaintext_size) != encrypted_size) {
        return std::nullopt;
    }
    return plaintext_size;
}

std::uint64_t chunk_plaintext_size(std::uint64_t plaintext_size, std::uint64_t chunk_id) {
    std::uint64_t start = chunk_id * CHUNK_DATA_SIZE;
    if (start >= plaintext_size) {
        return 0;
    }
    return std::min<std::uint64_t>(CHUNK_DATA_SIZE, plaintext_size - start);
}

std::uint64_t encrypted_chunk_offset(std::uint64_t chunk_id) {
    return chunk_id * ENCRYPTED_CHUNK_SIZE + ENCRYPTED_FILE_HEADER_SIZE;
}

} // namespace coffer::storage
