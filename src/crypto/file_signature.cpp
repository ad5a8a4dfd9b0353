#include "coffer/crypto/file_signature.hpp"
#include "coffer/crypto/chunk_codec.hpp"
#include "coffer/storage/file_format.hpp"
#include "coffer/core/logger.hpp"
#include <array>
#include <stdexcept>

namespace coffer::crypto {

namespace {
    // Fixed seed so every digest is domain separated from plain BLAKE2b use
    constexpr Blake2bKey DIGEST_SEED = {
        'c', 'o', 'f', 'f', 'e', 'r', '.', 'f', 'i', 'l', 'e', '-', 's', 'i', 'g', 'n',
        'a', 't', 'u', 'r', 'e', '.', 'v', '1', 0, 0, 0, 0, 0, 0, 0, 0
    };
}

FileSignatureBuilder::FileSignatureBuilder()
    : state_(FileSignatureState::EMPTY)
    , next_chunk_id_(0) {
    
    auto result = hasher_.initialize(&DIGEST_SEED);
    if (!result) {
        throw std::runtime_error("Failed to initialize file signature digest: " + result.message);
    }
}

Result FileSignatureBuilder::append(std::int32_t chunk_id, std::span<const std::uint8_t> plaintext) {
    if (state_ == FileSignatureState::FINALIZED) {
        return Result(ErrorCode::INVALID_STATE, "File signature is already finalized");
    }
    
    if (chunk_id != next_chunk_id_) {
        return Result(ErrorCode::INVALID_STATE,
            "Expected chunk " + std::to_string(next_chunk_id_) + ", got " + std::to_string(chunk_id));
    }
    
    std::array<std::uint8_t, CHUNK_ID_SIZE> id_bytes;
    chunk_utils::write_int32_be(id_bytes.data(), chunk_id);
    
    auto result = hasher_.update(id_bytes);
    if (result) {
        result = hasher_.update(plaintext);
    }
    if (!result) {
        return result;
    }
    
    state_ = FileSignatureState::ACCUMULATING;
    next_chunk_id_++;
    return Result();
}

Result FileSignatureBuilder::seal() {
    if (digest_) {
        return Result();
    }
    
    Blake2bHash digest;
    auto result = hasher_.finalize(std::span(digest));
    if (!result) {
        return result;
    }
    
    digest_ = digest;
    state_ = FileSignatureState::FINALIZED;
    return Result();
}

Result FileSignatureBuilder::finalize(const Ed25519SecretKey& signing_key,
                                      const std::string& handle,
                                      Ed25519Signature& out_signature) {
    if (!storage::is_valid_handle(handle)) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Invalid handle: " + handle);
    }
    
    auto result = seal();
    if (!result) {
        return result;
    }
    
    return signer_.sign_combined(*digest_, as_bytes(handle), signing_key, out_signature);
}

bool FileSignatureBuilder::verify(const Ed25519PublicKey& public_key,
                                  const Ed25519Signature& signature,
                                  const std::string& handle) {
    if (!storage::is_valid_handle(handle)) {
        return false;
    }
    
    auto result = seal();
    if (!result) {
        LOG_ERROR("Failed to seal file signature digest: {}", result.message);
        return false;
    }
    
    return signer_.verify_combined(*digest_, as_bytes(handle), signature, public_key).success();
}

} // namespace coffer::crypto
