#include "coffer/crypto/random.hpp"
#include "coffer/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>

namespace coffer::crypto {

namespace {
    constexpr char ALPHANUMERIC[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    constexpr std::uint32_t ALPHANUMERIC_COUNT = sizeof(ALPHANUMERIC) - 1;
}

std::atomic<bool> SecureRandom::initialized_{false};

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }
    
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    
    if (!initialized_.exchange(true)) {
        LOG_DEBUG("Cryptographic random number generator initialized");
    }
    return true;
}

Result SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return Result(ErrorCode::CRYPTO_FAILURE, "Random generator not initialized");
    }
    
    if (output.empty()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Output buffer is empty");
    }
    
    randombytes_buf(output.data(), output.size());
    return Result();
}

SecureBytes SecureRandom::generate_bytes(size_t count) {
    SecureBytes result(count);
    auto status = generate_bytes(result.span());
    if (!status.success()) {
        throw std::runtime_error("Failed to generate random bytes: " + status.message);
    }
    return result;
}

XChaCha20Key SecureRandom::generate_key() {
    if (!initialize()) {
        throw std::runtime_error("Failed to initialize libsodium for key generation");
    }
    
    XChaCha20Key key;
    crypto_aead_xchacha20poly1305_ietf_keygen(key.data());
    return key;
}

std::string SecureRandom::generate_alphanumeric(size_t length) {
    if (!initialize()) {
        throw std::runtime_error("Failed to initialize libsodium for identifier generation");
    }
    
    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        result.push_back(ALPHANUMERIC[randombytes_uniform(ALPHANUMERIC_COUNT)]);
    }
    return result;
}

} // namespace coffer::crypto
