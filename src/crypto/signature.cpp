#include "coffer/crypto/signature.hpp"
#include <sodium.h>
#include <stdexcept>

namespace coffer::crypto {

namespace {
    std::vector<std::uint8_t> concat(std::span<const std::uint8_t> message,
                                     std::span<const std::uint8_t> context) {
        std::vector<std::uint8_t> combined;
        combined.reserve(message.size() + context.size());
        combined.insert(combined.end(), message.begin(), message.end());
        combined.insert(combined.end(), context.begin(), context.end());
        return combined;
    }
}

struct SignatureEngine::Impl {
    Impl() {
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium");
        }
    }
};

SignatureEngine::SignatureEngine() 
    : impl_(std::make_unique<Impl>()) {
}

SignatureEngine::~SignatureEngine() = default;

Result SignatureEngine::sign(
    std::span<const std::uint8_t> message,
    const Ed25519SecretKey& secret_key,
    Ed25519Signature& out_signature) const {
    
    if (message.empty()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Message cannot be empty");
    }
    
    unsigned long long signature_len = 0;
    
    int result = crypto_sign_detached(
        out_signature.data(),
        &signature_len,
        message.data(),
        message.size(),
        secret_key.data()
    );
    
    if (result != 0 || signature_len != ED25519_SIGNATURE_SIZE) {
        return Result(ErrorCode::CRYPTO_FAILURE, "Failed to create signature");
    }
    
    return Result();
}

Result SignatureEngine::verify(
    std::span<const std::uint8_t> message,
    const Ed25519Signature& signature,
    const Ed25519PublicKey& public_key) const {
    
    if (message.empty()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Message cannot be empty");
    }
    
    int result = crypto_sign_verify_detached(
        signature.data(),
        message.data(),
        message.size(),
        public_key.data()
    );
    
    if (result != 0) {
        return Result(ErrorCode::SIGNATURE_MISMATCH, "Signature verification failed");
    }
    
    return Result();
}

Result SignatureEngine::sign_combined(
    std::span<const std::uint8_t> message,
    std::span<const std::uint8_t> context,
    const Ed25519SecretKey& secret_key,
    Ed25519Signature& out_signature) const {
    
    auto combined = concat(message, context);
    return sign(combined, secret_key, out_signature);
}

Result SignatureEngine::verify_combined(
    std::span<const std::uint8_t> message,
    std::span<const std::uint8_t> context,
    const Ed25519Signature& signature,
    const Ed25519PublicKey& public_key) const {
    
    auto combined = concat(message, context);
    return verify(combined, signature, public_key);
}

} // namespace coffer::crypto
