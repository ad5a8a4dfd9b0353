#pragma once

#include "coffer/crypto/crypto_types.hpp"
#include <memory>
#include <span>
#include <vector>

namespace coffer::crypto {

class SignatureEngine {
public:
    SignatureEngine();
    ~SignatureEngine();
    
    // Ed25519 signing
    Result sign(
        std::span<const std::uint8_t> message,
        const Ed25519SecretKey& secret_key,
        Ed25519Signature& out_signature
    ) const;
    
    // Ed25519 verification
    Result verify(
        std::span<const std::uint8_t> message,
        const Ed25519Signature& signature,
        const Ed25519PublicKey& public_key
    ) const;
    
    // Signs message || context as one value
    Result sign_combined(
        std::span<const std::uint8_t> message,
        std::span<const std::uint8_t> context,
        const Ed25519SecretKey& secret_key,
        Ed25519Signature& out_signature
    ) const;
    
    Result verify_combined(
        std::span<const std::uint8_t> message,
        std::span<const std::uint8_t> context,
        const Ed25519Signature& signature,
        const Ed25519PublicKey& public_key
    ) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace coffer::crypto
