#pragma once

#include "coffer/core/result.hpp"
#include <array>
#include <vector>
#include <span>
#include <string>
#include <cstdint>

namespace coffer::crypto {

using core::ErrorCode;
using core::Result;

// Key sizes for different algorithms
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SECRET_KEY_SIZE = 64;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

constexpr size_t X25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t X25519_SECRET_KEY_SIZE = 32;

constexpr size_t XCHACHA20_KEY_SIZE = 32;
constexpr size_t XCHACHA20_NONCE_SIZE = 24;

constexpr size_t POLY1305_TAG_SIZE = 16;
constexpr size_t AEAD_TAG_SIZE = POLY1305_TAG_SIZE;

constexpr size_t BLAKE2B_HASH_SIZE = 32;
constexpr size_t BLAKE2B_KEY_SIZE = 32;

// nonce || ciphertext || tag
constexpr size_t AEAD_OVERHEAD = XCHACHA20_NONCE_SIZE + AEAD_TAG_SIZE;

using Ed25519PublicKey = std::array<std::uint8_t, ED25519_PUBLIC_KEY_SIZE>;
using Ed25519SecretKey = std::array<std::uint8_t, ED25519_SECRET_KEY_SIZE>;
using Ed25519Signature = std::array<std::uint8_t, ED25519_SIGNATURE_SIZE>;

using X25519PublicKey = std::array<std::uint8_t, X25519_PUBLIC_KEY_SIZE>;
using X25519SecretKey = std::array<std::uint8_t, X25519_SECRET_KEY_SIZE>;

using XChaCha20Key = std::array<std::uint8_t, XCHACHA20_KEY_SIZE>;
using XChaCha20Nonce = std::array<std::uint8_t, XCHACHA20_NONCE_SIZE>;

using Blake2bHash = std::array<std::uint8_t, BLAKE2B_HASH_SIZE>;
using Blake2bKey = std::array<std::uint8_t, BLAKE2B_KEY_SIZE>;

// Per-file chunk key and the user's master key share the AEAD key size
using FileCryptKey = XChaCha20Key;
using MasterKey = XChaCha20Key;

struct Ed25519KeyPair {
    Ed25519PublicKey public_key;
    Ed25519SecretKey secret_key;
};

struct X25519KeyPair {
    X25519PublicKey public_key;
    X25519SecretKey secret_key;
};

// Secure memory utilities
struct SecureBytes {
    std::vector<std::uint8_t> data;
    
    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    SecureBytes(const std::vector<std::uint8_t>& bytes);
    SecureBytes(std::span<const std::uint8_t> bytes);
    
    ~SecureBytes();
    
    // Disable copy to prevent key material leakage
    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;
    
    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;
    
    std::uint8_t* data_ptr() { return data.data(); }
    const std::uint8_t* data_ptr() const { return data.data(); }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
    
    std::span<std::uint8_t> span() { return std::span(data); }
    std::span<const std::uint8_t> span() const { return std::span(data); }
    
    void clear();
    void resize(size_t new_size);
};

// Wipes key material held in fixed-size arrays
void secure_zero(std::span<std::uint8_t> bytes);

inline std::span<const std::uint8_t> as_bytes(const std::string& str) {
    return std::span(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
}

} // namespace coffer::crypto
