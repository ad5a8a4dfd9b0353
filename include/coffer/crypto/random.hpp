#pragma once

#include "coffer/crypto/crypto_types.hpp"
#include <atomic>
#include <span>
#include <string>
#include <vector>

namespace coffer::crypto {

class SecureRandom {
public:
    // Safe to call repeatedly and from several threads
    static bool initialize();
    
    static Result generate_bytes(std::span<std::uint8_t> output);
    static SecureBytes generate_bytes(size_t count);
    
    static XChaCha20Key generate_key();
    
    // Uniformly distributed [A-Za-z0-9] string
    static std::string generate_alphanumeric(size_t length);

private:
    static std::atomic<bool> initialized_;
};

} // namespace coffer::crypto
