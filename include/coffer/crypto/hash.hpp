#pragma once

#include "coffer/crypto/crypto_types.hpp"
#include <memory>
#include <span>

namespace coffer::crypto {

// Streaming BLAKE2b (libsodium generichash), optionally keyed
class Blake2bHasher {
public:
    Blake2bHasher();
    ~Blake2bHasher();
    
    Blake2bHasher(Blake2bHasher&& other) noexcept;
    Blake2bHasher& operator=(Blake2bHasher&& other) noexcept;
    
    Result initialize(const Blake2bKey* key = nullptr);
    Result update(std::span<const std::uint8_t> data);
    Result finalize(std::span<std::uint8_t> output);
    Blake2bHash finalize();
    
    bool is_initialized() const { return initialized_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {
    Blake2bHash hash(std::span<const std::uint8_t> data);
}

} // namespace coffer::crypto
