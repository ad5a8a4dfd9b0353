#include "coffer/crypto/hash.hpp"
#include <sodium.h>
#include <stdexcept>

namespace coffer::crypto {

struct Blake2bHasher::Impl {
    crypto_generichash_state state;
};

Blake2bHasher::Blake2bHasher() 
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Blake2bHasher::~Blake2bHasher() {
    if (impl_) {
        sodium_memzero(&impl_->state, sizeof(impl_->state));
    }
}

Blake2bHasher::Blake2bHasher(Blake2bHasher&& other) noexcept
    : impl_(std::move(other.impl_))
    , initialized_(other.initialized_) {
    other.initialized_ = false;
}

Blake2bHasher& Blake2bHasher::operator=(Blake2bHasher&& other) noexcept {
    if (this != &other) {
        impl_ = std::move(other.impl_);
        initialized_ = other.initialized_;
        other.initialized_ = false;
    }
    return *this;
}

Result Blake2bHasher::initialize(const Blake2bKey* key) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>();
    }
    
    if (sodium_init() < 0) {
        return Result(ErrorCode::CRYPTO_FAILURE, "Failed to initialize libsodium");
    }
    
    const std::uint8_t* key_data = key ? key->data() : nullptr;
    size_t key_size = key ? key->size() : 0;
    
    if (crypto_generichash_init(&impl_->state, key_data, key_size, BLAKE2B_HASH_SIZE) != 0) {
        return Result(ErrorCode::CRYPTO_FAILURE, "Failed to initialize BLAKE2b hasher");
    }
    
    initialized_ = true;
    return Result();
}

Result Blake2bHasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return Result(ErrorCode::INVALID_STATE, "Hasher not initialized");
    }
    
    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return Result(ErrorCode::CRYPTO_FAILURE, "Failed to update hash");
    }
    
    return Result();
}

Result Blake2bHasher::finalize(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return Result(ErrorCode::INVALID_STATE, "Hasher not initialized");
    }
    
    if (output.size() < BLAKE2B_HASH_SIZE) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Output buffer too small");
    }
    
    if (crypto_generichash_final(&impl_->state, output.data(), BLAKE2B_HASH_SIZE) != 0) {
        return Result(ErrorCode::CRYPTO_FAILURE, "Failed to finalize hash");
    }
    
    initialized_ = false; // Hasher is consumed
    return Result();
}

Blake2bHash Blake2bHasher::finalize() {
    Blake2bHash result;
    auto status = finalize(std::span(result));
    if (!status.success()) {
        throw std::runtime_error("Failed to finalize hash: " + status.message);
    }
    return result;
}

namespace hash_utils {

Blake2bHash hash(std::span<const std::uint8_t> data) {
    Blake2bHasher hasher;
    auto status = hasher.initialize();
    if (status.success()) {
        status = hasher.update(data);
    }
    if (!status.success()) {
        throw std::runtime_error("Failed to hash data: " + status.message);
    }
    return hasher.finalize();
}

} // namespace hash_utils

} // namespace coffer::crypto
