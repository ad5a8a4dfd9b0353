#include "coffer/crypto/crypto_types.hpp"
#include <sodium.h>

namespace coffer::crypto {

SecureBytes::SecureBytes(size_t size) : data(size) {
    sodium_memzero(data.data(), data.size());
}

SecureBytes::SecureBytes(const std::vector<std::uint8_t>& bytes) : data(bytes) {}

SecureBytes::SecureBytes(std::span<const std::uint8_t> bytes) 
    : data(bytes.begin(), bytes.end()) {}

SecureBytes::~SecureBytes() {
    clear();
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept 
    : data(std::move(other.data)) {
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        clear();
        data = std::move(other.data);
    }
    return *this;
}

void SecureBytes::clear() {
    if (!data.empty()) {
        sodium_memzero(data.data(), data.size());
        data.clear();
    }
}

void SecureBytes::resize(size_t new_size) {
    size_t old_size = data.size();
    if (new_size < old_size) {
        sodium_memzero(data.data() + new_size, old_size - new_size);
    }
    data.resize(new_size);
    
    if (new_size > old_size) {
        sodium_memzero(data.data() + old_size, new_size - old_size);
    }
}

void secure_zero(std::span<std::uint8_t> bytes) {
    if (!bytes.empty()) {
        sodium_memzero(bytes.data(), bytes.size());
    }
}

} // namespace coffer::crypto
