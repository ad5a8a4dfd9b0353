#include "coffer/crypto/encoding.hpp"
#include <sodium.h>
#include <stdexcept>

namespace coffer::crypto::encoding {

namespace {
    constexpr int VARIANT = sodium_base64_VARIANT_ORIGINAL;
    
    void ensure_sodium() {
        if (sodium_init() < 0) {
            throw std::runtime_error("Failed to initialize libsodium");
        }
    }
}

std::string base64_encode(std::span<const std::uint8_t> data) {
    ensure_sodium();
    
    std::string encoded(sodium_base64_encoded_len(data.size(), VARIANT), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), VARIANT);
    
    // Drop the terminating NUL written by libsodium
    encoded.resize(encoded.size() - 1);
    return encoded;
}

Result base64_decode(const std::string& encoded, std::vector<std::uint8_t>& out) {
    ensure_sodium();
    
    out.assign(encoded.size() / 4 * 3 + 3, 0);
    size_t decoded_len = 0;
    const char* end = nullptr;
    
    if (sodium_base642bin(out.data(), out.size(), encoded.data(), encoded.size(),
                          nullptr, &decoded_len, &end, VARIANT) != 0 ||
        end != encoded.data() + encoded.size()) {
        out.clear();
        return Result(ErrorCode::INVALID_ARGUMENT, "Invalid base64 encoding");
    }
    
    out.resize(decoded_len);
    return Result();
}

std::string hex_encode(std::span<const std::uint8_t> data) {
    ensure_sodium();
    
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);
    return hex;
}

} // namespace coffer::crypto::encoding
