#pragma once

#include "coffer/crypto/crypto_types.hpp"
#include <span>
#include <string>
#include <vector>

namespace coffer::crypto::encoding {

// Standard alphabet with padding, as carried in JSON request bodies
std::string base64_encode(std::span<const std::uint8_t> data);
Result base64_decode(const std::string& encoded, std::vector<std::uint8_t>& out);

std::string hex_encode(std::span<const std::uint8_t> data);

} // namespace coffer::crypto::encoding
