#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace betarb {
namespace crypto {

/**
 * MD5 digest as lowercase hex. Used for cache signatures, not security.
 */
std::string md5_hex(const std::string& data);

/**
 * Hex encoding.
 */
std::string hex_encode(const std::vector<uint8_t>& data);

} // namespace crypto
} // namespace betarb
