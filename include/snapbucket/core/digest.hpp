#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace snapbucket {

// Base64 MD5, the Content-MD5 header value for `data`
std::string md5_base64(std::span<const uint8_t> data);

std::string md5_hex(std::span<const uint8_t> data);

// Lowercase hex of `len` random bytes
std::string random_hex(size_t len);

}  // namespace snapbucket
