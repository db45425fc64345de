#pragma once
#include <string>

namespace champ {

// Lowercase hex SHA-256 of `data` (OpenSSL EVP). 64 chars.
std::string sha256_hex(const std::string& data);

} // namespace champ
