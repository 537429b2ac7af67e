#pragma once
#include <string>
#include <string_view>

namespace softmock::core::util {
// Lowercase hex SHA-256 of `data`.
std::string sha256_hex(std::string_view data);
// Uppercase, colon separated (AA:BB:...) rendering used for certificate fingerprints.
std::string hex_colon(const unsigned char* data, unsigned int len);
}
