#pragma once

#include <string>

// Lowercase hex SHA-256 of the given bytes (OpenSSL EVP).
std::string sha256_hex(const std::string& data);
