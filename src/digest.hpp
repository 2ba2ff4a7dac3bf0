#pragma once
#include <string>

// Lowercase hex SHA-256 of `data`.
std::string sha256_hex(const std::string& data);
