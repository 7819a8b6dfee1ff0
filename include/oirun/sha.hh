#pragma once

#include <string>
#include <string_view>

// Returns the lowercase hex SHA-256 digest of @p data
std::string sha256(std::string_view data);

// Returns the lowercase hex SHA-256 digest of the file @p path, throws on error
std::string sha256_file(const std::string& path);
