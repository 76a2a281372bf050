#pragma once

#include <string>
#include <vector>

namespace driftwatch {

// Lowercase hex SHA-256 of the given bytes
std::string sha256_hex(const std::string& data);

// Hash of the parts joined with an unambiguous separator
std::string sha256_hex(const std::vector<std::string>& parts);

// Hash of a file's content; throws std::runtime_error if unreadable
std::string file_sha256_hex(const std::string& path);

} // namespace driftwatch
