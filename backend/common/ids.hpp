#pragma once
#include <string>

namespace common {

// Random RFC 4122 id, lower-case, 36 characters.
std::string newUuid();

// Lower-case hex SHA-256 of `data`.
std::string sha256Hex(const std::string& data);

} // namespace common
