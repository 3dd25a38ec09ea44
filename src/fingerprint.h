#pragma once

#include <string>

namespace codegate {

// Hex SHA-256 of arbitrary bytes
std::string sha256_hex(const std::string& data);

// Short identifier for a snippet in log lines. Snippet text itself is never logged.
std::string request_fingerprint(const std::string& code);

} // namespace codegate
