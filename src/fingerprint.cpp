#include "fingerprint.h"
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

namespace codegate {

namespace {

constexpr size_t FINGERPRINT_LENGTH = 16;

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string request_fingerprint(const std::string& code) {
    return sha256_hex(code).substr(0, FINGERPRINT_LENGTH);
}

} // namespace codegate
