#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace vouchrun {

// SHA256 and encoding helpers used for result digests and commitments
class HashUtils {
public:
    static std::string sha256(const std::vector<uint8_t>& data);
    static std::string sha256_string(const std::string& data);

    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // True for 64 lowercase/uppercase hex characters
    static bool is_valid_sha256(const std::string& hash);

    // Base64 without line breaks (wire encoding of binary fields)
    static std::string base64_encode(const unsigned char* data, size_t len);
    static std::vector<unsigned char> base64_decode(const std::string& encoded);
};

} // namespace vouchrun
