/**
 * BucketSync - Digest helpers built on libsodium, used for request signing.
 */
#pragma once

#include <cstddef>
#include <istream>
#include <span>
#include <string>
#include <string_view>

namespace bucketsync::crypto
{

    void ensure_sodium_init();

    std::string to_hex(std::span<const unsigned char> data);

    // Lowercase hex SHA-256 of the input.
    std::string sha256_hex(std::string_view data);

    std::string sha256_stream(std::istream &input);

    // Raw 32-byte HMAC-SHA-256; keys of any length are accepted.
    std::string hmac_sha256(std::string_view key, std::string_view data);

    std::string hmac_sha256_hex(std::string_view key, std::string_view data);

} // namespace bucketsync::crypto
