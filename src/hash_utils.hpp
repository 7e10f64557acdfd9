#pragma once

#include <array>
#include <span>
#include <cstdint>
#include <openssl/sha.h>

namespace minawallet {

// HashUtils wraps the OpenSSL digests needed by the Base58Check codec
class HashUtils {
public:
    // Returns the 32-byte SHA256 digest of data
    static std::array<uint8_t, SHA256_DIGEST_LENGTH> sha256(std::span<const uint8_t> data);

    // Returns SHA256(SHA256(data))
    static std::array<uint8_t, SHA256_DIGEST_LENGTH> double_sha256(std::span<const uint8_t> data);

private:
    HashUtils() = delete;
};

} // namespace minawallet
