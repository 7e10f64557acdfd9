#include "hash_utils.hpp"

namespace minawallet {

// Computes the SHA256 hash of input data using OpenSSL's one-shot digest.
std::array<uint8_t, SHA256_DIGEST_LENGTH> HashUtils::sha256(std::span<const uint8_t> data) {
    std::array<uint8_t, SHA256_DIGEST_LENGTH> hash;
    SHA256(data.data(), data.size(), hash.data());
    return hash;
}

// Computes double SHA256 hash (SHA256(SHA256(data))).
// Base58Check takes the first four bytes of this digest as its checksum,
// for Mina keys and addresses exactly as for Bitcoin.
std::array<uint8_t, SHA256_DIGEST_LENGTH> HashUtils::double_sha256(std::span<const uint8_t> data) {
    auto first_hash = sha256(data);
    return sha256(std::span<const uint8_t>(first_hash.data(), first_hash.size()));
}

} // namespace minawallet
