#pragma once

#include <string>
#include "keys.hpp"

namespace minawallet {

// KeyCodec converts between Mina keys and their textual encodings.
//
// Encodings (compatible with mina-signer):
//   secret hex    - 64 hex digits, scalar in big-endian order
//   secret base58 - Base58Check(0x5a, 0x01 || scalar little-endian)
//   address       - Base58Check(0xcb, 0x01 || 0x01 || x little-endian || is_odd)
//
// Every failure is reported as KeyCodecError.
class KeyCodec {
public:
    // Random keypair from the secure RNG
    static Keypair generate();

    // Public key for a secret; deterministic
    static PublicKey derive_public_key(const SecretKey& secret);

    static SecretKey secret_from_hex(const std::string& hex);
    static SecretKey secret_from_base58(const std::string& base58);

    static std::string secret_to_hex(const SecretKey& secret);
    static std::string secret_to_base58(const SecretKey& secret);

    static std::string address_encode(const PublicKey& public_key);
    static PublicKey address_decode(const std::string& address);

private:
    KeyCodec() = delete;
};

} // namespace minawallet
