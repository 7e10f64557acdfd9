#pragma once

#include <span>
#include <string>
#include <vector>
#include <cstdint>

namespace minawallet {

// Base58 is a utility class for Base58 and Base58Check encoding.
//
// Base58 uses a 58-character alphabet without the easily confused
// characters 0, O, I and l. Mina uses the Bitcoin alphabet and the Bitcoin
// Base58Check layout (version byte, payload, 4-byte double-SHA256 checksum)
// for both its addresses and its exported secret keys.
class Base58 {
public:
    // Number of checksum bytes appended by Base58Check
    static constexpr size_t CHECKSUM_SIZE = 4;

    // Result of a Base58Check decode with the checksum already verified
    struct Decoded {
        uint8_t version;
        std::vector<uint8_t> payload;
    };

    // Encodes raw bytes into a Base58 string
    static std::string encode(std::span<const uint8_t> data);

    // Decodes a Base58 string into raw bytes (no checksum handling)
    static std::vector<uint8_t> decode(const std::string& encoded);

    // Encodes version || payload || checksum
    static std::string encode_check(uint8_t version, std::span<const uint8_t> payload);

    // Decodes and verifies a Base58Check string
    static Decoded decode_check(const std::string& encoded);

private:
    Base58() = delete;
};

} // namespace minawallet
