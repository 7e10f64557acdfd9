#include "base58.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <algorithm>
#include <array>

namespace minawallet {

namespace {

const std::string BASE58_CHARS =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

std::array<uint8_t, Base58::CHECKSUM_SIZE> checksum(std::span<const uint8_t> data) {
    auto digest = HashUtils::double_sha256(data);
    std::array<uint8_t, Base58::CHECKSUM_SIZE> result;
    std::copy_n(digest.begin(), result.size(), result.begin());
    return result;
}

} // namespace

// Encodes bytes as Base58.
//
// The input is treated as one big-endian number and repeatedly divided by 58.
// Each leading 0x00 byte is written as a leading '1' so that zero prefixes
// survive a round trip.
std::string Base58::encode(std::span<const uint8_t> data) {
    size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // Base58 digits, least significant first
    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);
    for (size_t i = leading_zeros; i < data.size(); ++i) {
        uint32_t carry = data[i];
        for (auto& digit : digits) {
            carry += static_cast<uint32_t>(digit) << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(leading_zeros, '1');
    result.reserve(leading_zeros + digits.size());
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result.push_back(BASE58_CHARS[*it]);
    }
    return result;
}

// Decodes a Base58-encoded string into bytes.
//
// The decoding process:
// 1. Converts each Base58 character to its corresponding value
// 2. Builds the result by multiplying existing value by 58 and adding new digits
// 3. Handles leading '1' characters (which represent leading zeros)
//
// Throws KeyCodecError(Base58Decode) on a character outside the alphabet.
std::vector<uint8_t> Base58::decode(const std::string& encoded) {
    std::vector<uint8_t> result;
    for (char c : encoded) {
        auto digit = BASE58_CHARS.find(c);
        if (digit == std::string::npos) {
            throw KeyCodecError(KeyCodecError::ErrorType::Base58Decode,
                "invalid base58 character");
        }

        size_t carry = digit;
        for (auto it = result.rbegin(); it != result.rend(); ++it) {
            carry += static_cast<size_t>(*it) * 58;
            *it = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }

        while (carry > 0) {
            result.insert(result.begin(), static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    size_t leading_ones = 0;
    while (leading_ones < encoded.size() && encoded[leading_ones] == '1') {
        ++leading_ones;
    }
    result.insert(result.begin(), leading_ones, 0);
    return result;
}

std::string Base58::encode_check(uint8_t version, std::span<const uint8_t> payload) {
    std::vector<uint8_t> data;
    data.reserve(1 + payload.size() + CHECKSUM_SIZE);
    data.push_back(version);
    data.insert(data.end(), payload.begin(), payload.end());

    auto check = checksum(data);
    data.insert(data.end(), check.begin(), check.end());
    return encode(data);
}

// Decodes a Base58Check string and verifies its checksum.
// Layout: [version (1)] [payload (n)] [checksum (4)]
Base58::Decoded Base58::decode_check(const std::string& encoded) {
    auto data = decode(encoded);
    if (data.size() < 1 + CHECKSUM_SIZE) {
        throw KeyCodecError(KeyCodecError::ErrorType::Base58Decode,
            "base58check data too short");
    }

    auto body = std::span<const uint8_t>(data.data(), data.size() - CHECKSUM_SIZE);
    auto expected = checksum(body);
    if (!std::equal(expected.begin(), expected.end(), data.end() - CHECKSUM_SIZE)) {
        throw KeyCodecError(KeyCodecError::ErrorType::ChecksumMismatch,
            "base58check checksum mismatch");
    }

    return Decoded{data.front(), std::vector<uint8_t>(body.begin() + 1, body.end())};
}

} // namespace minawallet
