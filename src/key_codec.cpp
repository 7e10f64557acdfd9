#include "key_codec.hpp"
#include "base58.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "pallas.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <array>
#include <vector>

namespace minawallet {

namespace {

// Wraps a little-endian scalar into a SecretKey after checking 1 <= k < q.
// The caller's buffer is wiped whether or not the scalar is accepted.
SecretKey make_secret(std::array<uint8_t, FIELD_SIZE>& scalar_le) {
    bool valid = PallasCurve::instance().is_valid_scalar(scalar_le);
    if (!valid) {
        OPENSSL_cleanse(scalar_le.data(), scalar_le.size());
        throw KeyCodecError(KeyCodecError::ErrorType::ScalarOutOfRange,
            "secret scalar is not in the range [1, q-1]");
    }
    SecretKey secret{SecureMemory(scalar_le)};
    OPENSSL_cleanse(scalar_le.data(), scalar_le.size());
    return secret;
}

void wipe(std::vector<uint8_t>& bytes) {
    if (!bytes.empty()) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
    }
}

} // namespace

Keypair KeyCodec::generate() {
    SecretKey secret(PallasCurve::instance().random_scalar());
    auto public_key = derive_public_key(secret);
    return Keypair{std::move(secret), public_key};
}

PublicKey KeyCodec::derive_public_key(const SecretKey& secret) {
    return PallasCurve::instance().multiply_generator(secret.bytes());
}

// Parses a secret key from hex.
//
// Mina prints scalars big-endian in hex while serializing them little-endian
// everywhere else, so the decoded bytes are reversed before the range check.
SecretKey KeyCodec::secret_from_hex(const std::string& hex) {
    if (hex.size() != SECRET_HEX_LENGTH) {
        throw KeyCodecError(KeyCodecError::ErrorType::InvalidLength,
            "expected " + std::to_string(SECRET_HEX_LENGTH) + " hex characters, got " +
            std::to_string(hex.size()));
    }

    std::vector<uint8_t> big_endian;
    try {
        big_endian = HexUtils::decode(hex);
    } catch (const std::invalid_argument& e) {
        throw KeyCodecError(KeyCodecError::ErrorType::InvalidHex, e.what());
    }

    std::array<uint8_t, FIELD_SIZE> scalar_le{};
    std::reverse_copy(big_endian.begin(), big_endian.end(), scalar_le.begin());
    wipe(big_endian);
    return make_secret(scalar_le);
}

// Parses a secret key from Base58Check text.
// Decoded layout: [0x5a] [0x01] [scalar (32 bytes, little-endian)]
SecretKey KeyCodec::secret_from_base58(const std::string& base58) {
    auto decoded = Base58::decode_check(base58);
    if (decoded.version != SECRET_KEY_VERSION) {
        wipe(decoded.payload);
        throw KeyCodecError(KeyCodecError::ErrorType::InvalidVersion,
            "not a secret key version byte");
    }
    if (decoded.payload.size() != SECRET_PAYLOAD_SIZE) {
        wipe(decoded.payload);
        throw KeyCodecError(KeyCodecError::ErrorType::InvalidLength,
            "secret key payload must be " + std::to_string(SECRET_PAYLOAD_SIZE) + " bytes");
    }
    if (decoded.payload[0] != SECRET_KEY_TAG) {
        wipe(decoded.payload);
        throw KeyCodecError(KeyCodecError::ErrorType::InvalidVersion,
            "unexpected secret key tag byte");
    }

    std::array<uint8_t, FIELD_SIZE> scalar_le{};
    std::copy_n(decoded.payload.begin() + 1, FIELD_SIZE, scalar_le.begin());
    wipe(decoded.payload);
    return make_secret(scalar_le);
}

std::string KeyCodec::secret_to_hex(const SecretKey& secret) {
    auto scalar_le = secret.bytes();
    std::array<uint8_t, FIELD_SIZE> big_endian{};
    std::reverse_copy(scalar_le.begin(), scalar_le.end(), big_endian.begin());
    auto hex = HexUtils::encode(big_endian);
    OPENSSL_cleanse(big_endian.data(), big_endian.size());
    return hex;
}

std::string KeyCodec::secret_to_base58(const SecretKey& secret) {
    auto scalar_le = secret.bytes();
    std::vector<uint8_t> payload;
    payload.reserve(SECRET_PAYLOAD_SIZE);
    payload.push_back(SECRET_KEY_TAG);
    payload.insert(payload.end(), scalar_le.begin(), scalar_le.end());
    auto encoded = Base58::encode_check(SECRET_KEY_VERSION, payload);
    wipe(payload);
    return encoded;
}

// Encodes a compressed public key as a Mina address.
// Payload: [0x01] [0x01] [x (32 bytes, little-endian)] [is_odd]
std::string KeyCodec::address_encode(const PublicKey& public_key) {
    std::vector<uint8_t> payload;
    payload.reserve(ADDRESS_PAYLOAD_SIZE);
    payload.push_back(NON_ZERO_CURVE_POINT_TAG);
    payload.push_back(COMPRESSED_POINT_TAG);
    payload.insert(payload.end(), public_key.x.begin(), public_key.x.end());
    payload.push_back(public_key.is_odd ? 1 : 0);
    return Base58::encode_check(ADDRESS_VERSION, payload);
}

// Decodes a Mina address back into a compressed public key.
//
// Checks, in order: length, alphabet and checksum, version byte, tag bytes,
// parity byte, and finally that x is a field element on the curve.
PublicKey KeyCodec::address_decode(const std::string& address) {
    if (address.size() != ADDRESS_LENGTH) {
        throw KeyCodecError(KeyCodecError::ErrorType::InvalidLength,
            "expected " + std::to_string(ADDRESS_LENGTH) + " characters, got " +
            std::to_string(address.size()));
    }

    auto decoded = Base58::decode_check(address);
    if (decoded.version != ADDRESS_VERSION) {
        throw KeyCodecError(KeyCodecError::ErrorType::InvalidVersion,
            "not an address version byte");
    }
    const auto& payload = decoded.payload;
    if (payload.size() != ADDRESS_PAYLOAD_SIZE) {
        throw KeyCodecError(KeyCodecError::ErrorType::InvalidLength,
            "address payload must be " + std::to_string(ADDRESS_PAYLOAD_SIZE) + " bytes");
    }
    if (payload[0] != NON_ZERO_CURVE_POINT_TAG || payload[1] != COMPRESSED_POINT_TAG) {
        throw KeyCodecError(KeyCodecError::ErrorType::InvalidVersion,
            "unexpected address tag bytes");
    }
    uint8_t parity = payload.back();
    if (parity > 1) {
        throw KeyCodecError(KeyCodecError::ErrorType::NonCurvePoint,
            "invalid parity byte");
    }

    PublicKey public_key;
    std::copy_n(payload.begin() + 2, FIELD_SIZE, public_key.x.begin());
    public_key.is_odd = parity == 1;
    PallasCurve::instance().check_point(public_key);
    return public_key;
}

} // namespace minawallet
