#include "key_codec.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "test_vectors.hpp"

#include <gtest/gtest.h>
#include <cctype>
#include <string>

using namespace minawallet;
namespace v = minawallet::vectors;

namespace {

KeyCodecError::ErrorType error_type_of(void (*call)()) {
    try {
        call();
    } catch (const KeyCodecError& e) {
        return e.type();
    }
    ADD_FAILURE() << "expected KeyCodecError";
    return KeyCodecError::ErrorType::Backend;
}

}  // namespace

/**
 * @given the mina-signer test secret in hex
 * @when its public key is derived and encoded
 * @then the address and Base58 secret match mina-signer's output
 */
TEST(KeyCodec, KnownAnswerFromHex) {
    auto secret = KeyCodec::secret_from_hex(v::SECRET_HEX);
    auto public_key = KeyCodec::derive_public_key(secret);

    EXPECT_EQ(KeyCodec::address_encode(public_key), v::ADDRESS);
    EXPECT_EQ(KeyCodec::secret_to_base58(secret), v::SECRET_BASE58);
    EXPECT_EQ(KeyCodec::secret_to_hex(secret), v::SECRET_HEX);
    EXPECT_EQ(HexUtils::encode(public_key.x), v::ADDRESS_X_HEX);
    EXPECT_EQ(public_key.is_odd, v::ADDRESS_IS_ODD);
}

/**
 * @given the same secret in Base58
 * @when parsed
 * @then it yields the same scalar as the hex form
 */
TEST(KeyCodec, KnownAnswerFromBase58) {
    auto secret = KeyCodec::secret_from_base58(v::SECRET_BASE58);
    EXPECT_EQ(KeyCodec::secret_to_hex(secret), v::SECRET_HEX);
    EXPECT_EQ(KeyCodec::address_encode(KeyCodec::derive_public_key(secret)), v::ADDRESS);
}

/**
 * @given the smallest and largest valid scalars
 * @when their public keys are derived
 * @then they are G and -G, which differ only in the parity of y
 */
TEST(KeyCodec, BoundaryScalars) {
    auto one = KeyCodec::secret_from_hex(v::ONE_HEX);
    auto last = KeyCodec::secret_from_hex(v::Q_MINUS_ONE_HEX);
    auto g = KeyCodec::derive_public_key(one);
    auto minus_g = KeyCodec::derive_public_key(last);

    EXPECT_EQ(KeyCodec::address_encode(g), v::GENERATOR_ADDRESS);
    EXPECT_EQ(KeyCodec::address_encode(minus_g), v::NEGATED_GENERATOR_ADDRESS);
    EXPECT_EQ(g.x, minus_g.x);
    EXPECT_TRUE(g.is_odd);
    EXPECT_FALSE(minus_g.is_odd);
    EXPECT_EQ(KeyCodec::secret_to_base58(one), v::ONE_BASE58);
    EXPECT_EQ(KeyCodec::secret_to_base58(last), v::Q_MINUS_ONE_BASE58);
}

/**
 * @given hex in upper case
 * @when parsed
 * @then it is accepted and exported back in lower case
 */
TEST(KeyCodec, HexIsCaseInsensitive) {
    std::string upper(v::SECRET_HEX);
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    EXPECT_EQ(KeyCodec::secret_to_hex(KeyCodec::secret_from_hex(upper)), v::SECRET_HEX);
}

TEST(KeyCodec, HexRejections) {
    EXPECT_EQ(error_type_of([] { KeyCodec::secret_from_hex("abcd"); }),
              KeyCodecError::ErrorType::InvalidLength);
    EXPECT_EQ(error_type_of([] { KeyCodec::secret_from_hex(std::string(v::SECRET_HEX) + "00"); }),
              KeyCodecError::ErrorType::InvalidLength);
    EXPECT_EQ(error_type_of([] {
                  KeyCodec::secret_from_hex(
                      "zz4244176fddb5d769b7de2027469d027ad428fadcc0c02396e6280142efb718");
              }),
              KeyCodecError::ErrorType::InvalidHex);
    EXPECT_EQ(error_type_of([] { KeyCodec::secret_from_hex(v::ZERO_HEX); }),
              KeyCodecError::ErrorType::ScalarOutOfRange);
    EXPECT_EQ(error_type_of([] { KeyCodec::secret_from_hex(v::Q_HEX); }),
              KeyCodecError::ErrorType::ScalarOutOfRange);
}

TEST(KeyCodec, Base58Rejections) {
    EXPECT_EQ(error_type_of([] { KeyCodec::secret_from_base58(v::ZERO_BASE58); }),
              KeyCodecError::ErrorType::ScalarOutOfRange);
    EXPECT_EQ(error_type_of([] { KeyCodec::secret_from_base58(v::Q_BASE58); }),
              KeyCodecError::ErrorType::ScalarOutOfRange);
    EXPECT_EQ(error_type_of([] { KeyCodec::secret_from_base58(v::SECRET_WRONG_VERSION); }),
              KeyCodecError::ErrorType::InvalidVersion);
    EXPECT_EQ(error_type_of([] { KeyCodec::secret_from_base58(v::SECRET_WRONG_TAG); }),
              KeyCodecError::ErrorType::InvalidVersion);
    // An address is valid Base58Check but carries the wrong version byte
    EXPECT_EQ(error_type_of([] { KeyCodec::secret_from_base58(v::ADDRESS); }),
              KeyCodecError::ErrorType::InvalidVersion);
    EXPECT_EQ(error_type_of([] { KeyCodec::secret_from_base58(v::SECRET_HEX); }),
              KeyCodecError::ErrorType::Base58Decode);
}

/**
 * @given valid addresses
 * @when decoded and re-encoded
 * @then the original text is reproduced
 */
TEST(KeyCodec, AddressDecodeIsInverseOfEncode) {
    for (const char* address : {v::ADDRESS, v::OTHER_ADDRESS, v::GENERATOR_ADDRESS,
                                v::NEGATED_GENERATOR_ADDRESS}) {
        EXPECT_EQ(KeyCodec::address_encode(KeyCodec::address_decode(address)), address);
    }
    auto other = KeyCodec::address_decode(v::OTHER_ADDRESS);
    EXPECT_EQ(HexUtils::encode(other.x), v::OTHER_ADDRESS_X_HEX);
    EXPECT_FALSE(other.is_odd);
}

TEST(KeyCodec, AddressRejections) {
    EXPECT_EQ(error_type_of([] { KeyCodec::address_decode("B62q"); }),
              KeyCodecError::ErrorType::InvalidLength);
    EXPECT_EQ(error_type_of([] { KeyCodec::address_decode(v::ADDRESS_WRONG_VERSION); }),
              KeyCodecError::ErrorType::InvalidVersion);
    EXPECT_EQ(error_type_of([] { KeyCodec::address_decode(v::ADDRESS_WRONG_TAG); }),
              KeyCodecError::ErrorType::InvalidVersion);
    EXPECT_EQ(error_type_of([] { KeyCodec::address_decode(v::ADDRESS_BAD_PARITY); }),
              KeyCodecError::ErrorType::NonCurvePoint);
    EXPECT_EQ(error_type_of([] { KeyCodec::address_decode(v::ADDRESS_NOT_ON_CURVE); }),
              KeyCodecError::ErrorType::NonCurvePoint);
    EXPECT_EQ(error_type_of([] { KeyCodec::address_decode(v::ADDRESS_X_EQUALS_P); }),
              KeyCodecError::ErrorType::NonCurvePoint);
}

/**
 * @given two freshly generated keypairs
 * @when compared
 * @then they differ, and each public key matches its secret
 */
TEST(KeyCodec, GenerateProducesConsistentKeypairs) {
    auto first = KeyCodec::generate();
    auto second = KeyCodec::generate();

    EXPECT_NE(KeyCodec::secret_to_hex(first.secret), KeyCodec::secret_to_hex(second.secret));
    EXPECT_EQ(KeyCodec::derive_public_key(first.secret), first.public_key);
    EXPECT_EQ(KeyCodec::derive_public_key(second.secret), second.public_key);
}
