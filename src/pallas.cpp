#include "pallas.hpp"
#include "consts.hpp"
#include "error.hpp"
#include <openssl/err.h>
#include <array>
#include <string>

namespace minawallet {

namespace {

using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using SecretBnPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using PointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

// Builds a KeyCodecError(Backend) carrying the most recent OpenSSL reason
// and leaves the OpenSSL error queue empty.
KeyCodecError backend_error(const std::string& what) {
    std::array<char, 256> reason{};
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return KeyCodecError(KeyCodecError::ErrorType::Backend, what);
    }
    ERR_error_string_n(code, reason.data(), reason.size());
    return KeyCodecError(KeyCodecError::ErrorType::Backend, what + ": " + reason.data());
}

BnPtr bn_from_hex(const char* hex) {
    BIGNUM* raw = nullptr;
    if (BN_hex2bn(&raw, hex) == 0) {
        throw backend_error("failed to load curve parameter");
    }
    return BnPtr(raw, BN_free);
}

BnCtxPtr new_ctx() {
    BnCtxPtr ctx(BN_CTX_secure_new(), BN_CTX_free);
    if (!ctx) {
        throw backend_error("failed to allocate BN_CTX");
    }
    return ctx;
}

SecretBnPtr scalar_from_le(std::span<const uint8_t> scalar_le) {
    if (scalar_le.size() != FIELD_SIZE) {
        throw KeyCodecError(KeyCodecError::ErrorType::InvalidLength,
            "scalar must be " + std::to_string(FIELD_SIZE) + " bytes");
    }
    SecretBnPtr k(BN_secure_new(), BN_clear_free);
    if (!k || !BN_lebin2bn(scalar_le.data(), static_cast<int>(scalar_le.size()), k.get())) {
        throw backend_error("failed to load scalar");
    }
    BN_set_flags(k.get(), BN_FLG_CONSTTIME);
    return k;
}

} // namespace

const PallasCurve& PallasCurve::instance() {
    static const PallasCurve curve;
    return curve;
}

// Builds the Pallas group from its domain parameters:
//   p  - base field modulus
//   a  - 0
//   b  - 5
//   G  - (1, GY), generator of the whole group
//   q  - group order (prime, cofactor 1)
PallasCurve::PallasCurve()
    : group_(nullptr, EC_GROUP_free)
    , p_(bn_from_hex(PALLAS_P))
    , q_(bn_from_hex(PALLAS_Q))
{
    auto ctx = new_ctx();
    BnPtr a(BN_new(), BN_free);
    BnPtr b(BN_new(), BN_free);
    if (!a || !b || !BN_set_word(a.get(), 0) || !BN_set_word(b.get(), PALLAS_B)) {
        throw backend_error("failed to set curve coefficients");
    }

    group_.reset(EC_GROUP_new_curve_GFp(p_.get(), a.get(), b.get(), ctx.get()));
    if (!group_) {
        throw backend_error("failed to create Pallas group");
    }

    auto gx = bn_from_hex(PALLAS_GX);
    auto gy = bn_from_hex(PALLAS_GY);
    BnPtr cofactor(BN_new(), BN_free);
    PointPtr generator(EC_POINT_new(group_.get()), EC_POINT_free);
    if (!cofactor || !generator || !BN_one(cofactor.get()) ||
        !EC_POINT_set_affine_coordinates(group_.get(), generator.get(), gx.get(), gy.get(), ctx.get()) ||
        !EC_GROUP_set_generator(group_.get(), generator.get(), q_.get(), cofactor.get())) {
        throw backend_error("failed to set Pallas generator");
    }
}

bool PallasCurve::is_valid_scalar(std::span<const uint8_t> scalar_le) const {
    if (scalar_le.size() != FIELD_SIZE) {
        return false;
    }
    auto k = scalar_from_le(scalar_le);
    return !BN_is_zero(k.get()) && BN_cmp(k.get(), q_.get()) < 0;
}

// Computes the public point for a secret scalar: P = k * G.
//
// The result is returned in Mina's compressed form: x as 32 little-endian
// bytes and the parity of y. Zero and out-of-range scalars are refused
// before OpenSSL is called, so a point at infinity can only come from a
// backend fault and is reported as NonCurvePoint.
PublicKey PallasCurve::multiply_generator(std::span<const uint8_t> scalar_le) const {
    auto k = scalar_from_le(scalar_le);
    if (BN_is_zero(k.get()) || BN_cmp(k.get(), q_.get()) >= 0) {
        throw KeyCodecError(KeyCodecError::ErrorType::ScalarOutOfRange,
            "scalar is not in the range [1, q-1]");
    }

    auto ctx = new_ctx();
    PointPtr point(EC_POINT_new(group_.get()), EC_POINT_free);
    if (!point || !EC_POINT_mul(group_.get(), point.get(), k.get(), nullptr, nullptr, ctx.get())) {
        throw backend_error("scalar multiplication failed");
    }
    if (EC_POINT_is_at_infinity(group_.get(), point.get())) {
        throw KeyCodecError(KeyCodecError::ErrorType::NonCurvePoint,
            "derived public key is the point at infinity");
    }

    BnPtr x(BN_new(), BN_free);
    BnPtr y(BN_new(), BN_free);
    if (!x || !y ||
        !EC_POINT_get_affine_coordinates(group_.get(), point.get(), x.get(), y.get(), ctx.get())) {
        throw backend_error("failed to read public key coordinates");
    }

    PublicKey public_key;
    if (BN_bn2lebinpad(x.get(), public_key.x.data(), static_cast<int>(public_key.x.size())) < 0) {
        throw backend_error("public key x-coordinate does not fit");
    }
    public_key.is_odd = BN_is_odd(y.get()) == 1;
    return public_key;
}

void PallasCurve::check_point(const PublicKey& public_key) const {
    BnPtr x(BN_lebin2bn(public_key.x.data(), static_cast<int>(public_key.x.size()), nullptr), BN_free);
    if (!x) {
        throw backend_error("failed to load x-coordinate");
    }
    if (BN_cmp(x.get(), p_.get()) >= 0) {
        throw KeyCodecError(KeyCodecError::ErrorType::NonCurvePoint,
            "x-coordinate is not a field element");
    }

    auto ctx = new_ctx();
    PointPtr point(EC_POINT_new(group_.get()), EC_POINT_free);
    if (!point) {
        throw backend_error("failed to allocate point");
    }
    if (!EC_POINT_set_compressed_coordinates(group_.get(), point.get(), x.get(),
                                             public_key.is_odd ? 1 : 0, ctx.get())) {
        ERR_clear_error();
        throw KeyCodecError(KeyCodecError::ErrorType::NonCurvePoint,
            "x-coordinate is not on the Pallas curve");
    }
}

// Draws k uniformly from [1, q-1]: a uniform value in [0, q-2] plus one.
// The single RNG call is not retried on failure.
SecureMemory PallasCurve::random_scalar() const {
    BnPtr range(BN_dup(q_.get()), BN_free);
    SecretBnPtr k(BN_secure_new(), BN_clear_free);
    if (!range || !k || !BN_sub_word(range.get(), 1)) {
        throw backend_error("failed to prepare scalar range");
    }

    if (!BN_priv_rand_range(k.get(), range.get())) {
        ERR_clear_error();
        throw KeyCodecError(KeyCodecError::ErrorType::EntropyUnavailable,
            "secure random source failed");
    }
    if (!BN_add_word(k.get(), 1)) {
        throw backend_error("failed to shift scalar");
    }

    std::array<uint8_t, FIELD_SIZE> bytes{};
    if (BN_bn2lebinpad(k.get(), bytes.data(), static_cast<int>(bytes.size())) < 0) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
        throw backend_error("scalar does not fit");
    }
    SecureMemory scalar(bytes);
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return scalar;
}

} // namespace minawallet
