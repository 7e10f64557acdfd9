#pragma once

#include <span>
#include <memory>
#include <cstdint>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include "keys.hpp"
#include "secure_memory.hpp"

namespace minawallet {

// PallasCurve hands the Pallas domain parameters to OpenSSL's generic
// prime-field EC_GROUP and exposes the few operations the key codec needs.
// All point arithmetic is performed by OpenSSL.
//
// Scalars cross this interface as 32 little-endian bytes, the byte order
// Mina serializes field elements in.
class PallasCurve {
public:
    // The process-wide curve. Built on first use, immutable afterwards.
    static const PallasCurve& instance();

    // Returns true if 1 <= scalar < q
    bool is_valid_scalar(std::span<const uint8_t> scalar_le) const;

    // Computes scalar * G and returns it compressed.
    // Throws KeyCodecError(ScalarOutOfRange) for scalars outside [1, q-1].
    PublicKey multiply_generator(std::span<const uint8_t> scalar_le) const;

    // Checks that x < p and that (x, parity) decompresses to a curve point.
    // Throws KeyCodecError(NonCurvePoint) otherwise.
    void check_point(const PublicKey& public_key) const;

    // Draws a uniform scalar in [1, q-1] from OpenSSL's private RNG.
    // Throws KeyCodecError(EntropyUnavailable) when the RNG fails.
    SecureMemory random_scalar() const;

    PallasCurve(const PallasCurve&) = delete;
    PallasCurve& operator=(const PallasCurve&) = delete;

private:
    PallasCurve();

    std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)> group_;
    std::unique_ptr<BIGNUM, decltype(&BN_free)> p_;
    std::unique_ptr<BIGNUM, decltype(&BN_free)> q_;
};

} // namespace minawallet
