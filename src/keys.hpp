#pragma once

#include <array>
#include <span>
#include <cstdint>
#include "consts.hpp"
#include "secure_memory.hpp"

namespace minawallet {

// Compressed Pallas point: the x-coordinate (little-endian field bytes)
// and the parity of y. This is exactly what a Mina address carries.
struct PublicKey {
    std::array<uint8_t, FIELD_SIZE> x{};
    bool is_odd = false;

    bool operator==(const PublicKey&) const = default;
};

// A Pallas scalar in [1, q-1], stored little-endian in locked memory.
// Only KeyCodec creates these, after range-checking the scalar.
class SecretKey {
public:
    explicit SecretKey(SecureMemory scalar) : scalar_(std::move(scalar)) {}

    std::span<const uint8_t> bytes() const { return scalar_.span(); }

private:
    SecureMemory scalar_;
};

struct Keypair {
    SecretKey secret;
    PublicKey public_key;
};

} // namespace minawallet
