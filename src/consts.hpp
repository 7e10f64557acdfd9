#pragma once

#include <cstdint>
#include <cstddef>

namespace minawallet {

    // Base58Check version bytes
    constexpr uint8_t ADDRESS_VERSION = 0xcb;     // "B62q..." addresses
    constexpr uint8_t SECRET_KEY_VERSION = 0x5a;  // "EK..." secret keys

    // Tag bytes following the version byte
    constexpr uint8_t NON_ZERO_CURVE_POINT_TAG = 0x01;
    constexpr uint8_t COMPRESSED_POINT_TAG = 0x01;
    constexpr uint8_t SECRET_KEY_TAG = 0x01;

    // Sizes
    constexpr size_t FIELD_SIZE = 32;             // Fp and Fq elements
    constexpr size_t SECRET_HEX_LENGTH = 64;
    constexpr size_t ADDRESS_LENGTH = 55;
    constexpr size_t ADDRESS_PAYLOAD_SIZE = 2 + FIELD_SIZE + 1;  // tags || x || parity
    constexpr size_t SECRET_PAYLOAD_SIZE = 1 + FIELD_SIZE;       // tag || scalar

    // Pallas: y^2 = x^3 + 5 over Fp, prime order q, generator (1, GY)
    constexpr const char* PALLAS_P =
        "40000000000000000000000000000000224698fc094cf91b992d30ed00000001";
    constexpr const char* PALLAS_Q =
        "40000000000000000000000000000000224698fc0994a8dd8c46eb2100000001";
    constexpr const char* PALLAS_GX = "1";
    constexpr const char* PALLAS_GY =
        "1b74b5a30a12937c53dfa9f06378ee548f655bd4333d477119cf7a23caed2abb";
    constexpr unsigned long PALLAS_B = 5;

} // namespace minawallet
