#pragma once

#include <string>
#include "keys.hpp"

namespace minawallet {

// Checks that address is a well-formed Mina address: alphabet, checksum,
// version and tag bytes, and a point on the curve.
// Throws WalletError(InvalidAddress) with the reason.
void validate_address(const std::string& address);

// Parses an address into its compressed public key.
// Throws WalletError(InvalidAddress).
PublicKey address_to_public_key(const std::string& address);

// Inverse of address_to_public_key
std::string public_key_to_address(const PublicKey& public_key);

} // namespace minawallet
