#include "address.hpp"
#include "error.hpp"
#include "key_codec.hpp"

namespace minawallet {

void validate_address(const std::string& address) {
    address_to_public_key(address);
}

PublicKey address_to_public_key(const std::string& address) {
    try {
        return KeyCodec::address_decode(address);
    } catch (const KeyCodecError& e) {
        throw WalletError(WalletError::ErrorType::InvalidAddress, e.what());
    }
}

std::string public_key_to_address(const PublicKey& public_key) {
    return KeyCodec::address_encode(public_key);
}

} // namespace minawallet
