/**
 * @file wallet.cpp
 * @brief Construction and export paths of the Mina wallet value type
 *
 * Every key operation is delegated to KeyCodec. This file only decides
 * which WalletError a codec failure becomes:
 *  - failures while generating        -> KeypairGenerationFailed
 *  - failures while parsing a secret  -> InvalidSecretKey
 *  - a parsed secret the curve refuses -> InvalidSecretKey as well
 */

#include "wallet.hpp"
#include "error.hpp"
#include "key_codec.hpp"
#include "logger.hpp"
#include <utility>

namespace minawallet {

namespace {

Logger wallet_logger() {
    static Logger logger = create_logger("wallet");
    return logger;
}

// Parses a secret with the given codec function and derives its public key.
// Any codec failure on the way is an invalid secret key.
template <typename Parse>
Keypair import_keypair(Parse parse, const std::string& text) {
    try {
        SecretKey secret = parse(text);
        auto public_key = KeyCodec::derive_public_key(secret);
        return Keypair{std::move(secret), public_key};
    } catch (const KeyCodecError& e) {
        throw WalletError(WalletError::ErrorType::InvalidSecretKey, e.what());
    }
}

} // namespace

Wallet::Wallet(Keypair keypair, Network network)
    : keypair_(std::move(keypair))
    , network_(network)
{}

Wallet Wallet::create(Network network) {
    try {
        Wallet wallet(KeyCodec::generate(), network);
        wallet_logger()->debug("generated wallet {} on {}", wallet.address(), to_string(network));
        return wallet;
    } catch (const KeyCodecError& e) {
        wallet_logger()->debug("keypair generation failed: {}", e.what());
        throw WalletError(WalletError::ErrorType::KeypairGenerationFailed, e.what());
    }
}

Wallet Wallet::from_secret_key_hex(const std::string& secret_hex, Network network) {
    Wallet wallet(import_keypair(&KeyCodec::secret_from_hex, secret_hex), network);
    wallet_logger()->debug("imported hex secret for {}", wallet.address());
    return wallet;
}

Wallet Wallet::from_secret_key_base58(const std::string& secret_base58, Network network) {
    Wallet wallet(import_keypair(&KeyCodec::secret_from_base58, secret_base58), network);
    wallet_logger()->debug("imported base58 secret for {}", wallet.address());
    return wallet;
}

std::string Wallet::address() const {
    return KeyCodec::address_encode(keypair_.public_key);
}

std::string Wallet::secret_key_hex() const {
    return KeyCodec::secret_to_hex(keypair_.secret);
}

std::string Wallet::secret_key_base58() const {
    return KeyCodec::secret_to_base58(keypair_.secret);
}

std::ostream& operator<<(std::ostream& os, const Wallet& wallet) {
    return os << "Wallet { address: " << wallet.address()
              << ", network: " << wallet.network() << " }";
}

WalletInfo::WalletInfo(std::string address, std::string network)
    : address_(std::move(address))
    , network_(std::move(network))
{}

WalletInfo WalletInfo::redact(const Wallet& wallet) {
    return WalletInfo(wallet.address(), to_string(wallet.network()));
}

void to_json(nlohmann::json& j, const WalletInfo& info) {
    j = nlohmann::json{
        {"address", info.address_},
        {"network", info.network_}
    };
}

} // namespace minawallet
