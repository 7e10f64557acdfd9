#pragma once

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "keys.hpp"
#include "network.hpp"

namespace minawallet {

// A Mina wallet: one keypair bound to a network label.
//
// The public key is always derived from the secret, so the two cannot
// disagree. A Wallet is immutable after construction and move-only: the
// secret has exactly one owner and is wiped when that owner goes away.
class Wallet {
public:
    // Creates a wallet with a fresh random keypair.
    // Throws WalletError(KeypairGenerationFailed) if the secure RNG fails.
    static Wallet create(Network network);

    // Imports a wallet from a 64-character hex secret key.
    // Throws WalletError(InvalidSecretKey).
    static Wallet from_secret_key_hex(const std::string& secret_hex, Network network);

    // Imports a wallet from a Base58Check ("EK...") secret key.
    // Throws WalletError(InvalidSecretKey).
    static Wallet from_secret_key_base58(const std::string& secret_base58, Network network);

    Wallet(Wallet&&) noexcept = default;
    Wallet& operator=(Wallet&&) noexcept = default;
    Wallet(const Wallet&) = delete;
    Wallet& operator=(const Wallet&) = delete;

    const PublicKey& public_key() const { return keypair_.public_key; }

    // "B62q..." address; depends on the public key only
    std::string address() const;

    std::string secret_key_hex() const;
    std::string secret_key_base58() const;

    Network network() const { return network_; }

    const Keypair& keypair() const { return keypair_; }

private:
    Wallet(Keypair keypair, Network network);

    Keypair keypair_;
    Network network_;
};

// Debug rendering: address and network only, never the secret.
std::ostream& operator<<(std::ostream& os, const Wallet& wallet);

// Shareable projection of a Wallet. There is no field able to hold a
// secret, and the only way to build one is redact().
class WalletInfo {
public:
    static WalletInfo redact(const Wallet& wallet);

    const std::string& address() const { return address_; }
    const std::string& network() const { return network_; }

private:
    WalletInfo(std::string address, std::string network);

    std::string address_;
    std::string network_;

    friend void to_json(nlohmann::json& j, const WalletInfo& info);
};

} // namespace minawallet
