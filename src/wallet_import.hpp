#pragma once

#include <span>
#include <stdexcept>
#include <string>
#include <vector>
#include "network.hpp"
#include "wallet.hpp"

namespace minawallet {

// Every format in the chain rejected the secret key.
// attempts() holds one "<format>: <reason>" line per format tried.
class ImportError : public std::runtime_error {
public:
    explicit ImportError(std::vector<std::string> attempts)
        : std::runtime_error("Invalid secret key format. Expected hex (64 chars) or base58 (52 chars).")
        , attempts_(std::move(attempts))
    {}

    const std::vector<std::string>& attempts() const { return attempts_; }

private:
    std::vector<std::string> attempts_;
};

// A named way of turning secret key text into a Wallet
struct SecretKeyFormat {
    const char* name;
    Wallet (*import)(const std::string& secret_key, Network network);
};

// Hex first, then Base58
std::span<const SecretKeyFormat> default_secret_key_formats();

// Tries each format in order and returns the first wallet that imports.
// Throws ImportError once every format has failed.
Wallet import_first(std::span<const SecretKeyFormat> formats,
                    const std::string& secret_key, Network network);

// import_first over default_secret_key_formats()
Wallet import_wallet(const std::string& secret_key, Network network);

} // namespace minawallet
