#include "wallet_import.hpp"
#include "error.hpp"
#include "logger.hpp"
#include <array>

namespace minawallet {

namespace {

const std::array<SecretKeyFormat, 2> DEFAULT_FORMATS = {{
    {"hex", &Wallet::from_secret_key_hex},
    {"base58", &Wallet::from_secret_key_base58},
}};

} // namespace

std::span<const SecretKeyFormat> default_secret_key_formats() {
    return DEFAULT_FORMATS;
}

Wallet import_first(std::span<const SecretKeyFormat> formats,
                    const std::string& secret_key, Network network) {
    static Logger logger = create_logger("wallet");

    std::vector<std::string> attempts;
    attempts.reserve(formats.size());
    for (const auto& format : formats) {
        try {
            return format.import(secret_key, network);
        } catch (const WalletError& e) {
            attempts.push_back(std::string(format.name) + ": " + e.detail());
        }
    }

    for (const auto& attempt : attempts) {
        logger->debug("secret key rejected as {}", attempt);
    }
    throw ImportError(std::move(attempts));
}

Wallet import_wallet(const std::string& secret_key, Network network) {
    return import_first(default_secret_key_formats(), secret_key, network);
}

} // namespace minawallet
