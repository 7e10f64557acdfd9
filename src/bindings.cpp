#include "bindings.hpp"
#include "address.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "logger.hpp"
#include "network.hpp"
#include "presenter.hpp"
#include "version.hpp"
#include "wallet.hpp"

namespace minawallet::bindings {

namespace {

Logger bindings_logger() {
    static Logger logger = create_logger("bindings");
    return logger;
}

Envelope ok(Envelope data) {
    Envelope result;
    result["success"] = true;
    result["data"] = std::move(data);
    result["error"] = nullptr;
    return result;
}

Envelope err(const std::string& error) {
    bindings_logger()->debug("call failed: {}", error);
    Envelope result;
    result["success"] = false;
    result["data"] = nullptr;
    result["error"] = error;
    return result;
}

const char* INVALID_NETWORK = "Invalid network. Use 'mainnet' or 'testnet'.";

// Shared body of the two import calls
template <typename Import>
Envelope import_with(Import import, const std::string& secret_key, const std::string& network) {
    auto network_id = parse_network(network);
    if (!network_id) {
        return err(INVALID_NETWORK);
    }
    try {
        return ok(render_json(import(secret_key, *network_id)));
    } catch (const WalletError& e) {
        return err(std::string("Failed to import wallet: ") + e.what());
    }
}

} // namespace

Envelope generate_wallet(const std::string& network) {
    auto network_id = parse_network(network);
    if (!network_id) {
        return err(INVALID_NETWORK);
    }
    try {
        return ok(render_json(Wallet::create(*network_id)));
    } catch (const WalletError& e) {
        return err(std::string("Failed to generate wallet: ") + e.what());
    }
}

Envelope import_wallet_from_hex(const std::string& secret_hex, const std::string& network) {
    return import_with(&Wallet::from_secret_key_hex, secret_hex, network);
}

Envelope import_wallet_from_base58(const std::string& secret_base58, const std::string& network) {
    return import_with(&Wallet::from_secret_key_base58, secret_base58, network);
}

Envelope validate_address(const std::string& address) {
    Envelope result;
    try {
        minawallet::validate_address(address);
        result["valid"] = true;
        result["error"] = nullptr;
    } catch (const WalletError& e) {
        result["valid"] = false;
        result["error"] = e.detail();
    }
    return ok(std::move(result));
}

Envelope address_to_pubkey_components(const std::string& address) {
    try {
        auto public_key = address_to_public_key(address);
        Envelope components;
        components["x"] = HexUtils::encode(public_key.x);
        components["is_odd"] = public_key.is_odd;
        return ok(std::move(components));
    } catch (const WalletError& e) {
        return err(e.what());
    }
}

std::string version() {
    return VERSION;
}

} // namespace minawallet::bindings
