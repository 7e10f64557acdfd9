/**
 * Boundary API for embedding hosts
 *
 * Each call returns an envelope instead of throwing:
 *
 *   { "success": bool, "data": <value> | null, "error": <string> | null }
 *
 * The host must check "success" before reading "data". Wallet payloads are
 * the same object the CLI prints with --format json.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace minawallet::bindings {

using Envelope = nlohmann::ordered_json;

// data: {address, secret_key_hex, secret_key_base58, network}
Envelope generate_wallet(const std::string& network);

Envelope import_wallet_from_hex(const std::string& secret_hex, const std::string& network);

Envelope import_wallet_from_base58(const std::string& secret_base58, const std::string& network);

// Always succeeds; data: {valid: bool, error: string | null}
Envelope validate_address(const std::string& address);

// data: {x: little-endian hex of the x-coordinate, is_odd: bool}
Envelope address_to_pubkey_components(const std::string& address);

std::string version();

} // namespace minawallet::bindings
