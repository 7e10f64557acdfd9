#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "wallet.hpp"

namespace minawallet {

enum class OutputFormat {
    Text,
    Json
};

// "json" selects Json. Anything else, including unknown names, selects Text.
OutputFormat parse_output_format(const std::string& name);

// Multi-line report with both secret encodings and a safety warning.
// Ends with a newline.
std::string render_text(const Wallet& wallet);

// {address, secret_key_hex, secret_key_base58, network}, in that order
nlohmann::ordered_json render_json(const Wallet& wallet);

// render_text, or render_json dumped with a two-space indent plus newline
std::string render_wallet(const Wallet& wallet, OutputFormat format);

} // namespace minawallet
