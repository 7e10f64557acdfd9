#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace minawallet {

// Network a wallet is labelled with. Display context only; it does not
// affect keys or addresses.
enum class Network {
    Mainnet,
    Testnet
};

// Case-insensitive: "mainnet", "MAINNET" and "MainNet" all parse.
std::optional<Network> parse_network(const std::string& name);

// Lower-case name: "mainnet" or "testnet"
std::string to_string(Network network);

std::ostream& operator<<(std::ostream& os, Network network);

} // namespace minawallet
