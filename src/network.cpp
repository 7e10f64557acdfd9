#include "network.hpp"
#include <algorithm>
#include <cctype>

namespace minawallet {

std::optional<Network> parse_network(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "mainnet") {
        return Network::Mainnet;
    }
    if (lower == "testnet") {
        return Network::Testnet;
    }
    return std::nullopt;
}

std::string to_string(Network network) {
    switch (network) {
        case Network::Mainnet:
            return "mainnet";
        case Network::Testnet:
            return "testnet";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, Network network) {
    return os << to_string(network);
}

} // namespace minawallet
