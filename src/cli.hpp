/**
 * mina-wallet command line
 *
 * Usage:
 *   mina-wallet [-v] generate [-n mainnet|testnet] [-f text|json]
 *   mina-wallet [-v] import <secret_key> [-n mainnet|testnet] [-f text|json]
 *   mina-wallet [-v] validate <address>
 *   mina-wallet [-v] address <secret_key>
 *
 * Exit status is 0 on success and 1 on any failure. Failures print exactly
 * one line on the error stream and nothing on the output stream.
 */

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace minawallet {

// Usage errors detected after option parsing (unknown command, bad network)
class CliError : public std::runtime_error {
public:
    explicit CliError(const std::string& message) : std::runtime_error(message) {}
};

struct CliOptions {
    std::string command;
    std::string argument;            // secret key or address, by command
    std::string network = "mainnet";
    std::string format = "text";
    bool verbose = false;
    bool help = false;
    bool version = false;
};

// Parses argv into CliOptions.
// Throws CliError or boost::program_options::error on invalid usage.
CliOptions parse_cli(int argc, const char* const argv[]);

// Runs the command line and returns the process exit code
int run_cli(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

} // namespace minawallet
