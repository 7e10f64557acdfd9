#include "cli.hpp"
#include "address.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "network.hpp"
#include "presenter.hpp"
#include "version.hpp"
#include "wallet.hpp"
#include "wallet_import.hpp"
#include <boost/program_options.hpp>
#include <exception>
#include <sstream>
#include <vector>

namespace po = boost::program_options;

namespace minawallet {

namespace {

// Options accepted before the command, shown in --help
po::options_description global_options() {
    po::options_description description("Global options");
    // clang-format off
    description.add_options()
        ("help,h", "Show this help message")
        ("version,V", "Print the version")
        ("verbose,v", "Write debug logs to stderr");
    // clang-format on
    return description;
}

// The command name and everything after it; hidden from --help
po::options_description command_options() {
    po::options_description description;
    // clang-format off
    description.add_options()
        ("command", po::value<std::string>(), "Command to run")
        ("subargs", po::value<std::vector<std::string>>(), "Arguments for the command");
    // clang-format on
    return description;
}

po::options_description wallet_output_options() {
    po::options_description description("Wallet options");
    // clang-format off
    description.add_options()
        ("network,n", po::value<std::string>()->default_value("mainnet"), "Network: mainnet or testnet")
        ("format,f", po::value<std::string>()->default_value("text"), "Output format: text or json");
    // clang-format on
    return description;
}

std::string usage() {
    std::ostringstream out;
    out << "Mina wallet CLI tool\n"
        << "\n"
        << "Usage: mina-wallet [options] <command> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  generate              Generate a new random wallet\n"
        << "  import <secret_key>   Import a wallet from a hex or base58 secret key\n"
        << "  validate <address>    Validate a Mina address\n"
        << "  address <secret_key>  Print the address for a secret key (without showing the secret)\n"
        << "\n";
    po::options_description visible;
    visible.add(global_options()).add(wallet_output_options());
    out << visible;
    return out.str();
}

// Parses the options that follow the command name
void parse_command_args(const std::vector<std::string>& args, CliOptions& options) {
    po::options_description description;
    po::positional_options_description positional;
    const char* argument = nullptr;

    if (options.command == "generate") {
        description.add(wallet_output_options());
    } else if (options.command == "import") {
        description.add(wallet_output_options());
        argument = "secret_key";
        description.add_options()(argument, po::value<std::string>()->required(),
                                  "Secret key in hex or base58 format");
    } else if (options.command == "validate") {
        argument = "address";
        description.add_options()(argument, po::value<std::string>()->required(),
                                  "The Mina address to validate");
    } else if (options.command == "address") {
        argument = "secret_key";
        description.add_options()(argument, po::value<std::string>()->required(),
                                  "Secret key in hex or base58 format");
    } else {
        throw CliError("Unknown command '" + options.command + "'. Run 'mina-wallet --help' for usage.");
    }
    if (argument != nullptr) {
        positional.add(argument, 1);
    }

    po::variables_map vm;
    po::store(po::command_line_parser(args).options(description).positional(positional).run(), vm);
    po::notify(vm);

    if (vm.count("network")) {
        options.network = vm["network"].as<std::string>();
    }
    if (vm.count("format")) {
        options.format = vm["format"].as<std::string>();
    }
    if (argument != nullptr) {
        options.argument = vm[argument].as<std::string>();
    }
}

// Command options are only accepted after the command name. Without this
// check "-n testnet generate" would run "testnet" as the command.
void reject_options_before_command(const po::parsed_options& parsed) {
    for (const auto& option : parsed.options) {
        if (option.string_key == "command") {
            return;
        }
        if (option.unregistered && !option.original_tokens.empty()) {
            throw CliError("Option '" + option.original_tokens.front() +
                "' is not valid before the command. Run 'mina-wallet --help' for usage.");
        }
    }
}

Network require_network(const std::string& name) {
    auto network = parse_network(name);
    if (!network) {
        throw CliError("Invalid network '" + name + "'. Use 'mainnet' or 'testnet'.");
    }
    return *network;
}

// Runs one command. Output is rendered fully before anything is written,
// so a failing command leaves the output stream untouched.
int dispatch(const CliOptions& options, std::ostream& out, std::ostream& err) {
    auto logger = create_logger("cli");
    logger->debug("running command '{}'", options.command);

    if (options.command == "generate") {
        auto network = require_network(options.network);
        auto wallet = Wallet::create(network);
        out << render_wallet(wallet, parse_output_format(options.format));
        return 0;
    }

    if (options.command == "import") {
        auto network = require_network(options.network);
        auto wallet = import_wallet(options.argument, network);
        out << render_wallet(wallet, parse_output_format(options.format));
        return 0;
    }

    if (options.command == "validate") {
        try {
            validate_address(options.argument);
        } catch (const WalletError& e) {
            err << "Invalid address: " << e.detail() << std::endl;
            return 1;
        }
        out << "Address is valid: " << options.argument << std::endl;
        return 0;
    }

    // address: derive in a mainnet context and print the address only
    auto wallet = import_wallet(options.argument, Network::Mainnet);
    out << wallet.address() << std::endl;
    return 0;
}

} // namespace

CliOptions parse_cli(int argc, const char* const argv[]) {
    CliOptions options;

    po::positional_options_description positional;
    positional.add("command", 1).add("subargs", -1);

    po::options_description all_options;
    all_options.add(global_options()).add(command_options());

    // The parser keeps a pointer to all_options, so it must outlive store()
    po::parsed_options parsed = po::command_line_parser(argc, argv)
        .options(all_options)
        .positional(positional)
        .allow_unregistered()
        .run();

    po::variables_map vm;
    po::store(parsed, vm);
    po::notify(vm);

    options.verbose = vm.count("verbose") > 0;
    options.help = vm.count("help") > 0;
    options.version = vm.count("version") > 0;
    if (options.help || options.version) {
        return options;
    }

    reject_options_before_command(parsed);
    if (!vm.count("command")) {
        throw CliError("No command given. Run 'mina-wallet --help' for usage.");
    }
    options.command = vm["command"].as<std::string>();

    // Everything after the command name, in command line order
    std::vector<std::string> args = po::collect_unrecognized(parsed.options, po::include_positional);
    args.erase(args.begin());
    parse_command_args(args, options);
    return options;
}

int run_cli(int argc, const char* const argv[], std::ostream& out, std::ostream& err) {
    try {
        auto options = parse_cli(argc, argv);
        if (options.verbose) {
            set_log_level(spdlog::level::debug);
        }
        if (options.help) {
            out << usage();
            return 0;
        }
        if (options.version) {
            out << "mina-wallet " << VERSION << std::endl;
            return 0;
        }
        return dispatch(options, out, err);
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace minawallet
