#include "cli.hpp"
#include "logger.hpp"
#include "test_vectors.hpp"
#include "version.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace minawallet;
namespace v = minawallet::vectors;

namespace {

struct CliResult {
    int code;
    std::string out;
    std::string err;
};

CliResult run(std::vector<std::string> args) {
    args.insert(args.begin(), "mina-wallet");
    std::vector<const char*> argv;
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    std::ostringstream out;
    std::ostringstream err;
    int code = run_cli(static_cast<int>(argv.size()), argv.data(), out, err);
    return {code, out.str(), err.str()};
}

size_t line_count(const std::string& text) {
    size_t count = 0;
    for (char c : text) {
        if (c == '\n') {
            ++count;
        }
    }
    return count;
}

} // namespace

/**
 * @given generate with a mixed-case network and json output
 * @when run
 * @then stdout is a JSON wallet labelled with the lower-case network
 */
TEST(Cli, GenerateJson) {
    auto result = run({"generate", "--network", "TestNet", "--format", "json"});

    ASSERT_EQ(result.code, 0) << result.err;
    EXPECT_TRUE(result.err.empty());
    auto j = nlohmann::json::parse(result.out);
    EXPECT_EQ(j["network"].get<std::string>(), "testnet");
    EXPECT_EQ(j["address"].get<std::string>().size(), 55u);
}

TEST(Cli, GenerateDefaultsToMainnetText) {
    auto result = run({"generate"});

    ASSERT_EQ(result.code, 0) << result.err;
    EXPECT_EQ(result.out.rfind("Wallet Generated Successfully!\n", 0), 0u);
    EXPECT_NE(result.out.find("Network:          mainnet\n"), std::string::npos);
}

TEST(Cli, UnknownFormatFallsBackToText) {
    auto result = run({"generate", "-f", "yaml"});

    ASSERT_EQ(result.code, 0) << result.err;
    EXPECT_EQ(result.out.rfind("Wallet Generated Successfully!\n", 0), 0u);
}

TEST(Cli, ImportHexAndBase58) {
    auto from_hex = run({"import", v::SECRET_HEX, "-f", "json"});
    auto from_base58 = run({"import", v::SECRET_BASE58, "--format", "json", "-n", "testnet"});

    ASSERT_EQ(from_hex.code, 0) << from_hex.err;
    ASSERT_EQ(from_base58.code, 0) << from_base58.err;
    auto hex_json = nlohmann::json::parse(from_hex.out);
    auto base58_json = nlohmann::json::parse(from_base58.out);
    EXPECT_EQ(hex_json["address"].get<std::string>(), v::ADDRESS);
    EXPECT_EQ(hex_json["network"].get<std::string>(), "mainnet");
    EXPECT_EQ(base58_json["secret_key_hex"].get<std::string>(), v::SECRET_HEX);
    EXPECT_EQ(base58_json["network"].get<std::string>(), "testnet");
}

TEST(Cli, ImportInvalidKey) {
    auto result = run({"import", "not-a-key"});

    EXPECT_EQ(result.code, 1);
    EXPECT_TRUE(result.out.empty());
    EXPECT_EQ(result.err,
              "Error: Invalid secret key format. Expected hex (64 chars) or base58 (52 chars).\n");
}

/**
 * @given a secret key
 * @when the address command runs
 * @then only the address is printed, never the secret
 */
TEST(Cli, AddressPrintsOnlyAddress) {
    auto result = run({"address", v::SECRET_BASE58});

    ASSERT_EQ(result.code, 0) << result.err;
    EXPECT_EQ(result.out, std::string(v::ADDRESS) + "\n");
}

TEST(Cli, AddressRejectsInvalidKey) {
    auto result = run({"address", "not-a-key"});

    EXPECT_EQ(result.code, 1);
    EXPECT_TRUE(result.out.empty());
    EXPECT_EQ(line_count(result.err), 1u);
    EXPECT_EQ(result.err.rfind("Error: ", 0), 0u);
}

TEST(Cli, ValidateAddress) {
    auto valid = run({"validate", v::ADDRESS});
    EXPECT_EQ(valid.code, 0);
    EXPECT_EQ(valid.out, std::string("Address is valid: ") + v::ADDRESS + "\n");
    EXPECT_TRUE(valid.err.empty());

    auto invalid = run({"validate", v::ADDRESS_BAD_PARITY});
    EXPECT_EQ(invalid.code, 1);
    EXPECT_TRUE(invalid.out.empty());
    EXPECT_EQ(invalid.err.rfind("Invalid address: ", 0), 0u);
    EXPECT_EQ(line_count(invalid.err), 1u);
}

TEST(Cli, InvalidNetwork) {
    auto result = run({"generate", "--network", "devnet"});

    EXPECT_EQ(result.code, 1);
    EXPECT_TRUE(result.out.empty());
    EXPECT_EQ(result.err, "Error: Invalid network 'devnet'. Use 'mainnet' or 'testnet'.\n");
}

TEST(Cli, UsageErrors) {
    auto unknown = run({"sign"});
    EXPECT_EQ(unknown.code, 1);
    EXPECT_EQ(unknown.err.rfind("Error: Unknown command 'sign'", 0), 0u);

    auto none = run({});
    EXPECT_EQ(none.code, 1);
    EXPECT_EQ(none.err, "Error: No command given. Run 'mina-wallet --help' for usage.\n");

    auto missing = run({"validate"});
    EXPECT_EQ(missing.code, 1);
    EXPECT_TRUE(missing.out.empty());
    EXPECT_EQ(line_count(missing.err), 1u);
}

TEST(Cli, HelpAndVersion) {
    auto help = run({"--help"});
    EXPECT_EQ(help.code, 0);
    EXPECT_NE(help.out.find("validate <address>"), std::string::npos);

    auto version = run({"--version"});
    EXPECT_EQ(version.code, 0);
    EXPECT_EQ(version.out, std::string("mina-wallet ") + VERSION + "\n");
}

TEST(Cli, ParseVerboseFlag) {
    const char* argv[] = {"mina-wallet", "-v", "validate", v::ADDRESS};
    auto options = parse_cli(4, argv);

    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.command, "validate");
    EXPECT_EQ(options.argument, v::ADDRESS);
}

/**
 * @given a command line for the address command with a bad key
 * @when parsed and run twice in a row
 * @then each run fails cleanly with exit code 1 and empty stdout
 */
TEST(Cli, RepeatedRunsFailCleanly) {
    for (int i = 0; i < 2; ++i) {
        auto result = run({"address", "not-a-key"});
        EXPECT_EQ(result.code, 1);
        EXPECT_TRUE(result.out.empty());
        EXPECT_EQ(line_count(result.err), 1u);
    }
}

TEST(Cli, ParseImportOptions) {
    const char* argv[] = {"mina-wallet", "import", v::SECRET_HEX, "--network", "TESTNET", "-f", "json"};
    auto options = parse_cli(7, argv);

    EXPECT_EQ(options.command, "import");
    EXPECT_EQ(options.argument, v::SECRET_HEX);
    EXPECT_EQ(options.network, "TESTNET");
    EXPECT_EQ(options.format, "json");
    EXPECT_FALSE(options.verbose);
}

TEST(Cli, ParseGenerateDefaults) {
    const char* argv[] = {"mina-wallet", "generate"};
    auto options = parse_cli(2, argv);

    EXPECT_EQ(options.command, "generate");
    EXPECT_EQ(options.network, "mainnet");
    EXPECT_EQ(options.format, "text");
    EXPECT_TRUE(options.argument.empty());
}

/**
 * @given a wallet option placed before the command name
 * @when run
 * @then the option is reported instead of its value being taken as the command
 */
TEST(Cli, OptionBeforeCommandIsRejected) {
    auto result = run({"-n", "testnet", "generate"});

    EXPECT_EQ(result.code, 1);
    EXPECT_TRUE(result.out.empty());
    EXPECT_EQ(result.err,
              "Error: Option '-n' is not valid before the command. Run 'mina-wallet --help' for usage.\n");
}

TEST(Cli, HelpListsVisibleOptionsOnly) {
    auto help = run({"-h"});

    EXPECT_EQ(help.code, 0);
    EXPECT_NE(help.out.find("--verbose"), std::string::npos);
    EXPECT_NE(help.out.find("--network"), std::string::npos);
    EXPECT_NE(help.out.find("--format"), std::string::npos);
    EXPECT_EQ(help.out.find("subargs"), std::string::npos);
}

TEST(Cli, OptionNotValidForCommand) {
    auto result = run({"validate", v::ADDRESS, "--network", "testnet"});

    EXPECT_EQ(result.code, 1);
    EXPECT_TRUE(result.out.empty());
    EXPECT_EQ(result.err.rfind("Error: ", 0), 0u);
    EXPECT_EQ(line_count(result.err), 1u);
}
