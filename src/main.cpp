// Mina Wallet CLI
//
// Entry point for the mina-wallet command line tool. It creates and imports
// Mina wallets, validates addresses and derives addresses from secret keys.
// Command parsing and dispatch live in cli.cpp so they can be driven from
// tests with in-memory streams.

#include "cli.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    return minawallet::run_cli(argc, argv, std::cout, std::cerr);
}
