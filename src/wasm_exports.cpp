// Flat C API over minawallet::bindings

#include "wasm_exports.h"
#include "bindings.hpp"
#include "version.hpp"
#include <openssl/crypto.h>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>

namespace {

using minawallet::bindings::Envelope;

// Copies the envelope into a malloc'd buffer. The intermediate string may
// hold secret keys and is wiped before it is released.
char* to_c_string(const Envelope& envelope) {
    std::string text = envelope.dump();
    char* out = static_cast<char*>(std::malloc(text.size() + 1));
    if (out != nullptr) {
        std::memcpy(out, text.c_str(), text.size() + 1);
    }
    OPENSSL_cleanse(text.data(), text.size());
    return out;
}

std::string arg(const char* value) {
    return value != nullptr ? std::string(value) : std::string();
}

// Exceptions must not cross the C boundary; anything the bindings did not
// turn into an envelope is reported as a failed call.
template <typename Call>
char* guarded(Call call) {
    try {
        return to_c_string(call());
    } catch (const std::exception& e) {
        Envelope failure;
        failure["success"] = false;
        failure["data"] = nullptr;
        failure["error"] = std::string("Internal error: ") + e.what();
        return to_c_string(failure);
    }
}

} // namespace

extern "C" {

char* mina_wallet_generate(const char* network) {
    return guarded([&] { return minawallet::bindings::generate_wallet(arg(network)); });
}

char* mina_wallet_import_hex(const char* secret_hex, const char* network) {
    return guarded([&] {
        return minawallet::bindings::import_wallet_from_hex(arg(secret_hex), arg(network));
    });
}

char* mina_wallet_import_base58(const char* secret_base58, const char* network) {
    return guarded([&] {
        return minawallet::bindings::import_wallet_from_base58(arg(secret_base58), arg(network));
    });
}

char* mina_wallet_validate_address(const char* address) {
    return guarded([&] { return minawallet::bindings::validate_address(arg(address)); });
}

char* mina_wallet_address_to_pubkey(const char* address) {
    return guarded([&] { return minawallet::bindings::address_to_pubkey_components(arg(address)); });
}

const char* mina_wallet_version(void) {
    return minawallet::VERSION;
}

void mina_wallet_free(char* json) {
    if (json == nullptr) {
        return;
    }
    OPENSSL_cleanse(json, std::strlen(json));
    std::free(json);
}

} // extern "C"
