/* ============================================================================
 * Mina wallet: flat C API
 * ============================================================================
 * Interface for Emscripten export and other foreign hosts.
 *
 * Every call except mina_wallet_version returns a NUL-terminated JSON
 * envelope {"success":..,"data":..,"error":..} allocated with malloc.
 * Release it with mina_wallet_free. NULL is returned only when the
 * envelope itself cannot be allocated.
 * ============================================================================
 */
#ifndef MINAWALLET_WASM_EXPORTS_H
#define MINAWALLET_WASM_EXPORTS_H

#ifdef __EMSCRIPTEN__
#include <emscripten/emscripten.h>
#define MINAWALLET_EXPORT EMSCRIPTEN_KEEPALIVE
#elif defined(_WIN32)
#define MINAWALLET_EXPORT __declspec(dllexport)
#else
#define MINAWALLET_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* network: "mainnet" or "testnet", any case */
MINAWALLET_EXPORT char* mina_wallet_generate(const char* network);

MINAWALLET_EXPORT char* mina_wallet_import_hex(const char* secret_hex, const char* network);

MINAWALLET_EXPORT char* mina_wallet_import_base58(const char* secret_base58, const char* network);

MINAWALLET_EXPORT char* mina_wallet_validate_address(const char* address);

MINAWALLET_EXPORT char* mina_wallet_address_to_pubkey(const char* address);

/* Static string, do not free */
MINAWALLET_EXPORT const char* mina_wallet_version(void);

/* Wipes and frees a string returned by this API; NULL is ignored */
MINAWALLET_EXPORT void mina_wallet_free(char* json);

#ifdef __cplusplus
}
#endif

#endif /* MINAWALLET_WASM_EXPORTS_H */
