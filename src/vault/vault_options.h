// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_VAULT_VAULT_OPTIONS_H
#define CANARY_VAULT_VAULT_OPTIONS_H

#include <storage/secure_storage.h>
#include <vault/crypter.h>
#include <vault/pin_policy.h>

#include <cstdint>
#include <string>

class CConfigParser;

/**
 * Tunables of one vault instance.
 *
 * Config keys (canary.conf or CANARY_<KEY>):
 *   pinlength       exact PIN length (default 6)
 *   pindigitsonly   digits only (default 1)
 *   kdfiterations   PBKDF2 iterations for new bundles (default 150000)
 *   serviceid       storage identifier (default canary_eth_key_bundle)
 */
struct CVaultOptions {
    CPinPolicy pinPolicy;
    uint32_t nKdfIterations;
    std::string strServiceId;

    CVaultOptions()
        : nKdfIterations(VAULT_DEFAULT_KDF_ITERATIONS),
          strServiceId(DEFAULT_VAULT_SERVICE_ID) {}

    /**
     * Read options from a parsed config. Out-of-range values are logged and
     * replaced by their defaults.
     */
    static CVaultOptions FromConfig(const CConfigParser& config);
};

#endif // CANARY_VAULT_VAULT_OPTIONS_H
