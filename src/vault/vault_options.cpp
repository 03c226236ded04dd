// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <vault/vault_options.h>
#include <util/config.h>
#include <util/logging.h>

CVaultOptions CVaultOptions::FromConfig(const CConfigParser& config) {
    CVaultOptions options;

    int64_t pinLength = config.GetInt64("pinlength", CPinPolicy::DEFAULT_LENGTH);
    bool digitsOnly = config.GetBool("pindigitsonly", true);
    if (pinLength < static_cast<int64_t>(CPinPolicy::MIN_LENGTH) ||
        pinLength > static_cast<int64_t>(CPinPolicy::MAX_LENGTH)) {
        LogPrintConfig(WARN, "pinlength=%lld is outside [%zu, %zu], using %zu",
                       static_cast<long long>(pinLength), CPinPolicy::MIN_LENGTH,
                       CPinPolicy::MAX_LENGTH, CPinPolicy::DEFAULT_LENGTH);
        pinLength = CPinPolicy::DEFAULT_LENGTH;
    }
    options.pinPolicy = CPinPolicy(static_cast<size_t>(pinLength), digitsOnly);

    int64_t iterations = config.GetInt64("kdfiterations", VAULT_DEFAULT_KDF_ITERATIONS);
    if (iterations < VAULT_MIN_KDF_ITERATIONS || iterations > VAULT_MAX_KDF_ITERATIONS) {
        LogPrintConfig(WARN, "kdfiterations=%lld is outside [%u, %u], using %u",
                       static_cast<long long>(iterations), VAULT_MIN_KDF_ITERATIONS,
                       VAULT_MAX_KDF_ITERATIONS, VAULT_DEFAULT_KDF_ITERATIONS);
        iterations = VAULT_DEFAULT_KDF_ITERATIONS;
    }
    options.nKdfIterations = static_cast<uint32_t>(iterations);

    std::string serviceId = config.GetString("serviceid", DEFAULT_VAULT_SERVICE_ID);
    if (!IsValidServiceId(serviceId)) {
        LogPrintConfig(WARN, "serviceid \"%s\" is not a valid identifier, using %s",
                       serviceId.c_str(), DEFAULT_VAULT_SERVICE_ID);
        serviceId = DEFAULT_VAULT_SERVICE_ID;
    }
    options.strServiceId = serviceId;

    return options;
}
