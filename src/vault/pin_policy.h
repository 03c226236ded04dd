// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_VAULT_PIN_POLICY_H
#define CANARY_VAULT_PIN_POLICY_H

#include <util/secure_allocator.h>

#include <cstddef>
#include <string>

struct PinValidationResult {
    bool is_valid;
    std::string error_message;

    PinValidationResult() : is_valid(false) {}
    PinValidationResult(bool valid, const std::string& error)
        : is_valid(valid), error_message(error) {}
};

/**
 * PIN format policy
 *
 * Product policy, not a cryptographic requirement. The default is exactly
 * six ASCII digits. With digits_only disabled any printable ASCII character
 * except space is accepted. Error messages never echo the PIN.
 */
class CPinPolicy {
public:
    static constexpr size_t DEFAULT_LENGTH = 6;
    static constexpr size_t MIN_LENGTH = 4;
    static constexpr size_t MAX_LENGTH = 64;

    CPinPolicy() : m_length(DEFAULT_LENGTH), m_digitsOnly(true) {}
    CPinPolicy(size_t length, bool digitsOnly);

    PinValidationResult Validate(const SecureString& pin) const;
    bool IsValid(const SecureString& pin) const { return Validate(pin).is_valid; }

    size_t GetLength() const { return m_length; }
    bool IsDigitsOnly() const { return m_digitsOnly; }

    //! "6 digits", "8 characters"
    std::string Describe() const;

private:
    size_t m_length;
    bool m_digitsOnly;
};

#endif // CANARY_VAULT_PIN_POLICY_H
