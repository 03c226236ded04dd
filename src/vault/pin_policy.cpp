// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <vault/pin_policy.h>

#include <stdexcept>

CPinPolicy::CPinPolicy(size_t length, bool digitsOnly)
    : m_length(length), m_digitsOnly(digitsOnly) {
    if (length < MIN_LENGTH || length > MAX_LENGTH) {
        throw std::invalid_argument("CPinPolicy: PIN length must be between " +
                                    std::to_string(MIN_LENGTH) + " and " +
                                    std::to_string(MAX_LENGTH));
    }
}

PinValidationResult CPinPolicy::Validate(const SecureString& pin) const {
    if (pin.size() != m_length) {
        return PinValidationResult(false, "PIN must be exactly " + Describe());
    }

    for (char c : pin) {
        if (m_digitsOnly) {
            if (c < '0' || c > '9') {
                return PinValidationResult(false, "PIN must contain digits only");
            }
        } else if (c <= ' ' || c > '~') {
            return PinValidationResult(false, "PIN contains an unsupported character");
        }
    }

    return PinValidationResult(true, "");
}

std::string CPinPolicy::Describe() const {
    return std::to_string(m_length) + (m_digitsOnly ? " digits" : " characters");
}
