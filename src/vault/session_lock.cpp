// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <vault/session_lock.h>
#include <session/session_manager.h>
#include <vault/vault.h>

std::function<void()> BindVaultToSession(CVault& vault, CSessionManager& session) {
    return session.AddListener([&vault](const SessionEvent& event) {
        if (event.type == SessionEventType::LOCKED) {
            vault.Lock();
        }
    });
}
