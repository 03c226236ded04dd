// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_VAULT_SESSION_LOCK_H
#define CANARY_VAULT_SESSION_LOCK_H

#include <functional>

class CSessionManager;
class CVault;

/**
 * Lock vault on every LOCKED event from session. The vault is locked before
 * the event dispatch returns.
 *
 * @return Unsubscribe function; call it before vault is destroyed
 */
std::function<void()> BindVaultToSession(CVault& vault, CSessionManager& session);

#endif // CANARY_VAULT_SESSION_LOCK_H
