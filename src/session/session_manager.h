// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_SESSION_SESSION_MANAGER_H
#define CANARY_SESSION_SESSION_MANAGER_H

#include <session/lifecycle.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

enum class SessionEventType {
    LOCKED,
    BACKGROUND,
    FOREGROUND
};

const char* SessionEventTypeToString(SessionEventType type);

struct SessionEvent {
    SessionEventType type;
    int64_t timestamp;      // Milliseconds since the Unix epoch
};

/**
 * CSessionManager
 *
 * Turns lifecycle transitions into session events. Leaving the foreground
 * emits BACKGROUND immediately followed by LOCKED, with no grace period.
 * Returning to the foreground emits FOREGROUND and never unlocks anything.
 *
 * Listeners are called synchronously, in registration order, on the thread
 * that delivered the transition. A listener that throws is logged and the
 * remaining listeners still run.
 */
class CSessionManager {
public:
    using Listener = std::function<void(const SessionEvent&)>;

    explicit CSessionManager(ILifecycleSource& source);
    ~CSessionManager();

    CSessionManager(const CSessionManager&) = delete;
    CSessionManager& operator=(const CSessionManager&) = delete;

    /**
     * Subscribe to the lifecycle source. If the app is already in the
     * background, BACKGROUND and LOCKED are emitted before returning.
     * No-op while active.
     */
    void Start();

    //! Unsubscribe and forget any background period. No-op while inactive.
    void Stop();

    /**
     * Register a listener.
     * @return Function that removes exactly this listener; safe to call more
     *         than once and after the manager is gone
     */
    std::function<void()> AddListener(Listener listener);

    //! Emit LOCKED now, whether or not the manager is active
    void TriggerLock();

    bool IsActive() const;
    bool IsInBackground() const;

    //! Time since the app left the foreground, std::nullopt in the foreground
    std::optional<std::chrono::milliseconds> GetBackgroundDuration() const;

private:
    struct ListenerRegistry {
        std::mutex cs;
        std::vector<std::pair<uint64_t, Listener>> listeners;
        uint64_t nNextId{1};
    };

    ILifecycleSource& m_source;
    std::shared_ptr<ListenerRegistry> m_registry;

    mutable std::mutex cs_session;
    bool fActive;
    std::optional<uint64_t> m_subscription;
    std::optional<std::chrono::steady_clock::time_point> m_backgroundSince;

    void HandleLifecycleChange(AppLifecycleState state);
    void Notify(const SessionEvent& event);
};

#endif // CANARY_SESSION_SESSION_MANAGER_H
