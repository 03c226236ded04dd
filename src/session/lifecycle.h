// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_SESSION_LIFECYCLE_H
#define CANARY_SESSION_LIFECYCLE_H

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

/**
 * Application lifecycle as reported by the host platform.
 * INACTIVE is treated the same as BACKGROUND (app switcher, lock screen).
 */
enum class AppLifecycleState {
    ACTIVE,
    BACKGROUND,
    INACTIVE
};

const char* AppLifecycleStateToString(AppLifecycleState state);

/**
 * Stream of lifecycle transitions. A session manager subscribes to exactly one.
 */
class ILifecycleSource {
public:
    using Handler = std::function<void(AppLifecycleState)>;

    virtual ~ILifecycleSource() = default;

    virtual AppLifecycleState GetCurrentState() const = 0;

    /**
     * Register a handler for future transitions.
     * @return Subscription id for Unsubscribe()
     */
    virtual uint64_t Subscribe(Handler handler) = 0;

    //! Unknown ids are ignored
    virtual void Unsubscribe(uint64_t id) = 0;
};

/**
 * In-process lifecycle source driven by explicit SetState() calls.
 * Used by the command-line tool and by tests to simulate OS signals.
 */
class CManualLifecycleSource : public ILifecycleSource {
public:
    explicit CManualLifecycleSource(AppLifecycleState initial = AppLifecycleState::ACTIVE);

    AppLifecycleState GetCurrentState() const override;
    uint64_t Subscribe(Handler handler) override;
    void Unsubscribe(uint64_t id) override;

    /**
     * Record a transition and deliver it synchronously to every subscriber.
     * Setting the current state again is not a transition and delivers nothing.
     */
    void SetState(AppLifecycleState state);

    size_t GetSubscriberCount() const;

private:
    mutable std::mutex cs_source;
    AppLifecycleState m_state;
    std::map<uint64_t, Handler> m_handlers;
    uint64_t nNextId;
};

#endif // CANARY_SESSION_LIFECYCLE_H
