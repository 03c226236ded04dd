// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <session/session_manager.h>
#include <util/logging.h>

#include <exception>

static int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

const char* SessionEventTypeToString(SessionEventType type) {
    switch (type) {
        case SessionEventType::LOCKED: return "locked";
        case SessionEventType::BACKGROUND: return "background";
        case SessionEventType::FOREGROUND: return "foreground";
    }
    return "unknown";
}

CSessionManager::CSessionManager(ILifecycleSource& source)
    : m_source(source),
      m_registry(std::make_shared<ListenerRegistry>()),
      fActive(false) {
}

CSessionManager::~CSessionManager() {
    Stop();
}

void CSessionManager::Start() {
    {
        std::lock_guard<std::mutex> lock(cs_session);
        if (fActive) {
            return;
        }
        fActive = true;
        m_backgroundSince.reset();
        m_subscription = m_source.Subscribe([this](AppLifecycleState state) {
            HandleLifecycleChange(state);
        });
    }
    LogPrintSession(INFO, "Session manager started");

    // Subscribed first so a transition racing with this check is not lost
    AppLifecycleState current = m_source.GetCurrentState();
    if (current != AppLifecycleState::ACTIVE) {
        HandleLifecycleChange(current);
    }
}

void CSessionManager::Stop() {
    std::optional<uint64_t> subscription;
    {
        std::lock_guard<std::mutex> lock(cs_session);
        if (!fActive) {
            return;
        }
        fActive = false;
        m_backgroundSince.reset();
        subscription.swap(m_subscription);
    }
    if (subscription) {
        m_source.Unsubscribe(*subscription);
    }
    LogPrintSession(INFO, "Session manager stopped");
}

std::function<void()> CSessionManager::AddListener(Listener listener) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(m_registry->cs);
        id = m_registry->nNextId++;
        m_registry->listeners.emplace_back(id, std::move(listener));
    }

    std::weak_ptr<ListenerRegistry> weak = m_registry;
    return [weak, id]() {
        std::shared_ptr<ListenerRegistry> registry = weak.lock();
        if (!registry) {
            return;
        }
        std::lock_guard<std::mutex> lock(registry->cs);
        auto& listeners = registry->listeners;
        for (auto it = listeners.begin(); it != listeners.end(); ++it) {
            if (it->first == id) {
                listeners.erase(it);
                break;
            }
        }
    };
}

void CSessionManager::TriggerLock() {
    Notify(SessionEvent{SessionEventType::LOCKED, GetTimeMillis()});
}

bool CSessionManager::IsActive() const {
    std::lock_guard<std::mutex> lock(cs_session);
    return fActive;
}

bool CSessionManager::IsInBackground() const {
    std::lock_guard<std::mutex> lock(cs_session);
    return m_backgroundSince.has_value();
}

std::optional<std::chrono::milliseconds> CSessionManager::GetBackgroundDuration() const {
    std::lock_guard<std::mutex> lock(cs_session);
    if (!m_backgroundSince) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - *m_backgroundSince);
}

void CSessionManager::HandleLifecycleChange(AppLifecycleState state) {
    bool emitBackground = false;
    bool emitForeground = false;
    {
        std::lock_guard<std::mutex> lock(cs_session);
        if (!fActive) {
            return;
        }
        if (state == AppLifecycleState::BACKGROUND || state == AppLifecycleState::INACTIVE) {
            m_backgroundSince = std::chrono::steady_clock::now();
            emitBackground = true;
        } else if (m_backgroundSince) {
            m_backgroundSince.reset();
            emitForeground = true;
        }
    }

    if (emitBackground) {
        LogPrintSession(INFO, "App left the foreground (%s), locking session", AppLifecycleStateToString(state));
        int64_t now = GetTimeMillis();
        Notify(SessionEvent{SessionEventType::BACKGROUND, now});
        TriggerLock();
    } else if (emitForeground) {
        LogPrintSession(DEBUG, "App returned to the foreground");
        Notify(SessionEvent{SessionEventType::FOREGROUND, GetTimeMillis()});
    }
}

void CSessionManager::Notify(const SessionEvent& event) {
    // Snapshot so a listener can remove itself or others during dispatch
    std::vector<std::pair<uint64_t, Listener>> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_registry->cs);
        snapshot = m_registry->listeners;
    }

    for (size_t i = 0; i < snapshot.size(); ++i) {
        try {
            snapshot[i].second(event);
        } catch (const std::exception& e) {
            LogPrintSession(ERROR, "Listener %zu threw exception on %s event: %s",
                            i, SessionEventTypeToString(event.type), e.what());
        } catch (...) {
            LogPrintSession(ERROR, "Listener %zu threw unknown exception on %s event",
                            i, SessionEventTypeToString(event.type));
        }
    }
}
