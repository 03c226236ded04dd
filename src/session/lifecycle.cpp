// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <session/lifecycle.h>
#include <util/logging.h>

#include <exception>
#include <vector>

const char* AppLifecycleStateToString(AppLifecycleState state) {
    switch (state) {
        case AppLifecycleState::ACTIVE: return "active";
        case AppLifecycleState::BACKGROUND: return "background";
        case AppLifecycleState::INACTIVE: return "inactive";
    }
    return "unknown";
}

CManualLifecycleSource::CManualLifecycleSource(AppLifecycleState initial)
    : m_state(initial), nNextId(1) {
}

AppLifecycleState CManualLifecycleSource::GetCurrentState() const {
    std::lock_guard<std::mutex> lock(cs_source);
    return m_state;
}

uint64_t CManualLifecycleSource::Subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(cs_source);
    uint64_t id = nNextId++;
    m_handlers.emplace(id, std::move(handler));
    return id;
}

void CManualLifecycleSource::Unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(cs_source);
    m_handlers.erase(id);
}

void CManualLifecycleSource::SetState(AppLifecycleState state) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(cs_source);
        if (state == m_state) {
            return;
        }
        m_state = state;
        handlers.reserve(m_handlers.size());
        for (const auto& entry : m_handlers) {
            handlers.push_back(entry.second);
        }
    }

    LogPrintSession(DEBUG, "Lifecycle transition to %s", AppLifecycleStateToString(state));

    // Handlers run without cs_source so they may subscribe or unsubscribe
    for (const Handler& handler : handlers) {
        try {
            handler(state);
        } catch (const std::exception& e) {
            LogPrintSession(ERROR, "Lifecycle handler threw exception: %s", e.what());
        } catch (...) {
            LogPrintSession(ERROR, "Lifecycle handler threw unknown exception");
        }
    }
}

size_t CManualLifecycleSource::GetSubscriberCount() const {
    std::lock_guard<std::mutex> lock(cs_source);
    return m_handlers.size();
}
