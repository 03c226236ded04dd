// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#ifndef CANARY_UTIL_LOGGING_H
#define CANARY_UTIL_LOGGING_H

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <memory>
#include <cstdint>

/**
 * Category/level logger shared by the vault, the session layer and the CLI.
 *
 * Secrets (PINs, wrapping keys, private keys) must never be passed to any of
 * the LogPrint* macros. Addresses and error kinds are fine.
 */

enum class LogCategory : uint32_t {
    NONE = 0,
    VAULT = (1 << 0),         // Vault state transitions
    SESSION = (1 << 1),       // Lifecycle events and listeners
    STORAGE = (1 << 2),       // Secure storage adapters
    CRYPTO = (1 << 3),        // Primitive failures (never key material)
    CONFIG = (1 << 4),        // canary.conf and environment
    ALL = 0xFFFFFFFF
};

/**
 * Log levels
 * Note: LVL_ prefix avoids clashing with an ERROR macro on some platforms
 */
enum class LogLevel {
    LVL_ERROR = 0,
    LVL_WARN = 1,
    LVL_INFO = 2,
    LVL_DEBUG = 3
};

class CLoggingConfig {
public:
    static CLoggingConfig& GetInstance();

    void EnableCategory(LogCategory category);
    void DisableCategory(LogCategory category);
    bool IsCategoryEnabled(LogCategory category) const;

    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const;

    // File logging
    void SetLogFile(const std::string& path);
    std::string GetLogFile() const;
    bool IsFileLoggingEnabled() const;

    // Console logging
    void SetConsoleLogging(bool enable);
    bool IsConsoleLoggingEnabled() const { return m_consoleLogging; }

    // Log rotation
    void SetMaxLogSize(size_t maxSize);
    size_t GetMaxLogSize() const;
    void SetMaxLogFiles(size_t maxFiles);
    size_t GetMaxLogFiles() const;

private:
    CLoggingConfig() = default;
    ~CLoggingConfig() = default;

    std::atomic<uint32_t> m_enabledCategories{static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<LogLevel> m_logLevel{LogLevel::LVL_INFO};
    std::string m_logFile;
    std::atomic<bool> m_consoleLogging{true};
    size_t m_maxLogSize{10 * 1024 * 1024};  // 10 MB default
    size_t m_maxLogFiles{10};
    mutable std::mutex m_configMutex;
};

/**
 * Parse a level name ("error", "warn", "info", "debug").
 * @return false if the name is unknown; level is left untouched
 */
bool ParseLogLevel(const std::string& name, LogLevel& level);

//! Same for category names ("vault", "session", "storage", "crypto", "config")
bool ParseLogCategory(const std::string& name, LogCategory& category);

class CLogger {
public:
    static CLogger& GetInstance();

    /**
     * Open the log file, if file logging is enabled.
     * @param datadir Directory that relative log file names are resolved against
     */
    bool Initialize(const std::string& datadir);

    void Shutdown();

    void Log(LogCategory category, LogLevel level, const std::string& message);
    void LogPrintFormat(LogCategory category, LogLevel level, const char* format, ...)
        __attribute__((format(printf, 4, 5)));

private:
    CLogger() = default;
    ~CLogger();

    void RotateLogIfNeeded();
    void WriteToFile(const std::string& message);
    void WriteToConsole(LogLevel level, const std::string& message);
    std::string FormatLogMsg(LogCategory category, LogLevel level, const std::string& message);

    std::unique_ptr<std::ofstream> m_logFile;
    std::string m_logPath;
    std::mutex m_logMutex;
    std::atomic<bool> m_initialized{false};
    size_t m_currentLogSize{0};
};

#define LogPrintf(category, level, format, ...) \
    CLogger::GetInstance().LogPrintFormat(LogCategory::category, LogLevel::LVL_##level, format, ##__VA_ARGS__)

#define LogPrintVault(level, format, ...) LogPrintf(VAULT, level, format, ##__VA_ARGS__)
#define LogPrintSession(level, format, ...) LogPrintf(SESSION, level, format, ##__VA_ARGS__)
#define LogPrintStorage(level, format, ...) LogPrintf(STORAGE, level, format, ##__VA_ARGS__)
#define LogPrintCrypto(level, format, ...) LogPrintf(CRYPTO, level, format, ##__VA_ARGS__)
#define LogPrintConfig(level, format, ...) LogPrintf(CONFIG, level, format, ##__VA_ARGS__)

#endif // CANARY_UTIL_LOGGING_H
