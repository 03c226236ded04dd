// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

/**
 * Configuration file and environment variable support.
 * Reads canary.conf from the data directory; CANARY_* environment
 * variables override file settings.
 */

#ifndef CANARY_UTIL_CONFIG_H
#define CANARY_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * Configuration file parser
 *
 * Supports:
 * - Key=value pairs
 * - Comments (# and ;)
 * - Section headers [section] (ignored)
 * - Environment variable overrides (CANARY_*)
 */
class CConfigParser {
private:
    std::multimap<std::string, std::string> m_settings;
    std::map<std::string, std::string> m_overrides;
    std::string m_config_file_path;
    bool m_loaded;

    static std::string Trim(const std::string& str);
    static std::string ToLower(std::string str);
    bool ParseLine(const std::string& line, std::string& key, std::string& value);
    static std::optional<std::string> GetEnv(const std::string& name);

    std::optional<std::string> Lookup(const std::string& key) const;

public:
    CConfigParser();

    /**
     * Load configuration from file
     * @param file_path Path to canary.conf
     * @return true if loaded successfully (or file doesn't exist), false on read error
     */
    bool LoadConfigFile(const std::string& file_path);

    /**
     * Parse settings from an in-memory buffer (same syntax as the file).
     */
    void LoadFromString(const std::string& contents);

    /**
     * Force a value, as a command-line argument does. Beats environment and file.
     */
    void SetOverride(const std::string& key, const std::string& value);

    /**
     * Get string value
     * Priority: Override > Environment variable > Config file > Default
     */
    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /**
     * Get boolean value
     * Supports: 1, 0, true, false, yes, no, on, off
     */
    bool GetBool(const std::string& key, bool default_value = false) const;

    bool IsSet(const std::string& key) const { return Lookup(key).has_value(); }
    bool IsLoaded() const { return m_loaded; }
    std::string GetConfigFilePath() const { return m_config_file_path; }
};

/**
 * @param datadir Data directory (if empty, uses default)
 * @return Path to canary.conf
 */
std::string GetConfigFilePath(const std::string& datadir = "");

/**
 * $HOME/.canary, falling back to the passwd entry and then the working directory
 */
std::string GetDefaultDataDir();

/**
 * Create a directory (mode 0700) if it does not exist yet.
 */
bool EnsureDataDir(const std::string& datadir);

#endif // CANARY_UTIL_CONFIG_H
