// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

static const char* const ENV_PREFIX = "CANARY_";

CConfigParser::CConfigParser() : m_loaded(false) {
}

std::string CConfigParser::Trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string CConfigParser::ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), ::tolower);
    return str;
}

bool CConfigParser::ParseLine(const std::string& line, std::string& key, std::string& value) {
    std::string clean_line = line;
    size_t comment_pos = clean_line.find_first_of("#;");
    if (comment_pos != std::string::npos) {
        clean_line = clean_line.substr(0, comment_pos);
    }

    clean_line = Trim(clean_line);
    if (clean_line.empty()) {
        return false;
    }

    if (clean_line[0] == '[' && clean_line.back() == ']') {
        return false;
    }

    size_t eq_pos = clean_line.find('=');
    if (eq_pos == std::string::npos) {
        return false;
    }

    key = Trim(clean_line.substr(0, eq_pos));
    value = Trim(clean_line.substr(eq_pos + 1));

    if (value.length() >= 2 && value[0] == '"' && value.back() == '"') {
        value = value.substr(1, value.length() - 2);
    }

    return !key.empty();
}

std::optional<std::string> CConfigParser::GetEnv(const std::string& name) {
    const char* env_value = std::getenv(name.c_str());
    if (env_value == nullptr) {
        return std::nullopt;
    }
    return std::string(env_value);
}

bool CConfigParser::LoadConfigFile(const std::string& file_path) {
    m_config_file_path = file_path;
    m_settings.clear();
    m_loaded = false;

    struct stat file_stat;
    if (lstat(file_path.c_str(), &file_stat) != 0) {
        if (errno == ENOENT) {
            LogPrintConfig(DEBUG, "Config file not found: %s (using defaults)", file_path.c_str());
            m_loaded = true;
            return true;
        }
        LogPrintConfig(ERROR, "Cannot stat config file %s: %s", file_path.c_str(), strerror(errno));
        return false;
    }

    mode_t mode = file_stat.st_mode;
    if (S_ISLNK(mode)) {
        LogPrintConfig(WARN, "Config file %s is a symlink", file_path.c_str());
    }
    if (mode & (S_IWGRP | S_IWOTH)) {
        LogPrintConfig(WARN, "Config file %s is writable by other users (mode %o)",
                       file_path.c_str(), static_cast<unsigned>(mode & 0777));
        LogPrintConfig(WARN, "Consider: chmod 600 %s", file_path.c_str());
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        LogPrintConfig(ERROR, "Cannot open config file %s", file_path.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        LogPrintConfig(ERROR, "Error while reading config file %s", file_path.c_str());
        return false;
    }

    LoadFromString(buffer.str());
    if (!m_settings.empty()) {
        LogPrintConfig(INFO, "Loaded configuration from %s (%zu settings)",
                       file_path.c_str(), m_settings.size());
    }
    return true;
}

void CConfigParser::LoadFromString(const std::string& contents) {
    std::istringstream stream(contents);
    std::string line;
    while (std::getline(stream, line)) {
        std::string key, value;
        if (ParseLine(line, key, value)) {
            key = ToLower(key);
            m_settings.emplace(key, value);
            LogPrintConfig(DEBUG, "Config: %s = %s", key.c_str(), value.c_str());
        }
    }
    m_loaded = true;
}

void CConfigParser::SetOverride(const std::string& key, const std::string& value) {
    m_overrides[ToLower(key)] = value;
}

std::optional<std::string> CConfigParser::Lookup(const std::string& key) const {
    const std::string key_lower = ToLower(key);

    auto ov = m_overrides.find(key_lower);
    if (ov != m_overrides.end()) {
        return ov->second;
    }

    std::string env_key = ENV_PREFIX + key;
    std::transform(env_key.begin(), env_key.end(), env_key.begin(), ::toupper);
    auto env_value = GetEnv(env_key);
    if (env_value.has_value()) {
        LogPrintConfig(DEBUG, "Config: %s = %s (from environment)",
                       key_lower.c_str(), env_value->c_str());
        return env_value;
    }

    // Last assignment in the file wins
    auto range = m_settings.equal_range(key_lower);
    if (range.first != range.second) {
        auto last = range.second;
        --last;
        return last->second;
    }

    return std::nullopt;
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    auto value = Lookup(key);
    return value.has_value() ? *value : default_value;
}

int64_t CConfigParser::GetInt64(const std::string& key, int64_t default_value) const {
    std::string value = GetString(key, "");
    if (value.empty()) {
        return default_value;
    }

    try {
        size_t pos = 0;
        int64_t parsed = std::stoll(value, &pos);
        if (pos == value.size()) {
            return parsed;
        }
    } catch (const std::exception&) {
        // fall through to the warning below
    }

    LogPrintConfig(WARN, "Config: Invalid integer value for %s: %s (using default: %lld)",
                   key.c_str(), value.c_str(), static_cast<long long>(default_value));
    return default_value;
}

bool CConfigParser::GetBool(const std::string& key, bool default_value) const {
    std::string value = ToLower(GetString(key, ""));
    if (value.empty()) {
        return default_value;
    }

    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }

    LogPrintConfig(WARN, "Config: Invalid boolean value for %s: %s (using default: %s)",
                   key.c_str(), value.c_str(), default_value ? "true" : "false");
    return default_value;
}

std::string GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pwd = getpwuid(getuid());
        if (pwd != nullptr) {
            home = pwd->pw_dir;
        }
    }

    if (home != nullptr) {
        return std::string(home) + "/.canary";
    }
    return ".canary";
}

std::string GetConfigFilePath(const std::string& datadir) {
    std::string dir = datadir.empty() ? GetDefaultDataDir() : datadir;
    return dir + "/canary.conf";
}

bool EnsureDataDir(const std::string& datadir) {
    struct stat st;
    if (stat(datadir.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            LogPrintConfig(ERROR, "Data directory %s exists but is not a directory", datadir.c_str());
            return false;
        }
        return true;
    }
    if (mkdir(datadir.c_str(), 0700) != 0 && errno != EEXIST) {
        LogPrintConfig(ERROR, "Cannot create data directory %s: %s", datadir.c_str(), strerror(errno));
        return false;
    }
    return true;
}
