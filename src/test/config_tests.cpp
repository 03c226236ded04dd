// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <storage/secure_storage.h>
#include <util/config.h>
#include <util/logging.h>
#include <vault/crypter.h>
#include <vault/vault_options.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace {

/**
 * Sets an environment variable for the lifetime of the object
 */
struct ScopedEnv {
    std::string name;
    std::optional<std::string> previous;

    ScopedEnv(const std::string& n, const std::string& value) : name(n) {
        const char* old = std::getenv(name.c_str());
        if (old != nullptr) {
            previous = std::string(old);
        }
        setenv(name.c_str(), value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (previous) {
            setenv(name.c_str(), previous->c_str(), 1);
        } else {
            unsetenv(name.c_str());
        }
    }
};

} // namespace

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_AUTO_TEST_CASE(parse_syntax) {
    CConfigParser config;
    config.LoadFromString(
        "# comment line\n"
        "; another comment\n"
        "[vault]\n"
        "  PinLength = 8   # trailing comment\n"
        "serviceid=\"quoted_id\"\n"
        "no equals sign here\n"
        "=missingkey\n"
        "kdfiterations=200000\n"
        "kdfiterations=250000\n");

    BOOST_CHECK(config.IsLoaded());
    BOOST_CHECK_EQUAL(config.GetInt64("pinlength"), 8);
    BOOST_CHECK_EQUAL(config.GetString("serviceid"), "quoted_id");
    // Last assignment wins
    BOOST_CHECK_EQUAL(config.GetInt64("kdfiterations"), 250000);
    BOOST_CHECK(!config.IsSet("no equals sign here"));
    BOOST_CHECK_EQUAL(config.GetString("missing", "fallback"), "fallback");
}

BOOST_AUTO_TEST_CASE(typed_getters) {
    CConfigParser config;
    config.LoadFromString(
        "a=1\nb=yes\nc=OFF\nd=maybe\n"
        "n=42\nneg=-7\nbad=12abc\nhuge=99999999999999999999999\n");

    BOOST_CHECK(config.GetBool("a"));
    BOOST_CHECK(config.GetBool("b"));
    BOOST_CHECK(!config.GetBool("c", true));
    BOOST_CHECK(config.GetBool("d", true));
    BOOST_CHECK(!config.GetBool("d", false));
    BOOST_CHECK(config.GetBool("unset", true));

    BOOST_CHECK_EQUAL(config.GetInt64("n"), 42);
    BOOST_CHECK_EQUAL(config.GetInt64("neg"), -7);
    BOOST_CHECK_EQUAL(config.GetInt64("bad", 5), 5);
    BOOST_CHECK_EQUAL(config.GetInt64("huge", 6), 6);
}

BOOST_AUTO_TEST_CASE(priority_override_env_file) {
    CConfigParser config;
    config.LoadFromString("serviceid=from_file\n");
    BOOST_CHECK_EQUAL(config.GetString("serviceid"), "from_file");

    {
        ScopedEnv env("CANARY_SERVICEID", "from_env");
        BOOST_CHECK_EQUAL(config.GetString("serviceid"), "from_env");

        config.SetOverride("ServiceId", "from_cli");
        BOOST_CHECK_EQUAL(config.GetString("serviceid"), "from_cli");
    }
    BOOST_CHECK_EQUAL(config.GetString("serviceid"), "from_cli");
}

BOOST_AUTO_TEST_CASE(missing_file_means_defaults) {
    CConfigParser config;
    std::string path = (std::filesystem::temp_directory_path() / "canary_no_such_dir_9f3a" / "canary.conf").string();
    BOOST_CHECK(config.LoadConfigFile(path));
    BOOST_CHECK(config.IsLoaded());
    BOOST_CHECK_EQUAL(config.GetInt64("pinlength", 6), 6);
}

BOOST_AUTO_TEST_CASE(load_file) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "canary_config_test.conf";
    {
        std::ofstream out(path);
        out << "pinlength=4\n";
        out << "printtoconsole=0\n";
    }

    CConfigParser config;
    BOOST_REQUIRE(config.LoadConfigFile(path.string()));
    BOOST_CHECK_EQUAL(config.GetConfigFilePath(), path.string());
    BOOST_CHECK_EQUAL(config.GetInt64("pinlength"), 4);
    BOOST_CHECK(!config.GetBool("printtoconsole", true));

    std::filesystem::remove(path);
}

BOOST_AUTO_TEST_CASE(config_file_path) {
    BOOST_CHECK_EQUAL(GetConfigFilePath("/var/lib/canary"), "/var/lib/canary/canary.conf");

    ScopedEnv home("HOME", "/home/tester");
    BOOST_CHECK_EQUAL(GetDefaultDataDir(), "/home/tester/.canary");
    BOOST_CHECK_EQUAL(GetConfigFilePath(), "/home/tester/.canary/canary.conf");
}

BOOST_AUTO_TEST_CASE(vault_options_defaults) {
    CConfigParser config;
    config.LoadFromString("");
    CVaultOptions options = CVaultOptions::FromConfig(config);

    BOOST_CHECK_EQUAL(options.pinPolicy.GetLength(), 6U);
    BOOST_CHECK(options.pinPolicy.IsDigitsOnly());
    BOOST_CHECK_EQUAL(options.nKdfIterations, VAULT_DEFAULT_KDF_ITERATIONS);
    BOOST_CHECK_EQUAL(options.strServiceId, DEFAULT_VAULT_SERVICE_ID);
}

BOOST_AUTO_TEST_CASE(vault_options_from_config) {
    CConfigParser config;
    config.LoadFromString(
        "pinlength=8\n"
        "pindigitsonly=0\n"
        "kdfiterations=200000\n"
        "serviceid=test_bundle\n");
    CVaultOptions options = CVaultOptions::FromConfig(config);

    BOOST_CHECK_EQUAL(options.pinPolicy.GetLength(), 8U);
    BOOST_CHECK(!options.pinPolicy.IsDigitsOnly());
    BOOST_CHECK_EQUAL(options.nKdfIterations, 200000U);
    BOOST_CHECK_EQUAL(options.strServiceId, "test_bundle");
}

BOOST_AUTO_TEST_CASE(vault_options_reject_out_of_range) {
    CConfigParser config;
    config.LoadFromString(
        "pinlength=2\n"
        "kdfiterations=1000\n"
        "serviceid=../escape\n");
    CVaultOptions options = CVaultOptions::FromConfig(config);

    BOOST_CHECK_EQUAL(options.pinPolicy.GetLength(), CPinPolicy::DEFAULT_LENGTH);
    BOOST_CHECK_EQUAL(options.nKdfIterations, VAULT_DEFAULT_KDF_ITERATIONS);
    BOOST_CHECK_EQUAL(options.strServiceId, DEFAULT_VAULT_SERVICE_ID);

    CConfigParser tooSlow;
    tooSlow.LoadFromString("kdfiterations=300001\n");
    BOOST_CHECK_EQUAL(CVaultOptions::FromConfig(tooSlow).nKdfIterations, VAULT_DEFAULT_KDF_ITERATIONS);

    CConfigParser bounds;
    bounds.LoadFromString("kdfiterations=300000\n");
    BOOST_CHECK_EQUAL(CVaultOptions::FromConfig(bounds).nKdfIterations, VAULT_MAX_KDF_ITERATIONS);
}

BOOST_AUTO_TEST_CASE(log_level_names) {
    LogLevel level = LogLevel::LVL_INFO;
    BOOST_CHECK(ParseLogLevel("debug", level));
    BOOST_CHECK(level == LogLevel::LVL_DEBUG);
    BOOST_CHECK(ParseLogLevel("WARN", level));
    BOOST_CHECK(level == LogLevel::LVL_WARN);
    BOOST_CHECK(!ParseLogLevel("verbose", level));
    BOOST_CHECK(level == LogLevel::LVL_WARN);
}

BOOST_AUTO_TEST_CASE(log_category_names_and_filter) {
    LogCategory category = LogCategory::NONE;
    BOOST_CHECK(ParseLogCategory("Storage", category));
    BOOST_CHECK(category == LogCategory::STORAGE);
    BOOST_CHECK(!ParseLogCategory("net", category));
    BOOST_CHECK(category == LogCategory::STORAGE);

    CLoggingConfig& logConfig = CLoggingConfig::GetInstance();
    logConfig.DisableCategory(LogCategory::STORAGE);
    BOOST_CHECK(!logConfig.IsCategoryEnabled(LogCategory::STORAGE));
    BOOST_CHECK(logConfig.IsCategoryEnabled(LogCategory::VAULT));
    logConfig.EnableCategory(LogCategory::STORAGE);
    BOOST_CHECK(logConfig.IsCategoryEnabled(LogCategory::STORAGE));

    const size_t oldSize = logConfig.GetMaxLogSize();
    const size_t oldFiles = logConfig.GetMaxLogFiles();
    logConfig.SetMaxLogSize(1024);
    logConfig.SetMaxLogFiles(3);
    BOOST_CHECK_EQUAL(logConfig.GetMaxLogSize(), 1024u);
    BOOST_CHECK_EQUAL(logConfig.GetMaxLogFiles(), 3u);
    logConfig.SetMaxLogSize(oldSize);
    logConfig.SetMaxLogFiles(oldFiles);
}

BOOST_AUTO_TEST_SUITE_END()
