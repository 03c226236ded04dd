// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license
// Command-line front end for the local key vault

#include <session/lifecycle.h>
#include <session/session_manager.h>
#include <storage/secure_storage.h>
#include <util/config.h>
#include <util/logging.h>
#include <util/secure_allocator.h>
#include <vault/session_lock.h>
#include <vault/vault.h>
#include <vault/vault_errors.h>
#include <vault/vault_options.h>

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

static const int EXIT_OK = 0;
static const int EXIT_USAGE = 1;
static const int EXIT_VAULT_ERROR = 2;

// Settings that may also be given as --<key>=<value>, overriding canary.conf and CANARY_*
static const char* const OVERRIDABLE_KEYS[] = {
    "pinlength", "pindigitsonly", "kdfiterations", "serviceid", "storagedir",
    "loglevel", "printtoconsole", "debuglogfile", "debugexclude", "maxlogsize",
    "maxlogfiles",
};

struct VaultToolConfig {
    std::string datadir;
    std::string conf;
    std::string command;
    bool confirm_reset = false;
    std::vector<std::pair<std::string, std::string>> overrides;

    static bool IsOverridableKey(const std::string& key) {
        for (const char* known : OVERRIDABLE_KEYS) {
            if (key == known) return true;
        }
        return false;
    }

    bool ParseArgs(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);

            if (arg.find("--datadir=") == 0) {
                datadir = arg.substr(10);
            }
            else if (arg.find("--conf=") == 0) {
                conf = arg.substr(7);
            }
            else if (arg == "--yes") {
                confirm_reset = true;
            }
            else if (arg == "--help" || arg == "-h") {
                return false;
            }
            else if (arg.find("--") == 0 && arg.find('=') != std::string::npos &&
                     IsOverridableKey(arg.substr(2, arg.find('=') - 2))) {
                size_t eq = arg.find('=');
                overrides.emplace_back(arg.substr(2, eq - 2), arg.substr(eq + 1));
            }
            else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }
            else if (command.empty()) {
                command = arg;
            }
            else {
                std::cerr << "Unexpected argument: " << arg << std::endl;
                return false;
            }
        }
        if (command.empty()) {
            std::cerr << "Missing command" << std::endl;
            return false;
        }
        return true;
    }

    void PrintUsage(const char* program) {
        std::cout << "Canary Vault - PIN-protected local signing key" << std::endl;
        std::cout << std::endl;
        std::cout << "Usage: " << program << " [options] <command>" << std::endl;
        std::cout << std::endl;
        std::cout << "Commands:" << std::endl;
        std::cout << "  create                Generate a new key and protect it with a PIN" << std::endl;
        std::cout << "  import                Protect an existing hex private key with a PIN" << std::endl;
        std::cout << "  unlock                Check a PIN against the stored key" << std::endl;
        std::cout << "  change-pin            Re-protect the stored key under a new PIN" << std::endl;
        std::cout << "  reset                 Delete the stored key (requires --yes)" << std::endl;
        std::cout << "  address               Print the stored address" << std::endl;
        std::cout << "  status                Print vault state and settings" << std::endl;
        std::cout << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --datadir=<path>      Data directory (default: ~/.canary)" << std::endl;
        std::cout << "  --conf=<file>         Configuration file (default: <datadir>/canary.conf)" << std::endl;
        std::cout << "  --yes                 Confirm a reset" << std::endl;
        std::cout << "  --<key>=<value>       Override a configuration key (see below)" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
        std::cout << std::endl;
        std::cout << "PINs and private keys are read from standard input, one per line." << std::endl;
        std::cout << std::endl;
        std::cout << "Configuration:" << std::endl;
        std::cout << "  Keys: pinlength, pindigitsonly, kdfiterations, serviceid, storagedir," << std::endl;
        std::cout << "        loglevel, printtoconsole, debuglogfile, debugexclude," << std::endl;
        std::cout << "        maxlogsize (MB), maxlogfiles" << std::endl;
        std::cout << "  Environment variables: CANARY_* (e.g., CANARY_KDFITERATIONS=200000)" << std::endl;
        std::cout << "  Priority: Command-line > Environment > Config file > Default" << std::endl;
    }
};

/**
 * Read one line of secret input without it passing through a plain std::string.
 * The prompt goes to stderr and only when stdin is a terminal.
 */
static bool ReadSecretLine(const char* prompt, SecureString& secret) {
    secret.clear();
    secret.reserve(128);
    if (isatty(STDIN_FILENO)) {
        std::cerr << prompt << std::flush;
    }

    int c;
    while ((c = std::getchar()) != EOF) {
        if (c == '\n') {
            break;
        }
        secret.push_back(static_cast<char>(c));
    }
    if (!secret.empty() && secret.back() == '\r') {
        secret.pop_back();
    }
    return c != EOF || !secret.empty();
}

static bool ReadNewPin(SecureString& pin) {
    SecureString confirm;
    if (!ReadSecretLine("New PIN: ", pin) || !ReadSecretLine("Confirm PIN: ", confirm)) {
        std::cerr << "Error: Expected a PIN on standard input" << std::endl;
        return false;
    }
    if (pin != confirm) {
        std::cerr << "Error: PINs do not match" << std::endl;
        return false;
    }
    return true;
}

static int ReportVaultError(const char* action, VaultError err) {
    std::cerr << "Error: " << action << " failed: " << GetVaultErrorMessage(err) << std::endl;
    if (err == VaultError::DATA_CORRUPTION) {
        std::cerr << "The stored key bundle is damaged. Run 'reset --yes' and import the key from a backup." << std::endl;
    }
    return EXIT_VAULT_ERROR;
}

static void SetupLogging(const CConfigParser& config, const std::string& datadir) {
    CLoggingConfig& logConfig = CLoggingConfig::GetInstance();

    LogLevel level = LogLevel::LVL_INFO;
    std::string levelName = config.GetString("loglevel", "info");
    if (!ParseLogLevel(levelName, level)) {
        std::cerr << "Warning: Unknown loglevel '" << levelName << "', using info" << std::endl;
    }
    logConfig.SetLogLevel(level);
    logConfig.SetConsoleLogging(config.GetBool("printtoconsole", false));
    logConfig.SetLogFile(config.GetString("debuglogfile", "debug.log"));

    // debugexclude=storage,config
    std::stringstream excluded(config.GetString("debugexclude", ""));
    std::string name;
    while (std::getline(excluded, name, ',')) {
        if (name.empty()) continue;
        LogCategory category;
        if (ParseLogCategory(name, category)) {
            logConfig.DisableCategory(category);
        } else {
            std::cerr << "Warning: Unknown log category '" << name << "' in debugexclude" << std::endl;
        }
    }

    int64_t maxSizeMB = config.GetInt64("maxlogsize", 10);
    if (maxSizeMB > 0) {
        logConfig.SetMaxLogSize(static_cast<size_t>(maxSizeMB) * 1024 * 1024);
    }
    int64_t maxFiles = config.GetInt64("maxlogfiles", 10);
    if (maxFiles > 0) {
        logConfig.SetMaxLogFiles(static_cast<size_t>(maxFiles));
    }

    if (!CLogger::GetInstance().Initialize(datadir)) {
        std::cerr << "Warning: Could not open log file, continuing without file logging" << std::endl;
    }
}

static int RunCommand(const VaultToolConfig& args, CVault& vault) {
    const std::string& command = args.command;
    std::string address;

    if (command == "create") {
        SecureString pin;
        if (!ReadNewPin(pin)) {
            return EXIT_USAGE;
        }
        VaultError err = vault.CreateVault(pin, address);
        if (err != VaultError::OK) {
            return ReportVaultError("create", err);
        }
        std::cout << address << std::endl;
        return EXIT_OK;
    }

    if (command == "import") {
        SecureString keyHex;
        SecureString pin;
        if (!ReadSecretLine("Private key (hex): ", keyHex)) {
            std::cerr << "Error: Expected a private key on standard input" << std::endl;
            return EXIT_USAGE;
        }
        if (!ReadNewPin(pin)) {
            return EXIT_USAGE;
        }
        VaultError err = vault.ImportVault(keyHex, pin, address);
        if (err != VaultError::OK) {
            return ReportVaultError("import", err);
        }
        std::cout << address << std::endl;
        return EXIT_OK;
    }

    if (command == "unlock") {
        SecureString pin;
        if (!ReadSecretLine("PIN: ", pin)) {
            std::cerr << "Error: Expected a PIN on standard input" << std::endl;
            return EXIT_USAGE;
        }
        VaultError err = vault.Unlock(pin, &address);
        if (err != VaultError::OK) {
            return ReportVaultError("unlock", err);
        }
        std::cout << address << std::endl;
        return EXIT_OK;
    }

    if (command == "change-pin") {
        SecureString currentPin;
        SecureString newPin;
        if (!ReadSecretLine("Current PIN: ", currentPin)) {
            std::cerr << "Error: Expected a PIN on standard input" << std::endl;
            return EXIT_USAGE;
        }
        if (!ReadNewPin(newPin)) {
            return EXIT_USAGE;
        }
        VaultError err = vault.ChangePin(currentPin, newPin);
        if (err != VaultError::OK) {
            return ReportVaultError("change-pin", err);
        }
        std::cout << "PIN changed" << std::endl;
        return EXIT_OK;
    }

    if (command == "reset") {
        if (!args.confirm_reset) {
            std::cerr << "Error: reset deletes the stored key; pass --yes to confirm" << std::endl;
            return EXIT_USAGE;
        }
        VaultError err = vault.Reset();
        if (err != VaultError::OK) {
            return ReportVaultError("reset", err);
        }
        std::cout << "Vault reset" << std::endl;
        return EXIT_OK;
    }

    if (command == "address") {
        std::optional<std::string> stored;
        VaultError err = vault.GetAddress(stored);
        if (err != VaultError::OK) {
            return ReportVaultError("address", err);
        }
        if (!stored) {
            return ReportVaultError("address", VaultError::NO_VAULT_FOUND);
        }
        std::cout << *stored << std::endl;
        return EXIT_OK;
    }

    if (command == "status") {
        std::optional<std::string> stored;
        VaultError err = vault.GetAddress(stored);
        const CVaultOptions& options = vault.GetOptions();

        std::cout << "state:          " << VaultStateToString(vault.GetState()) << std::endl;
        std::cout << "address:        " << (stored ? *stored : std::string("-")) << std::endl;
        std::cout << "bundle:         " << GetVaultErrorName(err) << std::endl;
        std::cout << "serviceid:      " << options.strServiceId << std::endl;
        std::cout << "pin:            " << options.pinPolicy.Describe() << std::endl;
        std::cout << "kdfiterations:  " << options.nKdfIterations << std::endl;
        return err == VaultError::OK ? EXIT_OK : EXIT_VAULT_ERROR;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    return EXIT_USAGE;
}

int main(int argc, char* argv[]) {
    // Unbuffered, so PIN lines are not left behind in the stdio buffer
    std::setvbuf(stdin, nullptr, _IONBF, 0);

    VaultToolConfig args;
    if (!args.ParseArgs(argc, argv)) {
        args.PrintUsage(argv[0]);
        return EXIT_USAGE;
    }

    std::string datadir = args.datadir.empty() ? GetDefaultDataDir() : args.datadir;
    if (!EnsureDataDir(datadir)) {
        std::cerr << "ERROR: Cannot create data directory: " << datadir << std::endl;
        return EXIT_USAGE;
    }

    std::string config_file = args.conf.empty() ? GetConfigFilePath(datadir) : args.conf;
    CConfigParser config;
    if (!config.LoadConfigFile(config_file)) {
        std::cerr << "ERROR: Failed to load configuration file: " << config_file << std::endl;
        return EXIT_USAGE;
    }
    for (const auto& entry : args.overrides) {
        config.SetOverride(entry.first, entry.second);
    }

    SetupLogging(config, datadir);

    std::string storagedir = config.GetString("storagedir", datadir);
    if (!EnsureDataDir(storagedir)) {
        std::cerr << "ERROR: Cannot create storage directory: " << storagedir << std::endl;
        CLogger::GetInstance().Shutdown();
        return EXIT_USAGE;
    }

    CFileSecureStorage storage(storagedir);
    CVault vault(storage, CVaultOptions::FromConfig(config));

    CManualLifecycleSource lifecycle;
    CSessionManager session(lifecycle);
    std::function<void()> unbind = BindVaultToSession(vault, session);
    session.Start();

    int ret;
    VaultError err = vault.Initialize();
    if (err == VaultError::STORAGE_FAILURE) {
        ret = ReportVaultError("initialize", err);
    } else {
        // A damaged bundle is reported by the command that reads it
        ret = RunCommand(args, vault);
    }

    session.TriggerLock();
    session.Stop();
    unbind();
    CLogger::GetInstance().Shutdown();
    return ret;
}
