#pragma once

#include <cstddef>
#include <string>

/**
 * Engine configuration.
 *
 * JSON layout:
 *   {
 *     "database": { "data_dir": "data", "users_file": "", "key_file": "" },
 *     "auth":     { "session_timeout_minutes": 60, "max_login_attempts": 5,
 *                   "lockout_duration_minutes": 15,
 *                   "hash_ops_limit": 2, "hash_mem_limit": 67108864 },
 *     "logging":  { "level": "info", "file": "logs/aqualog.log" }
 *   }
 *
 * Empty users_file / key_file resolve inside data_dir.
 * Environment overrides (applied last): AQUALOG_DATA_DIR,
 * AQUALOG_SESSION_TIMEOUT, AQUALOG_MAX_LOGIN_ATTEMPTS,
 * AQUALOG_LOCKOUT_DURATION, AQUALOG_LOG_LEVEL.
 */
struct AuthConfig {
    std::string data_dir = "data";
    std::string users_file;
    std::string key_file;

    int session_timeout_minutes = 60;
    int max_login_attempts = 5;
    int lockout_duration_minutes = 15;

    unsigned long long hash_ops_limit = 2;          // crypto_pwhash_OPSLIMIT_INTERACTIVE
    std::size_t hash_mem_limit = 64 * 1024 * 1024;  // crypto_pwhash_MEMLIMIT_INTERACTIVE

    std::string log_level = "info";
    std::string log_file = "logs/aqualog.log";

    std::string usersPath() const;
    std::string keyPath() const;

    // Missing keys keep their defaults. Throws nlohmann::json::exception on bad JSON or types.
    static AuthConfig fromJson(const std::string& json);
    std::string toJson() const;

    /**
     * Load from path, then apply environment overrides and sanity checks.
     * A missing file is created with the defaults; an unreadable or
     * malformed one is logged and the defaults are used.
     */
    static AuthConfig load(const std::string& path);

    void applyEnvironment();

    // Resets out-of-range values to their defaults, logging each one.
    void validate();
};
