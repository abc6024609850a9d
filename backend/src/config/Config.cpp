#include "Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <sodium.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {
    constexpr const char* USERS_FILE = "users.db";
    constexpr const char* KEY_FILE = "encryption.key";

    template <typename T>
    void readKey(const nlohmann::json& section, const char* key, T& out) {
        if (section.contains(key)) {
            out = section.at(key).get<T>();
        }
    }

    bool parseInt(const char* text, int& out) {
        try {
            size_t used = 0;
            std::string s(text);
            int value = std::stoi(s, &used);
            if (used != s.size()) return false;
            out = value;
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }
}

std::string AuthConfig::usersPath() const {
    if (!users_file.empty()) return users_file;
    return (fs::path(data_dir) / USERS_FILE).string();
}

std::string AuthConfig::keyPath() const {
    if (!key_file.empty()) return key_file;
    return (fs::path(data_dir) / KEY_FILE).string();
}

AuthConfig AuthConfig::fromJson(const std::string& json) {
    AuthConfig config;
    auto j = nlohmann::json::parse(json);

    if (j.contains("database") && j["database"].is_object()) {
        const auto& db = j["database"];
        readKey(db, "data_dir", config.data_dir);
        readKey(db, "users_file", config.users_file);
        readKey(db, "key_file", config.key_file);
    }
    if (j.contains("auth") && j["auth"].is_object()) {
        const auto& auth = j["auth"];
        readKey(auth, "session_timeout_minutes", config.session_timeout_minutes);
        readKey(auth, "max_login_attempts", config.max_login_attempts);
        readKey(auth, "lockout_duration_minutes", config.lockout_duration_minutes);
        readKey(auth, "hash_ops_limit", config.hash_ops_limit);
        readKey(auth, "hash_mem_limit", config.hash_mem_limit);
    }
    if (j.contains("logging") && j["logging"].is_object()) {
        const auto& logging = j["logging"];
        readKey(logging, "level", config.log_level);
        readKey(logging, "file", config.log_file);
    }
    return config;
}

std::string AuthConfig::toJson() const {
    nlohmann::json j;

    j["database"]["data_dir"] = data_dir;
    j["database"]["users_file"] = users_file;
    j["database"]["key_file"] = key_file;

    j["auth"]["session_timeout_minutes"] = session_timeout_minutes;
    j["auth"]["max_login_attempts"] = max_login_attempts;
    j["auth"]["lockout_duration_minutes"] = lockout_duration_minutes;
    j["auth"]["hash_ops_limit"] = hash_ops_limit;
    j["auth"]["hash_mem_limit"] = hash_mem_limit;

    j["logging"]["level"] = log_level;
    j["logging"]["file"] = log_file;

    return j.dump(2);
}

AuthConfig AuthConfig::load(const std::string& path) {
    AuthConfig config;

    std::ifstream file(path);
    if (file.is_open()) {
        std::stringstream buffer;
        buffer << file.rdbuf();
        try {
            config = fromJson(buffer.str());
            spdlog::info("Loaded configuration from {}", path);
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("Failed to load config file {}: {}", path, e.what());
            config = AuthConfig{};
        }
    } else if (!fs::exists(path)) {
        try {
            fs::path p(path);
            if (p.has_parent_path()) fs::create_directories(p.parent_path());
            std::ofstream out(path);
            out << config.toJson() << "\n";
            if (out.good()) {
                spdlog::info("Created configuration file at {}", path);
            } else {
                spdlog::error("Failed to create config file {}", path);
            }
        } catch (const fs::filesystem_error& e) {
            spdlog::error("Failed to create config file {}: {}", path, e.what());
        }
    } else {
        spdlog::warn("Config file {} exists but cannot be read; using defaults", path);
    }

    config.applyEnvironment();
    config.validate();
    return config;
}

void AuthConfig::applyEnvironment() {
    if (const char* v = std::getenv("AQUALOG_DATA_DIR"); v && *v) {
        data_dir = v;
        spdlog::info("Override from env: AQUALOG_DATA_DIR = {}", data_dir);
    }
    if (const char* v = std::getenv("AQUALOG_LOG_LEVEL"); v && *v) {
        log_level = v;
        spdlog::info("Override from env: AQUALOG_LOG_LEVEL = {}", log_level);
    }

    struct IntOverride { const char* name; int* target; };
    const IntOverride ints[] = {
        { "AQUALOG_SESSION_TIMEOUT", &session_timeout_minutes },
        { "AQUALOG_MAX_LOGIN_ATTEMPTS", &max_login_attempts },
        { "AQUALOG_LOCKOUT_DURATION", &lockout_duration_minutes },
    };
    for (const auto& o : ints) {
        const char* v = std::getenv(o.name);
        if (v == nullptr) continue;
        if (parseInt(v, *o.target)) {
            spdlog::info("Override from env: {} = {}", o.name, *o.target);
        } else {
            spdlog::warn("Invalid value for {}: {}", o.name, v);
        }
    }
}

void AuthConfig::validate() {
    const AuthConfig defaults;

    if (session_timeout_minutes < 1) {
        spdlog::warn("session_timeout_minutes {} out of range, using {}", session_timeout_minutes, defaults.session_timeout_minutes);
        session_timeout_minutes = defaults.session_timeout_minutes;
    }
    if (max_login_attempts < 1) {
        spdlog::warn("max_login_attempts {} out of range, using {}", max_login_attempts, defaults.max_login_attempts);
        max_login_attempts = defaults.max_login_attempts;
    }
    if (lockout_duration_minutes < 0) {
        spdlog::warn("lockout_duration_minutes {} out of range, using {}", lockout_duration_minutes, defaults.lockout_duration_minutes);
        lockout_duration_minutes = defaults.lockout_duration_minutes;
    }
    // Negative JSON values wrap to huge unsigned ones and land here too.
    if (hash_ops_limit < crypto_pwhash_OPSLIMIT_MIN || hash_ops_limit > crypto_pwhash_OPSLIMIT_MAX) {
        spdlog::warn("hash_ops_limit {} out of range, using {}", hash_ops_limit, defaults.hash_ops_limit);
        hash_ops_limit = defaults.hash_ops_limit;
    }
    if (hash_mem_limit < crypto_pwhash_MEMLIMIT_MIN || hash_mem_limit > crypto_pwhash_MEMLIMIT_MAX) {
        spdlog::warn("hash_mem_limit {} out of range, using {}", hash_mem_limit, defaults.hash_mem_limit);
        hash_mem_limit = defaults.hash_mem_limit;
    }
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        spdlog::warn("Unknown log level '{}', using '{}'", log_level, defaults.log_level);
        log_level = defaults.log_level;
    }
    if (data_dir.empty()) {
        data_dir = defaults.data_dir;
    }
}
