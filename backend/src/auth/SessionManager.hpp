#pragma once

#include <ctime>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "User.hpp"

class Clock;

struct Session {
    std::string token;
    Identity identity;
    std::time_t created_at = 0;
    std::time_t last_activity_at = 0;
};

// Server-side sessions keyed by an opaque random token. Nothing is persisted.
// Idle expiry is evaluated lazily whenever a token is presented: an expired
// session is dropped and reads exactly like an unknown token. create() also
// drops every expired session, so abandoned tokens do not accumulate.
class SessionManager {
public:
    SessionManager(const Clock& clock, std::time_t idle_timeout_seconds);

    std::string create(const Identity& identity);

    // Identity behind token, refreshing its activity time. nullopt if unknown or expired.
    std::optional<Identity> current(const std::string& token);

    // false if the session is unknown or already expired.
    bool touch(const std::string& token);

    bool isExpired(const Session& session, std::time_t now) const;

    void logout(const std::string& token);

    // Drops every session of username; returns how many were dropped.
    std::size_t revokeUser(const std::string& username);

    std::optional<Session> peek(const std::string& token) const;
    std::size_t size() const;
    std::time_t idleTimeout() const { return idle_timeout; }

private:
    // Caller holds the mutex. Returns the live session or nullptr, erasing it if expired.
    Session* live(const std::string& token, std::time_t now);

    const Clock& clock;
    std::time_t idle_timeout;

    mutable std::mutex mutex;
    std::unordered_map<std::string, Session> sessions;
};
