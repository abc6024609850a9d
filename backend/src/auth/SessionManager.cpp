#include "SessionManager.hpp"
#include "AuthError.hpp"
#include "../utils/Clock.hpp"
#include "../utils/encoding.hpp"
#include <sodium.h>
#include <spdlog/spdlog.h>

static constexpr std::size_t TOKEN_BYTES = 32;

SessionManager::SessionManager(const Clock& c, std::time_t idle_timeout_seconds)
    : clock(c), idle_timeout(idle_timeout_seconds)
{
    if (idle_timeout <= 0) {
        throw AuthException(AuthError::InvalidInput, "session timeout must be positive");
    }
    spdlog::debug("SessionManager initialized (idle timeout {}s)", idle_timeout);
}

std::string SessionManager::create(const Identity& identity) {
    unsigned char raw[TOKEN_BYTES];
    randombytes_buf(raw, TOKEN_BYTES);
    std::string token = encoding::toHex(raw, TOKEN_BYTES);
    sodium_memzero(raw, TOKEN_BYTES);

    Session s;
    s.token = token;
    s.identity = identity;
    s.created_at = clock.now();
    s.last_activity_at = s.created_at;

    std::lock_guard<std::mutex> lock(mutex);

    // Sweep abandoned sessions.
    std::size_t swept = 0;
    for (auto it = sessions.begin(); it != sessions.end();) {
        if (isExpired(it->second, s.created_at)) {
            it = sessions.erase(it);
            ++swept;
        }
        else {
            ++it;
        }
    }
    if (swept) spdlog::debug("Dropped {} expired session(s)", swept);

    sessions[token] = s;
    spdlog::info("Session started for '{}'", identity.username);
    return token;
}

bool SessionManager::isExpired(const Session& session, std::time_t now) const {
    return now - session.last_activity_at > idle_timeout;
}

Session* SessionManager::live(const std::string& token, std::time_t now) {
    auto it = sessions.find(token);
    if (it == sessions.end()) return nullptr;

    if (isExpired(it->second, now)) {
        spdlog::info("Session for '{}' expired after {}s idle",
            it->second.identity.username, now - it->second.last_activity_at);
        sessions.erase(it);
        return nullptr;
    }
    return &it->second;
}

std::optional<Identity> SessionManager::current(const std::string& token) {
    const std::time_t now = clock.now();

    std::lock_guard<std::mutex> lock(mutex);
    Session* s = live(token, now);
    if (!s) return std::nullopt;

    s->last_activity_at = now;
    return s->identity;
}

bool SessionManager::touch(const std::string& token) {
    const std::time_t now = clock.now();

    std::lock_guard<std::mutex> lock(mutex);
    Session* s = live(token, now);
    if (!s) return false;

    s->last_activity_at = now;
    return true;
}

void SessionManager::logout(const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(token);
    if (it == sessions.end()) {
        spdlog::debug("logout() called but no session matched");
        return;
    }
    spdlog::info("User '{}' logging out", it->second.identity.username);
    sessions.erase(it);
}

std::size_t SessionManager::revokeUser(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t dropped = 0;
    for (auto it = sessions.begin(); it != sessions.end();) {
        if (it->second.identity.username == username) {
            it = sessions.erase(it);
            ++dropped;
        }
        else {
            ++it;
        }
    }
    if (dropped) spdlog::info("Revoked {} session(s) of '{}'", dropped, username);
    return dropped;
}

std::optional<Session> SessionManager::peek(const std::string& token) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(token);
    if (it == sessions.end()) return std::nullopt;
    return it->second;
}

std::size_t SessionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return sessions.size();
}
