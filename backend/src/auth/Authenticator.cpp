#include "Authenticator.hpp"
#include "KeyManager.hpp"
#include "PasswordHasher.hpp"
#include "UserStore.hpp"
#include "../utils/Clock.hpp"
#include <sodium.h>
#include <spdlog/spdlog.h>

std::string LoginResult::publicMessage() const {
    if (ok()) return "Welcome, " + identity->username + "!";

    switch (error) {
    case AuthError::AccountDisabled:
        return "This account is disabled. Contact your administrator.";
    case AuthError::AccountLocked:
        return "This account is temporarily locked. Try again later.";
    case AuthError::StoreUnavailable:
        return "Login is temporarily unavailable.";
    default:
        return "Invalid username or password.";
    }
}

static LoginResult failure(AuthError error, std::time_t remaining = 0) {
    LoginResult r;
    r.error = error;
    r.lock_remaining = remaining;
    return r;
}

Authenticator::Authenticator(UserStore& u, KeyManager& k, const PasswordHasher& h, const Clock& c)
    : users(u), keys(k), hasher(h), clock(c)
{
    dummy.salt = hasher.generateSalt();
    std::vector<unsigned char> digest(PasswordHasher::DIGEST_BYTES);
    randombytes_buf(digest.data(), digest.size());
    dummy.password_hash = keys.seal(digest);
    sodium_memzero(digest.data(), digest.size());
}

bool Authenticator::verify(const User& user, const std::string& password, bool& readable) {
    spdlog::debug("Verifying password (not logging password or hash)");

    std::vector<unsigned char> stored;
    readable = keys.open(user.password_hash, stored);
    if (!readable) {
        spdlog::error("Stored hash for '{}' cannot be decrypted", user.username);
        return false;
    }

    auto computed = hasher.digest(password, user.salt);
    bool match = PasswordHasher::equal(stored, computed);

    sodium_memzero(stored.data(), stored.size());
    sodium_memzero(computed.data(), computed.size());
    return match;
}

LoginResult Authenticator::authenticate(const std::string& username, const std::string& password) {
    spdlog::info("Login attempt for username '{}'", username);

    if (username.empty() || password.empty()) {
        spdlog::warn("Login failed: empty username or password");
        return failure(AuthError::InvalidCredentials);
    }

    try {
        auto user = users.find(username);
        if (!user) {
            bool readable = true;
            verify(dummy, password, readable);
            spdlog::warn("Login failed: username '{}' not found", username);
            return failure(AuthError::InvalidCredentials);
        }

        if (!user->active) {
            spdlog::warn("Login failed: user '{}' is deactivated", username);
            return failure(AuthError::AccountDisabled);
        }

        const std::time_t now = clock.now();
        if (user->isLocked(now)) {
            std::time_t remaining = user->locked_until - now;
            spdlog::warn("Login failed: user '{}' is locked for {}s", username, remaining);
            return failure(AuthError::AccountLocked, remaining);
        }

        bool readable = true;
        if (!verify(*user, password, readable)) {
            if (!readable) return failure(AuthError::StoreUnavailable);

            int count = users.recordFailedAttempt(username);
            spdlog::warn("Login failed: incorrect password for '{}' (attempt {})", username, count);
            return failure(AuthError::InvalidCredentials);
        }

        users.recordSuccess(username);

        LoginResult ok;
        ok.identity = Identity{ user->username, user->role, user->display_name };
        spdlog::info("User '{}' authenticated successfully (role: {})", username, roleToString(user->role));
        return ok;
    }
    catch (const AuthException& e) {
        if (e.kind() == AuthError::NotFound) {
            // Deleted between lookup and bookkeeping.
            spdlog::warn("Login failed: user '{}' vanished during authentication", username);
            return failure(AuthError::InvalidCredentials);
        }
        spdlog::error("Authentication error for user '{}': {}", username, e.what());
        return failure(e.kind());
    }
}
