#include "UserStore.hpp"
#include "AuthError.hpp"
#include "KeyManager.hpp"
#include "PasswordHasher.hpp"
#include "../storage/RecordStore.hpp"
#include "../utils/Clock.hpp"
#include <sodium.h>
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

static constexpr std::size_t MAX_USERNAME = 64;
static constexpr std::size_t MAX_PASSWORD = 1024;
static constexpr std::size_t MAX_TEXT = 256;

static void validateText(const std::string& value, const char* field) {
    bool bad = value.size() > MAX_TEXT || std::any_of(value.begin(), value.end(),
        [](unsigned char c) { return std::iscntrl(c); });
    if (bad) {
        throw AuthException(AuthError::InvalidInput, std::string("invalid ") + field);
    }
}

UserStore::UserStore(RecordStore& s, KeyManager& k, const PasswordHasher& h,
                     const Clock& c, LockoutPolicy p)
    : store(s), keys(k), hasher(h), clock(c), policy(p)
{
    if (policy.max_attempts < 1 || policy.lockout_seconds < 0) {
        throw AuthException(AuthError::InvalidInput, "lockout policy needs max_attempts >= 1");
    }
    if (!store.load()) {
        spdlog::error("Credential store could not be loaded");
        throw AuthException(AuthError::StoreUnavailable, "credential store could not be loaded");
    }
    // A new key is only acceptable while nothing is sealed under an old one.
    keys.resolveKey(store.all().empty());
    spdlog::info("UserStore ready (lockout after {} attempts for {}s)",
        policy.max_attempts, policy.lockout_seconds);
}

void UserStore::validateUsername(const std::string& username) {
    if (username.empty() || username.size() > MAX_USERNAME) {
        throw AuthException(AuthError::InvalidInput, "username must be 1-64 characters");
    }
    bool bad = std::any_of(username.begin(), username.end(),
        [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); });
    if (bad) {
        throw AuthException(AuthError::InvalidInput, "username may not contain whitespace or control characters");
    }
}

void UserStore::validatePassword(const std::string& password) {
    if (password.empty()) {
        throw AuthException(AuthError::InvalidInput, "password must not be empty");
    }
    if (password.size() > MAX_PASSWORD) {
        throw AuthException(AuthError::InvalidInput, "password is too long");
    }
}

std::string UserStore::sealDigest(const std::string& password, const std::string& salt) {
    auto digest = hasher.digest(password, salt);
    std::string sealed = keys.seal(digest);
    sodium_memzero(digest.data(), digest.size());
    return sealed;
}

User UserStore::create(const std::string& username, const std::string& password, Role role,
                       const std::string& display_name, const std::string& email)
{
    spdlog::info("Creating user '{}' (role: {})", username, roleToString(role));

    validateUsername(username);
    validatePassword(password);
    validateText(display_name, "display name");
    validateText(email, "email");

    if (find(username)) {
        spdlog::warn("Create failed: username '{}' already exists", username);
        throw AuthException(AuthError::DuplicateUsername, "user '" + username + "' already exists");
    }

    // Argon2id runs outside the lock; the duplicate check is repeated under it.
    User u(username, "", hasher.generateSalt(), role);
    u.password_hash = sealDigest(password, u.salt);
    u.display_name = display_name;
    u.email = email;
    u.created_at = clock.now();

    std::lock_guard<std::mutex> lock(mutex);
    if (store.get(username)) {
        spdlog::warn("Create failed: username '{}' already exists", username);
        throw AuthException(AuthError::DuplicateUsername, "user '" + username + "' already exists");
    }
    if (!store.put(u)) {
        throw AuthException(AuthError::StoreUnavailable, "failed to persist user '" + username + "'");
    }

    spdlog::info("Created user: {} (role: {})", username, roleToString(role));
    return u;
}

std::optional<User> UserStore::find(const std::string& username) const {
    std::lock_guard<std::mutex> lock(mutex);
    return store.get(username);
}

User UserStore::mutate(const std::string& username, const std::function<void(User&)>& change) {
    std::lock_guard<std::mutex> lock(mutex);

    auto current = store.get(username);
    if (!current) {
        throw AuthException(AuthError::NotFound, "user '" + username + "' not found");
    }

    User next = *current;
    change(next);

    if (!store.put(next)) {
        throw AuthException(AuthError::StoreUnavailable, "failed to persist user '" + username + "'");
    }
    return next;
}

// Caller holds the mutex.
void UserStore::requireAnotherAdmin(const User& target) const {
    if (!target.isAdmin() || !target.active) return;

    auto users = store.all();
    bool other = std::any_of(users.begin(), users.end(), [&](const User& u) {
        return u.username != target.username && u.isAdmin() && u.active;
    });
    if (!other) {
        spdlog::warn("Refusing to remove the last active administrator '{}'", target.username);
        throw AuthException(AuthError::InvalidInput, "cannot remove the last active administrator");
    }
}

void UserStore::updateRole(const std::string& username, Role role) {
    mutate(username, [&](User& u) {
        if (role != Role::Admin) requireAnotherAdmin(u);
        u.role = role;
    });
    spdlog::info("Updated user '{}' role to '{}'", username, roleToString(role));
}

void UserStore::setPassword(const std::string& username, const std::string& new_password) {
    validatePassword(new_password);

    auto current = find(username);
    if (!current) {
        throw AuthException(AuthError::NotFound, "user '" + username + "' not found");
    }

    // Argon2id runs outside the lock. A changed salt means the account was
    // deleted and re-created meanwhile, so the digest belongs to no one.
    std::string sealed = sealDigest(new_password, current->salt);
    mutate(username, [&](User& u) {
        if (u.salt != current->salt) {
            spdlog::warn("Password change for '{}' raced with re-creation of the account", username);
            throw AuthException(AuthError::NotFound, "user '" + username + "' was replaced");
        }
        u.password_hash = sealed;
    });

    spdlog::info("Changed password for user: {}", username);
}

void UserStore::setActive(const std::string& username, bool active) {
    mutate(username, [&](User& u) {
        if (!active) requireAnotherAdmin(u);
        u.active = active;
    });
    spdlog::info("{} user: {}", active ? "Activated" : "Deactivated", username);
}

void UserStore::setProfile(const std::string& username, const std::string& display_name, const std::string& email) {
    validateText(display_name, "display name");
    validateText(email, "email");
    mutate(username, [&](User& u) {
        u.display_name = display_name;
        u.email = email;
    });
    spdlog::info("Updated profile for user: {}", username);
}

int UserStore::recordFailedAttempt(const std::string& username) {
    const std::time_t now = clock.now();

    User updated = mutate(username, [&](User& u) {
        u.failed_attempts += 1;
        if (u.failed_attempts >= policy.max_attempts) {
            u.locked_until = now + policy.lockout_seconds;
        }
    });

    if (updated.failed_attempts >= policy.max_attempts) {
        spdlog::warn("User '{}' locked for {}s after {} failed attempts",
            username, policy.lockout_seconds, updated.failed_attempts);
    }
    return updated.failed_attempts;
}

void UserStore::recordSuccess(const std::string& username) {
    const std::time_t now = clock.now();
    mutate(username, [&](User& u) {
        u.failed_attempts = 0;
        u.locked_until = 0;
        u.last_login_at = now;
    });
}

void UserStore::unlock(const std::string& username) {
    mutate(username, [](User& u) {
        u.failed_attempts = 0;
        u.locked_until = 0;
    });
    spdlog::info("Unlocked user: {}", username);
}

std::vector<User> UserStore::listAll() const {
    std::lock_guard<std::mutex> lock(mutex);
    auto users = store.all();
    std::sort(users.begin(), users.end(),
        [](const User& a, const User& b) { return a.username < b.username; });
    return users;
}

void UserStore::remove(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex);

    auto current = store.get(username);
    if (!current) {
        throw AuthException(AuthError::NotFound, "user '" + username + "' not found");
    }
    requireAnotherAdmin(*current);

    if (!store.erase(username)) {
        throw AuthException(AuthError::StoreUnavailable, "failed to delete user '" + username + "'");
    }
    spdlog::info("Deleted user: {}", username);
}

bool UserStore::empty() const {
    std::lock_guard<std::mutex> lock(mutex);
    return store.all().empty();
}
