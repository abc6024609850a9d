#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "AccessControl.hpp"
#include "Authenticator.hpp"
#include "KeyManager.hpp"
#include "PasswordHasher.hpp"
#include "SessionManager.hpp"
#include "User.hpp"
#include "UserStore.hpp"
#include "../config/Config.hpp"

class RecordStore;
class Clock;

// The credential and access-control engine, constructed once and passed to
// whoever needs it. Owns its key, its store handle and its session table.
//
// Construction resolves the encryption key, so an engine whose key cannot be
// resolved never exists (AuthException(KeyResolutionError)).
//
// Administrative calls take the caller's session token, pass the single
// capability gate and then reach the UserStore. Their failures are thrown
// as AuthException and are meant to be shown to the (privileged) caller.
class AuthManager {
public:
    // Production wiring: file Storage at config.usersPath(), system clock,
    // key from AQUALOG_ENCRYPTION_KEY or config.keyPath().
    explicit AuthManager(const AuthConfig& config);

    AuthManager(const AuthConfig& config,
                std::unique_ptr<RecordStore> store,
                std::shared_ptr<const Clock> clock,
                std::optional<std::string> externalKey);

    ~AuthManager();

    AuthManager(const AuthManager&) = delete;
    AuthManager& operator=(const AuthManager&) = delete;

    // On success result.token identifies the new session.
    LoginResult login(const std::string& username, const std::string& password);
    void logout(const std::string& token);
    std::optional<Identity> currentIdentity(const std::string& token);

    // The gate for collaborators guarding their own mutations.
    // Throws NotAuthenticated (unknown/expired token) or PermissionDenied.
    Identity authorize(const std::string& token, Capability cap);

    // Administrative surface; every call requires Capability::Admin.
    User createUser(const std::string& token, const std::string& username, const std::string& password,
                    Role role, const std::string& display_name = "", const std::string& email = "");
    void changePassword(const std::string& token, const std::string& username, const std::string& new_password);
    void changeRole(const std::string& token, const std::string& username, Role role);
    void activate(const std::string& token, const std::string& username);
    void deactivate(const std::string& token, const std::string& username);
    void unlock(const std::string& token, const std::string& username);
    std::vector<User> listUsers(const std::string& token);
    void deleteUser(const std::string& token, const std::string& username);

    static bool isAdmin(const Identity& identity) { return rbac::isAdmin(identity); }
    static bool canWrite(const Identity& identity) { return rbac::canWrite(identity); }
    static bool canRead(const Identity& identity) { return rbac::canRead(identity); }

    // Creates "admin" with password when the store holds no users at all.
    // Returns true if the account was created.
    bool ensureDefaultAdmin(const std::string& password);

    // Management interface that bypasses login (operator tooling).
    UserStore& users() { return user_store; }
    SessionManager& sessions() { return session_manager; }
    KeyManager& keys() { return key_manager; }

private:
    std::shared_ptr<const Clock> clock;
    std::unique_ptr<RecordStore> store;
    KeyManager key_manager;
    PasswordHasher hasher;
    UserStore user_store;
    Authenticator authenticator;
    SessionManager session_manager;
};
