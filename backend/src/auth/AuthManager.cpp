#include "AuthManager.hpp"
#include "AuthError.hpp"
#include "../storage/Storage.hpp"
#include "../utils/Clock.hpp"
#include <spdlog/spdlog.h>

static HashParams hashParams(const AuthConfig& config) {
    HashParams p;
    p.ops_limit = config.hash_ops_limit;
    p.mem_limit = config.hash_mem_limit;
    return p;
}

static LockoutPolicy lockoutPolicy(const AuthConfig& config) {
    LockoutPolicy p;
    p.max_attempts = config.max_login_attempts;
    p.lockout_seconds = static_cast<std::time_t>(config.lockout_duration_minutes) * 60;
    return p;
}

AuthManager::AuthManager(const AuthConfig& config)
    : AuthManager(config,
                  std::make_unique<Storage>(config.usersPath()),
                  std::make_shared<SystemClock>(),
                  KeyManager::keyFromEnvironment())
{
}

AuthManager::AuthManager(const AuthConfig& config,
                         std::unique_ptr<RecordStore> recordStore,
                         std::shared_ptr<const Clock> clk,
                         std::optional<std::string> externalKey)
    : clock(std::move(clk)),
      store(std::move(recordStore)),
      key_manager(config.keyPath(), std::move(externalKey)),
      hasher(hashParams(config)),
      user_store(*store, key_manager, hasher, *clock, lockoutPolicy(config)),
      authenticator(user_store, key_manager, hasher, *clock),
      session_manager(*clock, static_cast<std::time_t>(config.session_timeout_minutes) * 60)
{
    spdlog::info("AuthManager initialized with user file '{}'", config.usersPath());
}

AuthManager::~AuthManager() = default;

LoginResult AuthManager::login(const std::string& username, const std::string& password) {
    LoginResult result = authenticator.authenticate(username, password);
    if (result.ok()) {
        result.token = session_manager.create(*result.identity);
    }
    return result;
}

void AuthManager::logout(const std::string& token) {
    session_manager.logout(token);
}

std::optional<Identity> AuthManager::currentIdentity(const std::string& token) {
    return session_manager.current(token);
}

Identity AuthManager::authorize(const std::string& token, Capability cap) {
    auto identity = session_manager.current(token);
    if (!identity) {
        spdlog::warn("Rejected '{}' request: no valid session", rbac::capabilityName(cap));
        throw AuthException(AuthError::NotAuthenticated, "not authenticated");
    }
    rbac::require(*identity, cap);
    return *identity;
}

User AuthManager::createUser(const std::string& token, const std::string& username, const std::string& password,
                             Role role, const std::string& display_name, const std::string& email)
{
    Identity caller = authorize(token, Capability::Admin);
    spdlog::info("'{}' creating user '{}'", caller.username, username);
    return user_store.create(username, password, role, display_name, email);
}

void AuthManager::changePassword(const std::string& token, const std::string& username, const std::string& new_password) {
    Identity caller = authorize(token, Capability::Admin);
    spdlog::info("'{}' changing password of '{}'", caller.username, username);
    user_store.setPassword(username, new_password);
    session_manager.revokeUser(username);
}

void AuthManager::changeRole(const std::string& token, const std::string& username, Role role) {
    Identity caller = authorize(token, Capability::Admin);
    spdlog::info("'{}' changing role of '{}' to '{}'", caller.username, username, roleToString(role));
    user_store.updateRole(username, role);
    session_manager.revokeUser(username);
}

void AuthManager::activate(const std::string& token, const std::string& username) {
    Identity caller = authorize(token, Capability::Admin);
    spdlog::info("'{}' activating '{}'", caller.username, username);
    user_store.setActive(username, true);
}

void AuthManager::deactivate(const std::string& token, const std::string& username) {
    Identity caller = authorize(token, Capability::Admin);
    spdlog::info("'{}' deactivating '{}'", caller.username, username);
    user_store.setActive(username, false);
    session_manager.revokeUser(username);
}

void AuthManager::unlock(const std::string& token, const std::string& username) {
    Identity caller = authorize(token, Capability::Admin);
    spdlog::info("'{}' unlocking '{}'", caller.username, username);
    user_store.unlock(username);
}

std::vector<User> AuthManager::listUsers(const std::string& token) {
    authorize(token, Capability::Admin);
    return user_store.listAll();
}

void AuthManager::deleteUser(const std::string& token, const std::string& username) {
    Identity caller = authorize(token, Capability::Admin);
    spdlog::info("'{}' deleting '{}'", caller.username, username);
    user_store.remove(username);
    session_manager.revokeUser(username);
}

bool AuthManager::ensureDefaultAdmin(const std::string& password) {
    if (!user_store.empty()) return false;

    user_store.create("admin", password, Role::Admin, "System Administrator");
    spdlog::info("Created default admin user 'admin' (password not logged)");
    return true;
}
