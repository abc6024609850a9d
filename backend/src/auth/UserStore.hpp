#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "User.hpp"

class RecordStore;
class KeyManager;
class PasswordHasher;
class Clock;

struct LockoutPolicy {
    int max_attempts = 5;
    std::time_t lockout_seconds = 15 * 60;
};

// The credential table. Owns every UserRecord mutation: salts, sealed hashes,
// failure counters and lock timestamps only change through here.
//
// All methods are thread-safe. Each mutation is a single read-modify-write
// under the store mutex followed by one atomic RecordStore::put, so
// concurrent failures against one username never lose a counter increment.
//
// Failures throw AuthException: NotFound, DuplicateUsername, InvalidInput,
// or StoreUnavailable when the backing store refuses a write.
//
// Construction loads the store and resolves the key. A key may only be
// generated for an empty store; otherwise a missing key file is
// KeyResolutionError.
class UserStore {
public:
    UserStore(RecordStore& store, KeyManager& keys, const PasswordHasher& hasher,
              const Clock& clock, LockoutPolicy policy = LockoutPolicy{});

    User create(const std::string& username, const std::string& password, Role role,
                const std::string& display_name = "", const std::string& email = "");

    // Exact, case-sensitive match.
    std::optional<User> find(const std::string& username) const;

    void updateRole(const std::string& username, Role role);
    void setPassword(const std::string& username, const std::string& new_password);
    void setActive(const std::string& username, bool active);
    void setProfile(const std::string& username, const std::string& display_name, const std::string& email);

    // Returns the new count; locks the account once it reaches max_attempts.
    int recordFailedAttempt(const std::string& username);
    void recordSuccess(const std::string& username);
    void unlock(const std::string& username);

    std::vector<User> listAll() const; // sorted by username
    void remove(const std::string& username);

    bool empty() const;
    const LockoutPolicy& lockoutPolicy() const { return policy; }

    static void validateUsername(const std::string& username);
    static void validatePassword(const std::string& password);

private:
    User mutate(const std::string& username, const std::function<void(User&)>& change);
    std::string sealDigest(const std::string& password, const std::string& salt);
    void requireAnotherAdmin(const User& target) const;

    RecordStore& store;
    KeyManager& keys;
    const PasswordHasher& hasher;
    const Clock& clock;
    LockoutPolicy policy;

    mutable std::mutex mutex;
};
