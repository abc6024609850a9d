#pragma once

#include <ctime>
#include <optional>
#include <string>
#include "AuthError.hpp"
#include "User.hpp"

class UserStore;
class KeyManager;
class PasswordHasher;
class Clock;

// Outcome of one login attempt. Failures are values, not exceptions.
struct LoginResult {
    std::optional<Identity> identity;
    AuthError error = AuthError::InvalidCredentials;
    std::time_t lock_remaining = 0; // seconds, only for AccountLocked
    std::string token;              // session token, filled in by AuthManager

    bool ok() const { return identity.has_value(); }

    // What a login form may show. Unknown user and wrong password read the same.
    std::string publicMessage() const;
};

class Authenticator {
public:
    Authenticator(UserStore& users, KeyManager& keys, const PasswordHasher& hasher, const Clock& clock);

    // Lookup, active check, lockout check, constant-time digest comparison,
    // then counter bookkeeping. Terminal in one pass.
    LoginResult authenticate(const std::string& username, const std::string& password);

private:
    bool verify(const User& user, const std::string& password, bool& readable);

    UserStore& users;
    KeyManager& keys;
    const PasswordHasher& hasher;
    const Clock& clock;

    // Unknown usernames are verified against this record, so they cost the
    // same hash and decryption as a real one.
    User dummy;
};
