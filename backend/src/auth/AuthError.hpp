#pragma once
#include <stdexcept>
#include <string>

enum class AuthError {
    InvalidCredentials,  // unknown user or wrong password, deliberately merged
    AccountDisabled,
    AccountLocked,
    DuplicateUsername,
    NotFound,
    InvalidInput,
    KeyResolutionError,
    StoreUnavailable,
    NotAuthenticated,
    PermissionDenied
};

const char* authErrorName(AuthError error);

// Raised by the administrative surface, the key manager and the store.
// The message is detailed; it is meant for privileged callers and logs.
class AuthException : public std::runtime_error {
public:
    AuthException(AuthError kind, const std::string& message)
        : std::runtime_error(message), error(kind) {}

    AuthError kind() const { return error; }

private:
    AuthError error;
};
