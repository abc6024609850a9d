#include "AuthError.hpp"

const char* authErrorName(AuthError error) {
    switch (error) {
    case AuthError::InvalidCredentials: return "InvalidCredentials";
    case AuthError::AccountDisabled:    return "AccountDisabled";
    case AuthError::AccountLocked:      return "AccountLocked";
    case AuthError::DuplicateUsername:  return "DuplicateUsername";
    case AuthError::NotFound:           return "NotFound";
    case AuthError::InvalidInput:       return "InvalidInput";
    case AuthError::KeyResolutionError: return "KeyResolutionError";
    case AuthError::StoreUnavailable:   return "StoreUnavailable";
    case AuthError::NotAuthenticated:   return "NotAuthenticated";
    case AuthError::PermissionDenied:   return "PermissionDenied";
    }
    return "Unknown";
}
