#pragma once
#include <string>
#include <ctime>
#include <optional>

enum class Role {
    Admin,
    User
};

const char* roleToString(Role role);
std::optional<Role> roleFromString(const std::string& name); // "admin" / "user", case-insensitive

class User {
public:
    User() = default;
    User(const std::string& user, const std::string& hash, const std::string& salt_hex, Role r);

    std::string username;
    std::string display_name;  // empty when unset
    std::string email;         // empty when unset
    std::string password_hash; // hex(nonce || secretbox(argon2id digest)), never the digest itself
    std::string salt;          // hex-encoded, fixed at creation
    Role role = Role::User;
    bool active = true;
    int failed_attempts = 0;
    std::time_t locked_until = 0;  // 0 = not locked
    std::time_t created_at = 0;
    std::time_t last_login_at = 0; // 0 = never

    bool isLocked(std::time_t now) const { return locked_until != 0 && now < locked_until; }
    bool isAdmin() const { return role == Role::Admin; }
};

// The authenticated principal handed out by a successful login.
struct Identity {
    std::string username;
    Role role = Role::User;
    std::string display_name;
};
