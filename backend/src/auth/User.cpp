#include "User.hpp"
#include <algorithm>
#include <cctype>

User::User(const std::string& user, const std::string& hash, const std::string& salt_hex, Role r)
    : username(user), password_hash(hash), salt(salt_hex), role(r)
{
}

const char* roleToString(Role role) {
    return role == Role::Admin ? "admin" : "user";
}

std::optional<Role> roleFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "admin") return Role::Admin;
    if (lower == "user") return Role::User;
    return std::nullopt;
}
