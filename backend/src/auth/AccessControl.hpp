#pragma once
#include "User.hpp"

enum class Capability : unsigned {
    Read = 1u << 0,
    Write = 1u << 1,
    Admin = 1u << 2
};

using CapabilitySet = unsigned;

// Role -> capability policy. This is the only place roles are interpreted;
// every mutating entry point goes through require().
namespace rbac {

// User: {read}. Admin: {read, write, admin}.
CapabilitySet capabilities(Role role);

bool has(CapabilitySet set, Capability cap);

bool canRead(const Identity& identity);
bool canWrite(const Identity& identity);
bool isAdmin(const Identity& identity);

// Throws AuthException(PermissionDenied) unless identity's role grants cap.
void require(const Identity& identity, Capability cap);

const char* capabilityName(Capability cap);

}
