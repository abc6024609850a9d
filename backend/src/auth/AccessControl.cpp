#include "AccessControl.hpp"
#include "AuthError.hpp"
#include <spdlog/spdlog.h>

namespace rbac {

static constexpr CapabilitySet bit(Capability cap) {
    return static_cast<CapabilitySet>(cap);
}

CapabilitySet capabilities(Role role) {
    switch (role) {
    case Role::Admin:
        return bit(Capability::Read) | bit(Capability::Write) | bit(Capability::Admin);
    case Role::User:
        return bit(Capability::Read);
    }
    return 0;
}

bool has(CapabilitySet set, Capability cap) {
    return (set & bit(cap)) != 0;
}

bool canRead(const Identity& identity) {
    return has(capabilities(identity.role), Capability::Read);
}

bool canWrite(const Identity& identity) {
    return has(capabilities(identity.role), Capability::Write);
}

bool isAdmin(const Identity& identity) {
    return has(capabilities(identity.role), Capability::Admin);
}

void require(const Identity& identity, Capability cap) {
    if (has(capabilities(identity.role), cap)) return;

    spdlog::warn("Access denied: '{}' ({}) lacks '{}'",
        identity.username, roleToString(identity.role), capabilityName(cap));
    throw AuthException(AuthError::PermissionDenied,
        std::string(capabilityName(cap)) + " permission required");
}

const char* capabilityName(Capability cap) {
    switch (cap) {
    case Capability::Read:  return "read";
    case Capability::Write: return "write";
    case Capability::Admin: return "admin";
    }
    return "unknown";
}

}
