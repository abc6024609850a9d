#include "OperatorCommands.hpp"

#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <sodium.h>
#include <spdlog/spdlog.h>

#include "../auth/AuthError.hpp"
#include "../auth/AuthManager.hpp"

namespace {

std::string formatTime(std::time_t t) {
    if (t == 0) return "never";
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

int usage(std::ostream& out) {
    out << "Usage: aqualog-admin <command> [arguments]\n"
        "  list\n"
        "  create <user> <admin|user> [name] [email]\n"
        "  change-password <user>\n"
        "  change-role <user> <admin|user>\n"
        "  activate <user>\n"
        "  deactivate <user>\n"
        "  unlock <user>\n"
        "  delete <user>\n";
    return 2;
}

void wipe(std::string& secret) {
    if (!secret.empty()) sodium_memzero(&secret[0], secret.size());
}

}

void printUsers(const std::vector<User>& users, std::ostream& out) {
    out << "\n===== USERS =====\n";

    if (users.empty()) {
        out << "No users found.\n";
        return;
    }

    const std::time_t now = std::time(nullptr);
    for (const auto& u : users) {
        out << (u.isAdmin() ? "[admin] " : "[user]  ") << u.username
            << " - " << (u.active ? "Active" : "Inactive")
            << (u.isLocked(now) ? " (Locked)" : "") << "\n";

        if (!u.display_name.empty()) out << "   Name: " << u.display_name << "\n";
        if (!u.email.empty()) out << "   Email: " << u.email << "\n";
        out << "   Failed attempts: " << u.failed_attempts << "\n";
        if (u.isLocked(now)) out << "   Locked until: " << formatTime(u.locked_until) << "\n";
        out << "   Last login: " << formatTime(u.last_login_at) << "\n";
        out << "   Created: " << formatTime(u.created_at) << "\n";
        out << "-----------------------------\n";
    }
}

int runOperatorCommand(AuthManager& auth, const std::vector<std::string>& args,
                       std::ostream& out, const SecretReader& readSecret)
{
    if (args.empty()) return usage(out);

    const std::string& command = args[0];
    const std::size_t argc = args.size();
    UserStore& users = auth.users();

    std::optional<Role> role;
    if ((command == "create" && argc >= 3) || (command == "change-role" && argc == 3)) {
        role = roleFromString(args[2]);
        if (!role) {
            out << "Role must be 'admin' or 'user'.\n";
            return 2;
        }
    }

    try {
        if (command == "list" && argc == 1) {
            printUsers(users.listAll(), out);
        }
        else if (command == "create" && argc >= 3 && argc <= 5) {
            std::string password = readSecret("Password for '" + args[1] + "': ");
            try {
                users.create(args[1], password, *role, argc > 3 ? args[3] : "", argc > 4 ? args[4] : "");
            }
            catch (...) {
                wipe(password);
                throw;
            }
            wipe(password);
            out << "User '" << args[1] << "' created.\n";
        }
        else if (command == "change-password" && argc == 2) {
            std::string password = readSecret("New password: ");
            std::string confirm = readSecret("Confirm password: ");
            const bool same = password == confirm;
            wipe(confirm);
            if (!same) {
                wipe(password);
                out << "Passwords do not match.\n";
                return 1;
            }
            try {
                users.setPassword(args[1], password);
            }
            catch (...) {
                wipe(password);
                throw;
            }
            wipe(password);
            auth.sessions().revokeUser(args[1]);
            out << "Password changed for '" << args[1] << "'.\n";
        }
        else if (command == "change-role" && argc == 3) {
            users.updateRole(args[1], *role);
            auth.sessions().revokeUser(args[1]);
            out << "Role of '" << args[1] << "' set to " << roleToString(*role) << ".\n";
        }
        else if ((command == "activate" || command == "deactivate") && argc == 2) {
            const bool active = command == "activate";
            users.setActive(args[1], active);
            if (!active) auth.sessions().revokeUser(args[1]);
            out << "User '" << args[1] << "' " << (active ? "activated" : "deactivated") << ".\n";
        }
        else if (command == "unlock" && argc == 2) {
            users.unlock(args[1]);
            out << "User '" << args[1] << "' unlocked.\n";
        }
        else if (command == "delete" && argc == 2) {
            users.remove(args[1]);
            auth.sessions().revokeUser(args[1]);
            out << "User '" << args[1] << "' deleted.\n";
        }
        else {
            return usage(out);
        }
    }
    catch (const AuthException& e) {
        spdlog::warn("Operator command '{}' failed: {}", command, e.what());
        out << "Error (" << authErrorName(e.kind()) << "): " << e.what() << "\n";
        return 1;
    }
    catch (const std::runtime_error& e) {
        spdlog::error("Operator command '{}' failed: {}", command, e.what());
        out << "Error: " << e.what() << "\n";
        return 1;
    }

    spdlog::info("Operator command '{}' completed", command);
    return 0;
}
