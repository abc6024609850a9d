#include <iostream>
#include <vector>
#include <string>
#include <sodium.h>
#include <limits>
#include <memory>
#include <optional>
#include <cstdlib>
#include <termios.h>
#include <unistd.h>

#include "../utils/logging.hpp"
#include "../utils/encoding.hpp"
#include "../config/Config.hpp"
#include "../auth/AuthError.hpp"
#include "../auth/AuthManager.hpp"
#include "OperatorCommands.hpp"

namespace {

// Turns terminal echo off for the lifetime of the guard (password prompts).
class EchoGuard {
public:
    EchoGuard() {
        if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &saved) != 0) return;
        struct termios quiet = saved;
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active = tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet) == 0;
    }
    ~EchoGuard() {
        if (active) {
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved);
            std::cout << "\n";
        }
    }
    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

private:
    struct termios saved {};
    bool active = false;
};

std::string prompt(const std::string& label) {
    std::string value;
    std::cout << label;
    std::getline(std::cin, value);
    return value;
}

std::string promptSecret(const std::string& label) {
    std::cout << label << std::flush;
    EchoGuard guard;
    std::string value;
    std::getline(std::cin, value);
    return value;
}

int askChoice() {
    int choice;
    if (!(std::cin >> choice)) {
        if (std::cin.eof()) return -1;
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        return 0;
    }
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return choice;
}

std::optional<Role> askRole() {
    std::string name = prompt("Role (admin/user): ");
    auto role = roleFromString(name);
    if (!role) std::cout << "Role must be 'admin' or 'user'.\n";
    return role;
}

// Generates the bootstrap admin password when AQUALOG_ADMIN_PASSWORD is unset.
// It is shown once on the terminal and never logged.
void bootstrapAdmin(AuthManager& auth) {
    if (!auth.users().empty()) return;

    std::string password;
    bool generated = false;
    if (const char* env = std::getenv("AQUALOG_ADMIN_PASSWORD"); env && *env) {
        password = env;
    }
    else {
        std::vector<unsigned char> raw(12);
        randombytes_buf(raw.data(), raw.size());
        password = encoding::toBase64Url(raw);
        sodium_memzero(raw.data(), raw.size());
        generated = true;
    }

    if (auth.ensureDefaultAdmin(password) && generated) {
        std::cout << "No users found. Created 'admin' with password: " << password << "\n"
            "Change it after the first login.\n";
    }
    sodium_memzero(&password[0], password.size());
}

// Runs one admin action; administrative failures are shown verbatim.
// Returns false when the session is gone and the user must log in again.
template <typename Action>
bool runAdmin(Action&& action) {
    try {
        action();
        return true;
    }
    catch (const AuthException& e) {
        if (e.kind() == AuthError::NotAuthenticated) {
            std::cout << "Session expired. Please log in again.\n";
            return false;
        }
        std::cout << "Error (" << authErrorName(e.kind()) << "): " << e.what() << "\n";
        return true;
    }
    catch (const std::runtime_error& e) {
        spdlog::error("Administrative action failed: {}", e.what());
        std::cout << "Error: " << e.what() << "\n";
        return true;
    }
}

void adminSession(AuthManager& auth, const std::string& token) {
    while (true) {
        auto me = auth.currentIdentity(token);
        if (!me) {
            std::cout << "Session expired. Please log in again.\n";
            return;
        }
        const bool admin = AuthManager::isAdmin(*me);

        std::cout << "\n===== MAIN MENU =====\n"
            "User: " << me->username << " (" << roleToString(me->role) << ")\n";
        if (admin) {
            std::cout <<
                "1. List users\n"
                "2. Create user\n"
                "3. Change password\n"
                "4. Change role\n"
                "5. Activate user\n"
                "6. Deactivate user\n"
                "7. Unlock user\n"
                "8. Delete user\n";
        }
        std::cout << "9. Logout\n> ";

        int choice = askChoice();
        if (choice < 0 || choice == 9) {
            auth.logout(token);
            std::cout << "Logged out.\n";
            return;
        }
        if (!admin) {
            std::cout << "Invalid.\n";
            continue;
        }

        bool still_valid = true;
        if (choice == 1) {
            still_valid = runAdmin([&] { printUsers(auth.listUsers(token), std::cout); });
        }
        else if (choice == 2) {
            std::string username = prompt("Username: ");
            std::string password = promptSecret("Password: ");
            auto role = askRole();
            if (!role) continue;
            std::string name = prompt("Full name (optional): ");
            std::string email = prompt("Email (optional): ");
            still_valid = runAdmin([&] {
                auth.createUser(token, username, password, *role, name, email);
                std::cout << "User '" << username << "' created.\n";
            });
            sodium_memzero(&password[0], password.size());
        }
        else if (choice == 3) {
            std::string username = prompt("Username: ");
            std::string password = promptSecret("New password: ");
            std::string confirm = promptSecret("Confirm password: ");
            if (password != confirm) {
                std::cout << "Passwords do not match.\n";
            }
            else {
                still_valid = runAdmin([&] {
                    auth.changePassword(token, username, password);
                    std::cout << "Password changed for '" << username << "'.\n";
                });
            }
            sodium_memzero(&password[0], password.size());
            sodium_memzero(&confirm[0], confirm.size());
        }
        else if (choice == 4) {
            std::string username = prompt("Username: ");
            auto role = askRole();
            if (!role) continue;
            still_valid = runAdmin([&] {
                auth.changeRole(token, username, *role);
                std::cout << "Role of '" << username << "' set to " << roleToString(*role) << ".\n";
            });
        }
        else if (choice == 5 || choice == 6) {
            std::string username = prompt("Username: ");
            still_valid = runAdmin([&] {
                if (choice == 5) auth.activate(token, username);
                else auth.deactivate(token, username);
                std::cout << "User '" << username << "' " << (choice == 5 ? "activated" : "deactivated") << ".\n";
            });
        }
        else if (choice == 7) {
            std::string username = prompt("Username: ");
            still_valid = runAdmin([&] {
                auth.unlock(token, username);
                std::cout << "User '" << username << "' unlocked.\n";
            });
        }
        else if (choice == 8) {
            std::string username = prompt("Username: ");
            std::string sure = prompt("Delete '" + username + "' permanently? (y/N): ");
            if (sure == "y" || sure == "Y") {
                still_valid = runAdmin([&] {
                    auth.deleteUser(token, username);
                    std::cout << "User '" << username << "' deleted.\n";
                });
            }
        }
        else {
            std::cout << "Invalid.\n";
        }

        if (!still_valid) return;
    }
}

}

int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    const char* config_env = std::getenv("AQUALOG_CONFIG");
    AuthConfig config = AuthConfig::load(config_env && *config_env ? config_env : "aqualog.json");

    try {
        Log::init(config.log_file, config.log_level);
    }
    catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Cannot open log file '" << config.log_file << "': " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<AuthManager> auth;
    try {
        auth = std::make_unique<AuthManager>(config);
        bootstrapAdmin(*auth);
    }
    catch (const AuthException& e) {
        spdlog::critical("Startup failed: {}", e.what());
        std::cerr << "Fatal (" << authErrorName(e.kind()) << "): " << e.what() << "\n";
        return 2;
    }
    catch (const std::runtime_error& e) {
        spdlog::critical("Startup failed: {}", e.what());
        std::cerr << "Fatal: " << e.what() << "\n";
        return 2;
    }

    if (argc > 1) {
        std::vector<std::string> args(argv + 1, argv + argc);
        return runOperatorCommand(*auth, args, std::cout, promptSecret);
    }

    // LOGIN
    while (true) {
        std::cout << "\n===== LOGIN MENU =====\n"
            "1. Login\n"
            "2. Exit\n> ";
        int choice = askChoice();

        if (choice == 1) {
            std::string username = prompt("Username: ");
            std::string password = promptSecret("Password: ");

            LoginResult result = auth->login(username, password);
            sodium_memzero(&password[0], password.size());

            std::cout << result.publicMessage() << "\n";
            if (result.ok()) {
                adminSession(*auth, result.token);
            }
        }
        else if (choice == 2 || choice < 0) {
            return 0;
        }
    }
}
