#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <vector>
#include "../auth/User.hpp"

class AuthManager;

// Reads a secret from the operator; the argument is the prompt label.
using SecretReader = std::function<std::string(const std::string&)>;

// Login-free account maintenance for whoever holds the data directory, e.g.
// unlocking the last admin or resetting a forgotten password:
//
//   aqualog-admin list
//   aqualog-admin create <user> <admin|user> [name] [email]
//   aqualog-admin change-password <user>
//   aqualog-admin change-role <user> <admin|user>
//   aqualog-admin activate|deactivate|unlock|delete <user>
//
// args excludes the program name. Returns 0 on success, 1 when the engine
// refuses the change (the error is written to out) and 2 on a usage error.
int runOperatorCommand(AuthManager& auth, const std::vector<std::string>& args,
                       std::ostream& out, const SecretReader& readSecret);

void printUsers(const std::vector<User>& users, std::ostream& out);
