#include "Storage.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static const char MAGIC_HDR[] = "AQUSERS1";
static const char RECORD_SEP[] = "---";

Storage::Storage(const std::string& file)
    : filename(file)
{
}

std::string Storage::serialize(const std::map<std::string, User>& users) {
    std::ostringstream out;
    out << MAGIC_HDR << "\n";

    for (const auto& entry : users) {
        const User& u = entry.second;
        out << u.username << "\n"
            << u.display_name << "\n"
            << u.email << "\n"
            << u.password_hash << "\n"
            << u.salt << "\n"
            << roleToString(u.role) << "\n"
            << (u.active ? 1 : 0) << "\n"
            << u.failed_attempts << "\n"
            << u.locked_until << "\n"
            << u.created_at << "\n"
            << u.last_login_at << "\n"
            << RECORD_SEP << "\n";
    }
    return out.str();
}

static bool writeAll(int fd, const std::string& data) {
    const char* p = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    return true;
}

static bool readNumber(std::istream& in, long long& out) {
    std::string line;
    if (!std::getline(in, line)) return false;
    try {
        size_t used = 0;
        out = std::stoll(line, &used);
        return used == line.size();
    }
    catch (const std::exception&) {
        return false;
    }
}

bool Storage::parse(const std::string& text, std::map<std::string, User>& users) {
    std::istringstream in(text);
    users.clear();

    std::string hdr;
    if (!std::getline(in, hdr) || hdr != MAGIC_HDR) {
        spdlog::error("Users file has an invalid header");
        return false;
    }

    while (true) {
        User u;
        if (!std::getline(in, u.username)) break; // clean end of file

        std::string role_name, sep;
        long long active = 0, failed = 0, locked = 0, created = 0, last_login = 0;

        if (!std::getline(in, u.display_name) ||
            !std::getline(in, u.email) ||
            !std::getline(in, u.password_hash) ||
            !std::getline(in, u.salt) ||
            !std::getline(in, role_name) ||
            !readNumber(in, active) ||
            !readNumber(in, failed) ||
            !readNumber(in, locked) ||
            !readNumber(in, created) ||
            !readNumber(in, last_login) ||
            !std::getline(in, sep) || sep != RECORD_SEP)
        {
            spdlog::error("Users file is truncated or malformed near record '{}'", u.username);
            return false;
        }

        auto role = roleFromString(role_name);
        if (!role || u.username.empty() || failed < 0) {
            spdlog::error("Users file holds an invalid record '{}'", u.username);
            return false;
        }

        u.role = *role;
        u.active = active != 0;
        u.failed_attempts = static_cast<int>(failed);
        u.locked_until = static_cast<std::time_t>(locked);
        u.created_at = static_cast<std::time_t>(created);
        u.last_login_at = static_cast<std::time_t>(last_login);

        if (!users.emplace(u.username, u).second) {
            spdlog::error("Users file lists '{}' twice", u.username);
            return false;
        }
    }
    return true;
}

bool Storage::load() {
    spdlog::info("Loading users from '{}'", filename);

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        if (fs::exists(filename)) {
            spdlog::error("User file '{}' exists but cannot be read", filename);
            return false;
        }
        spdlog::warn("User file '{}' not found; treating as empty", filename);
        records.clear();
        return true;
    }

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    std::map<std::string, User> loaded;
    if (!parse(text, loaded)) return false;

    records = std::move(loaded);
    spdlog::info("Loaded {} users", records.size());
    return true;
}

std::optional<User> Storage::get(const std::string& username) const {
    auto it = records.find(username);
    if (it == records.end()) return std::nullopt;
    return it->second;
}

std::vector<User> Storage::all() const {
    std::vector<User> out;
    out.reserve(records.size());
    for (const auto& entry : records) out.push_back(entry.second);
    return out;
}

bool Storage::put(const User& user) {
    auto next = records;
    next[user.username] = user;
    if (!persist(next)) return false;

    records = std::move(next);
    return true;
}

bool Storage::erase(const std::string& username) {
    auto next = records;
    if (next.erase(username) == 0) return true;
    if (!persist(next)) return false;

    records = std::move(next);
    return true;
}

bool Storage::persist(const std::map<std::string, User>& next) {
    const std::string temp_path = filename + ".tmp";
    const std::string data = serialize(next);

    try {
        fs::path parent = fs::path(filename).parent_path();
        if (!parent.empty()) fs::create_directories(parent);

        int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
        if (fd < 0) {
            spdlog::error("Failed to open '{}' for writing user data: {}", temp_path, std::strerror(errno));
            return false;
        }

        // Owner-only before any credential material lands in the file
        bool written = ::fchmod(fd, S_IRUSR | S_IWUSR) == 0 && writeAll(fd, data) && ::fsync(fd) == 0;
        if (::close(fd) != 0) written = false;

        if (!written) {
            spdlog::error("Failed to write user data to '{}': {}", temp_path, std::strerror(errno));
            std::error_code ec;
            fs::remove(temp_path, ec);
            return false;
        }

        fs::rename(temp_path, filename);

        std::string dir_path = parent.empty() ? "." : parent.string();
        int dir_fd = ::open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
        if (dir_fd < 0 || ::fsync(dir_fd) != 0) {
            spdlog::warn("Could not sync directory '{}'; rename may not be durable yet", dir_path);
        }
        if (dir_fd >= 0) ::close(dir_fd);
    }
    catch (const fs::filesystem_error& e) {
        spdlog::error("Filesystem error while saving users: {}", e.what());
        std::error_code ec;
        fs::remove(temp_path, ec);
        return false;
    }

    spdlog::debug("Saved {} user entries to '{}'", next.size(), filename);
    return true;
}
