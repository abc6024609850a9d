#pragma once
#include <map>
#include <string>
#include "RecordStore.hpp"

// File-backed RecordStore.
//
// Users file layout (text, one field per line):
//   Header: "AQUSERS1"
//   Per user: username, display_name, email, password_hash, salt, role,
//             active, failed_attempts, locked_until, created_at,
//             last_login_at, "---"
//
// Every put/erase rewrites the whole file to "<file>.tmp" (mode 0600),
// fsyncs it and renames it over the original, so a crash leaves either the
// old or the new table on disk. The in-memory table only changes after the
// rename succeeded. Not thread-safe on its own; UserStore serializes access.
class Storage : public RecordStore {
public:
    explicit Storage(const std::string& filename);

    bool load() override;

    std::optional<User> get(const std::string& username) const override;
    std::vector<User> all() const override;

    bool put(const User& user) override;
    bool erase(const std::string& username) override;

    const std::string& path() const { return filename; }

    static std::string serialize(const std::map<std::string, User>& users);
    static bool parse(const std::string& text, std::map<std::string, User>& users);

private:
    bool persist(const std::map<std::string, User>& next);

    std::string filename;
    std::map<std::string, User> records; // ordered by username
};
