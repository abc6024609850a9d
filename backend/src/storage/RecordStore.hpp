#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../auth/User.hpp"

// Durable keyed table of user records.
//
// Every mutating call is all-or-nothing: on false, neither the persisted
// state nor what get()/all() return has changed.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // (Re)read persisted records. false = backing store unreadable.
    virtual bool load() = 0;

    virtual std::optional<User> get(const std::string& username) const = 0;
    virtual std::vector<User> all() const = 0;

    // Insert or replace the record keyed by user.username.
    virtual bool put(const User& user) = 0;
    virtual bool erase(const std::string& username) = 0;
};
