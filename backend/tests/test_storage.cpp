#include "test_support.hpp"

#include <fstream>
#include "storage/Storage.hpp"

namespace fs = std::filesystem;

class StorageTest : public TempDirTest {
protected:
    std::string usersFile() const { return (testDir / "users.db").string(); }

    static User sampleUser(const std::string& name) {
        User u(name, "aabbcc", "00112233445566778899aabbccddeeff", Role::User);
        u.display_name = "Mario Rossi";
        u.email = "mario@example.org";
        u.failed_attempts = 3;
        u.locked_until = 1700000900;
        u.created_at = 1700000000;
        u.last_login_at = 1700000500;
        return u;
    }
};

TEST_F(StorageTest, MissingFileLoadsAsEmpty) {
    Storage storage(usersFile());
    ASSERT_TRUE(storage.load());
    EXPECT_TRUE(storage.all().empty());
    EXPECT_FALSE(fs::exists(usersFile()));
}

TEST_F(StorageTest, PutIsVisibleAfterReload) {
    {
        Storage storage(usersFile());
        ASSERT_TRUE(storage.load());
        ASSERT_TRUE(storage.put(sampleUser("mario")));
    }

    Storage reopened(usersFile());
    ASSERT_TRUE(reopened.load());
    auto u = reopened.get("mario");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->display_name, "Mario Rossi");
    EXPECT_EQ(u->email, "mario@example.org");
    EXPECT_EQ(u->salt, "00112233445566778899aabbccddeeff");
    EXPECT_EQ(u->role, Role::User);
    EXPECT_TRUE(u->active);
    EXPECT_EQ(u->failed_attempts, 3);
    EXPECT_EQ(u->locked_until, 1700000900);
    EXPECT_EQ(u->created_at, 1700000000);
    EXPECT_EQ(u->last_login_at, 1700000500);
}

TEST_F(StorageTest, OptionalFieldsMayBeEmpty) {
    Storage storage(usersFile());
    ASSERT_TRUE(storage.load());

    User u("luigi", "aa", "bb", Role::Admin);
    u.active = false;
    ASSERT_TRUE(storage.put(u));

    Storage reopened(usersFile());
    ASSERT_TRUE(reopened.load());
    auto loaded = reopened.get("luigi");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->display_name.empty());
    EXPECT_TRUE(loaded->email.empty());
    EXPECT_EQ(loaded->role, Role::Admin);
    EXPECT_FALSE(loaded->active);
}

TEST_F(StorageTest, EraseRemovesOnlyThatRecord) {
    Storage storage(usersFile());
    ASSERT_TRUE(storage.load());
    ASSERT_TRUE(storage.put(sampleUser("mario")));
    ASSERT_TRUE(storage.put(sampleUser("luigi")));

    ASSERT_TRUE(storage.erase("mario"));

    Storage reopened(usersFile());
    ASSERT_TRUE(reopened.load());
    EXPECT_FALSE(reopened.get("mario").has_value());
    EXPECT_TRUE(reopened.get("luigi").has_value());
}

TEST_F(StorageTest, AllIsOrderedByUsername) {
    Storage storage(usersFile());
    ASSERT_TRUE(storage.load());
    ASSERT_TRUE(storage.put(sampleUser("zoe")));
    ASSERT_TRUE(storage.put(sampleUser("anna")));
    ASSERT_TRUE(storage.put(sampleUser("mario")));

    auto users = storage.all();
    ASSERT_EQ(users.size(), 3u);
    EXPECT_EQ(users[0].username, "anna");
    EXPECT_EQ(users[1].username, "mario");
    EXPECT_EQ(users[2].username, "zoe");
}

TEST_F(StorageTest, UsersFileIsOwnerOnly) {
    Storage storage(usersFile());
    ASSERT_TRUE(storage.load());
    ASSERT_TRUE(storage.put(sampleUser("mario")));

    auto perms = fs::status(usersFile()).permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_FALSE(fs::exists(usersFile() + ".tmp"));
}

TEST_F(StorageTest, RejectsUnknownHeader) {
    std::ofstream(usersFile()) << "SRDATA1\nmario\n";

    Storage storage(usersFile());
    EXPECT_FALSE(storage.load());
}

TEST_F(StorageTest, RejectsTruncatedRecord) {
    std::ofstream(usersFile()) << "AQUSERS1\nmario\nMario\n\naabb\n";

    Storage storage(usersFile());
    EXPECT_FALSE(storage.load());
}

TEST_F(StorageTest, RejectsNonNumericCounter) {
    std::ofstream(usersFile())
        << "AQUSERS1\nmario\n\n\naa\nbb\nuser\n1\nthree\n0\n0\n0\n---\n";

    Storage storage(usersFile());
    EXPECT_FALSE(storage.load());
}

TEST_F(StorageTest, UnwritableTempFileFailsWithoutTouchingData) {
    Storage storage(usersFile());
    ASSERT_TRUE(storage.load());
    ASSERT_TRUE(storage.put(sampleUser("mario")));

    // A directory squatting on the temp name makes the write fail.
    fs::create_directory(usersFile() + ".tmp");

    EXPECT_FALSE(storage.put(sampleUser("luigi")));
    EXPECT_FALSE(storage.erase("mario"));
    EXPECT_FALSE(storage.get("luigi").has_value());
    EXPECT_TRUE(storage.get("mario").has_value());

    Storage reopened(usersFile());
    ASSERT_TRUE(reopened.load());
    EXPECT_TRUE(reopened.get("mario").has_value());
    EXPECT_FALSE(reopened.get("luigi").has_value());
}

TEST_F(StorageTest, FailedWriteLeavesStateUnchanged) {
    // A regular file where the parent directory should be makes every write fail.
    const fs::path blocker = testDir / "blocker";
    std::ofstream(blocker) << "not a directory";

    Storage storage((blocker / "users.db").string());
    ASSERT_TRUE(storage.load());

    EXPECT_FALSE(storage.put(sampleUser("mario")));
    EXPECT_FALSE(storage.get("mario").has_value());
    EXPECT_TRUE(storage.all().empty());
}
