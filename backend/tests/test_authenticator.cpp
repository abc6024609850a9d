#include "test_support.hpp"

#include <fstream>
#include <iterator>
#include <memory>
#include <thread>
#include <vector>

#include "auth/Authenticator.hpp"
#include "auth/KeyManager.hpp"
#include "auth/PasswordHasher.hpp"
#include "auth/UserStore.hpp"
#include "storage/Storage.hpp"

namespace fs = std::filesystem;

class AuthenticatorTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        build(LockoutPolicy{});
    }

    void build(LockoutPolicy policy) {
        auth.reset();
        users.reset();
        storage = std::make_unique<Storage>((testDir / "users.db").string());
        keys = std::make_unique<KeyManager>((testDir / "encryption.key").string());
        users = std::make_unique<UserStore>(*storage, *keys, hasher, clock, policy);
        auth = std::make_unique<Authenticator>(*users, *keys, hasher, clock);
        if (!users->find("mario")) users->create("mario", "Sub4Life!", Role::User, "Mario Rossi");
    }

    int failures() { return users->find("mario")->failed_attempts; }

    PasswordHasher hasher{ HashParams{ 1, 8192 } };
    ManualClock clock;
    std::unique_ptr<Storage> storage;
    std::unique_ptr<KeyManager> keys;
    std::unique_ptr<UserStore> users;
    std::unique_ptr<Authenticator> auth;
};

TEST_F(AuthenticatorTest, CorrectPasswordYieldsIdentity) {
    auto r = auth->authenticate("mario", "Sub4Life!");

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.identity->username, "mario");
    EXPECT_EQ(r.identity->role, Role::User);
    EXPECT_EQ(r.identity->display_name, "Mario Rossi");
    EXPECT_EQ(r.publicMessage(), "Welcome, mario!");
    EXPECT_EQ(users->find("mario")->last_login_at, clock.now());
}

TEST_F(AuthenticatorTest, WrongPasswordCountsOnce) {
    auto r = auth->authenticate("mario", "wrong");

    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error, AuthError::InvalidCredentials);
    EXPECT_EQ(failures(), 1);
}

TEST_F(AuthenticatorTest, UnknownUserReadsLikeWrongPassword) {
    auto unknown = auth->authenticate("nobody", "wrong");
    auto wrong = auth->authenticate("mario", "wrong");

    EXPECT_EQ(unknown.error, AuthError::InvalidCredentials);
    EXPECT_EQ(unknown.error, wrong.error);
    EXPECT_EQ(unknown.publicMessage(), wrong.publicMessage());
    EXPECT_FALSE(users->find("nobody").has_value());
}

TEST_F(AuthenticatorTest, UnknownUserWritesNothing) {
    const auto path = testDir / "users.db";
    auto bytes = [&] {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    };
    const std::string before = bytes();
    const auto stamp = fs::last_write_time(path);

    EXPECT_EQ(auth->authenticate("nobody", "wrong").error, AuthError::InvalidCredentials);

    EXPECT_EQ(bytes(), before);
    EXPECT_EQ(fs::last_write_time(path), stamp);
    EXPECT_EQ(users->listAll().size(), 1u);
}

TEST_F(AuthenticatorTest, DisabledAccountIsRejected) {
    users->setActive("mario", false);

    auto r = auth->authenticate("mario", "Sub4Life!");
    EXPECT_EQ(r.error, AuthError::AccountDisabled);
    EXPECT_EQ(failures(), 0);
}

TEST_F(AuthenticatorTest, LockedAccountRejectsEvenCorrectPassword) {
    for (int i = 1; i <= 5; ++i) {
        auto r = auth->authenticate("mario", "wrong");
        EXPECT_EQ(r.error, AuthError::InvalidCredentials);
        EXPECT_EQ(failures(), i);
    }

    auto r = auth->authenticate("mario", "Sub4Life!");
    EXPECT_EQ(r.error, AuthError::AccountLocked);
    EXPECT_EQ(r.lock_remaining, 900);
    EXPECT_EQ(r.publicMessage(), "This account is temporarily locked. Try again later.");

    // Attempts against a locked account are not counted.
    auth->authenticate("mario", "wrong");
    EXPECT_EQ(failures(), 5);
}

TEST_F(AuthenticatorTest, LockExpiresOnItsOwn) {
    for (int i = 0; i < 5; ++i) auth->authenticate("mario", "wrong");

    clock.advance(899);
    EXPECT_EQ(auth->authenticate("mario", "Sub4Life!").error, AuthError::AccountLocked);

    clock.advance(2);
    auto r = auth->authenticate("mario", "Sub4Life!");
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(failures(), 0);
}

TEST_F(AuthenticatorTest, WrongAttemptAfterExpiryRelocks) {
    for (int i = 0; i < 5; ++i) auth->authenticate("mario", "wrong");
    clock.advance(901);

    EXPECT_EQ(auth->authenticate("mario", "wrong").error, AuthError::InvalidCredentials);
    EXPECT_EQ(failures(), 6);
    EXPECT_EQ(auth->authenticate("mario", "Sub4Life!").error, AuthError::AccountLocked);
}

TEST_F(AuthenticatorTest, EmptyCredentialsAreNotCounted) {
    EXPECT_EQ(auth->authenticate("mario", "").error, AuthError::InvalidCredentials);
    EXPECT_EQ(auth->authenticate("", "Sub4Life!").error, AuthError::InvalidCredentials);
    EXPECT_EQ(failures(), 0);
}

TEST_F(AuthenticatorTest, UsernameMatchIsExact) {
    EXPECT_EQ(auth->authenticate("Mario", "Sub4Life!").error, AuthError::InvalidCredentials);
    EXPECT_EQ(failures(), 0);
}

TEST_F(AuthenticatorTest, UndecryptableHashIsStoreUnavailable) {
    auto u = *users->find("mario");
    u.password_hash = "00";
    ASSERT_TRUE(storage->put(u));

    auto r = auth->authenticate("mario", "Sub4Life!");
    EXPECT_EQ(r.error, AuthError::StoreUnavailable);
    EXPECT_EQ(r.publicMessage(), "Login is temporarily unavailable.");
    EXPECT_EQ(failures(), 0);
}

TEST_F(AuthenticatorTest, ConcurrentFailuresAreAllCounted) {
    build(LockoutPolicy{ 100, 900 });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 2; ++i) auth->authenticate("mario", "wrong");
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(failures(), 8);
}
