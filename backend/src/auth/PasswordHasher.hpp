#pragma once
#include <string>
#include <vector>

// Argon2id cost. Defaults are libsodium's INTERACTIVE limits.
struct HashParams {
    unsigned long long ops_limit = 2;
    std::size_t mem_limit = 64 * 1024 * 1024;
};

// One-way password digest: Argon2id(password, per-user salt).
// The digest is what gets sealed by the KeyManager; it never leaves the engine.
class PasswordHasher {
public:
    static constexpr std::size_t SALT_BYTES = 16;   // crypto_pwhash_SALTBYTES
    static constexpr std::size_t DIGEST_BYTES = 32;

    explicit PasswordHasher(HashParams params = HashParams{});

    // Fresh random salt, hex-encoded.
    std::string generateSalt() const;

    // Throws std::runtime_error if the salt is malformed or Argon2id fails (out of memory).
    std::vector<unsigned char> digest(const std::string& password, const std::string& salt_hex) const;

    // Constant-time comparison.
    static bool equal(const std::vector<unsigned char>& a, const std::vector<unsigned char>& b);

private:
    HashParams params;
};
