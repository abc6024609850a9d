#include "PasswordHasher.hpp"
#include "../utils/encoding.hpp"
#include <sodium.h>
#include <stdexcept>
#include <spdlog/spdlog.h>

static_assert(PasswordHasher::SALT_BYTES == crypto_pwhash_SALTBYTES, "salt size mismatch");

PasswordHasher::PasswordHasher(HashParams p)
    : params(p)
{
    if (sodium_init() < 0) {
        throw std::runtime_error("libsodium initialization failed");
    }
    if (params.ops_limit < crypto_pwhash_OPSLIMIT_MIN || params.mem_limit < crypto_pwhash_MEMLIMIT_MIN) {
        spdlog::error("Argon2id limits below libsodium minimum (ops={}, mem={})", params.ops_limit, params.mem_limit);
        throw std::runtime_error("password hash limits below libsodium minimum");
    }
    spdlog::debug("PasswordHasher initialized (ops={}, mem={})", params.ops_limit, params.mem_limit);
}

std::string PasswordHasher::generateSalt() const {
    unsigned char salt[SALT_BYTES];
    randombytes_buf(salt, SALT_BYTES);
    return encoding::toHex(salt, SALT_BYTES);
}

std::vector<unsigned char> PasswordHasher::digest(const std::string& password, const std::string& salt_hex) const {
    spdlog::debug("Hashing password (not logging password or salt)");

    std::vector<unsigned char> salt;
    if (!encoding::fromHex(salt_hex, salt) || salt.size() != SALT_BYTES) {
        spdlog::error("Salt length mismatch while decoding");
        throw std::runtime_error("malformed salt");
    }

    std::vector<unsigned char> out(DIGEST_BYTES);
    if (crypto_pwhash(out.data(),
        out.size(),
        password.c_str(),
        static_cast<unsigned long long>(password.size()),
        salt.data(),
        params.ops_limit,
        params.mem_limit,
        crypto_pwhash_ALG_ARGON2ID13) != 0)
    {
        spdlog::error("crypto_pwhash failed (likely out of memory)");
        throw std::runtime_error("crypto_pwhash failed (out of memory)");
    }
    return out;
}

bool PasswordHasher::equal(const std::vector<unsigned char>& a, const std::vector<unsigned char>& b) {
    if (a.size() != b.size()) return false;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}
