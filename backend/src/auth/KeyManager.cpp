#include "KeyManager.hpp"
#include "AuthError.hpp"
#include "../utils/encoding.hpp"
#include <sodium.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static_assert(KeyManager::KEY_BYTES == crypto_secretbox_KEYBYTES, "secretbox key size mismatch");

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

KeyManager::KeyManager(const std::string& keyFile, std::optional<std::string> externalKey)
    : key_file(keyFile), external_key(std::move(externalKey))
{
    if (sodium_init() < 0) {
        spdlog::critical("libsodium initialization failed");
        throw std::runtime_error("libsodium initialization failed");
    }
    spdlog::debug("KeyManager created (key file '{}', external key {})",
        key_file, external_key ? "supplied" : "absent");
}

KeyManager::~KeyManager() {
    if (!key.empty()) {
        sodium_memzero(key.data(), key.size());
    }
}

std::optional<std::string> KeyManager::keyFromEnvironment() {
    const char* value = std::getenv(ENV_VAR);
    if (value == nullptr || *value == '\0') return std::nullopt;
    return std::string(value);
}

std::vector<unsigned char> KeyManager::decodeKey(const std::string& encoded, const char* origin) const {
    std::vector<unsigned char> decoded;
    if (!encoding::fromBase64Url(trim(encoded), decoded) || decoded.size() != KEY_BYTES) {
        if (!decoded.empty()) sodium_memzero(decoded.data(), decoded.size());
        spdlog::critical("Encryption key from {} is malformed (expected base64 of {} bytes)", origin, KEY_BYTES);
        throw AuthException(AuthError::KeyResolutionError,
            std::string("malformed encryption key from ") + origin);
    }
    return decoded;
}

std::optional<std::vector<unsigned char>> KeyManager::readKeyFile() const {
    std::error_code ec;
    if (!fs::exists(key_file, ec)) return std::nullopt;

    std::ifstream in(key_file, std::ios::binary);
    if (!in) {
        spdlog::critical("Key file '{}' exists but cannot be read", key_file);
        throw AuthException(AuthError::KeyResolutionError, "cannot read key file " + key_file);
    }

    std::string encoded((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto decoded = decodeKey(encoded, "key file");
    sodium_memzero(&encoded[0], encoded.size());
    return decoded;
}

std::vector<unsigned char> KeyManager::generateAndPersist() const {
    std::vector<unsigned char> fresh(KEY_BYTES);
    randombytes_buf(fresh.data(), fresh.size());
    std::string encoded = encoding::toBase64Url(fresh) + "\n";

    fs::path target(key_file);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) spdlog::warn("Cannot create key directory '{}': {}", target.parent_path().string(), ec.message());
    }

    const std::string temp_path = key_file + "." + std::to_string(::getpid()) + "."
        + std::to_string(randombytes_random()) + ".tmp";

    int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        spdlog::critical("Cannot create key file '{}': {}", temp_path, std::strerror(errno));
        throw AuthException(AuthError::KeyResolutionError, "cannot create key file " + key_file);
    }

    bool written = ::write(fd, encoded.data(), encoded.size()) == static_cast<ssize_t>(encoded.size())
        && ::fsync(fd) == 0;
    ::close(fd);
    sodium_memzero(&encoded[0], encoded.size());

    if (!written) {
        ::unlink(temp_path.c_str());
        spdlog::critical("Failed to write key file '{}'", temp_path);
        throw AuthException(AuthError::KeyResolutionError, "cannot write key file " + key_file);
    }

    // link() refuses to replace an existing file: if another process
    // published a key first, adopt theirs instead of overwriting it.
    if (::link(temp_path.c_str(), key_file.c_str()) != 0) {
        int err = errno;
        ::unlink(temp_path.c_str());
        sodium_memzero(fresh.data(), fresh.size());

        if (err == EEXIST) {
            spdlog::info("Key file '{}' appeared concurrently; using it", key_file);
            auto existing = readKeyFile();
            if (existing) return *existing;
        }
        spdlog::critical("Cannot publish key file '{}': {}", key_file, std::strerror(err));
        throw AuthException(AuthError::KeyResolutionError, "cannot publish key file " + key_file);
    }
    ::unlink(temp_path.c_str());

    std::string dir_path = target.has_parent_path() ? target.parent_path().string() : ".";
    int dir_fd = ::open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd >= 0) {
        ::fsync(dir_fd);
        ::close(dir_fd);
    }

    spdlog::info("Generated new encryption key: {}", key_file);
    return fresh;
}

const std::vector<unsigned char>& KeyManager::resolveKey(bool allow_generate) {
    std::lock_guard<std::mutex> lock(resolve_mutex);
    if (resolved) return key;

    if (external_key) {
        key = decodeKey(*external_key, ENV_VAR);
        spdlog::info("Using encryption key from {}", ENV_VAR);
    }
    else if (auto persisted = readKeyFile()) {
        key = std::move(*persisted);
        spdlog::info("Loaded encryption key from '{}'", key_file);
    }
    else if (allow_generate) {
        key = generateAndPersist();
    }
    else {
        spdlog::critical("Key file '{}' is missing but sealed records exist; refusing to generate a new key", key_file);
        throw AuthException(AuthError::KeyResolutionError, "key file " + key_file + " missing while sealed records exist");
    }

    resolved = true;
    return key;
}

std::string KeyManager::seal(const std::vector<unsigned char>& plain) {
    const auto& k = resolveKey();

    std::vector<unsigned char> box(crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES + plain.size());
    unsigned char* nonce = box.data();
    randombytes_buf(nonce, crypto_secretbox_NONCEBYTES);

    if (crypto_secretbox_easy(box.data() + crypto_secretbox_NONCEBYTES,
        plain.data(), plain.size(), nonce, k.data()) != 0)
    {
        spdlog::error("crypto_secretbox_easy failed");
        throw std::runtime_error("crypto_secretbox_easy failed");
    }
    return encoding::toHex(box);
}

bool KeyManager::open(const std::string& sealed, std::vector<unsigned char>& plain) {
    const auto& k = resolveKey();

    std::vector<unsigned char> box;
    if (!encoding::fromHex(sealed, box) ||
        box.size() < crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES)
    {
        spdlog::error("Sealed value is malformed");
        return false;
    }

    const unsigned char* nonce = box.data();
    const unsigned char* ciphertext = box.data() + crypto_secretbox_NONCEBYTES;
    const size_t clen = box.size() - crypto_secretbox_NONCEBYTES;

    plain.resize(clen - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plain.data(), ciphertext, clen, nonce, k.data()) != 0) {
        spdlog::error("Decryption failed (wrong key or tampered value)");
        plain.clear();
        return false;
    }
    return true;
}
