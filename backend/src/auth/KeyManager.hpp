#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Owns the symmetric key that protects stored password hashes at rest.
//
// Resolution order, performed once per instance:
//   1. external key material (AQUALOG_ENCRYPTION_KEY, URL-safe base64 of 32 bytes)
//   2. the persisted key file
//   3. a freshly generated key, written to the key file before it is returned
//
// Malformed external material or a corrupt key file throws
// AuthException(KeyResolutionError); there is never a silent fallback to a new
// key, since that would orphan every hash encrypted under the old one.
class KeyManager {
public:
    static constexpr std::size_t KEY_BYTES = 32; // crypto_secretbox_KEYBYTES
    static constexpr const char* ENV_VAR = "AQUALOG_ENCRYPTION_KEY";

    KeyManager(const std::string& keyFile, std::optional<std::string> externalKey = std::nullopt);
    ~KeyManager();

    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;

    // Idempotent; concurrent first calls resolve a single key.
    // With allow_generate false, a missing key file is KeyResolutionError
    // instead of a fresh key (records sealed under the lost key exist).
    const std::vector<unsigned char>& resolveKey(bool allow_generate = true);

    // hex(nonce || crypto_secretbox(plain)) under the resolved key.
    std::string seal(const std::vector<unsigned char>& plain);

    // Returns false if sealed is malformed or fails authentication.
    bool open(const std::string& sealed, std::vector<unsigned char>& plain);

    // AQUALOG_ENCRYPTION_KEY, if set and non-empty.
    static std::optional<std::string> keyFromEnvironment();

    const std::string& keyFilePath() const { return key_file; }

private:
    std::vector<unsigned char> decodeKey(const std::string& encoded, const char* origin) const;
    std::optional<std::vector<unsigned char>> readKeyFile() const;
    std::vector<unsigned char> generateAndPersist() const;

    std::string key_file;
    std::optional<std::string> external_key;

    std::mutex resolve_mutex;
    bool resolved = false;
    std::vector<unsigned char> key;
};
