// include/cipher.hpp
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ChunkStore {
namespace Crypto {

constexpr size_t KEY_SIZE = 32;   // AES-256
constexpr size_t NONCE_SIZE = 12; // GCM standard nonce
constexpr size_t TAG_SIZE = 16;
constexpr size_t SALT_SIZE = 16;
constexpr uint32_t DEFAULT_PBKDF2_ITERATIONS = 600000;

// 256-bit key. Wiped when destroyed.
class KeyMaterial {
public:
    KeyMaterial() { bytes.fill(0); }
    ~KeyMaterial();
    KeyMaterial(const KeyMaterial&) = default;
    KeyMaterial& operator=(const KeyMaterial&) = default;

    std::array<unsigned char, KEY_SIZE> bytes;
};

// Stretches a password with PBKDF2-HMAC-SHA256.
KeyMaterial deriveKey(const std::string& password, const std::vector<unsigned char>& salt, uint32_t iterations);

// Fresh random salt for a new manifest.
std::vector<unsigned char> generateSalt();

// Per-chunk AES-256-GCM. Output layout: nonce(12) || ciphertext || tag(16).
// A disabled cipher passes bytes through unchanged.
class Cipher {
public:
    static Cipher disabled();
    static Cipher withKey(const KeyMaterial& key);

    bool enabled() const { return enabled_; }

    std::vector<char> encrypt(const std::vector<char>& plaintext) const;

    // Throws MalformedCiphertext when input is shorter than a nonce and
    // AuthenticationFailure when the tag is missing or does not verify.
    std::vector<char> decrypt(const std::vector<char>& ciphertext) const;

private:
    Cipher() = default;

    bool enabled_ = false;
    KeyMaterial key_;
};

} // namespace Crypto
} // namespace ChunkStore
