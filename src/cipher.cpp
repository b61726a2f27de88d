// src/cipher.cpp
#include "cipher.hpp"
#include "errors.hpp"

#include <memory>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace ChunkStore {
namespace Crypto {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

CipherCtxPtr newContext() {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw EncryptionFailure("failed to allocate cipher context");
    }
    return ctx;
}

const unsigned char* asBytes(const char* p) { return reinterpret_cast<const unsigned char*>(p); }
unsigned char* asBytes(char* p) { return reinterpret_cast<unsigned char*>(p); }

} // namespace

KeyMaterial::~KeyMaterial() {
    OPENSSL_cleanse(bytes.data(), bytes.size());
}

KeyMaterial deriveKey(const std::string& password, const std::vector<unsigned char>& salt, uint32_t iterations) {
    if (iterations == 0) {
        throw ConfigurationError("PBKDF2 iteration count must be positive");
    }
    if (salt.empty()) {
        throw ConfigurationError("key derivation requires a non-empty salt");
    }
    KeyMaterial key;
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha256(),
                          static_cast<int>(key.bytes.size()), key.bytes.data()) != 1) {
        throw EncryptionFailure("PBKDF2 key derivation failed");
    }
    return key;
}

std::vector<unsigned char> generateSalt() {
    std::vector<unsigned char> salt(SALT_SIZE);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw EncryptionFailure("failed to generate salt");
    }
    return salt;
}

Cipher Cipher::disabled() {
    return Cipher();
}

Cipher Cipher::withKey(const KeyMaterial& key) {
    Cipher c;
    c.enabled_ = true;
    c.key_ = key;
    return c;
}

std::vector<char> Cipher::encrypt(const std::vector<char>& plaintext) const {
    if (!enabled_) {
        return plaintext;
    }

    std::vector<char> out(NONCE_SIZE + plaintext.size() + TAG_SIZE);
    unsigned char* nonce = asBytes(out.data());
    unsigned char* body = nonce + NONCE_SIZE;

    // Fresh nonce on every call; never derived from the chunk.
    if (RAND_bytes(nonce, static_cast<int>(NONCE_SIZE)) != 1) {
        throw EncryptionFailure("failed to generate nonce");
    }

    CipherCtxPtr ctx = newContext();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.bytes.data(), nonce) != 1) {
        throw EncryptionFailure("AES-GCM encrypt initialisation failed");
    }

    int len = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), body, &len, asBytes(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1) {
            throw EncryptionFailure("AES-GCM encrypt update failed");
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), body + total, &len) != 1) {
        throw EncryptionFailure("AES-GCM encrypt finalisation failed");
    }
    total += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), body + total) != 1) {
        throw EncryptionFailure("failed to read AES-GCM tag");
    }
    return out;
}

std::vector<char> Cipher::decrypt(const std::vector<char>& ciphertext) const {
    if (!enabled_) {
        return ciphertext;
    }
    if (ciphertext.size() < NONCE_SIZE) {
        throw MalformedCiphertext("ciphertext of " + std::to_string(ciphertext.size()) +
                                  " bytes is shorter than the nonce");
    }
    if (ciphertext.size() < NONCE_SIZE + TAG_SIZE) {
        throw AuthenticationFailure("ciphertext is missing its authentication tag");
    }

    const unsigned char* nonce = asBytes(ciphertext.data());
    const unsigned char* body = nonce + NONCE_SIZE;
    const size_t body_len = ciphertext.size() - NONCE_SIZE - TAG_SIZE;
    std::vector<unsigned char> tag(body + body_len, body + body_len + TAG_SIZE);

    CipherCtxPtr ctx = newContext();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.bytes.data(), nonce) != 1) {
        throw EncryptionFailure("AES-GCM decrypt initialisation failed");
    }

    std::vector<char> plaintext(body_len);
    int len = 0;
    int total = 0;
    if (body_len > 0) {
        if (EVP_DecryptUpdate(ctx.get(), asBytes(plaintext.data()), &len, body, static_cast<int>(body_len)) != 1) {
            throw EncryptionFailure("AES-GCM decrypt update failed");
        }
        total = len;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data()) != 1) {
        throw EncryptionFailure("failed to set AES-GCM tag");
    }
    // GCM final emits no bytes, it only checks the tag.
    unsigned char scratch[16];
    if (EVP_DecryptFinal_ex(ctx.get(), body_len > 0 ? asBytes(plaintext.data()) + total : scratch, &len) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw AuthenticationFailure("authentication tag mismatch (wrong password or corrupted ciphertext)");
    }
    return plaintext;
}

} // namespace Crypto
} // namespace ChunkStore
