// tests/cipher_test.cpp
#include <gtest/gtest.h>

#include "cipher.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace ChunkStore;
using ChunkStore::Testing::patternBytes;
using ChunkStore::Testing::TEST_KDF_ITERATIONS;

namespace {

Crypto::Cipher cipherFor(const std::string& password, const std::vector<unsigned char>& salt) {
    return Crypto::Cipher::withKey(Crypto::deriveKey(password, salt, TEST_KDF_ITERATIONS));
}

} // namespace

TEST(CipherTest, RoundTripRestoresPlaintext) {
    auto salt = Crypto::generateSalt();
    Crypto::Cipher cipher = cipherFor("correct horse", salt);

    for (size_t size : {0u, 1u, 15u, 16u, 17u, 4096u}) {
        std::vector<char> plaintext = patternBytes(size, static_cast<uint32_t>(size) + 7);
        std::vector<char> sealed = cipher.encrypt(plaintext);
        EXPECT_EQ(sealed.size(), plaintext.size() + Crypto::NONCE_SIZE + Crypto::TAG_SIZE);
        EXPECT_EQ(cipher.decrypt(sealed), plaintext);
    }
}

TEST(CipherTest, EveryEncryptionUsesAFreshNonce) {
    Crypto::Cipher cipher = cipherFor("pw", Crypto::generateSalt());
    std::vector<char> plaintext = patternBytes(64);

    std::vector<char> a = cipher.encrypt(plaintext);
    std::vector<char> b = cipher.encrypt(plaintext);
    EXPECT_NE(std::vector<char>(a.begin(), a.begin() + Crypto::NONCE_SIZE),
              std::vector<char>(b.begin(), b.begin() + Crypto::NONCE_SIZE));
    EXPECT_NE(a, b);
}

TEST(CipherTest, FlippedBitFailsAuthentication) {
    Crypto::Cipher cipher = cipherFor("pw", Crypto::generateSalt());
    std::vector<char> sealed = cipher.encrypt(patternBytes(100));

    // Nonce, body and tag alike.
    for (size_t pos = 0; pos < sealed.size(); ++pos) {
        std::vector<char> tampered = sealed;
        tampered[pos] = static_cast<char>(tampered[pos] ^ 0x01);
        EXPECT_THROW(cipher.decrypt(tampered), AuthenticationFailure) << "byte " << pos;
    }
}

TEST(CipherTest, WrongPasswordFailsAuthentication) {
    auto salt = Crypto::generateSalt();
    std::vector<char> sealed = cipherFor("right", salt).encrypt(patternBytes(32));
    EXPECT_THROW(cipherFor("wrong", salt).decrypt(sealed), AuthenticationFailure);
}

TEST(CipherTest, ShortInputIsRejected) {
    Crypto::Cipher cipher = cipherFor("pw", Crypto::generateSalt());

    EXPECT_THROW(cipher.decrypt(std::vector<char>(Crypto::NONCE_SIZE - 1, 'x')), MalformedCiphertext);
    // Long enough for a nonce but not for the tag.
    EXPECT_THROW(cipher.decrypt(std::vector<char>(Crypto::NONCE_SIZE + 3, 'x')), AuthenticationFailure);
}

TEST(CipherTest, DisabledCipherPassesBytesThrough) {
    Crypto::Cipher cipher = Crypto::Cipher::disabled();
    std::vector<char> bytes = patternBytes(10);

    EXPECT_FALSE(cipher.enabled());
    EXPECT_EQ(cipher.encrypt(bytes), bytes);
    EXPECT_EQ(cipher.decrypt(bytes), bytes);
}

TEST(KeyDerivationTest, SameInputsGiveSameKey) {
    auto salt = Crypto::generateSalt();
    EXPECT_EQ(salt.size(), Crypto::SALT_SIZE);

    auto k1 = Crypto::deriveKey("pw", salt, TEST_KDF_ITERATIONS);
    auto k2 = Crypto::deriveKey("pw", salt, TEST_KDF_ITERATIONS);
    auto k3 = Crypto::deriveKey("pw", Crypto::generateSalt(), TEST_KDF_ITERATIONS);
    EXPECT_EQ(k1.bytes, k2.bytes);
    EXPECT_NE(k1.bytes, k3.bytes);
}

TEST(KeyDerivationTest, RejectsInvalidParameters) {
    EXPECT_THROW(Crypto::deriveKey("pw", Crypto::generateSalt(), 0), ConfigurationError);
    EXPECT_THROW(Crypto::deriveKey("pw", {}, TEST_KDF_ITERATIONS), ConfigurationError);
}
