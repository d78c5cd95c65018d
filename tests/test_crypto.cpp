/**
 * @file test_crypto.cpp
 * @brief Argon2id derivation and ChaCha20-Poly1305 sealing
 */

#include <gtest/gtest.h>
#include "veil_crypto.hpp"
#include "veil_errors.hpp"

#include <string>
#include <vector>

using namespace veil;

class CryptoTest : public ::testing::Test {
protected:
    CryptoTest() : crypto(false), params(Crypto::KdfParams::minimum()) {}

    std::vector<uint8_t> bytes(const std::string& s) {
        return std::vector<uint8_t>(s.begin(), s.end());
    }

    Crypto crypto;
    Crypto::KdfParams params;
};

// ─── Key derivation ───────────────────────────────────────────────────────

TEST_F(CryptoTest, DeriveKeyIsDeterministicPerSalt) {
    SecureString password("correct horse");
    uint8_t salt[Crypto::SALT_LEN] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16};

    SecureMemory k1 = crypto.derive_key(password, salt, sizeof(salt), params);
    SecureMemory k2 = crypto.derive_key(password, salt, sizeof(salt), params);

    ASSERT_EQ(k1.size(), Crypto::KEY_LEN);
    EXPECT_EQ(k1.to_vector(), k2.to_vector());

    salt[0] ^= 0xFF;
    SecureMemory k3 = crypto.derive_key(password, salt, sizeof(salt), params);
    EXPECT_NE(k1.to_vector(), k3.to_vector());
}

TEST_F(CryptoTest, DeriveKeyAcceptsEmptyPassword) {
    SecureString empty;
    uint8_t salt[Crypto::SALT_LEN] = {};
    SecureMemory key = crypto.derive_key(empty, salt, sizeof(salt), params);
    EXPECT_EQ(key.size(), Crypto::KEY_LEN);
}

TEST_F(CryptoTest, DeriveKeyRejectsBadSalt) {
    SecureString password("pw");
    uint8_t salt[8] = {};
    EXPECT_THROW(crypto.derive_key(password, salt, sizeof(salt), params), std::invalid_argument);
    EXPECT_THROW(crypto.derive_key(password, nullptr, Crypto::SALT_LEN, params), std::invalid_argument);
}

TEST_F(CryptoTest, DeriveKeyRejectsOutOfRangeCost) {
    SecureString password("pw");
    uint8_t salt[Crypto::SALT_LEN] = {};
    Crypto::KdfParams bogus;
    bogus.opslimit = 0;
    bogus.memlimit = 1;
    EXPECT_FALSE(bogus.within_limits());
    EXPECT_THROW(crypto.derive_key(password, salt, sizeof(salt), bogus), std::invalid_argument);
}

TEST_F(CryptoTest, InteractiveProfileIsWithinLimits) {
    EXPECT_TRUE(Crypto::KdfParams::interactive().within_limits());
    EXPECT_TRUE(Crypto::KdfParams::minimum().within_limits());
}

// ─── Seal / open ──────────────────────────────────────────────────────────

TEST_F(CryptoTest, SealOpenRoundTrip) {
    SecureString password("hunter2");
    auto plaintext = bytes("the quick brown fox");
    auto aad = bytes("veil-meta/1\nencrypted=true\n");

    auto sealed = crypto.seal(plaintext.data(), plaintext.size(), password, aad, params);
    EXPECT_EQ(sealed.size(), Crypto::sealed_size(plaintext.size()));

    SecureMemory opened = crypto.open(sealed, password, aad, params);
    EXPECT_EQ(opened.to_vector(), plaintext);
}

TEST_F(CryptoTest, SealUsesFreshSaltAndNonce) {
    SecureString password("same");
    auto plaintext = bytes("same plaintext");
    auto a = crypto.seal(plaintext.data(), plaintext.size(), password, {}, params);
    auto b = crypto.seal(plaintext.data(), plaintext.size(), password, {}, params);
    EXPECT_NE(a, b);
}

TEST_F(CryptoTest, OpenWithWrongPasswordFails) {
    SecureString right("right");
    SecureString wrong("wrong");
    auto plaintext = bytes("secret");
    auto sealed = crypto.seal(plaintext.data(), plaintext.size(), right, {}, params);

    try {
        crypto.open(sealed, wrong, {}, params);
        FAIL() << "open with wrong password succeeded";
    } catch (const StegoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::WrongPasswordOrCorruption);
    }
}

TEST_F(CryptoTest, OpenWithAlteredAadFails) {
    SecureString password("pw");
    auto plaintext = bytes("secret");
    auto aad = bytes("redundancy=1\n");
    auto sealed = crypto.seal(plaintext.data(), plaintext.size(), password, aad, params);

    auto tampered = bytes("redundancy=3\n");
    EXPECT_THROW(crypto.open(sealed, password, tampered, params), StegoError);
}

TEST_F(CryptoTest, OpenDetectsEveryFlippedCiphertextByte) {
    SecureString password("pw");
    auto plaintext = bytes("abc");
    auto sealed = crypto.seal(plaintext.data(), plaintext.size(), password, {}, params);

    for (size_t i = Crypto::SALT_LEN + Crypto::NONCE_LEN; i < sealed.size(); ++i) {
        auto corrupt = sealed;
        corrupt[i] ^= 0x01;
        EXPECT_THROW(crypto.open(corrupt, password, {}, params), StegoError) << "byte " << i;
    }
}

TEST_F(CryptoTest, OpenTruncatedBlobFails) {
    SecureString password("pw");
    std::vector<uint8_t> short_blob(Crypto::SEAL_OVERHEAD - 1, 0);
    try {
        crypto.open(short_blob, password, {}, params);
        FAIL() << "truncated blob opened";
    } catch (const StegoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::WrongPasswordOrCorruption);
    }
}

TEST_F(CryptoTest, EmptyPlaintextSeals) {
    SecureString password("pw");
    auto sealed = crypto.seal(nullptr, 0, password, {}, params);
    EXPECT_EQ(sealed.size(), Crypto::SEAL_OVERHEAD);
    EXPECT_TRUE(crypto.open(sealed, password, {}, params).empty());
}

// ─── Hashing ──────────────────────────────────────────────────────────────

TEST_F(CryptoTest, Sha256KnownVectors) {
    EXPECT_EQ(Crypto::sha256_hex(nullptr, 0),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    auto abc = bytes("abc");
    EXPECT_EQ(Crypto::sha256_hex(abc.data(), abc.size()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(CryptoTest, GenerateRandomBytes) {
    auto r1 = crypto.generate_random(32);
    auto r2 = crypto.generate_random(32);
    EXPECT_EQ(r1.size(), 32u);
    EXPECT_NE(r1.to_vector(), r2.to_vector());
}
