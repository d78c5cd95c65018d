/**
 * @file veil_crypto.cpp
 * @brief Argon2id key derivation and ChaCha20-Poly1305 IETF sealing
 * @note libsodium is REQUIRED - no fallback implementations
 */

#include "veil_crypto.hpp"
#include "veil_errors.hpp"
#include "veil_logger.hpp"

#include <sodium.h>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace veil {

static_assert(Crypto::SALT_LEN == crypto_pwhash_SALTBYTES, "salt length must match crypto_pwhash");
static_assert(Crypto::NONCE_LEN == crypto_aead_chacha20poly1305_ietf_NPUBBYTES, "nonce length");
static_assert(Crypto::TAG_LEN == crypto_aead_chacha20poly1305_ietf_ABYTES, "tag length");
static_assert(Crypto::KEY_LEN == crypto_aead_chacha20poly1305_ietf_KEYBYTES, "key length");

// ---- KdfParams ---------------------------------------------------------

Crypto::KdfParams Crypto::KdfParams::interactive() {
    KdfParams p;
    p.opslimit = crypto_pwhash_OPSLIMIT_INTERACTIVE;
    p.memlimit = crypto_pwhash_MEMLIMIT_INTERACTIVE;
    return p;
}

Crypto::KdfParams Crypto::KdfParams::minimum() {
    KdfParams p;
    p.opslimit = crypto_pwhash_argon2id_OPSLIMIT_MIN;
    p.memlimit = crypto_pwhash_argon2id_MEMLIMIT_MIN;
    return p;
}

bool Crypto::KdfParams::within_limits() const {
    return opslimit >= crypto_pwhash_argon2id_OPSLIMIT_MIN &&
           opslimit <= crypto_pwhash_argon2id_OPSLIMIT_SENSITIVE &&
           memlimit >= crypto_pwhash_argon2id_MEMLIMIT_MIN &&
           memlimit <= crypto_pwhash_argon2id_MEMLIMIT_SENSITIVE;
}

// ---- Crypto ------------------------------------------------------------

Crypto::Crypto(bool lock_key_memory)
    : lock_key_memory_(lock_key_memory)
{
    init_libsodium();
}

void Crypto::init_libsodium() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

SecureMemory Crypto::generate_random(size_t size) {
    SecureMemory result(size);
    if (size > 0) {
        randombytes_buf(result.data(), size);
    }
    return result;
}

SecureMemory Crypto::derive_key(
    const SecureString& password,
    const uint8_t* salt, size_t salt_len,
    const KdfParams& params
) {
    if (!salt || salt_len != SALT_LEN) {
        throw std::invalid_argument("Argon2id salt must be exactly 16 bytes");
    }
    if (!params.within_limits()) {
        throw std::invalid_argument("Argon2id cost parameters out of range");
    }

    SecureMemory key(KEY_LEN);
    if (lock_key_memory_ && !key.lock()) {
        VEIL_LOG_DEBUG("[Crypto] mlock of derived key failed; continuing unlocked");
    }

    if (crypto_pwhash(
            key.data(), key.size(),
            password.c_str(), password.length(),
            salt,
            params.opslimit,
            params.memlimit,
            crypto_pwhash_ALG_ARGON2ID13) != 0) {
        throw std::runtime_error("Argon2id key derivation failed (out of memory)");
    }

    return key;
}

std::vector<uint8_t> Crypto::encrypt(
    const uint8_t* plaintext, size_t plaintext_len,
    const SecureMemory& key,
    const uint8_t* nonce,
    const std::vector<uint8_t>& additional_data
) {
    if (key.size() != KEY_LEN) {
        throw std::invalid_argument("Invalid key size for ChaCha20-Poly1305 (expected 32 bytes)");
    }
    if (!nonce) {
        throw std::invalid_argument("ChaCha20-Poly1305 nonce is required");
    }

    std::vector<uint8_t> ciphertext(plaintext_len + TAG_LEN);
    unsigned long long ciphertext_len = 0;

    if (crypto_aead_chacha20poly1305_ietf_encrypt(
            ciphertext.data(), &ciphertext_len,
            plaintext, plaintext_len,
            additional_data.empty() ? nullptr : additional_data.data(),
            additional_data.size(),
            nullptr,
            nonce,
            key.data()) != 0) {
        throw std::runtime_error("ChaCha20-Poly1305 encryption failed");
    }

    ciphertext.resize(static_cast<size_t>(ciphertext_len));
    return ciphertext;
}

SecureMemory Crypto::decrypt(
    const uint8_t* ciphertext, size_t ciphertext_len,
    const SecureMemory& key,
    const uint8_t* nonce,
    const std::vector<uint8_t>& additional_data
) {
    if (key.size() != KEY_LEN) {
        throw std::invalid_argument("Invalid key size for ChaCha20-Poly1305 (expected 32 bytes)");
    }
    if (!ciphertext || !nonce || ciphertext_len < TAG_LEN) {
        throw StegoError(ErrorKind::WrongPasswordOrCorruption, "ciphertext too short");
    }

    SecureMemory plaintext(ciphertext_len - TAG_LEN);
    unsigned long long plaintext_len = 0;

    if (crypto_aead_chacha20poly1305_ietf_decrypt(
            plaintext.data(), &plaintext_len,
            nullptr,
            ciphertext, ciphertext_len,
            additional_data.empty() ? nullptr : additional_data.data(),
            additional_data.size(),
            nonce,
            key.data()) != 0) {
        // plaintext buffer is wiped by SecureMemory on unwind
        throw StegoError(ErrorKind::WrongPasswordOrCorruption, "authentication failed");
    }

    return plaintext;
}

std::vector<uint8_t> Crypto::seal(
    const uint8_t* plaintext, size_t plaintext_len,
    const SecureString& password,
    const std::vector<uint8_t>& additional_data,
    const KdfParams& params
) {
    uint8_t salt[SALT_LEN];
    uint8_t nonce[NONCE_LEN];
    randombytes_buf(salt, sizeof(salt));
    randombytes_buf(nonce, sizeof(nonce));

    SecureMemory key = derive_key(password, salt, sizeof(salt), params);
    std::vector<uint8_t> body = encrypt(plaintext, plaintext_len, key, nonce, additional_data);

    std::vector<uint8_t> sealed;
    sealed.reserve(SALT_LEN + NONCE_LEN + body.size());
    sealed.insert(sealed.end(), salt, salt + SALT_LEN);
    sealed.insert(sealed.end(), nonce, nonce + NONCE_LEN);
    sealed.insert(sealed.end(), body.begin(), body.end());
    return sealed;
}

SecureMemory Crypto::open(
    const std::vector<uint8_t>& sealed,
    const SecureString& password,
    const std::vector<uint8_t>& additional_data,
    const KdfParams& params
) {
    if (sealed.size() < SEAL_OVERHEAD) {
        throw StegoError(ErrorKind::WrongPasswordOrCorruption, "sealed payload too short");
    }

    const uint8_t* salt = sealed.data();
    const uint8_t* nonce = sealed.data() + SALT_LEN;
    const uint8_t* body = sealed.data() + SALT_LEN + NONCE_LEN;
    size_t body_len = sealed.size() - SALT_LEN - NONCE_LEN;

    SecureMemory key = derive_key(password, salt, SALT_LEN, params);
    return decrypt(body, body_len, key, nonce, additional_data);
}

std::string Crypto::sha256_hex(const uint8_t* data, size_t len) {
    uint8_t hash[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(hash, data, len);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < sizeof(hash); ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

} // namespace veil
