#ifndef VEIL_CRYPTO_HPP
#define VEIL_CRYPTO_HPP

#include "veil_secure_memory.hpp"
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace veil {

/**
 * @brief Password-based authenticated encryption for stego payloads
 *
 * Key derivation: Argon2id v1.3 (crypto_pwhash), 16-byte salt.
 * Cipher: ChaCha20-Poly1305 IETF, 12-byte nonce, 16-byte tag.
 *
 * Sealed blob layout:
 *   [salt:16][nonce:12][ciphertext:N][tag:16]
 *
 * Derived keys live in SecureMemory and are wiped when the call returns.
 */
class Crypto {
public:
    static constexpr size_t SALT_LEN  = 16;
    static constexpr size_t NONCE_LEN = 12;
    static constexpr size_t TAG_LEN   = 16;
    static constexpr size_t KEY_LEN   = 32;
    static constexpr size_t SEAL_OVERHEAD = SALT_LEN + NONCE_LEN + TAG_LEN;

    struct KdfParams {
        unsigned long long opslimit = 0;
        size_t memlimit = 0;

        // libsodium's INTERACTIVE profile
        static KdfParams interactive();
        // Cheapest accepted profile; only for tests
        static KdfParams minimum();

        // Rejects values outside [MIN, SENSITIVE] so a crafted container
        // cannot make extraction allocate unbounded memory.
        bool within_limits() const;
    };

    explicit Crypto(bool lock_key_memory = true);
    ~Crypto() noexcept = default;

    // Random generation - returns SecureMemory
    SecureMemory generate_random(size_t size);

    // Argon2id(password, salt) -> 32-byte key
    SecureMemory derive_key(
        const SecureString& password,
        const uint8_t* salt, size_t salt_len,
        const KdfParams& params
    );

    // Raw AEAD with caller-supplied key and nonce: returns ciphertext||tag
    std::vector<uint8_t> encrypt(
        const uint8_t* plaintext, size_t plaintext_len,
        const SecureMemory& key,
        const uint8_t* nonce,
        const std::vector<uint8_t>& additional_data = {}
    );

    // Inverse of encrypt(); throws StegoError(WrongPasswordOrCorruption)
    SecureMemory decrypt(
        const uint8_t* ciphertext, size_t ciphertext_len,
        const SecureMemory& key,
        const uint8_t* nonce,
        const std::vector<uint8_t>& additional_data = {}
    );

    // Fresh salt + nonce, derive, encrypt: salt||nonce||ciphertext||tag
    std::vector<uint8_t> seal(
        const uint8_t* plaintext, size_t plaintext_len,
        const SecureString& password,
        const std::vector<uint8_t>& additional_data,
        const KdfParams& params
    );

    // Parse salt/nonce out of the blob, derive, decrypt
    SecureMemory open(
        const std::vector<uint8_t>& sealed,
        const SecureString& password,
        const std::vector<uint8_t>& additional_data,
        const KdfParams& params
    );

    static size_t sealed_size(size_t plaintext_len) noexcept {
        return plaintext_len + SEAL_OVERHEAD;
    }

    // Lowercase hex SHA-256
    static std::string sha256_hex(const uint8_t* data, size_t len);

private:
    void init_libsodium();

    bool lock_key_memory_;
};

} // namespace veil

#endif // VEIL_CRYPTO_HPP
