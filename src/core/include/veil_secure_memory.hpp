#ifndef VEIL_SECURE_MEMORY_HPP
#define VEIL_SECURE_MEMORY_HPP

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace veil {

/**
 * @brief Secure Memory Management with auto-zeroing
 *
 * Uses sodium_memzero for guaranteed secure erasure.
 * Supports mlock/munlock to keep derived keys out of swap.
 */
class SecureMemory {
public:
    SecureMemory();
    explicit SecureMemory(size_t size);
    SecureMemory(const uint8_t* data, size_t size);
    ~SecureMemory();

    // Disable copy - prevent accidental key duplication
    SecureMemory(const SecureMemory&) = delete;
    SecureMemory& operator=(const SecureMemory&) = delete;

    // Allow move
    SecureMemory(SecureMemory&& other) noexcept;
    SecureMemory& operator=(SecureMemory&& other) noexcept;

    uint8_t* data();
    const uint8_t* data() const;
    size_t size() const;
    bool empty() const;

    // Iterator support for range-based for loops
    uint8_t* begin();
    uint8_t* end();
    const uint8_t* begin() const;
    const uint8_t* end() const;

    // Copy out into a plain vector (for non-secret results such as ciphertext)
    std::vector<uint8_t> to_vector() const;

    // Securely zero the memory contents
    void zero();

    // Lock memory to prevent swapping (best-effort)
    bool lock();
    bool unlock();
    bool is_locked() const;

    static void secure_zero(void* ptr, size_t size);

private:
    void release();

    uint8_t* data_ = nullptr;
    size_t size_ = 0;
    bool locked_ = false;
};

/**
 * @brief Secure string with auto-zeroing destructor
 *
 * Holds the user's password for the duration of one hide/extract call.
 * Memory is zeroed on destruction and cannot be copied.
 */
class SecureString {
public:
    SecureString();
    explicit SecureString(const std::string& str);
    SecureString(const char* str, size_t len);
    ~SecureString();

    // Disable copy
    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    // Allow move
    SecureString(SecureString&& other) noexcept;
    SecureString& operator=(SecureString&& other) noexcept;

    const char* c_str() const;
    const char* data() const;
    size_t size() const;
    size_t length() const;
    bool empty() const;

    void clear();

private:
    char* data_ = nullptr;
    size_t size_ = 0;
    size_t capacity_ = 0;
};

namespace SecureOps {
    // Constant-time comparison to prevent timing attacks
    bool constant_time_compare(const void* a, const void* b, size_t len);

    // Cryptographically secure random bytes (uses libsodium)
    std::vector<uint8_t> generate_random(size_t size);
}

} // namespace veil

#endif // VEIL_SECURE_MEMORY_HPP
