#include "veil_secure_memory.hpp"
#include <sodium.h>
#include <cstring>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/mman.h>
#endif

namespace veil {

// ---- SecureMemory ------------------------------------------------------

SecureMemory::SecureMemory() = default;

SecureMemory::SecureMemory(size_t size)
    : size_(size)
{
    if (size > 0) {
        data_ = new uint8_t[size];
        std::memset(data_, 0, size_);
    }
}

SecureMemory::SecureMemory(const uint8_t* data, size_t size)
    : SecureMemory(size)
{
    if (size > 0) {
        if (!data) {
            throw std::invalid_argument("SecureMemory: null source with non-zero size");
        }
        std::memcpy(data_, data, size);
    }
}

SecureMemory::~SecureMemory() {
    release();
}

SecureMemory::SecureMemory(SecureMemory&& other) noexcept
    : data_(other.data_), size_(other.size_), locked_(other.locked_)
{
    other.data_ = nullptr;
    other.size_ = 0;
    other.locked_ = false;
}

SecureMemory& SecureMemory::operator=(SecureMemory&& other) noexcept {
    if (this != &other) {
        release();
        data_ = other.data_;
        size_ = other.size_;
        locked_ = other.locked_;
        other.data_ = nullptr;
        other.size_ = 0;
        other.locked_ = false;
    }
    return *this;
}

void SecureMemory::release() {
    if (data_) {
        zero();
        if (locked_) unlock();
        delete[] data_;
        data_ = nullptr;
    }
    size_ = 0;
}

uint8_t* SecureMemory::data() { return data_; }
const uint8_t* SecureMemory::data() const { return data_; }
size_t SecureMemory::size() const { return size_; }
bool SecureMemory::empty() const { return size_ == 0; }

uint8_t* SecureMemory::begin() { return data_; }
uint8_t* SecureMemory::end() { return data_ + size_; }
const uint8_t* SecureMemory::begin() const { return data_; }
const uint8_t* SecureMemory::end() const { return data_ + size_; }

std::vector<uint8_t> SecureMemory::to_vector() const {
    return std::vector<uint8_t>(begin(), end());
}

void SecureMemory::zero() {
    if (data_ && size_ > 0) {
        sodium_memzero(data_, size_);
    }
}

bool SecureMemory::lock() {
    if (!data_ || size_ == 0 || locked_) return false;
#ifdef _WIN32
    locked_ = VirtualLock(data_, size_) != 0;
#else
    locked_ = mlock(data_, size_) == 0;
#endif
    return locked_;
}

bool SecureMemory::unlock() {
    if (!data_ || size_ == 0 || !locked_) return false;
#ifdef _WIN32
    bool ok = VirtualUnlock(data_, size_) != 0;
#else
    bool ok = munlock(data_, size_) == 0;
#endif
    if (ok) locked_ = false;
    return ok;
}

bool SecureMemory::is_locked() const { return locked_; }

void SecureMemory::secure_zero(void* ptr, size_t size) {
    if (ptr && size > 0) {
        sodium_memzero(ptr, size);
    }
}

// ---- SecureString ------------------------------------------------------

SecureString::SecureString() = default;

SecureString::SecureString(const std::string& str)
    : SecureString(str.data(), str.size())
{}

SecureString::SecureString(const char* str, size_t len)
    : size_(len), capacity_(len + 1)
{
    data_ = new char[capacity_];
    if (len > 0 && str) {
        std::memcpy(data_, str, size_);
    } else {
        size_ = 0;
    }
    data_[size_] = '\0';
}

SecureString::~SecureString() {
    clear();
}

SecureString::SecureString(SecureString&& other) noexcept
    : data_(other.data_), size_(other.size_), capacity_(other.capacity_)
{
    other.data_ = nullptr;
    other.size_ = 0;
    other.capacity_ = 0;
}

SecureString& SecureString::operator=(SecureString&& other) noexcept {
    if (this != &other) {
        clear();
        data_ = other.data_;
        size_ = other.size_;
        capacity_ = other.capacity_;
        other.data_ = nullptr;
        other.size_ = 0;
        other.capacity_ = 0;
    }
    return *this;
}

const char* SecureString::c_str() const { return data_ ? data_ : ""; }
const char* SecureString::data() const { return c_str(); }
size_t SecureString::size() const { return size_; }
size_t SecureString::length() const { return size_; }
bool SecureString::empty() const { return size_ == 0; }

void SecureString::clear() {
    if (data_) {
        sodium_memzero(data_, capacity_);
        delete[] data_;
        data_ = nullptr;
    }
    size_ = 0;
    capacity_ = 0;
}

// ---- SecureOps ---------------------------------------------------------

namespace SecureOps {

bool constant_time_compare(const void* a, const void* b, size_t len) {
    if (!a || !b || len == 0) return false;
    return sodium_memcmp(a, b, len) == 0;
}

std::vector<uint8_t> generate_random(size_t size) {
    std::vector<uint8_t> result(size);
    if (size > 0) {
        randombytes_buf(result.data(), size);
    }
    return result;
}

} // namespace SecureOps

} // namespace veil
