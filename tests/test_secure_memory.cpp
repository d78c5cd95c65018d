/**
 * @file test_secure_memory.cpp
 * @brief Unit tests for SecureMemory, SecureString and SecureOps
 */

#include <gtest/gtest.h>
#include "veil_secure_memory.hpp"
#include <cstring>
#include <vector>

using namespace veil;

class SecureMemoryTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// ---- Basic Allocation Tests ----

TEST_F(SecureMemoryTest, DefaultConstruction) {
    SecureMemory mem;

    EXPECT_EQ(mem.size(), 0u);
    EXPECT_EQ(mem.data(), nullptr);
    EXPECT_TRUE(mem.empty());
}

TEST_F(SecureMemoryTest, SizeConstructionIsZeroFilled) {
    SecureMemory mem(32);

    ASSERT_EQ(mem.size(), 32u);
    ASSERT_NE(mem.data(), nullptr);
    for (uint8_t b : mem) {
        EXPECT_EQ(b, 0);
    }
}

TEST_F(SecureMemoryTest, DataFromPointer) {
    const uint8_t data[] = {0x01, 0x02, 0x03, 0x04, 0x05};
    SecureMemory mem(data, sizeof(data));

    EXPECT_EQ(mem.size(), 5u);
    EXPECT_EQ(std::memcmp(mem.data(), data, 5), 0);
}

TEST_F(SecureMemoryTest, NullSourceWithSizeThrows) {
    EXPECT_THROW(SecureMemory(nullptr, 4), std::invalid_argument);
}

TEST_F(SecureMemoryTest, EmptySourceIsAllowed) {
    SecureMemory mem(nullptr, 0);
    EXPECT_TRUE(mem.empty());
    EXPECT_TRUE(mem.to_vector().empty());
}

// ---- Move Semantics Tests ----

TEST_F(SecureMemoryTest, MoveConstruction) {
    SecureMemory original(32);
    std::memset(original.data(), 0xAB, 32);
    uint8_t* original_ptr = original.data();

    SecureMemory moved(std::move(original));

    EXPECT_EQ(moved.size(), 32u);
    EXPECT_EQ(moved.data(), original_ptr);
    EXPECT_EQ(moved.data()[0], 0xAB);
    EXPECT_EQ(original.size(), 0u);
    EXPECT_EQ(original.data(), nullptr);
}

TEST_F(SecureMemoryTest, MoveAssignment) {
    SecureMemory original(32);
    std::memset(original.data(), 0xCD, 32);
    SecureMemory target(16);

    target = std::move(original);

    EXPECT_EQ(target.size(), 32u);
    EXPECT_EQ(target.data()[0], 0xCD);
    EXPECT_EQ(original.data(), nullptr);
}

// ---- Zeroing ----

TEST_F(SecureMemoryTest, ZeroMethod) {
    SecureMemory mem(32);
    std::memset(mem.data(), 0xAA, 32);

    mem.zero();

    for (size_t i = 0; i < mem.size(); ++i) {
        EXPECT_EQ(mem.data()[i], 0);
    }
}

TEST_F(SecureMemoryTest, SecureZeroRawBuffer) {
    uint8_t buf[8];
    std::memset(buf, 0x5A, sizeof(buf));
    SecureMemory::secure_zero(buf, sizeof(buf));
    for (uint8_t b : buf) {
        EXPECT_EQ(b, 0);
    }
}

TEST_F(SecureMemoryTest, ToVectorCopiesContents) {
    const uint8_t data[] = {9, 8, 7};
    SecureMemory mem(data, 3);
    EXPECT_EQ(mem.to_vector(), std::vector<uint8_t>({9, 8, 7}));
}

// ---- SecureString Tests ----

TEST_F(SecureMemoryTest, SecureStringConstruction) {
    SecureString str("Hello, World!");

    EXPECT_FALSE(str.empty());
    EXPECT_EQ(str.size(), 13u);
    EXPECT_STREQ(str.c_str(), "Hello, World!");
}

TEST_F(SecureMemoryTest, SecureStringEmptyPassword) {
    SecureString str(std::string(""));

    EXPECT_TRUE(str.empty());
    EXPECT_STREQ(str.c_str(), "");
}

TEST_F(SecureMemoryTest, SecureStringMove) {
    SecureString original("Secret Password");

    SecureString moved(std::move(original));

    EXPECT_STREQ(moved.c_str(), "Secret Password");
    EXPECT_TRUE(original.empty());
}

TEST_F(SecureMemoryTest, SecureStringClear) {
    SecureString str("transient");
    str.clear();
    EXPECT_TRUE(str.empty());
}

// ---- Memory Lock Tests ----
// Note: mlock may fail without CAP_IPC_LOCK or under a low RLIMIT_MEMLOCK

TEST_F(SecureMemoryTest, MemoryLockNoThrow) {
    SecureMemory mem(1024);

    EXPECT_NO_THROW(mem.lock());
    EXPECT_NO_THROW(mem.unlock());
    EXPECT_FALSE(mem.is_locked());
}

TEST_F(SecureMemoryTest, LockEmptyFails) {
    SecureMemory mem;
    EXPECT_FALSE(mem.lock());
}

// ---- SecureOps ----

TEST_F(SecureMemoryTest, ConstantTimeCompare) {
    const uint8_t a[] = {1, 2, 3, 4};
    const uint8_t b[] = {1, 2, 3, 4};
    const uint8_t c[] = {1, 2, 3, 5};

    EXPECT_TRUE(SecureOps::constant_time_compare(a, b, sizeof(a)));
    EXPECT_FALSE(SecureOps::constant_time_compare(a, c, sizeof(a)));
    EXPECT_FALSE(SecureOps::constant_time_compare(a, nullptr, sizeof(a)));
}

TEST_F(SecureMemoryTest, GenerateRandomDiffers) {
    auto r1 = SecureOps::generate_random(32);
    auto r2 = SecureOps::generate_random(32);
    EXPECT_EQ(r1.size(), 32u);
    EXPECT_NE(r1, r2);
    EXPECT_TRUE(SecureOps::generate_random(0).empty());
}
