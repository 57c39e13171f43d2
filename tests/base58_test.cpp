// SPDX-License-Identifier: MIT

// tests/base58_test.cpp
#include <gtest/gtest.h>

#include <string>

#include "src/base58.hpp"

using namespace geyser_pipe;

TEST(Base58Test, EmptyInput) {
    EXPECT_EQ(EncodeBase58(""), "");
}

TEST(Base58Test, KnownVector) {
    EXPECT_EQ(EncodeBase58("Hello World!"), "2NEpo7TZRRrLZSi2U");
}

TEST(Base58Test, LeadingZerosBecomeOnes) {
    EXPECT_EQ(EncodeBase58(std::string(4, '\0')), "1111");
    EXPECT_EQ(EncodeBase58(std::string("\0\0\x01", 3)), "112");
}

TEST(Base58Test, SystemProgramId) {
    // 32 zero bytes: the Solana system program
    EXPECT_EQ(EncodeBase58(std::string(32, '\0')), std::string(32, '1'));
}

TEST(Base58Test, HighBytes) {
    EXPECT_EQ(EncodeBase58(std::string(32, '\xff')),
              "JEKNVnkbo3jma5nREBBJCDoXFVeKkD56V3xKrvRmWxFG");
}
