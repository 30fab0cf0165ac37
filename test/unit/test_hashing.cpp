#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "util/hashing.hpp"

namespace {

using safeintake::util::hashing::sha256Hex;

TEST(HashingTest, KnownDigests) {
    EXPECT_EQ(sha256Hex(std::string()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256Hex(std::string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashingTest, ByteAndStringOverloadsAgree) {
    const std::string text = "name,email\nAlice,a@example.com\n";
    const std::vector<uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(sha256Hex(bytes), sha256Hex(text));
    EXPECT_EQ(sha256Hex(bytes).size(), 64u);
}

} // namespace
