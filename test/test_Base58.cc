#include <gtest/gtest.h>

#include "Base58.hh"

namespace {
std::vector<uint8_t> from_hex(const std::string& hex) {
    std::vector<uint8_t> out;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}
}

TEST(Base58, KnownVectors) {
    EXPECT_EQ(base58_encode(from_hex("")), "");
    EXPECT_EQ(base58_encode(from_hex("61")), "2g");
    EXPECT_EQ(base58_encode(from_hex("626262")), "a3gV");
    EXPECT_EQ(base58_encode(from_hex("636363")), "aPEr");
    EXPECT_EQ(base58_encode(from_hex("00000000000000000000")), "1111111111");
    EXPECT_EQ(base58_encode(from_hex("00eb15231dfceb60925886b67d065299925915aeb172c06647")),
              "1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L");
}

TEST(Base58, DecodeKnownVectors) {
    std::vector<uint8_t> out;
    ASSERT_TRUE(base58_decode("a3gV", out));
    EXPECT_EQ(out, from_hex("626262"));
    ASSERT_TRUE(base58_decode("1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L", out));
    EXPECT_EQ(out, from_hex("00eb15231dfceb60925886b67d065299925915aeb172c06647"));
}

TEST(Base58, RejectsCharactersOutsideAlphabet) {
    std::vector<uint8_t> out;
    EXPECT_FALSE(base58_decode("0OIl", out));
    EXPECT_FALSE(base58_decode("abc!", out));
}

TEST(Base58, ZeroAddressIsAllOnes) {
    const Address zero{};
    EXPECT_EQ(base58_encode(zero), std::string(32, '1'));
}

TEST(Base58, ParseAddress) {
    Address address;
    const std::string program = "6EF8rrecthR5Dkzon8Nwu78hRvfCKubJ14M5uBEwF6P";
    ASSERT_TRUE(parse_address(program, address));
    EXPECT_EQ(base58_encode(address), program);

    EXPECT_FALSE(parse_address("a3gV", address)); // three bytes
    EXPECT_FALSE(parse_address("not base58!", address));
}
