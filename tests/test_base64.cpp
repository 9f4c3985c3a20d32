#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "trustchain/base64.hpp"
#include <algorithm>
#include <array>
#include <numeric>

using namespace trustchain;

TEST_CASE("Base64Encode - Empty input") {
    std::vector<uint8_t> empty;
    std::string encoded = base64Encode(empty);
    CHECK(encoded.empty());
}

TEST_CASE("Base64Encode - Padding") {
    std::vector<uint8_t> one = {0x4d};             // "M"
    std::vector<uint8_t> two = {0x4d, 0x61};       // "Ma"
    std::vector<uint8_t> three = {0x4d, 0x61, 0x6e}; // "Man"
    CHECK(base64Encode(one) == "TQ==");
    CHECK(base64Encode(two) == "TWE=");
    CHECK(base64Encode(three) == "TWFu");
}

TEST_CASE("Base64Encode - Standard alphabet") {
    std::vector<uint8_t> data = {0xfb, 0xff};
    CHECK(base64Encode(data) == "+/8=");
}

TEST_CASE("Base64Decode - Padding is optional") {
    std::vector<uint8_t> expected = {0x4d, 0x61};
    CHECK(base64Decode("TWE=") == expected);
    CHECK(base64Decode("TWE") == expected);
}

TEST_CASE("Base64Decode - Invalid characters") {
    CHECK_THROWS_AS(base64Decode("TW@u"), InvalidBase64Error);
    // URL-safe alphabet is not accepted for signatures
    CHECK_THROWS_AS(base64Decode("-_8"), InvalidBase64Error);
}

TEST_CASE("Base64Decode - Data after padding") {
    CHECK_THROWS_AS(base64Decode("TQ==TQ=="), InvalidBase64Error);
}

TEST_CASE("Base64 - Ed25519 sized buffers") {
    std::array<uint8_t, 64> signature;
    std::iota(signature.begin(), signature.end(), 0);
    auto encoded = base64Encode(signature);
    CHECK(encoded.size() == 88);
    auto decoded = base64Decode(encoded);
    CHECK(std::equal(decoded.begin(), decoded.end(), signature.begin(), signature.end()));
}

TEST_CASE("HexEncode") {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xa5, 0xff};
    CHECK(hexEncode(data) == "000fa5ff");
    CHECK(hexEncode(std::vector<uint8_t>{}).empty());
}
