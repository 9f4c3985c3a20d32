#include <doctest/doctest.h>
#include <algorithm>
#include <cstring>
#include <vector>
#include "trustchain/crypto.hpp"
#include "trustchain/secure_vector.hpp"

using namespace trustchain;

TEST_CASE("SecureAllocator: page backed allocation") {
    SecureAllocator<uint8_t> allocator;

    auto ptr = allocator.allocate(64);
    REQUIRE(ptr != nullptr);
    std::memset(ptr, 0xAA, 64);
    CHECK(ptr[0] == 0xAA);
    CHECK(ptr[63] == 0xAA);
    allocator.deallocate(ptr, 64);

    CHECK(allocator.allocate(0) == nullptr);
    allocator.deallocate(nullptr, 0);
}

TEST_CASE("SecureAllocator: allocators compare equal") {
    SecureAllocator<uint8_t> bytes;
    SecureAllocator<int> ints(bytes);
    CHECK(bytes == ints);
}

TEST_CASE("SecureVector: holds key material") {
    auto key = HmacSha256Algorithm::generateSecureKey();
    CHECK(key.size() == 32);

    SecureVector<uint8_t> copy(key.begin(), key.end());
    CHECK(std::equal(copy.begin(), copy.end(), key.begin(), key.end()));

    SecureVector<uint8_t> moved(std::move(copy));
    CHECK(moved.size() == 32);
    CHECK(moved == key);

    moved.clear();
    CHECK(moved.empty());
}

TEST_CASE("SecureUtils: to_secure_vector") {
    std::vector<uint8_t> seed(32);
    for (size_t i = 0; i < seed.size(); ++i) {
        seed[i] = static_cast<uint8_t>(i * 7);
    }
    auto secure = secure_utils::to_secure_vector(seed);
    REQUIRE(secure.size() == seed.size());
    CHECK(std::equal(secure.begin(), secure.end(), seed.begin()));

    // secret usable for HMAC once moved into locked storage
    HmacSha256Algorithm hmac(std::move(secure));
    std::vector<uint8_t> data = {'o', 'k'};
    CHECK(hmac.verify(data, hmac.sign(data)));
}

TEST_CASE("SecureUtils: constantTimeEqual") {
    std::vector<uint8_t> mac(32, 0x11);
    std::vector<uint8_t> same(32, 0x11);
    std::vector<uint8_t> lastByte = same;
    lastByte.back() ^= 0x01;
    std::vector<uint8_t> shorter(31, 0x11);

    CHECK(secure_utils::constantTimeEqual(mac, same));
    CHECK_FALSE(secure_utils::constantTimeEqual(mac, lastByte));
    CHECK_FALSE(secure_utils::constantTimeEqual(mac, shorter));
    CHECK(secure_utils::constantTimeEqual(std::vector<uint8_t>{}, std::vector<uint8_t>{}));
}
