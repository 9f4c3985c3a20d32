#include <doctest/doctest.h>
#include "trustchain/canonical_json.hpp"

#include <cmath>
#include <limits>

using namespace trustchain;
using json = nlohmann::json;

TEST_CASE("Canonicalize sorts keys at every level") {
    auto value = json::parse(R"({"b":1,"a":{"d":2,"c":[{"z":1,"y":2}]}})");
    CHECK(canonicalize(value) == R"({"a":{"c":[{"y":2,"z":1}],"d":2},"b":1})");
}

TEST_CASE("Canonicalize ignores insertion order") {
    nlohmann::ordered_json first;
    first["limit"] = 10;
    first["status"] = "open";
    first["filter"] = {{"owner", "me"}, {"archived", false}};

    nlohmann::ordered_json second;
    second["filter"] = {{"archived", false}, {"owner", "me"}};
    second["status"] = "open";
    second["limit"] = 10;

    CHECK(canonicalize(first) == canonicalize(second));
    CHECK(canonicalize(first) ==
          R"({"filter":{"archived":false,"owner":"me"},"limit":10,"status":"open"})");
}

TEST_CASE("Canonicalize scalars") {
    CHECK(canonicalize(json(nullptr)) == "null");
    CHECK(canonicalize(json(true)) == "true");
    CHECK(canonicalize(json(10)) == "10");
    CHECK(canonicalize(json(-3)) == "-3");
    CHECK(canonicalize(json(1.5)) == "1.5");
    CHECK(canonicalize(json::array()) == "[]");
    CHECK(canonicalize(json::object()) == "{}");
}

TEST_CASE("Canonicalize keeps array order") {
    CHECK(canonicalize(json::parse("[3,1,2]")) == "[3,1,2]");
}

TEST_CASE("Canonicalize escapes strings and keeps UTF-8") {
    CHECK(canonicalize(json("a\"b\n")) == "\"a\\\"b\\n\"");
    CHECK(canonicalize(json("h\xC3\xA9llo")) == "\"h\xC3\xA9llo\"");
}

TEST_CASE("Canonicalize rejects invalid UTF-8") {
    CHECK_THROWS_AS(canonicalize(json("bad \xFF byte")), CanonicalizationError);
    json nested = {{"args", {{"name", "\xC3"}}}};
    CHECK_THROWS_AS(canonicalize(nested), CanonicalizationError);
}

TEST_CASE("Canonicalize rejects non-finite numbers") {
    CHECK_THROWS_AS(canonicalize(json(std::numeric_limits<double>::quiet_NaN())),
                    CanonicalizationError);
    CHECK_THROWS_AS(canonicalize(json{{"x", std::numeric_limits<double>::infinity()}}),
                    CanonicalizationError);
}

TEST_CASE("Canonicalize bounds nesting") {
    json deep = 1;
    for (int i = 0; i < 20; ++i) {
        deep = json::array({deep});
    }
    CHECK_NOTHROW(canonicalize(deep));
    CHECK_THROWS_AS(canonicalize(deep, 10), CanonicalizationError);
}

TEST_CASE("Canonicalize rejects binary values") {
    json binary = json::binary(std::vector<std::uint8_t>{0x01, 0x02});
    CHECK_THROWS_AS(canonicalize(binary), CanonicalizationError);
}

TEST_CASE("CanonicalBytes matches text") {
    json value = {{"b", 2}, {"a", 1}};
    auto bytes = canonicalBytes(value);
    CHECK(std::string(bytes.begin(), bytes.end()) == R"({"a":1,"b":2})");
}
