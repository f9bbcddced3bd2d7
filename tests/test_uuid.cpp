#include <catch2/catch.hpp>
#include <idforge/uuid.hpp>
#include <algorithm>
#include <vector>

using namespace idforge;

static Uuid parse(const std::string& s) {
    auto r = Uuid::from_string(s);
    REQUIRE(r.is_ok());
    return r.value();
}

TEST_CASE("UUID to_string format", "[uuid]") {
    auto s = dns_namespace.to_string();
    REQUIRE(s == "6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    REQUIRE(s.size() == 36);
    REQUIRE(s[8] == '-');
    REQUIRE(s[13] == '-');
    REQUIRE(s[18] == '-');
    REQUIRE(s[23] == '-');
}

TEST_CASE("UUID namespace constants", "[uuid]") {
    REQUIRE(url_namespace.to_string() == "6ba7b811-9dad-11d1-80b4-00c04fd430c8");
    REQUIRE(iso_oid_namespace.to_string() == "6ba7b812-9dad-11d1-80b4-00c04fd430c8");
    REQUIRE(dns_namespace.version() == 1);
    REQUIRE(dns_namespace.is_rfc_variant());
}

TEST_CASE("UUID from_string roundtrip", "[uuid]") {
    auto u = parse("3d813cbb-47fb-32ba-91df-831e1593ac29");
    REQUIRE(u.bytes[0] == 0x3d);
    REQUIRE(u.bytes[15] == 0x29);
    REQUIRE(u.to_string() == "3d813cbb-47fb-32ba-91df-831e1593ac29");
    REQUIRE(u.version() == 3);
}

TEST_CASE("UUID from_string accepts uppercase", "[uuid]") {
    auto u = parse("6BA7B810-9DAD-11D1-80B4-00C04FD430C8");
    REQUIRE(u == dns_namespace);
}

TEST_CASE("UUID from_string rejects wrong length", "[uuid]") {
    auto r = Uuid::from_string("too-short");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == IdError::Parse);
}

TEST_CASE("UUID from_string rejects missing dashes", "[uuid]") {
    // Correct length (36 chars) but no dashes
    auto r = Uuid::from_string("550e8400e29b41d4a716446655440000abcd");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == IdError::Parse);
}

TEST_CASE("UUID from_string rejects invalid hex", "[uuid]") {
    auto r = Uuid::from_string("550e8400-e29b-41d4-a716-44665544gggg");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == IdError::Parse);
    REQUIRE(r.error().hint.find("32") != std::string::npos);
}

TEST_CASE("UUID nil", "[uuid]") {
    Uuid u{};
    REQUIRE(u.is_nil());
    REQUIRE(u.to_string() == "00000000-0000-0000-0000-000000000000");
    REQUIRE_FALSE(dns_namespace.is_nil());
}

TEST_CASE("UUID GUID layout swaps the first three fields", "[uuid]") {
    auto u = parse("01020304-0506-0708-090a-0b0c0d0e0f10");
    auto guid = u.to_guid_bytes();
    std::array<uint8_t, 16> expected = {
        4, 3, 2, 1, 6, 5, 8, 7, 9, 10, 11, 12, 13, 14, 15, 16
    };
    REQUIRE(guid == expected);
    REQUIRE(Uuid::from_guid_bytes(guid) == u);
}

TEST_CASE("UUID equality operators", "[uuid]") {
    auto a = dns_namespace;
    auto b = a; // copy
    REQUIRE(a == b);
    REQUIRE_FALSE(a != b);

    REQUIRE(a != url_namespace);
    REQUIRE_FALSE(a == url_namespace);
}

TEST_CASE("UUID ordering follows network byte order", "[uuid]") {
    std::vector<Uuid> ids = {iso_oid_namespace, dns_namespace, url_namespace};
    std::sort(ids.begin(), ids.end());
    REQUIRE(ids[0] == dns_namespace);
    REQUIRE(ids[1] == url_namespace);
    REQUIRE(ids[2] == iso_oid_namespace);
}
