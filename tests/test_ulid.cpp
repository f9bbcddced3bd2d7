#include <catch2/catch.hpp>
#include <idforge/generate.hpp>
#include <idforge/ulid.hpp>
#include <cstring>

using namespace idforge;

TEST_CASE("ULID of the RFC 9562 v7 example", "[ulid]") {
    auto u = Uuid::from_string("017f22e2-79b0-7cc3-98c4-dc0c0c07398f").value();
    REQUIRE(to_ulid_string(u) == "01FWHE4YDGFK1SHH6W1G60EECF");
}

TEST_CASE("ULID of the nil and max values", "[ulid]") {
    Uuid zero{};
    REQUIRE(to_ulid_string(zero) == "00000000000000000000000000");

    Uuid max{};
    max.bytes.fill(0xFF);
    REQUIRE(to_ulid_string(max) == "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
}

TEST_CASE("ULID timestamp prefix matches the v7 milliseconds", "[ulid]") {
    auto r = create_v7(from_unix_ms(1645557742000LL));
    REQUIRE(r.is_ok());
    auto s = to_ulid_string(r.value());
    REQUIRE(s.size() == ulid_length);
    REQUIRE(s.substr(0, 10) == "01FWHE4YDG");
}

TEST_CASE("ULID uses only Crockford characters", "[ulid]") {
    for (int i = 0; i < 50; ++i) {
        auto s = to_ulid_string(create_v7().value());
        REQUIRE(s.size() == 26);
        REQUIRE(s.find_first_not_of("0123456789ABCDEFGHJKMNPQRSTVWXYZ") == std::string::npos);
    }
}

TEST_CASE("try_format_ulid fails on a short buffer", "[ulid]") {
    char buf[25];
    std::memset(buf, '#', sizeof(buf));
    size_t written = 99;
    REQUIRE_FALSE(try_format_ulid(dns_namespace, buf, sizeof(buf), written));
    REQUIRE(written == 0);
    REQUIRE(buf[0] == '#');
}

TEST_CASE("try_format_ulid writes exactly 26 characters", "[ulid]") {
    char buf[40];
    std::memset(buf, '#', sizeof(buf));
    size_t written = 0;
    REQUIRE(try_format_ulid(dns_namespace, buf, sizeof(buf), written));
    REQUIRE(written == 26);
    REQUIRE(std::string(buf, written) == to_ulid_string(dns_namespace));
    REQUIRE(buf[26] == '#');
}

TEST_CASE("try_format_ulid with an exact-size buffer", "[ulid]") {
    char buf[ulid_length];
    size_t written = 0;
    REQUIRE(try_format_ulid(dns_namespace, buf, sizeof(buf), written));
    REQUIRE(written == ulid_length);
}
