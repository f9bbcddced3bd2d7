#include <catch2/catch.hpp>
#include <idforge/factory.hpp>
#include <idforge/ulid.hpp>

using namespace idforge;

namespace {

class CountingRandom : public RandomSource {
public:
    Status fill(uint8_t* buf, size_t len) override {
        for (size_t i = 0; i < len; ++i) buf[i] = next_++;
        ++calls;
        return ok_status();
    }

    int calls = 0;

private:
    uint8_t next_ = 0;
};

} // namespace

TEST_CASE("factory defaults match the free functions", "[factory]") {
    IdFactory factory;
    auto r = factory.from_name(dns_namespace, "python.org");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "886313e1-3b8a-5372-9b90-0c9aee199e5d");

    auto v8 = factory.v8_from_name(dns_namespace, "www.example.com");
    REQUIRE(v8.is_ok());
    REQUIRE(v8.value().to_string() == "5c146b14-3c52-8afd-938a-375d0df1fbf6");
}

TEST_CASE("factory uses the configured name version", "[factory]") {
    auto cfg = FactoryConfig::parse("[name]\nversion = 3\n").value();
    IdFactory factory(cfg);
    REQUIRE(factory.config().name_version == 3);

    auto r = factory.from_name(dns_namespace, "www.widgets.com");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "3d813cbb-47fb-32ba-91df-831e1593ac29");

    auto explicit5 = factory.from_name(dns_namespace, "python.org", 5);
    REQUIRE(explicit5.value().to_string() == "886313e1-3b8a-5372-9b90-0c9aee199e5d");
}

TEST_CASE("factory uses the configured v8 hash", "[factory]") {
    auto cfg = FactoryConfig::parse("[v8]\nhash = \"SHA384\"\n").value();
    IdFactory factory(cfg);
    auto r = factory.v8_from_name(url_namespace, "https://example.com/");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "4ec2a86e-4fea-85fb-b9ee-013a56335711");
}

TEST_CASE("factory time-based ids use the injected clock and random source", "[factory]") {
    FixedClock clock(from_unix_ms(1645557742000LL));
    CountingRandom random;
    IdFactory factory(FactoryConfig{}, clock, random);

    auto v7 = factory.v7();
    REQUIRE(v7.is_ok());
    REQUIRE(v7_unix_ms(v7.value()) == 1645557742000ULL);
    REQUIRE(to_ulid_string(v7.value()).substr(0, 10) == "01FWHE4YDG");

    auto v6 = factory.v6();
    REQUIRE(v6.is_ok());
    REQUIRE(v6.value().to_string().substr(0, 19) == "1ec9414c-232a-6b00-");

    auto v4 = factory.v4();
    REQUIRE(v4.is_ok());
    REQUIRE(v4.value().version() == 4);

    REQUIRE(random.calls == 3);
}

TEST_CASE("factory explicit timestamps override the clock", "[factory]") {
    FixedClock clock(from_unix_ms(1645557742000LL));
    IdFactory factory(FactoryConfig{}, clock);

    auto v7 = factory.v7(from_unix_ms(1000));
    REQUIRE(v7.is_ok());
    REQUIRE(v7_unix_ms(v7.value()) == 1000);

    auto v6 = factory.v6(Timestamp(Ticks(-gregorian_to_unix_ticks - 1)));
    REQUIRE(v6.is_err());
    REQUIRE(v6.error().code == IdError::OutOfRange);
}

TEST_CASE("factory v8 direct", "[factory]") {
    IdFactory factory;
    auto r = factory.v8(std::vector<uint8_t>(32, 0));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().to_string() == "00000000-0000-8000-8000-000000000000");
    REQUIRE(factory.v8(std::vector<uint8_t>(8, 0)).is_err());
}
