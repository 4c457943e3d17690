#include <catch2/catch_test_macros.hpp>
#include <streamgate/util/expected.hpp>
#include <streamgate/core/error.hpp>
#include <string>

TEST_CASE("expected<T, E> basic operations", "[expected]") {
    using streamgate::expected;

    SECTION("value construction") {
        expected<int, std::string> e = 42;
        REQUIRE(e.has_value());
        REQUIRE(*e == 42);
        REQUIRE(e.value() == 42);
    }

    SECTION("error construction") {
        expected<int, std::string> e = streamgate::unexpected<std::string>("error");
        REQUIRE(!e.has_value());
        REQUIRE(e.error() == "error");
    }

    SECTION("value_or") {
        expected<int, std::string> good = 42;
        expected<int, std::string> bad = streamgate::unexpected<std::string>("error");

        REQUIRE(good.value_or(0) == 42);
        REQUIRE(bad.value_or(0) == 0);
    }

    SECTION("boolean conversion") {
        expected<int, std::string> good = 42;
        expected<int, std::string> bad = streamgate::unexpected<std::string>("error");

        REQUIRE(static_cast<bool>(good) == true);
        REQUIRE(static_cast<bool>(bad) == false);
    }
}

TEST_CASE("expected<void, E> operations", "[expected]") {
    using streamgate::expected;

    SECTION("default construction") {
        expected<void, std::string> e;
        REQUIRE(e.has_value());
    }

    SECTION("error construction") {
        expected<void, std::string> e = streamgate::unexpected<std::string>("error");
        REQUIRE(!e.has_value());
        REQUIRE(e.error() == "error");
    }
}

TEST_CASE("expected with enum errors", "[expected]") {
    using streamgate::expected;
    using streamgate::SourceError;

    expected<std::string, SourceError> missing = streamgate::unexpected(SourceError::NotFound);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error() == SourceError::NotFound);

    expected<std::string, SourceError> found = std::string("payload");
    REQUIRE(found.has_value());
    REQUIRE(found->size() == 7);
}

TEST_CASE("value() on an error throws", "[expected]") {
    using streamgate::expected;

    expected<int, std::string> bad = streamgate::unexpected<std::string>("error");
    REQUIRE_THROWS_AS(bad.value(), streamgate::bad_expected_access<std::string>);
}
