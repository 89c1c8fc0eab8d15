#include "./version.hpp"

#include <catch2/catch.hpp>

using semver::bump;
using semver::order;
using semver::version;

TEST_CASE("Parse versions") {
    auto v = version::parse("4.5.6");
    CHECK(v.major == 4);
    CHECK(v.minor == 5);
    CHECK(v.patch == 6);
    CHECK_FALSE(v.is_prerelease());
    CHECK(v.build_metadata.empty());

    v = version::parse("0.4.0-pre.2+0a1b2c3");
    CHECK(v.is_prerelease());
    CHECK(v.prerelease.to_string() == "pre.2");
    CHECK(v.build_metadata.to_string() == "0a1b2c3");

    // Build metadata may have leading zeros
    v = version::parse("1.0.0+0042");
    CHECK(v.build_metadata.idents().front().kind() == semver::ident_kind::digits);

    v = version::parse("1.0.0--weird");
    CHECK(v.prerelease.to_string() == "-weird");
}

TEST_CASE("Versions are formatted as they were parsed") {
    auto str = GENERATE(as<std::string>{},
                        "0.0.0",
                        "1.2.3",
                        "10.20.30",
                        "1.2.4-pre.1+abc1234",
                        "2.0.0-rc.1.x-y",
                        "1.0.0+build.5");
    CHECK(version::parse(str).to_string() == str);
}

TEST_CASE("Compare versions") {
    auto [lhs, rhs, expect] = GENERATE(table<std::string, std::string, order>({
        {"1.2.3", "1.2.3", order::equivalent},
        {"1.2.3", "1.2.3+meta", order::equivalent},
        {"1.2.3-pre.1", "1.2.3", order::less},
        {"1.2.3-pre.1", "1.2.3-pre.2", order::less},
        {"1.2.3-pre.9", "1.2.3-pre.10", order::less},
        {"1.10.0", "1.9.0", order::greater},
        {"1.2.4-pre.1+abc", "1.2.3", order::greater},
        {"2.0.0", "1.99.99", order::greater},
    }));
    INFO(lhs << " <=> " << rhs);
    CHECK(semver::compare(version::parse(lhs), version::parse(rhs)) == expect);
}

TEST_CASE("Invalid versions") {
    auto [str, offset] = GENERATE(table<std::string, int>({
        {"", 0},
        {"banana", 0},
        {"v1.2.3", 0},
        {"01.2.3", 0},
        {"1", 1},
        {"1.2", 3},
        {"1.2.", 4},
        {"1.x.3", 2},
        {"1.2.3.4", 5},
    }));
    INFO(str);
    CHECK_FALSE(version::try_parse(str).has_value());
    try {
        auto v = version::parse(str);
        FAIL_CHECK("Parsed an invalid version: " << v.to_string());
    } catch (const semver::invalid_version& e) {
        CHECK(e.offset() == offset);
        CHECK(e.string() == str);
    }
}

TEST_CASE("Invalid prerelease identifiers") {
    auto str = GENERATE(as<std::string>{}, "1.2.3-", "1.2.3-pre.01", "1.2.3-pre..1", "1.2.3+");
    INFO(str);
    CHECK_FALSE(version::try_parse(str).has_value());
    CHECK_THROWS_AS(version::parse(str), semver::invalid_ident);
}

TEST_CASE("Increment versions") {
    auto [given, by, expect] = GENERATE(table<std::string, bump, std::string>({
        {"1.2.3", bump::patch, "1.2.4"},
        {"1.2.3", bump::minor, "1.3.0"},
        {"1.2.3", bump::major, "2.0.0"},
        {"0.0.0", bump::minor, "0.1.0"},
        {"0.3.0", bump::minor, "0.4.0"},
        {"1.2.3+build", bump::patch, "1.2.4"},
        // Prereleases of the requested bump are completed
        {"1.2.3-pre.1", bump::patch, "1.2.3"},
        {"1.3.0-pre.1", bump::minor, "1.3.0"},
        {"2.0.0-rc.1", bump::major, "2.0.0"},
        {"1.2.3-pre.1", bump::minor, "1.3.0"},
        {"2.1.0-rc.1", bump::major, "3.0.0"},
    }));
    INFO(given << " by " << int(by));
    auto prev = version::parse(given);
    auto next = prev.incremented(by);
    CHECK(next.to_string() == expect);
    CHECK(next > prev);
}
