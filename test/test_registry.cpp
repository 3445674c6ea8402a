#include <doctest/doctest.h>

#include "geoformat/geoformat.hpp"
#include <cmath>
#include <string>
#include <vector>

TEST_CASE("Registry - Standard order") {
    const auto &registry = gf::Registry::defaults();

    std::vector<std::string> expected = {"Decimal Degrees", "WolframAlpha",      "Hex",
                                         "Hex (C)",         "Decimal Fixed Point", "DMS",
                                         "DMS (LFV)",       "DMS (NaviDisplay)", "Radian",
                                         "Parcel ID"};
    CHECK(registry.names() == expected);
    CHECK(gf::listFormatNames() == expected);
    CHECK(registry.size() == 10);
    CHECK_FALSE(registry.empty());

    SUBCASE("Lookup by name and index") {
        CHECK(registry.indexOf("DMS").value() == 5);
        CHECK_FALSE(registry.indexOf("UTM").has_value());
        REQUIRE(registry.find("Parcel ID") != nullptr);
        CHECK(registry.find("Parcel ID")->name() == "Parcel ID");
        CHECK(registry.find("UTM") == nullptr);
        CHECK(registry.at(0).name() == "Decimal Degrees");
    }

    SUBCASE("defaults() is a single shared instance") { CHECK(&gf::Registry::defaults() == &registry); }
}

TEST_CASE("Registry - Detection") {
    const auto &registry = gf::Registry::defaults();

    SUBCASE("Decimal degrees") {
        auto d = registry.detect("-27.1234567, 109.2345678");
        REQUIRE(d.has_value());
        CHECK(d->name == "Decimal Degrees");
        CHECK(d->index == 0);
        CHECK(d->coordinate.longitude == doctest::Approx(-27.1234567));
        CHECK(d->coordinate.latitude == doctest::Approx(109.2345678));
    }

    SUBCASE("Swapping the components detects the same format") {
        auto d = registry.detect("109.2345678, -27.1234567");
        REQUIRE(d.has_value());
        CHECK(d->name == "Decimal Degrees");
        CHECK(d->coordinate.longitude == doctest::Approx(109.2345678));
        CHECK(d->coordinate.latitude == doctest::Approx(-27.1234567));
    }

    SUBCASE("DMS") {
        auto d = registry.detect("W109 16'36.88\", S27 07'32.46\"");
        REQUIRE(d.has_value());
        CHECK(d->name == "DMS");
        CHECK(d->coordinate.longitude == doctest::Approx(-109.2769).epsilon(1e-5));
        CHECK(d->coordinate.latitude == doctest::Approx(-27.1257).epsilon(1e-5));
    }

    SUBCASE("Decimal fixed point formats back through the wrapped half") {
        auto d = registry.detect("D 123456, D -654321");
        REQUIRE(d.has_value());
        CHECK(d->name == "Decimal Fixed Point");
        CHECK(registry.formatOne("Decimal Fixed Point", d->coordinate) == "D 123456, D 4294312975");
    }

    SUBCASE("Parcel ID") {
        auto d = registry.detect("PID 80000000, 00000000");
        REQUIRE(d.has_value());
        CHECK(d->name == "Parcel ID");
        CHECK(d->coordinate.longitude == 0.0);
        CHECK(std::signbit(d->coordinate.longitude));
        CHECK(d->coordinate.latitude == 0.0);
    }

    SUBCASE("Remaining dialects") {
        CHECK(registry.detect("27.12345670W 109.23456780N").value().name == "WolframAlpha");
        CHECK(registry.detect("e1000, fff1f000").value().name == "Hex");
        CHECK(registry.detect("0xe1000, 0xfff1f000").value().name == "Hex (C)");
    }

    SUBCASE("Nothing matches") {
        CHECK_FALSE(registry.detect("").has_value());
        CHECK_FALSE(registry.detect("hello world").has_value());
        CHECK_FALSE(gf::detectAndParse("1, 2, 3").has_value());
    }
}

TEST_CASE("Registry - Earliest converter wins") {
    const auto &registry = gf::Registry::defaults();

    SUBCASE("Digit-only hex pairs are decimal degrees") {
        auto d = registry.detect("123456, 654321");
        REQUIRE(d.has_value());
        CHECK(d->name == "Decimal Degrees");
        CHECK(registry.at(2).parse("123456, 654321").has_value());
    }

    SUBCASE("LFV text is taken by the generic DMS grammar with the same value") {
        gf::LfvConverter lfv;
        const std::string text = "S27 07 32 460 W109 16 36 880";
        auto d = registry.detect(text);
        REQUIRE(d.has_value());
        CHECK(d->name == "DMS");
        auto direct = lfv.parse(text);
        REQUIRE(direct.has_value());
        CHECK(d->coordinate.longitude == doctest::Approx(direct->longitude));
        CHECK(d->coordinate.latitude == doctest::Approx(direct->latitude));
    }

    SUBCASE("NaviDisplay text is taken by the generic DMS grammar") {
        gf::Coordinate c{-109.2769111, -27.1256833};
        auto d = registry.detect(registry.formatOne("DMS (NaviDisplay)", c));
        REQUIRE(d.has_value());
        CHECK(d->name == "DMS");
    }

    SUBCASE("Radian output reads back as decimal degrees") {
        gf::Coordinate c{45.0, -30.0};
        auto d = registry.detect(registry.formatOne("Radian", c));
        REQUIRE(d.has_value());
        CHECK(d->name == "Decimal Degrees");
        CHECK_FALSE(registry.find("Radian")->parse(registry.formatOne("Radian", c)).has_value());
    }
}

TEST_CASE("Registry - Format") {
    const auto &registry = gf::Registry::defaults();
    gf::Coordinate c{-27.1234567, 59.2345678};

    SUBCASE("formatAll is aligned with names") {
        auto all = registry.formatAll(c);
        REQUIRE(all.size() == registry.size());
        for (size_t i = 0; i < all.size(); ++i)
            CHECK(all[i] == registry.at(i).format(c));
        CHECK(all[0] == "-27.1234567, 59.2345678");
        CHECK(gf::formatAll(c) == all);
    }

    SUBCASE("formatOne by name or index") {
        CHECK(registry.formatOne(size_t{0}, c) == "-27.1234567, 59.2345678");
        CHECK(registry.formatOne("Decimal Degrees", c) == "-27.1234567, 59.2345678");
        CHECK(gf::formatOne("Hex", {1.0, -1.0}) == "e1000, fff1f000");
        CHECK(gf::formatOne(size_t{9}, {2.0, -2.0}) == "PID E10000, 80E10000");
    }

    SUBCASE("Every parseable format reads its own output back") {
        const double unit = 1.0 / gf::kFixedPointScale;
        const std::vector<std::pair<std::string, double>> tolerance = {
            {"Decimal Degrees", 0.5e-7},       {"WolframAlpha", 0.5e-8},
            {"Hex", unit},                     {"Hex (C)", unit},
            {"Decimal Fixed Point", unit},     {"DMS", 0.05 / 3600.0 + 1e-9},
            {"DMS (LFV)", 0.0005 / 3600.0 + 1e-9}, {"DMS (NaviDisplay)", 0.05 / 3600.0 + 1e-9},
            {"Parcel ID", 256.0 * unit},
        };

        for (const auto &entry : tolerance) {
            const auto &name = entry.first;
            const double tol = entry.second;
            CAPTURE(name);
            const auto *conv = registry.find(name);
            REQUIRE(conv != nullptr);
            auto back = conv->parse(conv->format(c));
            REQUIRE(back.has_value());
            CHECK(std::fabs(back->longitude - c.longitude) <= tol + 1e-12);
            CHECK(std::fabs(back->latitude - c.latitude) <= tol + 1e-12);
        }
    }

    SUBCASE("Integer formats read back to the same text") {
        for (const std::string name : {"Hex", "Hex (C)", "Decimal Fixed Point"}) {
            CAPTURE(name);
            const auto *conv = registry.find(name);
            REQUIRE(conv != nullptr);
            const auto text = conv->format(c);
            auto back = conv->parse(text);
            REQUIRE(back.has_value());
            CHECK(conv->format(*back) == text);
        }
    }

    SUBCASE("Every output is detected as something") {
        for (const auto &text : registry.formatAll(c)) {
            CAPTURE(text);
            CHECK(registry.detect(text).has_value());
        }
    }
}

TEST_CASE("Registry - Custom") {
    gf::Registry registry;
    CHECK(registry.empty());

    registry.add(gf::makeHex());
    registry.add(gf::makeDecimalDegrees());

    SUBCASE("Order is insertion order") {
        auto d = registry.detect("123456, 654321");
        REQUIRE(d.has_value());
        CHECK(d->name == "Hex");
        CHECK(d->index == 0);
    }

    SUBCASE("Null converters are refused") { CHECK_THROWS_AS(registry.add(nullptr), std::invalid_argument); }
}

TEST_CASE("Session") {
    gf::Session session;

    SUBCASE("Starts idle") {
        CHECK_FALSE(session.resolved());
        CHECK_THROWS_AS(session.coordinate(), std::runtime_error);
        CHECK_THROWS_AS(session.formatAll(), std::runtime_error);
    }

    SUBCASE("Resolves on a match") {
        auto name = session.detect("-27.1234567, 109.2345678");
        REQUIRE(name.has_value());
        CHECK(*name == "Decimal Degrees");
        CHECK(session.resolved());
        CHECK(session.formatName() == "Decimal Degrees");
        CHECK(session.coordinate().longitude == doctest::Approx(-27.1234567));
        CHECK(session.formatAll().size() == 10);
        CHECK(session.formatAll()[1] == "27.12345670W 109.23456780N");
    }

    SUBCASE("A later match replaces the coordinate") {
        REQUIRE(session.detect("-27.1234567, 109.2345678").has_value());
        REQUIRE(session.detect("PID 708000, 80708000").has_value());
        CHECK(session.formatName() == "Parcel ID");
        CHECK(session.coordinate().longitude == 1.0);
        CHECK(session.coordinate().latitude == -1.0);
    }

    SUBCASE("A miss returns to idle") {
        REQUIRE(session.detect("-27.1234567, 109.2345678").has_value());
        CHECK_FALSE(session.detect("not a coordinate").has_value());
        CHECK_FALSE(session.resolved());
        CHECK_THROWS_AS(session.formatName(), std::runtime_error);
    }

    SUBCASE("Reset") {
        REQUIRE(session.detect("1, 2").has_value());
        session.reset();
        CHECK_FALSE(session.resolved());
    }
}
