#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "core/color_registry.hpp"
#include <string>
#include <vector>

using namespace hanabi;

namespace {

// Ensemble de couleurs factice pour tester la construction de la table
enum class MockColor { RED, ROSE, BLUE, BLACK, GREEN };

using MockTable = ColorTable<MockColor>;

} // namespace

TEST_CASE("Global color registry", "[colors][registry]") {
    SECTION("Every declared color is registered") {
        REQUIRE(color_registry().size() == static_cast<size_t>(NUM_COLORS));
        REQUIRE(NUM_COLORS == 5);
    }

    SECTION("Same instance on every call") {
        REQUIRE(&color_registry() == &color_registry());
    }

    SECTION("Letters of the declared colors") {
        REQUIRE(color_letter(Color::RED) == 'R');
        REQUIRE(color_letter(Color::GREEN) == 'G');
        REQUIRE(color_letter(Color::BLUE) == 'B');
        REQUIRE(color_letter(Color::WHITE) == 'W');
        REQUIRE(color_letter(Color::YELLOW) == 'Y');
    }
}

TEST_CASE("ColorTable construction", "[colors][registry]") {
    SECTION("Distinct first letters build fine") {
        MockTable table({{MockColor::RED, "Red"}, {MockColor::BLUE, "Blue"}, {MockColor::GREEN, "Green"}});
        REQUIRE(table.size() == 3);
        REQUIRE(table.find_by_letter('B') == MockColor::BLUE);
        REQUIRE(table.find_by_name("Green") == MockColor::GREEN);
    }

    SECTION("Two colors sharing a first letter fail") {
        std::vector<MockTable::Entry> colliding = {
            {MockColor::RED, "Red"}, {MockColor::BLUE, "Blue"}, {MockColor::BLACK, "Black"}
        };
        REQUIRE_THROWS_AS(MockTable(colliding), ColorRegistryError);
        REQUIRE_THROWS_WITH(MockTable(colliding), Catch::Matchers::ContainsSubstring("'B'") &&
                                                  Catch::Matchers::ContainsSubstring("Black"));
    }

    SECTION("Collision is detected regardless of case") {
        REQUIRE_THROWS_AS(MockTable({{MockColor::RED, "Red"}, {MockColor::ROSE, "rose"}}), ColorRegistryError);
    }

    SECTION("Aliases of the same color are ignored") {
        MockTable table({{MockColor::RED, "Red"}, {MockColor::RED, "Rouge"}, {MockColor::RED, "crimson"}});
        REQUIRE(table.size() == 1);
        REQUIRE(table.find_by_letter('R') == MockColor::RED);
        REQUIRE_FALSE(table.find_by_letter('C').has_value());
        REQUIRE_FALSE(table.find_by_name("Rouge").has_value());
    }

    SECTION("Empty color name fails") {
        REQUIRE_THROWS_AS(MockTable(std::vector<MockTable::Entry>{{MockColor::RED, ""}}), ColorRegistryError);
    }

    SECTION("Configuration errors are not input errors") {
        try {
            MockTable table({{MockColor::BLUE, "Blue"}, {MockColor::BLACK, "Black"}});
            FAIL("ColorRegistryError expected, got a table of " << table.size() << " colors");
        } catch (const std::logic_error& e) {
            REQUIRE(dynamic_cast<const std::invalid_argument*>(&e) == nullptr);
        }
    }
}

TEST_CASE("parse_color by letter", "[colors][parse]") {
    SECTION("First letter of every color") {
        for (int c = 0; c < NUM_COLORS; ++c) {
            Color color = static_cast<Color>(c);
            auto parsed = parse_color(color_letter(color));
            REQUIRE(parsed.ok());
            REQUIRE(parsed.value() == color);
        }
        REQUIRE(parse_color('R').value() == Color::RED);
        REQUIRE(parse_color('Y').value() == Color::YELLOW);
    }

    SECTION("Unmapped letter fails") {
        auto parsed = parse_color('Z');
        REQUIRE_FALSE(parsed.ok());
        REQUIRE(parsed.error().kind == ErrorKind::UNKNOWN_COLOR_LETTER);
        REQUIRE(parsed.error().message == "Unknown card color abbreviation: Z");
    }

    SECTION("Lookup is case-sensitive") {
        REQUIRE(parse_color('r').error().kind == ErrorKind::UNKNOWN_COLOR_LETTER);
        REQUIRE(parse_color('g').error().kind == ErrorKind::UNKNOWN_COLOR_LETTER);
    }
}

TEST_CASE("parse_color by name", "[colors][parse]") {
    SECTION("Canonical names") {
        REQUIRE(parse_color(std::string("Red")).value() == Color::RED);
        REQUIRE(parse_color("Green").value() == Color::GREEN);
        REQUIRE(parse_color("Blue").value() == Color::BLUE);
        REQUIRE(parse_color("White").value() == Color::WHITE);
        REQUIRE(parse_color("Yellow").value() == Color::YELLOW);
    }

    SECTION("Names are case-sensitive") {
        REQUIRE(parse_color("red").error().kind == ErrorKind::UNKNOWN_COLOR_NAME);
        REQUIRE(parse_color("RED").error().kind == ErrorKind::UNKNOWN_COLOR_NAME);
    }

    SECTION("Unknown and empty names") {
        auto purple = parse_color("Purple");
        REQUIRE(purple.error().kind == ErrorKind::UNKNOWN_COLOR_NAME);
        REQUIRE(purple.error().message == "Unknown color name: Purple");

        REQUIRE(parse_color("").error().kind == ErrorKind::COLOR_NAME_EXPECTED);
        REQUIRE(parse_color(" Red").error().kind == ErrorKind::UNKNOWN_COLOR_NAME);
    }
}
