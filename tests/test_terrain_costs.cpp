#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "map/terrain_costs.hpp"
#include "test_support.hpp"

#include <cmath>

using namespace isr;
using namespace isr::map;
using Catch::Matchers::WithinAbs;

TEST_CASE("TerrainCostTable lookup by code", "[terrain]") {
    auto table = test::standard_terrain_table();
    REQUIRE(table.size() == 9);

    const TerrainCost* forest = table.find('F');
    REQUIRE(forest != nullptr);
    CHECK(forest->terrain == "forest");
    CHECK_THAT(forest->base_cost, WithinAbs(2.0, 1e-12));
    CHECK_THAT(forest->ascent_cost, WithinAbs(1.5, 1e-12));

    CHECK(table.contains('^'));
    CHECK_FALSE(table.contains('x'));
    CHECK(table.find('x') == nullptr);

    CHECK(table.is_passable('.'));
    CHECK_FALSE(table.is_passable('#'));
    CHECK_FALSE(table.is_passable('x'));
}

TEST_CASE("TerrainCostTable lookup of an unknown code is a configuration fault", "[terrain]") {
    auto table = test::standard_terrain_table();

    auto known = table.lookup('=');
    REQUIRE(known.ok());
    CHECK(known.value()->terrain == "paved");

    auto unknown = table.lookup('Q');
    REQUIRE_FALSE(unknown.ok());
    CHECK(unknown.error().kind == ErrorKind::Configuration);
    CHECK(unknown.error().field == "Q");
}

TEST_CASE("TerrainCostTable preserves record order", "[terrain]") {
    auto table = test::standard_terrain_table();
    const auto& recs = table.records();
    REQUIRE(recs.size() == 9);
    CHECK(recs.front().code == '.');
    CHECK(recs.back().code == '#');
}

TEST_CASE("TerrainCostTable rejects invalid records", "[terrain]") {
    SECTION("empty table") {
        auto r = TerrainCostTable::create({});
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Configuration);
        CHECK(r.error().field == "TerrainCosts");
    }

    SECTION("duplicate code") {
        auto r = TerrainCostTable::create({
            {'.', "plain", 1.0, 0.0, 0.0, 1.414, true},
            {'.', "also plain", 2.0, 0.0, 0.0, 1.414, true},
        });
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().field == ".");
    }

    SECTION("negative base cost") {
        auto r = TerrainCostTable::create({{'F', "forest", -1.0, 0.0, 0.0, 1.414, true}});
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Configuration);
        CHECK(r.error().field == "F");
    }

    SECTION("non-finite ascent cost") {
        auto r = TerrainCostTable::create(
            {{'^', "cliff", 5.0, std::nan(""), 0.0, 1.414, true}});
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().field == "^");
    }

    SECTION("non-printable code") {
        auto r = TerrainCostTable::create({{' ', "blank", 1.0, 0.0, 0.0, 1.414, true}});
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().field == "code");
    }
}
