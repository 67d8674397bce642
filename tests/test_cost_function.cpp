#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "map/grid.hpp"
#include "path/cost_function.hpp"
#include "test_support.hpp"

using namespace isr;
using namespace isr::path;
using coord::GridCoord;
using Catch::Matchers::WithinAbs;

namespace {

// Edge cost between two cells, taking elevations from the grid.
Result<f64> step_cost(const map::Grid& grid, const map::TerrainCostTable& table,
                      i32 fx, i32 fy, i32 tx, i32 ty, const CostConfig& cfg = {}) {
    return edge_cost(grid, table, grid.coord_at(fx, fy), grid.coord_at(tx, ty), cfg);
}

} // namespace

TEST_CASE("Edge cost combines base, ascent and priority", "[cost]") {
    auto table = test::standard_terrain_table();
    auto grid = map::Grid::from_rows({"SF", "~G"},
                                     {{0, 2}, {1, 0}},
                                     {{0.0, 1.5}, {0.5, 0.0}}).value();

    CostConfig cfg;
    cfg.priority_weight = 2.0;

    // forest 2.0 + ascent 1.5 * 2 + 2.0 * 1.5 = 8.0
    auto c = step_cost(grid, table, 0, 0, 1, 0, cfg);
    REQUIRE(c.ok());
    CHECK_THAT(c.value(), WithinAbs(8.0, 1e-9));

    // water 3.0 + ascent 1.0 * 1 + 2.0 * 0.5 = 5.0
    auto w = step_cost(grid, table, 0, 0, 0, 1, cfg);
    REQUIRE(w.ok());
    CHECK_THAT(w.value(), WithinAbs(5.0, 1e-9));
}

TEST_CASE("Edge cost charges descent per level", "[cost]") {
    auto table = test::standard_terrain_table();
    auto grid = map::Grid::from_rows({"^."}, {{4, 0}}).value();

    // plain 1.0 + descent 0.5 * 4 = 3.0
    auto c = step_cost(grid, table, 0, 0, 1, 0);
    REQUIRE(c.ok());
    CHECK_THAT(c.value(), WithinAbs(3.0, 1e-9));

    // cliff 5.0 + ascent 10.0 * 4 = 45.0
    auto up = step_cost(grid, table, 1, 0, 0, 0);
    REQUIRE(up.ok());
    CHECK_THAT(up.value(), WithinAbs(45.0, 1e-9));
}

TEST_CASE("Edge cost into a cliff three levels up", "[cost]") {
    auto table = test::standard_terrain_table();
    auto grid = map::Grid::from_rows({".^"}, {{0, 3}}).value();

    auto c = step_cost(grid, table, 0, 0, 1, 0);
    REQUIRE(c.ok());
    CHECK_THAT(c.value(), WithinAbs(35.0, 1e-9));

    auto flat = map::Grid::from_rows({".^"}).value();
    auto f = step_cost(flat, table, 0, 0, 1, 0);
    REQUIRE(f.ok());
    CHECK_THAT(f.value(), WithinAbs(5.0, 1e-9));
}

TEST_CASE("Edge cost reads elevations from the grid", "[cost]") {
    auto table = test::standard_terrain_table();
    auto grid = map::Grid::from_rows({"S^"}, {{0, 5}}).value();

    // cliff 5.0 + ascent 10.0 * 5 = 55.0, whatever h the caller passes
    auto flat_args = edge_cost(grid, table, {0, 0, 0}, {1, 0, 0});
    REQUIRE(flat_args.ok());
    CHECK_THAT(flat_args.value(), WithinAbs(55.0, 1e-9));

    auto stale_args = edge_cost(grid, table, {0, 0, 7}, {1, 0, 2});
    REQUIRE(stale_args.ok());
    CHECK_THAT(stale_args.value(), WithinAbs(55.0, 1e-9));

    auto grid_args = step_cost(grid, table, 0, 0, 1, 0);
    REQUIRE(grid_args.ok());
    CHECK(grid_args.value() == flat_args.value());
}

TEST_CASE("Edge cost saturates at the cap", "[cost]") {
    auto table = test::standard_terrain_table();

    SECTION("steep climb") {
        auto grid = map::Grid::from_rows({".^"}, {{0, 100}}).value();
        auto c = step_cost(grid, table, 0, 0, 1, 0);
        REQUIRE(c.ok());
        CHECK(c.value() == MAX_COST_CAP);
    }

    SECTION("huge priority") {
        auto grid = map::Grid::from_rows({".."}, {}, {{0.0, 1000.0}}).value();
        CostConfig cfg;
        cfg.priority_weight = 1.0;
        auto c = step_cost(grid, table, 0, 0, 1, 0, cfg);
        REQUIRE(c.ok());
        CHECK(c.value() == 255.0);
    }

    SECTION("custom cap") {
        auto grid = map::Grid::from_rows({".^"}, {{0, 2}}).value();
        CostConfig cfg;
        cfg.max_cost_cap = 10.0;
        auto c = step_cost(grid, table, 0, 0, 1, 0, cfg);
        REQUIRE(c.ok());
        CHECK(c.value() == 10.0);
    }
}

TEST_CASE("Edge cost into impassable terrain is infinite", "[cost]") {
    auto table = test::standard_terrain_table();
    auto grid = map::Grid::from_rows({".#"}).value();

    auto c = step_cost(grid, table, 0, 0, 1, 0);
    REQUIRE(c.ok());
    CHECK(c.value() == INF_COST);

    // Leaving a wall cell is fine; only the destination matters
    auto out = step_cost(grid, table, 1, 0, 0, 0);
    REQUIRE(out.ok());
    CHECK_THAT(out.value(), WithinAbs(1.0, 1e-9));
}

TEST_CASE("Diagonal edges depend on the movement rule", "[cost]") {
    auto table = test::standard_terrain_table();
    auto grid = map::Grid::from_rows({"..", ".F"}).value();

    CostConfig four;
    auto blocked = step_cost(grid, table, 0, 0, 1, 1, four);
    REQUIRE(blocked.ok());
    CHECK(blocked.value() == INF_COST);

    CostConfig eight;
    eight.movement = Movement::EightWay;
    auto diag = step_cost(grid, table, 0, 0, 1, 1, eight);
    REQUIRE(diag.ok());
    CHECK_THAT(diag.value(), WithinAbs(2.0 * 1.414, 1e-9));

    CHECK(is_diagonal_move({0, 0, 0}, {1, 1, 0}));
    CHECK_FALSE(is_diagonal_move({0, 0, 0}, {1, 0, 0}));
}

TEST_CASE("Edge cost faults", "[cost]") {
    auto table = test::standard_terrain_table();
    auto grid = map::Grid::from_rows({"...", "..X"}).value();

    SECTION("off-grid destination") {
        auto c = edge_cost(grid, table, {2, 0, 0}, {3, 0, 0});
        REQUIRE_FALSE(c.ok());
        CHECK(c.error().kind == ErrorKind::Boundary);
    }

    SECTION("off-grid origin") {
        auto c = edge_cost(grid, table, {-1, 0, 0}, {0, 0, 0});
        REQUIRE_FALSE(c.ok());
        CHECK(c.error().kind == ErrorKind::Boundary);
    }

    SECTION("unknown terrain code") {
        auto c = edge_cost(grid, table, {1, 1, 0}, {2, 1, 0});
        REQUIRE_FALSE(c.ok());
        CHECK(c.error().kind == ErrorKind::Configuration);
        CHECK(c.error().field == "X");
    }

    SECTION("cells are not adjacent") {
        auto c = edge_cost(grid, table, {0, 0, 0}, {2, 0, 0});
        REQUIRE_FALSE(c.ok());
        CHECK(c.error().kind == ErrorKind::Generic);
    }
}

TEST_CASE("CostConfig validation", "[cost]") {
    CostConfig cfg;
    CHECK(cfg.validate().ok());

    cfg.priority_weight = -0.1;
    auto neg = cfg.validate();
    REQUIRE_FALSE(neg.ok());
    CHECK(neg.error().field == "priority_weight");

    cfg.priority_weight = 0.0;
    cfg.max_cost_cap = 0.0;
    auto cap = cfg.validate();
    REQUIRE_FALSE(cap.ok());
    CHECK(cap.error().field == "max_cost_cap");
}
