#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"

#include <filesystem>
#include <string>

extern "C" {
#include <lua.h>
}

using namespace isr;
using namespace isr::lua;
using Catch::Matchers::WithinAbs;

namespace {

const fs::path DATA_DIR = ISOROUTE_DATA_DIR;

constexpr const char* MINIMAL_TABLE = R"(
    TerrainCosts = {
        { code = ".", terrain = "plain", base_cost = 1.0 },
        { code = "#", terrain = "wall", base_cost = 0, passable = false },
    }
)";

} // namespace

// ================================================================
// LuaState
// ================================================================

TEST_CASE("LuaState creation and basic execution", "[lua]") {
    LuaState state;
    REQUIRE(state.raw() != nullptr);
    REQUIRE(state.valid());

    auto result = state.do_string("x = 1 + 2");
    REQUIRE(result.ok());

    lua_getglobal(state.raw(), "x");
    CHECK(lua_tonumber(state.raw(), -1) == 3.0);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState register and call C function", "[lua]") {
    LuaState state;

    static int called = 0;
    state.register_function("test_fn", [](lua_State* L) -> int {
        called++;
        lua_pushnumber(L, 42);
        return 1;
    });

    called = 0;
    auto result = state.do_string("result = test_fn()");
    REQUIRE(result.ok());
    CHECK(called == 1);

    lua_getglobal(state.raw(), "result");
    CHECK(lua_tonumber(state.raw(), -1) == 42.0);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState reports syntax and runtime errors", "[lua]") {
    LuaState state;

    auto syntax = state.do_string("x = = 1");
    REQUIRE_FALSE(syntax.ok());
    CHECK_FALSE(syntax.error().message.empty());

    auto runtime = state.do_string("error('boom')");
    REQUIRE_FALSE(runtime.ok());
    CHECK(runtime.error().message.find("boom") != std::string::npos);

    // The state stays usable after an error
    CHECK(state.do_string("y = 2").ok());
}

TEST_CASE("LuaState opens only the sandboxed libraries", "[lua]") {
    LuaState state;
    auto result = state.do_string(R"(
        has_string = string ~= nil and string.len("abc") == 3
        has_math = math ~= nil and math.floor(2.5) == 2
        has_table = table ~= nil
        no_io = io == nil
    )");
    REQUIRE(result.ok());

    for (const char* name : {"has_string", "has_math", "has_table", "no_io"}) {
        lua_getglobal(state.raw(), name);
        CHECK(lua_toboolean(state.raw(), -1) == 1);
        lua_pop(state.raw(), 1);
    }
}

TEST_CASE("LuaState do_file on a missing file", "[lua]") {
    LuaState state;
    auto result = state.do_file(DATA_DIR / "no_such_script.lua");
    CHECK_FALSE(result.ok());
}

// ================================================================
// RouteConfigLoader
// ================================================================

TEST_CASE("RouteConfigLoader reads the shipped configuration", "[lua][config]") {
    RouteConfigLoader loader;
    auto cfg = loader.load_file(DATA_DIR / "route_config.lua");
    REQUIRE(cfg.ok());

    const auto& c = cfg.value();
    CHECK(c.iso.tile_width() == 64.0);
    CHECK(c.iso.tile_height() == 32.0);
    CHECK(c.iso.elevation_scale() == 16.0);

    CHECK(c.terrain.size() == 9);
    const auto* cliff = c.terrain.find('^');
    REQUIRE(cliff != nullptr);
    CHECK(cliff->terrain == "cliff");
    CHECK_THAT(cliff->ascent_cost, WithinAbs(10.0, 1e-12));
    CHECK_FALSE(c.terrain.is_passable('#'));
    CHECK_THAT(c.terrain.find('=')->base_cost, WithinAbs(0.8, 1e-12));

    CHECK(c.search.mode == path::SearchMode::Dijkstra);
    CHECK_FALSE(c.search.allow_diagonal);
    CHECK(c.search.max_cost_cap == 255.0);
}

TEST_CASE("RouteConfigLoader fills defaults", "[lua][config]") {
    RouteConfigLoader loader;
    auto cfg = loader.load_string(MINIMAL_TABLE);
    REQUIRE(cfg.ok());

    const auto& c = cfg.value();
    CHECK(c.iso.tile_width() == coord::IsoConfig::DEFAULT_TILE_WIDTH);
    CHECK(c.terrain.size() == 2);

    const auto* plain = c.terrain.find('.');
    REQUIRE(plain != nullptr);
    CHECK(plain->ascent_cost == 0.0);
    CHECK(plain->descent_cost == 0.0);
    CHECK_THAT(plain->diagonal_factor, WithinAbs(map::SQRT2, 1e-12));
    CHECK(plain->passable);

    CHECK(c.search.priority_weight == 0.0);
    CHECK(c.search.mode == path::SearchMode::Dijkstra);
}

TEST_CASE("RouteConfigLoader reads search defaults", "[lua][config]") {
    RouteConfigLoader loader;
    auto cfg = loader.load_string(std::string(MINIMAL_TABLE) + R"(
        Search = { priority_weight = 1.5, max_cost_cap = 100,
                   allow_diagonal = true, algorithm = "astar" }
    )");
    REQUIRE(cfg.ok());

    const auto opts = cfg.value().search.to_options();
    CHECK(opts.mode == path::SearchMode::AStar);
    CHECK(opts.cost.movement == path::Movement::EightWay);
    CHECK(opts.cost.priority_weight == 1.5);
    CHECK(opts.cost.max_cost_cap == 100.0);
}

TEST_CASE("RouteConfigLoader faults name the offending field", "[lua][config]") {
    RouteConfigLoader loader;

    SECTION("missing TerrainCosts") {
        auto r = loader.load_string("IsoProjection = { tile_width = 64 }");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Configuration);
        CHECK(r.error().field == "TerrainCosts");
    }

    SECTION("missing base_cost") {
        auto r = loader.load_string(R"(
            TerrainCosts = {
                { code = ".", base_cost = 1 },
                { code = "F", terrain = "forest" },
            }
        )");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().field == "TerrainCosts[2].base_cost");
    }

    SECTION("wrong field type") {
        auto r = loader.load_string(R"(
            TerrainCosts = { { code = ".", base_cost = "cheap" } }
        )");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().field == "TerrainCosts[1].base_cost");
    }

    SECTION("multi-character code") {
        auto r = loader.load_string(R"(
            TerrainCosts = { { code = "..", base_cost = 1 } }
        )");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().field == "TerrainCosts[1].code");
    }

    SECTION("duplicate code") {
        auto r = loader.load_string(R"(
            TerrainCosts = {
                { code = ".", base_cost = 1 },
                { code = ".", base_cost = 2 },
            }
        )");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().field == ".");
    }

    SECTION("negative cost") {
        auto r = loader.load_string(R"(
            TerrainCosts = { { code = "s", base_cost = 2.5, ascent_cost = -1 } }
        )");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().field == "s");
    }

    SECTION("non-positive tile width") {
        auto r = loader.load_string(std::string(MINIMAL_TABLE) +
                                    "IsoProjection = { tile_width = 0 }");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().field == "IsoProjection.tile_width");
    }

    SECTION("unknown algorithm") {
        auto r = loader.load_string(std::string(MINIMAL_TABLE) +
                                    "Search = { algorithm = \"bfs\" }");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().field == "Search.algorithm");
    }

    SECTION("negative priority weight") {
        auto r = loader.load_string(std::string(MINIMAL_TABLE) +
                                    "Search = { priority_weight = -2 }");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().field == "Search.priority_weight");
    }

    SECTION("script error") {
        auto r = loader.load_string("TerrainCosts = {");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Configuration);
    }

    SECTION("missing file") {
        auto r = loader.load_file(DATA_DIR / "missing_config.lua");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Configuration);
    }
}

TEST_CASE("Config scripts can log", "[lua][config]") {
    RouteConfigLoader loader;
    auto cfg = loader.load_string(std::string(MINIMAL_TABLE) + R"(
        LOG("loading ", 2, " terrains")
        SPEW("debug detail")
        WARN("careful")
    )");
    CHECK(cfg.ok());
}
