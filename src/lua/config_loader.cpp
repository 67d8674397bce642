#include "lua/config_loader.hpp"
#include "core/log.hpp"
#include "lua/lua_state.hpp"

#include <cmath>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace isr::lua {

namespace {

/// Restores the Lua stack height on scope exit.
class StackGuard {
public:
    explicit StackGuard(lua_State* L) : L_(L), top_(lua_gettop(L)) {}
    ~StackGuard() { lua_settop(L_, top_); }

    StackGuard(const StackGuard&) = delete;
    StackGuard& operator=(const StackGuard&) = delete;

private:
    lua_State* L_;
    int top_;
};

/// Push t[key] for the table at table_idx.
void push_field(lua_State* L, int table_idx, const char* key) {
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
}

/// Read a numeric field. nil yields `fallback`; nil without a fallback, or
/// a non-number, is a configuration fault on `path`.
Result<f64> read_number_field(lua_State* L, int table_idx, const char* key,
                              const std::string& path,
                              std::optional<f64> fallback = std::nullopt) {
    push_field(L, table_idx, key);
    const int type = lua_type(L, -1);
    f64 value = 0.0;
    if (type == LUA_TNUMBER) {
        value = lua_tonumber(L, -1);
    }
    lua_pop(L, 1);

    if (type == LUA_TNIL) {
        if (fallback) return *fallback;
        return configuration_fault(path, path + " is required");
    }
    if (type != LUA_TNUMBER) {
        return configuration_fault(path, path + " must be a number");
    }
    return value;
}

Result<bool> read_bool_field(lua_State* L, int table_idx, const char* key,
                             const std::string& path, bool fallback) {
    push_field(L, table_idx, key);
    const int type = lua_type(L, -1);
    const bool value = lua_toboolean(L, -1) != 0;
    lua_pop(L, 1);

    if (type == LUA_TNIL) return fallback;
    if (type != LUA_TBOOLEAN) {
        return configuration_fault(path, path + " must be a boolean");
    }
    return value;
}

Result<std::string> read_string_field(lua_State* L, int table_idx, const char* key,
                                      const std::string& path,
                                      std::optional<std::string> fallback = std::nullopt) {
    push_field(L, table_idx, key);
    const int type = lua_type(L, -1);
    std::string value;
    if (type == LUA_TSTRING) {
        value.assign(lua_tostring(L, -1), lua_strlen(L, -1));
    }
    lua_pop(L, 1);

    if (type == LUA_TNIL) {
        if (fallback) return *fallback;
        return configuration_fault(path, path + " is required");
    }
    if (type != LUA_TSTRING) {
        return configuration_fault(path, path + " must be a string");
    }
    return value;
}

Result<coord::IsoConfig> read_projection(lua_State* L) {
    StackGuard guard(L);

    lua_getglobal(L, "IsoProjection");
    if (lua_isnil(L, -1)) return coord::IsoConfig{};
    if (!lua_istable(L, -1)) {
        return configuration_fault("IsoProjection", "IsoProjection must be a table");
    }
    const int idx = lua_gettop(L);

    const coord::IsoConfig defaults;
    auto tw = read_number_field(L, idx, "tile_width", "IsoProjection.tile_width",
                                defaults.tile_width());
    if (!tw) return tw.error();
    auto th = read_number_field(L, idx, "tile_height", "IsoProjection.tile_height",
                                defaults.tile_height());
    if (!th) return th.error();
    auto beta = read_number_field(L, idx, "elevation_scale", "IsoProjection.elevation_scale",
                                  defaults.elevation_scale());
    if (!beta) return beta.error();

    auto cfg = coord::IsoConfig::create(tw.value(), th.value(), beta.value());
    if (!cfg) {
        Error err = cfg.error();
        err.field = "IsoProjection." + err.field;
        return err;
    }
    return cfg;
}

Result<map::TerrainCost> read_terrain_record(lua_State* L, int idx, int n) {
    const std::string prefix = fmt::format("TerrainCosts[{}]", n);
    map::TerrainCost rec;

    auto code = read_string_field(L, idx, "code", prefix + ".code");
    if (!code) return code.error();
    if (code.value().size() != 1) {
        return configuration_fault(prefix + ".code",
            fmt::format("{}.code must be a single character, got '{}'", prefix, code.value()));
    }
    rec.code = code.value()[0];

    auto name = read_string_field(L, idx, "terrain", prefix + ".terrain", std::string{});
    if (!name) return name.error();
    rec.terrain = name.value().empty() ? std::string(1, rec.code) : name.value();

    auto base = read_number_field(L, idx, "base_cost", prefix + ".base_cost");
    if (!base) return base.error();
    rec.base_cost = base.value();

    auto ascent = read_number_field(L, idx, "ascent_cost", prefix + ".ascent_cost", 0.0);
    if (!ascent) return ascent.error();
    rec.ascent_cost = ascent.value();

    auto descent = read_number_field(L, idx, "descent_cost", prefix + ".descent_cost", 0.0);
    if (!descent) return descent.error();
    rec.descent_cost = descent.value();

    auto diag = read_number_field(L, idx, "diagonal_factor", prefix + ".diagonal_factor",
                                  map::SQRT2);
    if (!diag) return diag.error();
    rec.diagonal_factor = diag.value();

    auto passable = read_bool_field(L, idx, "passable", prefix + ".passable", true);
    if (!passable) return passable.error();
    rec.passable = passable.value();

    return rec;
}

Result<map::TerrainCostTable> read_terrain_costs(lua_State* L) {
    StackGuard guard(L);

    lua_getglobal(L, "TerrainCosts");
    if (lua_isnil(L, -1)) {
        return configuration_fault("TerrainCosts", "TerrainCosts global not set by config script");
    }
    if (!lua_istable(L, -1)) {
        return configuration_fault("TerrainCosts", "TerrainCosts must be a table");
    }
    const int list_idx = lua_gettop(L);

    std::vector<map::TerrainCost> records;
    for (int i = 1; ; i++) {
        lua_pushnumber(L, i);
        lua_gettable(L, list_idx);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        if (!lua_istable(L, -1)) {
            return configuration_fault(fmt::format("TerrainCosts[{}]", i),
                                       fmt::format("TerrainCosts[{}] must be a table", i));
        }

        auto rec = read_terrain_record(L, lua_gettop(L), i);
        if (!rec) return rec.error();
        records.push_back(std::move(rec.value()));
        lua_pop(L, 1);
    }

    return map::TerrainCostTable::create(std::move(records));
}

Result<path::SearchMode> parse_algorithm(const std::string& name) {
    if (name == "dijkstra") return path::SearchMode::Dijkstra;
    if (name == "astar" || name == "a*") return path::SearchMode::AStar;
    return configuration_fault("Search.algorithm",
        "Search.algorithm must be \"dijkstra\" or \"astar\", got \"" + name + "\"");
}

Result<SearchDefaults> read_search_defaults(lua_State* L) {
    StackGuard guard(L);

    SearchDefaults defaults;
    lua_getglobal(L, "Search");
    if (lua_isnil(L, -1)) return defaults;
    if (!lua_istable(L, -1)) {
        return configuration_fault("Search", "Search must be a table");
    }
    const int idx = lua_gettop(L);

    auto weight = read_number_field(L, idx, "priority_weight", "Search.priority_weight",
                                    defaults.priority_weight);
    if (!weight) return weight.error();
    defaults.priority_weight = weight.value();

    auto cap = read_number_field(L, idx, "max_cost_cap", "Search.max_cost_cap",
                                 defaults.max_cost_cap);
    if (!cap) return cap.error();
    defaults.max_cost_cap = cap.value();

    auto diagonal = read_bool_field(L, idx, "allow_diagonal", "Search.allow_diagonal",
                                    defaults.allow_diagonal);
    if (!diagonal) return diagonal.error();
    defaults.allow_diagonal = diagonal.value();

    auto algo = read_string_field(L, idx, "algorithm", "Search.algorithm",
                                  std::string("dijkstra"));
    if (!algo) return algo.error();
    auto mode = parse_algorithm(algo.value());
    if (!mode) return mode.error();
    defaults.mode = mode.value();

    path::CostConfig check;
    check.priority_weight = defaults.priority_weight;
    check.max_cost_cap = defaults.max_cost_cap;
    if (auto r = check.validate(); !r) {
        Error err = r.error();
        err.field = "Search." + err.field;
        return err;
    }

    return defaults;
}

void register_log_functions(LuaState& state) {
    state.register_function("LOG", log::l_LOG);
    state.register_function("WARN", log::l_WARN);
    state.register_function("SPEW", log::l_SPEW);
    state.register_function("ALERT", log::l_ALERT);
}

} // namespace

path::SearchOptions SearchDefaults::to_options() const {
    path::SearchOptions opts;
    opts.mode = mode;
    opts.cost.priority_weight = priority_weight;
    opts.cost.max_cost_cap = max_cost_cap;
    opts.cost.movement = allow_diagonal ? path::Movement::EightWay
                                        : path::Movement::FourWay;
    return opts;
}

Result<RouteConfig> RouteConfigLoader::load_file(const fs::path& path) {
    spdlog::info("Loading route config: {}", path.string());

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return configuration_fault(path.string(),
                                   "config file not found: " + path.string());
    }

    LuaState state;
    register_log_functions(state);
    auto exec = state.do_file(path);
    if (!exec) {
        return configuration_fault(path.string(),
                                   "failed to execute config: " + exec.error().message);
    }
    return read_globals(state);
}

Result<RouteConfig> RouteConfigLoader::load_string(std::string_view code) {
    LuaState state;
    register_log_functions(state);
    auto exec = state.do_string(code);
    if (!exec) {
        return configuration_fault("config",
                                   "failed to execute config: " + exec.error().message);
    }
    return read_globals(state);
}

Result<RouteConfig> RouteConfigLoader::read_globals(LuaState& state) {
    lua_State* L = state.raw();

    auto iso = read_projection(L);
    if (!iso) return iso.error();

    auto terrain = read_terrain_costs(L);
    if (!terrain) return terrain.error();

    auto search = read_search_defaults(L);
    if (!search) return search.error();

    const auto& cfg = iso.value();
    spdlog::info("  Terrain types: {}, tile {}x{}, elevation scale {}",
                 terrain.value().size(), cfg.tile_width(), cfg.tile_height(),
                 cfg.elevation_scale());
    spdlog::debug("  Search defaults: {} {}, lambda {}, cap {}",
                  path::search_mode_name(search.value().mode),
                  search.value().allow_diagonal ? "8-way" : "4-way",
                  search.value().priority_weight, search.value().max_cost_cap);

    return RouteConfig{iso.value(), std::move(terrain.value()), search.value()};
}

} // namespace isr::lua
