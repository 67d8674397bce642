#pragma once

#include "coord/coordinates.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "map/terrain_costs.hpp"
#include "path/pathfinder.hpp"

#include <string_view>

namespace isr::lua {

class LuaState;

/// Query defaults from the optional `Search` table.
struct SearchDefaults {
    f64 priority_weight = 0.0;
    f64 max_cost_cap = path::MAX_COST_CAP;
    bool allow_diagonal = false;
    path::SearchMode mode = path::SearchMode::Dijkstra;

    /// Search options seeded from these defaults.
    path::SearchOptions to_options() const;
};

/// Everything a route configuration script provides.
struct RouteConfig {
    coord::IsoConfig iso;
    map::TerrainCostTable terrain;
    SearchDefaults search;
};

/// Loads route configuration from a Lua script.
///
/// The script sets globals:
///   IsoProjection = { tile_width = 64, tile_height = 32, elevation_scale = 16 }
///   TerrainCosts  = { { code = ".", terrain = "plain", base_cost = 1.0, ... }, ... }
///   Search        = { priority_weight = 0, max_cost_cap = 255,
///                     allow_diagonal = false, algorithm = "dijkstra" }
///
/// Only TerrainCosts is required. Every failure is a Configuration fault
/// whose `field` names the offending global, record field or code.
class RouteConfigLoader {
public:
    Result<RouteConfig> load_file(const fs::path& path);
    Result<RouteConfig> load_string(std::string_view code);

private:
    Result<RouteConfig> read_globals(LuaState& state);
};

} // namespace isr::lua
