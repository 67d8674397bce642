#include "path/cost_function.hpp"
#include "map/grid.hpp"
#include "map/terrain_costs.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <spdlog/fmt/fmt.h>

namespace isr::path {

const char* movement_name(Movement m) {
    switch (m) {
    case Movement::FourWay: return "4-way";
    case Movement::EightWay: return "8-way";
    }
    return "unknown";
}

Result<void> CostConfig::validate() const {
    if (!std::isfinite(priority_weight) || priority_weight < 0.0) {
        return configuration_fault(
            "priority_weight",
            fmt::format("priority_weight must be non-negative, got {}", priority_weight));
    }
    if (!std::isfinite(max_cost_cap) || max_cost_cap <= 0.0) {
        return configuration_fault(
            "max_cost_cap",
            fmt::format("max_cost_cap must be positive, got {}", max_cost_cap));
    }
    return {};
}

Result<f64> edge_cost(const map::Grid& grid, const map::TerrainCostTable& table,
                      const coord::GridCoord& from, const coord::GridCoord& to,
                      const CostConfig& cfg) {
    if (auto r = grid.check_bounds(from.x, from.y); !r) return r.error();
    if (auto r = grid.check_bounds(to.x, to.y); !r) return r.error();

    const i32 adx = std::abs(to.x - from.x);
    const i32 ady = std::abs(to.y - from.y);
    if (adx > 1 || ady > 1 || (adx == 0 && ady == 0)) {
        return Error(fmt::format("({}, {}) -> ({}, {}) is not a single step",
                                 from.x, from.y, to.x, to.y));
    }

    auto terrain = table.lookup(grid.terrain_at(to.x, to.y));
    if (!terrain) return terrain.error();
    const map::TerrainCost& t = *terrain.value();

    if (!t.passable) return INF_COST;

    const bool diagonal = is_diagonal_move(from, to);
    if (diagonal && cfg.movement == Movement::FourWay) return INF_COST;

    const f64 kappa = diagonal ? t.diagonal_factor : 1.0;
    const f64 dh = static_cast<f64>(grid.elevation_at(to.x, to.y)) -
                   static_cast<f64>(grid.elevation_at(from.x, from.y));

    f64 cost = t.base_cost * kappa
             + t.ascent_cost * std::max(0.0, dh)
             + t.descent_cost * std::max(0.0, -dh)
             + cfg.priority_weight * grid.priority_at(to.x, to.y);

    return std::min(cost, cfg.max_cost_cap);
}

} // namespace isr::path
