#include "path/heuristics.hpp"
#include "map/grid.hpp"
#include "map/terrain_costs.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <limits>

namespace isr::path {

const char* heuristic_name(Heuristic h) {
    switch (h) {
    case Heuristic::Auto: return "auto";
    case Heuristic::Manhattan: return "manhattan";
    case Heuristic::Octile: return "octile";
    }
    return "unknown";
}

HeuristicBounds compute_heuristic_bounds(const map::Grid& grid,
                                         const map::TerrainCostTable& table,
                                         const CostConfig& cfg) {
    // Mark which codes occur, then take minima over the passable ones.
    std::array<bool, 256> present{};
    for (i32 y = 0; y < grid.height(); ++y) {
        for (i32 x = 0; x < grid.width(); ++x) {
            present[static_cast<unsigned char>(grid.terrain_at(x, y))] = true;
        }
    }

    f64 min_step = std::numeric_limits<f64>::infinity();
    f64 min_diag = std::numeric_limits<f64>::infinity();
    for (const auto& rec : table.records()) {
        if (!rec.passable || !present[static_cast<unsigned char>(rec.code)]) continue;
        min_step = std::min(min_step, rec.base_cost);
        min_diag = std::min(min_diag, rec.base_cost * rec.diagonal_factor);
    }

    HeuristicBounds b;
    if (min_step != std::numeric_limits<f64>::infinity()) {
        b.min_step = std::min(min_step, cfg.max_cost_cap);
        b.min_diagonal_step = std::min(min_diag, cfg.max_cost_cap);
    }
    return b;
}

f64 manhattan_estimate(const coord::GridCoord& from, const coord::GridCoord& goal,
                       const HeuristicBounds& b) {
    const i32 dx = std::abs(from.x - goal.x);
    const i32 dy = std::abs(from.y - goal.y);
    return static_cast<f64>(dx + dy) * b.min_step;
}

f64 octile_estimate(const coord::GridCoord& from, const coord::GridCoord& goal,
                    const HeuristicBounds& b) {
    const f64 dx = static_cast<f64>(std::abs(from.x - goal.x));
    const f64 dy = static_cast<f64>(std::abs(from.y - goal.y));
    const f64 mn = std::min(dx, dy);
    const f64 mx = std::max(dx, dy);

    // Lower bound of a*m + d*D subject to a + d >= mx and a + 2d >= dx + dy
    // (a axial steps, d diagonal steps), taken over the vertices of that region.
    const f64 m = b.min_step;
    const f64 d = b.min_diagonal_step;
    return std::min({(mx - mn) * m + mn * d, mx * d, (dx + dy) * m});
}

Heuristic resolve_heuristic(Heuristic h, Movement movement) {
    if (h != Heuristic::Auto) return h;
    return movement == Movement::EightWay ? Heuristic::Octile : Heuristic::Manhattan;
}

f64 estimate(Heuristic h, const coord::GridCoord& from,
             const coord::GridCoord& goal, const HeuristicBounds& b) {
    switch (h) {
    case Heuristic::Manhattan: return manhattan_estimate(from, goal, b);
    case Heuristic::Octile:
    case Heuristic::Auto: return octile_estimate(from, goal, b);
    }
    return 0.0;
}

} // namespace isr::path
