#pragma once

#include "coord/coordinates.hpp"
#include "core/types.hpp"
#include "path/cost_function.hpp"

namespace isr::map {
class Grid;
class TerrainCostTable;
}

namespace isr::path {

enum class Heuristic : u8 {
    Auto,      // Manhattan for 4-way movement, Octile for 8-way
    Manhattan,
    Octile,
};

const char* heuristic_name(Heuristic h);

/// Cheapest possible single steps on a grid, used to scale heuristics.
/// Both are lower bounds of any saturated edge cost into a passable cell.
struct HeuristicBounds {
    f64 min_step = 0.0;          ///< min base_cost over passable terrains present
    f64 min_diagonal_step = 0.0; ///< min base_cost * diagonal_factor, same set
};

/// Scan the grid's passable terrains. Values are capped at
/// cfg.max_cost_cap (a saturated edge can be cheaper than its base cost).
/// Codes unknown to the table are ignored.
HeuristicBounds compute_heuristic_bounds(const map::Grid& grid,
                                         const map::TerrainCostTable& table,
                                         const CostConfig& cfg);

/// (|dx| + |dy|) * min_step. Admissible for 4-way movement.
f64 manhattan_estimate(const coord::GridCoord& from, const coord::GridCoord& goal,
                       const HeuristicBounds& b);

/// Octile distance scaled by the cheapest axial and diagonal steps.
/// Equals (max + (sqrt2 - 1) * min) * min_step when the cheapest diagonal
/// costs sqrt2 * min_step. Admissible for 4-way and 8-way movement.
f64 octile_estimate(const coord::GridCoord& from, const coord::GridCoord& goal,
                    const HeuristicBounds& b);

/// Resolve Auto against the movement rule.
Heuristic resolve_heuristic(Heuristic h, Movement movement);

f64 estimate(Heuristic h, const coord::GridCoord& from,
             const coord::GridCoord& goal, const HeuristicBounds& b);

} // namespace isr::path
