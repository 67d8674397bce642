#pragma once

#include "coord/coordinates.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <limits>

namespace isr::map {
class Grid;
class TerrainCostTable;
}

namespace isr::path {

/// Hard ceiling for a single edge cost.
constexpr f64 MAX_COST_CAP = 255.0;

constexpr f64 INF_COST = std::numeric_limits<f64>::infinity();

enum class Movement : u8 {
    FourWay,  // axis-aligned steps only
    EightWay, // axis-aligned and diagonal steps
};

const char* movement_name(Movement m);

struct CostConfig {
    f64 priority_weight = 0.0;       ///< lambda, must be >= 0
    f64 max_cost_cap = MAX_COST_CAP; ///< per-edge saturation, must be > 0
    Movement movement = Movement::FourWay;

    /// Configuration fault for a negative/non-finite weight or a
    /// non-positive/non-finite cap.
    Result<void> validate() const;
};

/// Edge cost from `from` to the 8-adjacent cell `to`:
///
///   c(u,v) = b(v)*k(u,v) + up(v)*max(0, dh) + down(v)*max(0, -dh) + lambda*P(v)
///
/// b/up/down are the base/ascent/descent costs of `to`'s terrain, k is 1 for
/// axis moves and the terrain's diagonal_factor for diagonal moves,
/// dh is the grid elevation of `to` minus that of `from` (the h fields of
/// the arguments are ignored), P(v) is `to`'s tactical priority. The result is
/// clamped to cfg.max_cost_cap before any accumulation.
///
/// Returns INF_COST if `to` is impassable, or if the move is diagonal under
/// Movement::FourWay. Boundary fault if either cell is off the grid,
/// Configuration fault if `to`'s terrain code is unknown, Generic error if
/// the cells are not 8-adjacent.
Result<f64> edge_cost(const map::Grid& grid, const map::TerrainCostTable& table,
                      const coord::GridCoord& from, const coord::GridCoord& to,
                      const CostConfig& cfg = {});

/// True if the step from -> to changes both x and y.
inline bool is_diagonal_move(const coord::GridCoord& from, const coord::GridCoord& to) {
    return from.x != to.x && from.y != to.y;
}

} // namespace isr::path
