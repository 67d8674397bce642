#pragma once

#include "coord/coordinates.hpp"
#include "core/result.hpp"
#include "path/pathfinder.hpp"

#include <optional>
#include <vector>

namespace isr::map {
class Grid;
class TerrainCostTable;
}

namespace isr::query {

/// Screen point -> grid cell with the cell's elevation filled in.
/// nullopt when the point falls outside the grid. The hit test itself
/// assumes elevation 0, so on raised terrain the result is approximate.
std::optional<coord::GridCoord> resolve_cell(const coord::IsoCoord& screen_point,
                                             const map::Grid& grid,
                                             const coord::IsoConfig& cfg);

/// Route search with the common knobs. Faults propagate unchanged;
/// NoPathFound and SearchAborted come back in PathResult::status.
Result<path::PathResult> find_path(const map::Grid& grid,
                                   const map::TerrainCostTable& table,
                                   const coord::GridCoord& start,
                                   const coord::GridCoord& goal,
                                   path::SearchMode mode,
                                   path::Movement movement,
                                   f64 priority_weight = 0.0);

/// Screen-space waypoints for a path. Each cell's own elevation lifts its
/// waypoint.
std::vector<coord::IsoCoord> project_path(const std::vector<coord::GridCoord>& path,
                                          const coord::IsoConfig& cfg);

} // namespace isr::query
