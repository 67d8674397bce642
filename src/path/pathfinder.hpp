#pragma once

#include "coord/coordinates.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "path/cost_function.hpp"
#include "path/heuristics.hpp"

#include <chrono>
#include <optional>
#include <vector>

namespace isr::map {
class Grid;
class TerrainCostTable;
}

namespace isr::path {

enum class SearchMode : u8 { Dijkstra, AStar };

const char* search_mode_name(SearchMode mode);

enum class SearchStatus : u8 {
    Found,
    NoPathFound,   // frontier exhausted: goal proven unreachable
    SearchAborted, // expansion cap or time budget hit first
};

const char* search_status_name(SearchStatus status);

struct SearchOptions {
    SearchMode mode = SearchMode::Dijkstra;
    Heuristic heuristic = Heuristic::Auto; ///< A* only
    CostConfig cost;                       ///< priority weight, cap, movement

    /// Drop diagonal steps unless both orthogonal side cells are passable.
    bool prevent_corner_cutting = false;

    /// Abort after this many expansions (0 = unlimited).
    u32 max_expansions = 0;

    /// Abort once this much wall-clock time has passed.
    std::optional<std::chrono::steady_clock::duration> time_budget;
};

struct SearchStats {
    u32 nodes_expanded = 0;
    std::chrono::steady_clock::duration elapsed{};

    f64 elapsed_ms() const {
        return std::chrono::duration<f64, std::milli>(elapsed).count();
    }
};

struct PathResult {
    SearchStatus status = SearchStatus::NoPathFound;
    SearchMode mode = SearchMode::Dijkstra;
    std::vector<coord::GridCoord> path; ///< start..goal inclusive, h = grid elevation
    f64 total_cost = INF_COST;          ///< sum of saturated edge costs
    SearchStats stats;

    bool found() const { return status == SearchStatus::Found; }
};

/// Grid-native Dijkstra / A* over a borrowed Grid and TerrainCostTable.
///
/// Holds no per-query state, so one Pathfinder may serve concurrent
/// searches from several threads.
class Pathfinder {
public:
    Pathfinder(const map::Grid& grid, const map::TerrainCostTable& table);

    /// Shortest path from start to goal. Only x/y of start and goal are
    /// used; elevations come from the grid.
    ///
    /// Errors: Boundary fault for an off-grid start/goal; Configuration
    /// fault for invalid options or a grid code the table does not know.
    /// NoPathFound and SearchAborted are reported in PathResult::status.
    Result<PathResult> search(const coord::GridCoord& start,
                              const coord::GridCoord& goal,
                              const SearchOptions& opts = {}) const;

    const map::Grid& grid() const { return grid_; }
    const map::TerrainCostTable& table() const { return table_; }

private:
    /// Validate options, endpoints and grid codes before searching.
    Result<void> check_query(const coord::GridCoord& start,
                             const coord::GridCoord& goal,
                             const SearchOptions& opts) const;

    /// Diagonal step allowed by the corner-cutting rule.
    bool diagonal_clear(i32 cx, i32 cy, i32 dx, i32 dy) const;

    const map::Grid& grid_;
    const map::TerrainCostTable& table_;
};

/// One-shot convenience wrapper around Pathfinder::search.
Result<PathResult> find_path(const map::Grid& grid,
                             const map::TerrainCostTable& table,
                             const coord::GridCoord& start,
                             const coord::GridCoord& goal,
                             const SearchOptions& opts = {});

} // namespace isr::path
