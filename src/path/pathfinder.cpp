#include "path/pathfinder.hpp"
#include "map/grid.hpp"
#include "map/terrain_costs.hpp"
#include "path/frontier.hpp"

#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

namespace isr::path {

namespace {

enum class CellState : u8 { Unvisited, Frontier, Settled };

constexpr u32 NO_PARENT = std::numeric_limits<u32>::max();

// Axis moves first (up, down, left, right), then diagonals. Shared by both
// modes so equal-cost ties resolve the same way.
constexpr i32 DIRS[8][2] = {
    {0, -1}, {0, 1}, {-1, 0}, {1, 0},
    {-1, -1}, {1, -1}, {-1, 1}, {1, 1},
};

} // namespace

const char* search_mode_name(SearchMode mode) {
    switch (mode) {
    case SearchMode::Dijkstra: return "dijkstra";
    case SearchMode::AStar: return "astar";
    }
    return "unknown";
}

const char* search_status_name(SearchStatus status) {
    switch (status) {
    case SearchStatus::Found: return "found";
    case SearchStatus::NoPathFound: return "no path found";
    case SearchStatus::SearchAborted: return "search aborted";
    }
    return "unknown";
}

Pathfinder::Pathfinder(const map::Grid& grid, const map::TerrainCostTable& table)
    : grid_(grid), table_(table) {}

Result<void> Pathfinder::check_query(const coord::GridCoord& start,
                                     const coord::GridCoord& goal,
                                     const SearchOptions& opts) const {
    if (auto r = opts.cost.validate(); !r) return r;

    if (opts.mode == SearchMode::AStar &&
        opts.heuristic == Heuristic::Manhattan &&
        opts.cost.movement == Movement::EightWay) {
        return configuration_fault(
            "heuristic", "manhattan heuristic is not admissible under 8-way movement");
    }

    if (auto r = grid_.check_bounds(start.x, start.y); !r) return r;
    if (auto r = grid_.check_bounds(goal.x, goal.y); !r) return r;

    return grid_.validate_codes(table_);
}

bool Pathfinder::diagonal_clear(i32 cx, i32 cy, i32 dx, i32 dy) const {
    return grid_.is_passable(cx + dx, cy, table_) &&
           grid_.is_passable(cx, cy + dy, table_);
}

Result<PathResult> Pathfinder::search(const coord::GridCoord& start,
                                      const coord::GridCoord& goal,
                                      const SearchOptions& opts) const {
    const auto t0 = std::chrono::steady_clock::now();

    if (auto r = check_query(start, goal, opts); !r) return r.error();

    PathResult result;
    result.mode = opts.mode;

    const i32 w = grid_.width();
    const i32 h = grid_.height();
    const size_t total = grid_.cell_count();

    auto idx = [w](i32 x, i32 y) -> u32 {
        return static_cast<u32>(y) * static_cast<u32>(w) + static_cast<u32>(x);
    };

    const u32 start_idx = idx(start.x, start.y);
    const u32 goal_idx = idx(goal.x, goal.y);
    const coord::GridCoord goal_cell = grid_.coord_at(goal.x, goal.y);

    const bool astar = opts.mode == SearchMode::AStar;
    const Heuristic heuristic = resolve_heuristic(opts.heuristic, opts.cost.movement);
    HeuristicBounds bounds;
    if (astar) bounds = compute_heuristic_bounds(grid_, table_, opts.cost);

    auto priority_of = [&](const coord::GridCoord& cell, f64 g) -> f64 {
        return astar ? g + estimate(heuristic, cell, goal_cell, bounds) : g;
    };

    std::vector<f64> g_cost(total, INF_COST);
    std::vector<u32> parent(total, NO_PARENT);
    std::vector<CellState> state(total, CellState::Unvisited);
    Frontier open(total);

    g_cost[start_idx] = 0.0;
    state[start_idx] = CellState::Frontier;
    open.push_or_decrease(start_idx, priority_of(grid_.coord_at(start.x, start.y), 0.0));

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (opts.time_budget) deadline = t0 + *opts.time_budget;

    const int dir_count = opts.cost.movement == Movement::EightWay ? 8 : 4;
    u32 nodes_expanded = 0;
    bool found = false;
    bool aborted = false;

    while (!open.empty()) {
        const u32 cur_idx = open.pop_min();
        state[cur_idx] = CellState::Settled;

        if (cur_idx == goal_idx) {
            found = true;
            break;
        }

        if ((opts.max_expansions != 0 && nodes_expanded >= opts.max_expansions) ||
            (deadline && std::chrono::steady_clock::now() >= *deadline)) {
            aborted = true;
            break;
        }
        ++nodes_expanded;

        const i32 cx = static_cast<i32>(cur_idx % static_cast<u32>(w));
        const i32 cy = static_cast<i32>(cur_idx / static_cast<u32>(w));
        const coord::GridCoord cur = grid_.coord_at(cx, cy);

        for (int d = 0; d < dir_count; ++d) {
            const i32 nx = cx + DIRS[d][0];
            const i32 ny = cy + DIRS[d][1];
            if (nx < 0 || ny < 0 || nx >= w || ny >= h) continue;

            const u32 n_idx = idx(nx, ny);
            if (state[n_idx] == CellState::Settled) continue;

            const coord::GridCoord next = grid_.coord_at(nx, ny);
            if (opts.prevent_corner_cutting && is_diagonal_move(cur, next) &&
                !diagonal_clear(cx, cy, DIRS[d][0], DIRS[d][1])) {
                continue;
            }

            auto step = edge_cost(grid_, table_, cur, next, opts.cost);
            if (!step) return step.error();
            if (step.value() == INF_COST) continue;

            const f64 new_g = g_cost[cur_idx] + step.value();
            if (new_g < g_cost[n_idx]) {
                g_cost[n_idx] = new_g;
                parent[n_idx] = cur_idx;
                state[n_idx] = CellState::Frontier;
                open.push_or_decrease(n_idx, priority_of(next, new_g));
            }
        }
    }

    result.stats.nodes_expanded = nodes_expanded;

    if (found) {
        result.status = SearchStatus::Found;
        result.total_cost = g_cost[goal_idx];
        for (u32 cur = goal_idx; cur != NO_PARENT; cur = parent[cur]) {
            result.path.push_back(grid_.coord_at(static_cast<i32>(cur % static_cast<u32>(w)),
                                                 static_cast<i32>(cur / static_cast<u32>(w))));
        }
        std::reverse(result.path.begin(), result.path.end());
    } else if (aborted) {
        result.status = SearchStatus::SearchAborted;
        spdlog::debug("Pathfinder: {} aborted after {} expansions ({},{}) -> ({},{})",
                      search_mode_name(opts.mode), nodes_expanded,
                      start.x, start.y, goal.x, goal.y);
    } else {
        result.status = SearchStatus::NoPathFound;
        spdlog::debug("Pathfinder: {} found no path from ({},{}) to ({},{})",
                      search_mode_name(opts.mode), start.x, start.y, goal.x, goal.y);
    }

    result.stats.elapsed = std::chrono::steady_clock::now() - t0;
    return result;
}

Result<PathResult> find_path(const map::Grid& grid,
                             const map::TerrainCostTable& table,
                             const coord::GridCoord& start,
                             const coord::GridCoord& goal,
                             const SearchOptions& opts) {
    return Pathfinder(grid, table).search(start, goal, opts);
}

} // namespace isr::path
