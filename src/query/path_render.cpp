#include "query/path_render.hpp"
#include "map/grid.hpp"

#include <cctype>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace isr::query {

namespace {

std::string upper_mode_name(path::SearchMode mode) {
    std::string name = path::search_mode_name(mode);
    for (auto& c : name) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return name;
}

} // namespace

std::string render_path(const map::Grid& grid, const std::vector<coord::GridCoord>& path,
                        const coord::GridCoord& start, const coord::GridCoord& goal) {
    std::vector<std::string> rows;
    rows.reserve(static_cast<size_t>(grid.height()));
    for (i32 y = 0; y < grid.height(); ++y) {
        rows.push_back(grid.row_string(y));
    }

    for (const auto& cell : path) {
        if (!grid.in_bounds(cell.x, cell.y)) continue;
        rows[static_cast<size_t>(cell.y)][static_cast<size_t>(cell.x)] = PATH_MARKER;
    }
    if (grid.in_bounds(start.x, start.y)) {
        rows[static_cast<size_t>(start.y)][static_cast<size_t>(start.x)] = 'S';
    }
    if (grid.in_bounds(goal.x, goal.y)) {
        rows[static_cast<size_t>(goal.y)][static_cast<size_t>(goal.x)] = 'G';
    }

    std::string out;
    for (size_t i = 0; i < rows.size(); ++i) {
        if (i > 0) out += '\n';
        out += rows[i];
    }
    return out;
}

std::string format_metrics(const path::PathResult& result) {
    std::string out = fmt::format("Algorithm: {}\n", upper_mode_name(result.mode));
    if (result.found()) {
        out += fmt::format("Total cost: {:.3f}\n", result.total_cost);
        out += fmt::format("Path length: {} nodes\n", result.path.size());
    } else {
        out += fmt::format("Status: {}\n", path::search_status_name(result.status));
    }
    out += fmt::format("Nodes expanded: {}\n", result.stats.nodes_expanded);
    out += fmt::format("Execution time: {:.3f} ms", result.stats.elapsed_ms());
    return out;
}

std::string format_comparison(const path::PathResult& dijkstra,
                              const path::PathResult& astar) {
    std::string out = "=== Algorithm Comparison ===\n";
    out += fmt::format("Dijkstra: Cost={:.3f}, Expanded={}, Time={:.3f}ms\n",
                       dijkstra.total_cost, dijkstra.stats.nodes_expanded,
                       dijkstra.stats.elapsed_ms());
    out += fmt::format("A*:       Cost={:.3f}, Expanded={}, Time={:.3f}ms",
                       astar.total_cost, astar.stats.nodes_expanded,
                       astar.stats.elapsed_ms());

    if (dijkstra.found() && astar.found() && dijkstra.total_cost != astar.total_cost) {
        out += fmt::format("\nNote: Cost difference = {:.6f}",
                           std::abs(dijkstra.total_cost - astar.total_cost));
    }
    if (dijkstra.stats.nodes_expanded > 0 &&
        astar.stats.nodes_expanded < dijkstra.stats.nodes_expanded) {
        const f64 savings = (1.0 - static_cast<f64>(astar.stats.nodes_expanded) /
                                   static_cast<f64>(dijkstra.stats.nodes_expanded)) * 100.0;
        out += fmt::format("\nA* expanded {:.1f}% fewer nodes", savings);
    }
    return out;
}

} // namespace isr::query
