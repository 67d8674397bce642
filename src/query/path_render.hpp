#pragma once

#include "coord/coordinates.hpp"
#include "path/pathfinder.hpp"

#include <string>
#include <vector>

namespace isr::map {
class Grid;
}

namespace isr::query {

constexpr char PATH_MARKER = '@';

/// Terrain layer as text with path cells drawn as '@'. The start and goal
/// cells are drawn as 'S' and 'G'.
std::string render_path(const map::Grid& grid, const std::vector<coord::GridCoord>& path,
                        const coord::GridCoord& start, const coord::GridCoord& goal);

/// Multi-line summary: algorithm, total cost, path length, nodes expanded,
/// execution time.
std::string format_metrics(const path::PathResult& result);

/// Side-by-side Dijkstra / A* summary.
std::string format_comparison(const path::PathResult& dijkstra,
                              const path::PathResult& astar);

} // namespace isr::query
