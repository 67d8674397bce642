#include "query/route_query.hpp"
#include "coord/hit_test.hpp"
#include "map/grid.hpp"

namespace isr::query {

std::optional<coord::GridCoord> resolve_cell(const coord::IsoCoord& screen_point,
                                             const map::Grid& grid,
                                             const coord::IsoConfig& cfg) {
    coord::HitTestResolver resolver(cfg, grid.width(), grid.height());
    auto cell = resolver.resolve(screen_point);
    if (!cell) return std::nullopt;
    return grid.coord_at(cell->x, cell->y);
}

Result<path::PathResult> find_path(const map::Grid& grid,
                                   const map::TerrainCostTable& table,
                                   const coord::GridCoord& start,
                                   const coord::GridCoord& goal,
                                   path::SearchMode mode,
                                   path::Movement movement,
                                   f64 priority_weight) {
    path::SearchOptions opts;
    opts.mode = mode;
    opts.cost.movement = movement;
    opts.cost.priority_weight = priority_weight;
    return path::Pathfinder(grid, table).search(start, goal, opts);
}

std::vector<coord::IsoCoord> project_path(const std::vector<coord::GridCoord>& path,
                                          const coord::IsoConfig& cfg) {
    std::vector<coord::IsoCoord> points;
    points.reserve(path.size());
    for (const auto& cell : path) {
        points.push_back(coord::to_iso(cell, cfg));
    }
    return points;
}

} // namespace isr::query
