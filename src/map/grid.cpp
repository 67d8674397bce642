#include "map/grid.hpp"

#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace isr::map {

Result<Grid> Grid::create(i32 width, i32 height,
                          std::vector<TerrainCode> terrain,
                          std::vector<i32> elevation,
                          std::vector<f64> priority) {
    if (width <= 0 || height <= 0) {
        return configuration_fault(
            "dimensions", fmt::format("grid dimensions must be positive, got {}x{}",
                                      width, height));
    }
    const size_t cells = static_cast<size_t>(width) * static_cast<size_t>(height);

    if (terrain.size() != cells) {
        return configuration_fault(
            "terrain", fmt::format("terrain layer has {} cells, expected {} ({}x{})",
                                   terrain.size(), cells, width, height));
    }
    if (elevation.empty()) {
        elevation.assign(cells, 0);
    } else if (elevation.size() != cells) {
        return configuration_fault(
            "elevation", fmt::format("elevation layer has {} cells, expected {}",
                                     elevation.size(), cells));
    }
    if (priority.empty()) {
        priority.assign(cells, 0.0);
    } else if (priority.size() != cells) {
        return configuration_fault(
            "priority", fmt::format("priority layer has {} cells, expected {}",
                                    priority.size(), cells));
    }
    for (size_t i = 0; i < cells; ++i) {
        if (!std::isfinite(priority[i]) || priority[i] < 0.0) {
            return configuration_fault(
                "priority", fmt::format("priority at ({}, {}) must be a non-negative number, got {}",
                                        i % width, i / width, priority[i]));
        }
    }

    Grid grid;
    grid.width_ = width;
    grid.height_ = height;
    grid.terrain_ = std::move(terrain);
    grid.elevation_ = std::move(elevation);
    grid.priority_ = std::move(priority);
    return grid;
}

Result<Grid> Grid::from_rows(const std::vector<std::string>& terrain_rows,
                             const std::vector<std::vector<i32>>& elevation_rows,
                             const std::vector<std::vector<f64>>& priority_rows) {
    if (terrain_rows.empty() || terrain_rows.front().empty()) {
        return configuration_fault("terrain", "terrain layer is empty");
    }
    const i32 height = static_cast<i32>(terrain_rows.size());
    const i32 width = static_cast<i32>(terrain_rows.front().size());

    std::vector<TerrainCode> terrain;
    terrain.reserve(static_cast<size_t>(width) * height);
    for (i32 y = 0; y < height; ++y) {
        const auto& row = terrain_rows[y];
        if (static_cast<i32>(row.size()) != width) {
            return configuration_fault(
                "terrain", fmt::format("non-rectangular terrain: row {} has {} cells, expected {}",
                                       y, row.size(), width));
        }
        terrain.insert(terrain.end(), row.begin(), row.end());
    }

    auto flatten = [&](const auto& rows, const char* layer, auto& out) -> Result<void> {
        if (rows.empty()) return {};
        if (static_cast<i32>(rows.size()) != height) {
            return configuration_fault(
                layer, fmt::format("{} layer has {} rows, terrain has {}",
                                   layer, rows.size(), height));
        }
        for (i32 y = 0; y < height; ++y) {
            if (static_cast<i32>(rows[y].size()) != width) {
                return configuration_fault(
                    layer, fmt::format("{} layer row {} has {} values, expected {}",
                                       layer, y, rows[y].size(), width));
            }
            out.insert(out.end(), rows[y].begin(), rows[y].end());
        }
        return {};
    };

    std::vector<i32> elevation;
    if (auto r = flatten(elevation_rows, "elevation", elevation); !r) return r.error();
    std::vector<f64> priority;
    if (auto r = flatten(priority_rows, "priority", priority); !r) return r.error();

    return create(width, height, std::move(terrain), std::move(elevation),
                  std::move(priority));
}

Result<void> Grid::check_bounds(i32 x, i32 y) const {
    if (!in_bounds(x, y)) {
        return boundary_fault(x, y, width_, height_);
    }
    return {};
}

Result<void> Grid::validate_codes(const TerrainCostTable& table) const {
    for (i32 y = 0; y < height_; ++y) {
        for (i32 x = 0; x < width_; ++x) {
            TerrainCode code = terrain_at(x, y);
            if (!table.contains(code)) {
                return configuration_fault(
                    std::string(1, code),
                    fmt::format("unknown terrain code '{}' at ({}, {})", code, x, y));
            }
        }
    }
    return {};
}

bool Grid::is_passable(i32 x, i32 y, const TerrainCostTable& table) const {
    if (!in_bounds(x, y)) return false;
    return table.is_passable(terrain_at(x, y));
}

std::string Grid::row_string(i32 y) const {
    auto begin = terrain_.begin() + static_cast<std::ptrdiff_t>(index(0, y));
    return std::string(begin, begin + width_);
}

} // namespace isr::map
