#pragma once

#include "coord/coordinates.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "map/terrain_costs.hpp"

#include <string>
#include <vector>

namespace isr::map {

/// Per-cell terrain code, elevation and tactical priority of a static map.
/// Row-major storage [y * width + x]. Immutable after create().
///
/// Search queries borrow a Grid read-only; several queries may share one
/// Grid across threads.
class Grid {
public:
    /// Validates dimensions (> 0), layer sizes (width * height each) and
    /// priorities (finite, >= 0). Empty elevation/priority vectors mean
    /// "all zero".
    static Result<Grid> create(i32 width, i32 height,
                               std::vector<TerrainCode> terrain,
                               std::vector<i32> elevation = {},
                               std::vector<f64> priority = {});

    /// Row-oriented builder: one string per terrain row. Elevation and
    /// priority rows, if given, must match the terrain shape.
    static Result<Grid> from_rows(const std::vector<std::string>& terrain_rows,
                                  const std::vector<std::vector<i32>>& elevation_rows = {},
                                  const std::vector<std::vector<f64>>& priority_rows = {});

    i32 width() const { return width_; }
    i32 height() const { return height_; }
    size_t cell_count() const { return terrain_.size(); }

    bool in_bounds(i32 x, i32 y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }

    /// Boundary fault if (x, y) is outside the grid.
    Result<void> check_bounds(i32 x, i32 y) const;

    size_t index(i32 x, i32 y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) +
               static_cast<size_t>(x);
    }

    // Unchecked accessors: caller guarantees in_bounds(x, y).
    TerrainCode terrain_at(i32 x, i32 y) const { return terrain_[index(x, y)]; }
    i32 elevation_at(i32 x, i32 y) const { return elevation_[index(x, y)]; }
    f64 priority_at(i32 x, i32 y) const { return priority_[index(x, y)]; }

    /// Cell (x, y) with its elevation filled in. Unchecked.
    coord::GridCoord coord_at(i32 x, i32 y) const {
        return {x, y, elevation_at(x, y)};
    }

    /// Configuration fault for the first cell whose code the table does not
    /// know (row-major order).
    Result<void> validate_codes(const TerrainCostTable& table) const;

    /// True if the cell is in bounds and its terrain is passable.
    bool is_passable(i32 x, i32 y, const TerrainCostTable& table) const;

    /// Terrain row y as a string.
    std::string row_string(i32 y) const;

private:
    Grid() = default;

    i32 width_ = 0;
    i32 height_ = 0;
    std::vector<TerrainCode> terrain_;
    std::vector<i32> elevation_;
    std::vector<f64> priority_;
};

} // namespace isr::map
