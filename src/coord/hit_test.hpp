#pragma once

#include "coord/coordinates.hpp"

#include <optional>

namespace isr::coord {

/// Resolves screen points to grid cells of a width x height grid.
///
/// The candidate is the rounded inverse transform (elevation assumed 0),
/// confirmed with the diamond test around the candidate's own center. If the
/// candidate does not contain the point, the grid-adjacent neighbors are
/// tried in the order up (y-1), down (y+1), left (x-1), right (x+1), and the
/// first in-bounds one that contains it wins.
///
/// Never fails: out-of-range and non-finite points are misses (nullopt).
class HitTestResolver {
public:
    HitTestResolver(const IsoConfig& cfg, i32 width, i32 height);

    std::optional<GridCoord> resolve(const IsoCoord& p) const;

    const IsoConfig& config() const { return cfg_; }
    i32 width() const { return width_; }
    i32 height() const { return height_; }

private:
    bool in_bounds(i32 x, i32 y) const;

    IsoConfig cfg_;
    i32 width_;
    i32 height_;
};

/// One-shot convenience wrapper around HitTestResolver.
std::optional<GridCoord> resolve_cell(const IsoCoord& p, const IsoConfig& cfg,
                                      i32 width, i32 height);

} // namespace isr::coord
