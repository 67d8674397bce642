#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <array>

// Grid <-> isometric screen transforms.
// Nothing in this module may depend on map/ or path/.

namespace isr::coord {

/// Logical grid cell with elevation.
struct GridCoord {
    i32 x = 0;
    i32 y = 0;
    i32 h = 0;

    bool operator==(const GridCoord&) const = default;
};

/// Screen-space point. Unbounded.
struct IsoCoord {
    f64 x = 0.0;
    f64 y = 0.0;
};

/// Integer pixel position (see to_iso_pixel).
struct IsoPixel {
    i32 x = 0;
    i32 y = 0;

    bool operator==(const IsoPixel&) const = default;
};

/// Unrounded solution of the inverse transform.
struct GridPointF {
    f64 x = 0.0;
    f64 y = 0.0;
};

/// Isometric projection parameters. Validated once in create(); immutable.
class IsoConfig {
public:
    static constexpr f64 DEFAULT_TILE_WIDTH = 64.0;
    static constexpr f64 DEFAULT_TILE_HEIGHT = 32.0;
    static constexpr f64 DEFAULT_ELEVATION_SCALE = 16.0;

    /// Default 64x32 tiles, 16 px per elevation level.
    IsoConfig() = default;

    /// Fails with a Configuration fault if tile_width <= 0, tile_height <= 0,
    /// elevation_scale < 0, or any value is not finite.
    static Result<IsoConfig> create(f64 tile_width, f64 tile_height,
                                    f64 elevation_scale);

    f64 tile_width() const { return tile_width_; }
    f64 tile_height() const { return tile_height_; }
    f64 elevation_scale() const { return elevation_scale_; }
    f64 half_width() const { return tile_width_ * 0.5; }
    f64 half_height() const { return tile_height_ * 0.5; }

private:
    IsoConfig(f64 tw, f64 th, f64 beta)
        : tile_width_(tw), tile_height_(th), elevation_scale_(beta) {}

    f64 tile_width_ = DEFAULT_TILE_WIDTH;
    f64 tile_height_ = DEFAULT_TILE_HEIGHT;
    f64 elevation_scale_ = DEFAULT_ELEVATION_SCALE;
};

/// X = (tw/2)(x - y), Y = (th/2)(x + y) - beta*h
IsoCoord to_iso(const GridCoord& g, const IsoConfig& cfg);

/// to_iso rounded to whole pixels, ties to even.
IsoPixel to_iso_pixel(const GridCoord& g, const IsoConfig& cfg);

/// Inverse transform without rounding. `elevation` undoes the vertical
/// offset; pass 0 when the elevation under the point is unknown.
GridPointF to_grid_fractional(const IsoCoord& p, const IsoConfig& cfg,
                              i32 elevation = 0);

/// Inverse transform rounded to the nearest cell. The returned h is
/// `elevation`. Components outside the i32 range saturate.
GridCoord to_grid(const IsoCoord& p, const IsoConfig& cfg, i32 elevation = 0);

/// Normalized diamond inclusion: |u| + |v| <= 1 (boundary included).
bool in_diamond(f64 u, f64 v);

/// True if p lies inside the diamond of cell g (centered on to_iso(g)).
bool point_in_cell_diamond(const IsoCoord& p, const GridCoord& g,
                           const IsoConfig& cfg);

/// Diamond corners of cell g: top, right, bottom, left.
std::array<IsoCoord, 4> tile_corners(const GridCoord& g, const IsoConfig& cfg);

} // namespace isr::coord
