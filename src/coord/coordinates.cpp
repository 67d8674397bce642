#include "coord/coordinates.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace isr::coord {

namespace {

i32 round_to_cell(f64 v) {
    constexpr f64 lo = static_cast<f64>(std::numeric_limits<i32>::min());
    constexpr f64 hi = static_cast<f64>(std::numeric_limits<i32>::max());
    if (std::isnan(v)) return std::numeric_limits<i32>::min();
    // Half-cell ties go to the even cell (default rounding mode)
    f64 r = std::nearbyint(v);
    if (r <= lo) return std::numeric_limits<i32>::min();
    if (r >= hi) return std::numeric_limits<i32>::max();
    return static_cast<i32>(r);
}

} // namespace

Result<IsoConfig> IsoConfig::create(f64 tile_width, f64 tile_height,
                                    f64 elevation_scale) {
    if (!std::isfinite(tile_width) || tile_width <= 0.0) {
        return configuration_fault(
            "tile_width", "tile_width must be positive, got " +
                              std::to_string(tile_width));
    }
    if (!std::isfinite(tile_height) || tile_height <= 0.0) {
        return configuration_fault(
            "tile_height", "tile_height must be positive, got " +
                               std::to_string(tile_height));
    }
    if (!std::isfinite(elevation_scale) || elevation_scale < 0.0) {
        return configuration_fault(
            "elevation_scale", "elevation_scale must be non-negative, got " +
                                   std::to_string(elevation_scale));
    }
    return IsoConfig(tile_width, tile_height, elevation_scale);
}

IsoCoord to_iso(const GridCoord& g, const IsoConfig& cfg) {
    const f64 x = static_cast<f64>(g.x);
    const f64 y = static_cast<f64>(g.y);
    const f64 h = static_cast<f64>(g.h);
    return {cfg.half_width() * (x - y),
            cfg.half_height() * (x + y) - cfg.elevation_scale() * h};
}

IsoPixel to_iso_pixel(const GridCoord& g, const IsoConfig& cfg) {
    // nearbyint uses the current rounding mode (round-half-to-even by default)
    IsoCoord p = to_iso(g, cfg);
    return {static_cast<i32>(std::nearbyint(p.x)),
            static_cast<i32>(std::nearbyint(p.y))};
}

GridPointF to_grid_fractional(const IsoCoord& p, const IsoConfig& cfg,
                              i32 elevation) {
    const f64 y_adj = p.y + cfg.elevation_scale() * static_cast<f64>(elevation);
    const f64 x_term = p.x / cfg.half_width();
    const f64 y_term = y_adj / cfg.half_height();
    return {(x_term + y_term) * 0.5, (y_term - x_term) * 0.5};
}

GridCoord to_grid(const IsoCoord& p, const IsoConfig& cfg, i32 elevation) {
    GridPointF f = to_grid_fractional(p, cfg, elevation);
    return {round_to_cell(f.x), round_to_cell(f.y), elevation};
}

bool in_diamond(f64 u, f64 v) {
    return std::fabs(u) + std::fabs(v) <= 1.0;
}

bool point_in_cell_diamond(const IsoCoord& p, const GridCoord& g,
                           const IsoConfig& cfg) {
    IsoCoord c = to_iso(g, cfg);
    const f64 u = (p.x - c.x) / cfg.half_width();
    const f64 v = (p.y - c.y) / cfg.half_height();
    return in_diamond(u, v);
}

std::array<IsoCoord, 4> tile_corners(const GridCoord& g, const IsoConfig& cfg) {
    IsoCoord c = to_iso(g, cfg);
    const f64 hw = cfg.half_width();
    const f64 hh = cfg.half_height();
    return {{
        {c.x, c.y - hh}, // top
        {c.x + hw, c.y}, // right
        {c.x, c.y + hh}, // bottom
        {c.x - hw, c.y}, // left
    }};
}

} // namespace isr::coord
