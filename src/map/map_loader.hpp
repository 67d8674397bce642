#pragma once

#include "coord/coordinates.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "map/grid.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace isr::map {

class TerrainCostTable;

/// Start and goal cells read from a points file or from S/G markers.
struct Endpoints {
    coord::GridCoord start;
    coord::GridCoord goal;
};

/// Layer files making up one map. Only the terrain layer is required.
struct MapPaths {
    fs::path terrain;
    std::optional<fs::path> elevation;
    std::optional<fs::path> priority;
    std::optional<fs::path> points;
};

/// A loaded map with its endpoints (elevation filled in from the grid).
struct MapBundle {
    Grid grid;
    coord::GridCoord start;
    coord::GridCoord goal;
};

/// One character per cell. Rows must be equally long and every code must be
/// known to `table`.
Result<std::vector<std::string>> parse_terrain_layer(std::string_view text,
                                                     const TerrainCostTable& table);

/// Whitespace-separated integers, one row per line.
Result<std::vector<std::vector<i32>>> parse_elevation_layer(std::string_view text);

/// Whitespace-separated non-negative reals, one row per line.
Result<std::vector<std::vector<f64>>> parse_priority_layer(std::string_view text);

/// Lines "S x y" and "G x y" (marker is case-insensitive). Blank lines and
/// lines starting with '#' are skipped.
Result<Endpoints> parse_points(std::string_view text);

/// Exactly one 'S' and one 'G' cell in the terrain rows.
Result<Endpoints> find_markers(const std::vector<std::string>& terrain_rows);

/// Read each layer, check that all layers share the terrain layer's shape,
/// and build the grid. Endpoints come from the points file if given,
/// otherwise from S/G markers in the terrain layer.
Result<MapBundle> load_map_layers(const MapPaths& paths, const TerrainCostTable& table);

/// Whole file as text. Configuration fault naming `layer` if unreadable.
Result<std::string> read_layer_file(const fs::path& path, const char* layer);

} // namespace isr::map
