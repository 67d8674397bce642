#include "map/map_loader.hpp"
#include "map/terrain_costs.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace isr::map {

namespace {

/// Split text into lines, dropping '\r' and leading/trailing blank lines.
std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        pos = end + 1;
    }

    auto blank = [](std::string_view s) {
        for (char c : s) {
            if (!std::isspace(static_cast<unsigned char>(c))) return false;
        }
        return true;
    };
    while (!lines.empty() && blank(lines.back())) lines.pop_back();
    size_t first = 0;
    while (first < lines.size() && blank(lines[first])) ++first;
    lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(first));
    return lines;
}

std::vector<std::string_view> split_tokens(std::string_view line) {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        size_t start = i;
        while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        if (i > start) tokens.push_back(line.substr(start, i - start));
    }
    return tokens;
}

bool parse_int(std::string_view token, i32& out) {
    const char* first = token.data();
    const char* last = token.data() + token.size();
    if (first != last && *first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

bool parse_real(std::string_view token, f64& out) {
    std::string buf(token);
    char* end = nullptr;
    out = std::strtod(buf.c_str(), &end);
    return end != buf.c_str() && *end == '\0';
}

Error layer_fault(const char* layer, std::string msg) {
    return configuration_fault(layer, fmt::format("{} layer: {}", layer, msg));
}

/// Shared row/column parser for the numeric layers.
template <typename T, typename ParseFn>
Result<std::vector<std::vector<T>>> parse_numeric_layer(std::string_view text,
                                                        const char* layer,
                                                        ParseFn parse) {
    auto lines = split_lines(text);
    if (lines.empty()) return layer_fault(layer, "layer is empty");

    std::vector<std::vector<T>> rows;
    rows.reserve(lines.size());
    for (size_t row = 0; row < lines.size(); row++) {
        auto tokens = split_tokens(lines[row]);
        std::vector<T> values;
        values.reserve(tokens.size());
        for (size_t col = 0; col < tokens.size(); col++) {
            T value{};
            if (auto r = parse(tokens[col], value); !r) {
                return layer_fault(layer, fmt::format("{} at row {} column {}",
                                                      r.error().message, row, col));
            }
            values.push_back(value);
        }
        if (values.empty()) {
            return layer_fault(layer, fmt::format("row {} is empty", row));
        }
        if (!rows.empty() && values.size() != rows.front().size()) {
            return layer_fault(layer, fmt::format(
                "non-rectangular: row {} has {} values, expected {}",
                row, values.size(), rows.front().size()));
        }
        rows.push_back(std::move(values));
    }
    return rows;
}

template <typename T>
Result<void> check_shape(const std::vector<std::vector<T>>& rows, const char* layer,
                         size_t width, size_t height) {
    if (rows.size() != height || rows.front().size() != width) {
        return layer_fault(layer, fmt::format(
            "size mismatch: terrain is {}x{}, {} is {}x{}",
            width, height, layer, rows.front().size(), rows.size()));
    }
    return {};
}

} // namespace

Result<std::string> read_layer_file(const fs::path& path, const char* layer) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return configuration_fault(layer, fmt::format("{} layer: cannot open {}",
                                                      layer, path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return configuration_fault(layer, fmt::format("{} layer: failed to read {}",
                                                      layer, path.string()));
    }
    return ss.str();
}

Result<std::vector<std::string>> parse_terrain_layer(std::string_view text,
                                                     const TerrainCostTable& table) {
    auto lines = split_lines(text);
    if (lines.empty()) return layer_fault("terrain", "layer is empty");

    std::vector<std::string> rows;
    rows.reserve(lines.size());
    const size_t width = lines.front().size();
    for (size_t row = 0; row < lines.size(); row++) {
        const auto line = lines[row];
        if (line.size() != width) {
            return layer_fault("terrain", fmt::format(
                "non-rectangular: row {} has {} chars, expected {}",
                row, line.size(), width));
        }
        for (size_t col = 0; col < line.size(); col++) {
            if (!table.contains(line[col])) {
                return configuration_fault(std::string(1, line[col]), fmt::format(
                    "terrain layer: unknown terrain code '{}' at row {} column {}",
                    line[col], row, col));
            }
        }
        rows.emplace_back(line);
    }
    return rows;
}

Result<std::vector<std::vector<i32>>> parse_elevation_layer(std::string_view text) {
    return parse_numeric_layer<i32>(text, "elevation",
        [](std::string_view token, i32& out) -> Result<void> {
            if (!parse_int(token, out)) {
                return Error(fmt::format("invalid integer '{}'", token));
            }
            return {};
        });
}

Result<std::vector<std::vector<f64>>> parse_priority_layer(std::string_view text) {
    return parse_numeric_layer<f64>(text, "priority",
        [](std::string_view token, f64& out) -> Result<void> {
            if (!parse_real(token, out)) {
                return Error(fmt::format("invalid number '{}'", token));
            }
            if (!std::isfinite(out) || out < 0.0) {
                return Error(fmt::format("priority must be non-negative, got '{}'", token));
            }
            return {};
        });
}

Result<Endpoints> parse_points(std::string_view text) {
    std::optional<coord::GridCoord> start;
    std::optional<coord::GridCoord> goal;

    auto lines = split_lines(text);
    for (size_t row = 0; row < lines.size(); row++) {
        auto tokens = split_tokens(lines[row]);
        if (tokens.empty() || tokens.front().front() == '#') continue;

        if (tokens.size() != 3 || tokens[0].size() != 1) {
            return layer_fault("points", fmt::format(
                "expected 'S x y' or 'G x y' at row {}", row));
        }
        const char marker = static_cast<char>(
            std::toupper(static_cast<unsigned char>(tokens[0][0])));
        if (marker != 'S' && marker != 'G') {
            return layer_fault("points", fmt::format(
                "unknown marker '{}' at row {}", tokens[0], row));
        }

        coord::GridCoord cell;
        if (!parse_int(tokens[1], cell.x)) {
            return layer_fault("points", fmt::format(
                "invalid integer '{}' at row {} column 1", tokens[1], row));
        }
        if (!parse_int(tokens[2], cell.y)) {
            return layer_fault("points", fmt::format(
                "invalid integer '{}' at row {} column 2", tokens[2], row));
        }

        auto& slot = marker == 'S' ? start : goal;
        if (slot) {
            return layer_fault("points", fmt::format(
                "duplicate '{}' at row {}", marker, row));
        }
        slot = cell;
    }

    if (!start) return layer_fault("points", "start 'S' not found");
    if (!goal) return layer_fault("points", "goal 'G' not found");
    return Endpoints{*start, *goal};
}

Result<Endpoints> find_markers(const std::vector<std::string>& terrain_rows) {
    std::optional<coord::GridCoord> start;
    std::optional<coord::GridCoord> goal;

    for (size_t y = 0; y < terrain_rows.size(); y++) {
        const auto& row = terrain_rows[y];
        for (size_t x = 0; x < row.size(); x++) {
            if (row[x] != 'S' && row[x] != 'G') continue;
            auto& slot = row[x] == 'S' ? start : goal;
            if (slot) {
                return layer_fault("terrain", fmt::format(
                    "duplicate '{}' marker at row {} column {}", row[x], y, x));
            }
            slot = coord::GridCoord{static_cast<i32>(x), static_cast<i32>(y), 0};
        }
    }

    if (!start) return layer_fault("terrain", "start 'S' not found");
    if (!goal) return layer_fault("terrain", "goal 'G' not found");
    return Endpoints{*start, *goal};
}

Result<MapBundle> load_map_layers(const MapPaths& paths, const TerrainCostTable& table) {
    spdlog::info("Loading map: {}", paths.terrain.string());

    auto terrain_text = read_layer_file(paths.terrain, "terrain");
    if (!terrain_text) return terrain_text.error();
    auto terrain = parse_terrain_layer(terrain_text.value(), table);
    if (!terrain) return terrain.error();

    const auto& rows = terrain.value();
    const size_t height = rows.size();
    const size_t width = rows.front().size();

    std::vector<std::vector<i32>> elevation;
    if (paths.elevation) {
        auto text = read_layer_file(*paths.elevation, "elevation");
        if (!text) return text.error();
        auto parsed = parse_elevation_layer(text.value());
        if (!parsed) return parsed.error();
        if (auto r = check_shape(parsed.value(), "elevation", width, height); !r) {
            return r.error();
        }
        elevation = std::move(parsed.value());
    }

    std::vector<std::vector<f64>> priority;
    if (paths.priority) {
        auto text = read_layer_file(*paths.priority, "priority");
        if (!text) return text.error();
        auto parsed = parse_priority_layer(text.value());
        if (!parsed) return parsed.error();
        if (auto r = check_shape(parsed.value(), "priority", width, height); !r) {
            return r.error();
        }
        priority = std::move(parsed.value());
    }

    Result<Endpoints> ends = Error("no endpoints");
    if (paths.points) {
        auto text = read_layer_file(*paths.points, "points");
        if (!text) return text.error();
        ends = parse_points(text.value());
    } else {
        ends = find_markers(rows);
    }
    if (!ends) return ends.error();

    auto grid = Grid::from_rows(rows, elevation, priority);
    if (!grid) return grid.error();

    const auto& g = grid.value();
    const auto& e = ends.value();
    if (auto r = g.check_bounds(e.start.x, e.start.y); !r) return r.error();
    if (auto r = g.check_bounds(e.goal.x, e.goal.y); !r) return r.error();

    spdlog::info("  Grid: {}x{}, start ({},{}), goal ({},{})", g.width(), g.height(),
                 e.start.x, e.start.y, e.goal.x, e.goal.y);

    const auto start = g.coord_at(e.start.x, e.start.y);
    const auto goal = g.coord_at(e.goal.x, e.goal.y);
    return MapBundle{std::move(grid.value()), start, goal};
}

} // namespace isr::map
