#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/config_loader.hpp"
#include "map/map_loader.hpp"
#include "query/path_render.hpp"
#include "path/pathfinder.hpp"
#include "query/route_query.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>

namespace {

struct CliOptions {
    isr::map::MapPaths map;
    isr::fs::path config_file = "data/route_config.lua";
    isr::fs::path log_file;
    std::optional<isr::path::SearchMode> mode;
    std::optional<isr::f64> priority_weight;
    std::optional<isr::f64> max_cost_cap;
    isr::u32 max_expansions = 0;
    std::optional<isr::coord::IsoCoord> click;
    bool allow_diagonal = false;
    bool compare = false;
    bool metrics = false;
    bool iso = false;
    bool verbose = false;
};

void print_usage() {
    std::cout << "IsoRoute v0.1.0\n"
              << "Route search on isometric terrain grids\n\n"
              << "Usage:\n"
              << "  isoroute <terrain-map> [options]\n\n"
              << "Options:\n"
              << "  --config <lua>            Route config script (default: data/route_config.lua)\n"
              << "  --elevation <file>        Elevation layer (integers)\n"
              << "  --priority <file>         Tactical priority layer (non-negative reals)\n"
              << "  --points <file>           Start/goal file ('S x y' / 'G x y')\n"
              << "  --algo dijkstra|astar     Search algorithm (default from config)\n"
              << "  --allow-diagonal          Allow 8-way movement\n"
              << "  --priority-weight <w>     Tactical priority weight\n"
              << "  --max-cost-cap <c>        Per-edge cost saturation (default: 255)\n"
              << "  --max-expansions <n>      Abort after n expansions (0 = unlimited)\n"
              << "  --compare                 Run Dijkstra and A* and compare\n"
              << "  --metrics                 Print cost, expansions and timing\n"
              << "  --click <X> <Y>           Goal from a screen point\n"
              << "  --iso                     Print screen-space waypoints\n"
              << "  --log <file>              Also log to a file\n"
              << "  --verbose                 Debug logging\n"
              << "  --help                    Show this help message\n";
}

bool parse_flag(int argc, char* argv[], const char* flag) {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], flag) == 0) return true;
    }
    return false;
}

std::string parse_log_arg(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            return argv[i + 1];
        }
    }
    return {};
}

bool parse_real(const char* text, const char* flag, isr::f64& out) {
    char* end = nullptr;
    out = std::strtod(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(out)) {
        spdlog::error("Invalid {} value: {}", flag, text);
        return false;
    }
    return true;
}

bool parse_count(const char* text, const char* flag, isr::u32& out) {
    char* end = nullptr;
    long long val = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0' || val < 0 || val > 0xFFFFFFFFLL) {
        spdlog::error("Invalid {} value: {}", flag, text);
        return false;
    }
    out = static_cast<isr::u32>(val);
    return true;
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    bool have_map = false;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (std::strcmp(arg, "--help") == 0) {
            print_usage();
            std::exit(0);
        } else if (std::strcmp(arg, "--config") == 0 && has_value) {
            opts.config_file = argv[++i];
        } else if (std::strcmp(arg, "--elevation") == 0 && has_value) {
            opts.map.elevation = argv[++i];
        } else if (std::strcmp(arg, "--priority") == 0 && has_value) {
            opts.map.priority = argv[++i];
        } else if (std::strcmp(arg, "--points") == 0 && has_value) {
            opts.map.points = argv[++i];
        } else if (std::strcmp(arg, "--log") == 0 && has_value) {
            opts.log_file = argv[++i];
        } else if (std::strcmp(arg, "--algo") == 0 && has_value) {
            const char* name = argv[++i];
            if (std::strcmp(name, "dijkstra") == 0) {
                opts.mode = isr::path::SearchMode::Dijkstra;
            } else if (std::strcmp(name, "astar") == 0) {
                opts.mode = isr::path::SearchMode::AStar;
            } else {
                spdlog::error("Unknown --algo value: {} (expected dijkstra or astar)", name);
                return std::nullopt;
            }
        } else if (std::strcmp(arg, "--priority-weight") == 0 && has_value) {
            isr::f64 w = 0.0;
            if (!parse_real(argv[++i], "--priority-weight", w)) return std::nullopt;
            opts.priority_weight = w;
        } else if (std::strcmp(arg, "--max-cost-cap") == 0 && has_value) {
            isr::f64 c = 0.0;
            if (!parse_real(argv[++i], "--max-cost-cap", c)) return std::nullopt;
            opts.max_cost_cap = c;
        } else if (std::strcmp(arg, "--max-expansions") == 0 && has_value) {
            if (!parse_count(argv[++i], "--max-expansions", opts.max_expansions)) {
                return std::nullopt;
            }
        } else if (std::strcmp(arg, "--click") == 0 && i + 2 < argc) {
            isr::coord::IsoCoord p;
            if (!parse_real(argv[++i], "--click", p.x)) return std::nullopt;
            if (!parse_real(argv[++i], "--click", p.y)) return std::nullopt;
            opts.click = p;
        } else if (std::strcmp(arg, "--allow-diagonal") == 0) {
            opts.allow_diagonal = true;
        } else if (std::strcmp(arg, "--compare") == 0) {
            opts.compare = true;
        } else if (std::strcmp(arg, "--metrics") == 0) {
            opts.metrics = true;
        } else if (std::strcmp(arg, "--iso") == 0) {
            opts.iso = true;
        } else if (std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
        } else if (arg[0] == '-' && arg[1] == '-') {
            spdlog::error("Unknown or incomplete option: {}", arg);
            return std::nullopt;
        } else if (!have_map) {
            opts.map.terrain = arg;
            have_map = true;
        } else {
            spdlog::error("Unexpected argument: {}", arg);
            return std::nullopt;
        }
    }

    if (!have_map) {
        print_usage();
        return std::nullopt;
    }
    return opts;
}

void report_fault(const char* what, const isr::Error& err) {
    spdlog::error("{}: [{}] {}", what, isr::error_kind_name(err.kind), err.message);
}

/// Logs the outcome; true if a path was found.
bool check_found(const isr::path::PathResult& result) {
    if (result.found()) return true;
    if (result.status == isr::path::SearchStatus::SearchAborted) {
        spdlog::error("Search aborted after {} expansions",
                      result.stats.nodes_expanded);
    } else {
        spdlog::error("No path found");
    }
    return false;
}

void print_waypoints(const std::vector<isr::coord::GridCoord>& path,
                     const isr::coord::IsoConfig& iso) {
    auto points = isr::query::project_path(path, iso);
    std::cout << "Waypoints (screen):\n";
    for (size_t i = 0; i < points.size(); i++) {
        std::cout << "  (" << path[i].x << ", " << path[i].y << ", h=" << path[i].h
                  << ") -> (" << points[i].x << ", " << points[i].y << ")\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    isr::log::init(parse_log_arg(argc, argv),
                   parse_flag(argc, argv, "--verbose") ? spdlog::level::debug
                                                       : spdlog::level::info);

    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        isr::log::shutdown();
        return 1;
    }
    const CliOptions& cli = *parsed;

    isr::lua::RouteConfigLoader config_loader;
    auto config = config_loader.load_file(cli.config_file);
    if (!config) {
        report_fault("Config load failed", config.error());
        isr::log::shutdown();
        return 1;
    }
    const auto& route_cfg = config.value();

    isr::path::SearchOptions opts = route_cfg.search.to_options();
    if (cli.mode) opts.mode = *cli.mode;
    if (cli.priority_weight) opts.cost.priority_weight = *cli.priority_weight;
    if (cli.max_cost_cap) opts.cost.max_cost_cap = *cli.max_cost_cap;
    if (cli.allow_diagonal) opts.cost.movement = isr::path::Movement::EightWay;
    opts.max_expansions = cli.max_expansions;

    auto loaded = isr::map::load_map_layers(cli.map, route_cfg.terrain);
    if (!loaded) {
        report_fault("Map load failed", loaded.error());
        isr::log::shutdown();
        return 1;
    }
    const auto& bundle = loaded.value();

    isr::coord::GridCoord goal = bundle.goal;
    if (cli.click) {
        auto cell = isr::query::resolve_cell(*cli.click, bundle.grid, route_cfg.iso);
        if (!cell) {
            spdlog::error("Screen point ({}, {}) is outside the grid",
                          cli.click->x, cli.click->y);
            isr::log::shutdown();
            return 1;
        }
        spdlog::info("Click ({}, {}) resolved to cell ({}, {})",
                     cli.click->x, cli.click->y, cell->x, cell->y);
        goal = *cell;
    }

    isr::path::Pathfinder finder(bundle.grid, route_cfg.terrain);
    int exit_code = 0;

    if (cli.compare) {
        auto dijkstra_opts = opts;
        dijkstra_opts.mode = isr::path::SearchMode::Dijkstra;
        auto astar_opts = opts;
        astar_opts.mode = isr::path::SearchMode::AStar;

        auto dijkstra = finder.search(bundle.start, goal, dijkstra_opts);
        if (!dijkstra) {
            report_fault("Search failed", dijkstra.error());
            isr::log::shutdown();
            return 1;
        }
        auto astar = finder.search(bundle.start, goal, astar_opts);
        if (!astar) {
            report_fault("Search failed", astar.error());
            isr::log::shutdown();
            return 1;
        }

        if (check_found(dijkstra.value()) && check_found(astar.value())) {
            std::cout << "=== Dijkstra Path ===\n"
                      << isr::query::render_path(bundle.grid, dijkstra.value().path,
                                               bundle.start, goal)
                      << "\n\n=== A* Path ===\n"
                      << isr::query::render_path(bundle.grid, astar.value().path,
                                               bundle.start, goal)
                      << "\n\n";
            if (cli.metrics) {
                std::cout << isr::query::format_comparison(dijkstra.value(), astar.value())
                          << "\n";
            }
            if (cli.iso) print_waypoints(dijkstra.value().path, route_cfg.iso);
        } else {
            exit_code = 1;
        }
    } else {
        auto result = finder.search(bundle.start, goal, opts);
        if (!result) {
            report_fault("Search failed", result.error());
            isr::log::shutdown();
            return 1;
        }

        const auto& res = result.value();
        if (check_found(res)) {
            std::cout << isr::query::render_path(bundle.grid, res.path, bundle.start, goal)
                      << "\n";
            if (cli.metrics) {
                std::cout << "\n" << isr::query::format_metrics(res) << "\n";
            }
            if (cli.iso) print_waypoints(res.path, route_cfg.iso);
        } else {
            if (cli.metrics) std::cout << isr::query::format_metrics(res) << "\n";
            exit_code = 1;
        }
    }

    isr::log::shutdown();
    return exit_code;
}
