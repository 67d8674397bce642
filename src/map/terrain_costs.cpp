#include "map/terrain_costs.hpp"

#include <cmath>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace isr::map {

namespace {

Result<void> check_cost_field(const TerrainCost& rec, const char* name,
                              f64 value) {
    if (!std::isfinite(value) || value < 0.0) {
        return configuration_fault(
            std::string(1, rec.code),
            fmt::format("terrain '{}' ({}): {} must be a non-negative number, got {}",
                        rec.code, rec.terrain, name, value));
    }
    return {};
}

} // namespace

Result<TerrainCostTable> TerrainCostTable::create(
    std::vector<TerrainCost> records) {
    if (records.empty()) {
        return configuration_fault("TerrainCosts", "terrain cost table is empty");
    }

    TerrainCostTable table;
    for (size_t i = 0; i < records.size(); ++i) {
        const auto& rec = records[i];
        unsigned char uc = static_cast<unsigned char>(rec.code);
        if (uc <= 0x20 || uc >= 0x7f) {
            return configuration_fault(
                "code", fmt::format("terrain record {} has a non-printable code", i + 1));
        }

        for (auto [name, value] : {std::pair{"base_cost", rec.base_cost},
                                   std::pair{"ascent_cost", rec.ascent_cost},
                                   std::pair{"descent_cost", rec.descent_cost},
                                   std::pair{"diagonal_factor", rec.diagonal_factor}}) {
            auto check = check_cost_field(rec, name, value);
            if (!check) return check.error();
        }

        if (table.index_.contains(rec.code)) {
            return configuration_fault(
                std::string(1, rec.code),
                fmt::format("duplicate terrain code '{}'", rec.code));
        }
        table.index_[rec.code] = i;
    }

    table.records_ = std::move(records);
    return table;
}

const TerrainCost* TerrainCostTable::find(TerrainCode code) const {
    auto it = index_.find(code);
    return (it != index_.end()) ? &records_[it->second] : nullptr;
}

Result<const TerrainCost*> TerrainCostTable::lookup(TerrainCode code) const {
    const TerrainCost* rec = find(code);
    if (!rec) {
        return configuration_fault(std::string(1, code),
                                   fmt::format("unknown terrain code '{}'", code));
    }
    return rec;
}

bool TerrainCostTable::is_passable(TerrainCode code) const {
    const TerrainCost* rec = find(code);
    return rec && rec->passable;
}

} // namespace isr::map
