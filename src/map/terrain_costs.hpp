#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace isr::map {

/// Single-character terrain identifier as it appears in terrain layers.
using TerrainCode = char;

constexpr f64 SQRT2 = 1.41421356237309504880;

/// Cost parameters for one terrain type.
struct TerrainCost {
    TerrainCode code = '.';
    std::string terrain;        ///< Display name ("plain", "forest", ...)
    f64 base_cost = 1.0;
    f64 ascent_cost = 0.0;      ///< Per elevation level climbed
    f64 descent_cost = 0.0;     ///< Per elevation level descended
    f64 diagonal_factor = SQRT2;
    bool passable = true;
};

/// Immutable terrain code -> cost lookup.
/// Built once per session from validated configuration records.
class TerrainCostTable {
public:
    /// Validates every record (non-negative finite costs, unique codes,
    /// printable code, at least one record). Any violation is a
    /// Configuration fault naming the offending code.
    static Result<TerrainCostTable> create(std::vector<TerrainCost> records);

    /// Lookup; nullptr if the code is unknown.
    const TerrainCost* find(TerrainCode code) const;

    /// Lookup that reports an unknown code as a Configuration fault.
    Result<const TerrainCost*> lookup(TerrainCode code) const;

    /// True if the code is known and its terrain is passable.
    bool is_passable(TerrainCode code) const;

    bool contains(TerrainCode code) const { return find(code) != nullptr; }
    size_t size() const { return records_.size(); }

    /// Records in configuration order.
    const std::vector<TerrainCost>& records() const { return records_; }

private:
    TerrainCostTable() = default;

    std::vector<TerrainCost> records_;
    std::unordered_map<TerrainCode, size_t> index_;
};

} // namespace isr::map
