#pragma once

#include "gridcore/border/border.h"
#include "gridcore/cell/cell_range.h"
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>

namespace gridcore {

// Cell value; std::monostate is "no value". Interpreting it is up to the renderer.
using CellValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

// Index of a cell record in the model's arena.
using CellId = std::uint32_t;
static constexpr CellId kNoCell = std::numeric_limits<CellId>::max();

inline bool hasValue(const CellValue& value) {
    return !std::holds_alternative<std::monostate>(value);
}

/**
 * A rectangular region of the grid (1x1 or merged) with its value,
 * the name of the renderer that draws it and its border.
 * The border is managed through the BorderModel.
 */
struct Cell {
    CellRange range;
    std::string rendererName;
    CellValue value;
    std::optional<Border> border;
};

} // namespace gridcore
