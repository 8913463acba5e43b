#pragma once

#include "gridcore/cell/cell_range.h"
#include <cstdint>
#include <functional>
#include <vector>

namespace gridcore {

enum class CellModelEventType : std::uint16_t {
    BeforeDelete = 1,
    Inserted = 2,
    Hidden = 3,
    Shown = 4,
    Resized = 5,
    Merged = 6,
    Split = 7,
};

/**
 * Structural change in the cell model.
 * BeforeDelete/Inserted use startIndex + count; Hidden/Shown/Resized use
 * indices (only those that actually changed); Merged/Split use range.
 */
struct CellModelEvent {
    CellModelEventType type;
    bool isRow = true;
    int startIndex = 0;
    int count = 0;
    std::vector<int> indices;
    CellRange range{};
};

using CellModelListener = std::function<void(const CellModelEvent&)>;
using SubscriptionId = std::uint32_t;

} // namespace gridcore
