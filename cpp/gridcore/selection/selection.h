#pragma once

#include "gridcore/cell/cell_range.h"
#include "gridcore/core/types.h"
#include <cstddef>
#include <optional>
#include <vector>

namespace gridcore {

/**
 * A selected range plus the cell the selection started at.
 * The initial cell drives keyboard navigation; when unset the
 * top-left cell of the range is used.
 */
struct Selection {
    CellRange range;
    std::optional<CellPosition> initial;

    CellPosition initialPosition() const {
        return initial ? *initial : CellPosition{range.startRow, range.startColumn};
    }

    bool operator==(const Selection& other) const {
        return range == other.range && initialPosition() == other.initialPosition();
    }
    bool operator!=(const Selection& other) const { return !(*this == other); }
};

// Outcome of adding a selection: which existing entries go, which new ones come.
struct ValidationResult {
    bool accepted = true;
    std::vector<std::size_t> toRemove;
    std::vector<Selection> toAdd;
};

} // namespace gridcore
