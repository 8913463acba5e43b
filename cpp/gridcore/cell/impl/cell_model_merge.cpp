// CellModel merge / split methods
// Part of the cell_model.h class split

#include "gridcore/cell/cell_model.h"
#include "gridcore/cell/cell_range_util.h"
#include "gridcore/core/logging.h"

#include <stdexcept>

namespace gridcore {

bool CellModel::mergeCells(const CellRange& range) {
    if (range.startRow > range.endRow || range.startColumn > range.endColumn) {
        throw std::invalid_argument("CellModel::mergeCells: reversed range");
    }
    requireInBounds(range.startRow, range.startColumn, "CellModel::mergeCells");
    requireInBounds(range.endRow, range.endColumn, "CellModel::mergeCells");

    for (int row = range.startRow; row <= range.endRow; ++row) {
        for (int column = range.startColumn; column <= range.endColumn; ++column) {
            const CellId id = slot(row, column);
            if (id != kNoCell && !CellRangeUtil::isSingleRowColumnRange(cells_[id].range)) {
                GRIDCORE_LOG_DEBUG("mergeCells: (%d, %d) already belongs to a merged cell", row, column);
                return false;
            }
        }
    }

    CellId anchor = slot(range.startRow, range.startColumn);
    if (anchor == kNoCell) {
        Cell cell;
        cell.range = CellRange::fromSingleRowColumn(range.startRow, range.startColumn);
        anchor = allocateCell(std::move(cell));
    }

    for (int row = range.startRow; row <= range.endRow; ++row) {
        for (int column = range.startColumn; column <= range.endColumn; ++column) {
            CellId& id = slot(row, column);
            if (id != kNoCell && id != anchor) {
                releaseCell(id);
            }
            id = anchor;
        }
    }
    cells_[anchor].range = range;

    CellModelEvent event{CellModelEventType::Merged};
    event.range = range;
    emit(event);
    return true;
}

void CellModel::splitCell(int row, int column) {
    requireInBounds(row, column, "CellModel::splitCell");

    const CellId anchor = slot(row, column);
    if (anchor == kNoCell || CellRangeUtil::isSingleRowColumnRange(cells_[anchor].range)) {
        return;
    }

    const CellRange merged = cells_[anchor].range;
    const std::optional<Border> border = cells_[anchor].border;

    for (int r = merged.startRow; r <= merged.endRow; ++r) {
        for (int c = merged.startColumn; c <= merged.endColumn; ++c) {
            if (r == merged.startRow && c == merged.startColumn) continue;

            CellId& id = slot(r, c);
            id = kNoCell;
            if (!border) continue;

            // Keep the sides that were drawn on the outline of the merged cell.
            Border sides;
            if (r == merged.startRow) sides.top = border->top;
            if (r == merged.endRow) sides.bottom = border->bottom;
            if (c == merged.startColumn) sides.left = border->left;
            if (c == merged.endColumn) sides.right = border->right;
            if (sides.empty()) continue;

            Cell cell;
            cell.range = CellRange::fromSingleRowColumn(r, c);
            cell.border = sides;
            id = allocateCell(std::move(cell));
        }
    }

    Cell& first = cells_[anchor];
    first.range = CellRange::fromSingleRowColumn(merged.startRow, merged.startColumn);
    if (first.border) {
        if (merged.endRow != merged.startRow) first.border->bottom.reset();
        if (merged.endColumn != merged.startColumn) first.border->right.reset();
        if (first.border->empty()) first.border.reset();
    }

    CellModelEvent event{CellModelEventType::Split};
    event.range = merged;
    emit(event);
}

} // namespace gridcore
