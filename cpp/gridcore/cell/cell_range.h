#pragma once

#include "gridcore/core/types.h"

namespace gridcore {

/**
 * Range of cells in terms of rows and columns.
 * All bounds are 0-indexed and inclusive.
 */
struct CellRange {
    int startRow = 0;
    int endRow = 0;
    int startColumn = 0;
    int endColumn = 0;

    static CellRange fromSingleRowColumn(int row, int column) {
        return CellRange{row, row, column, column};
    }

    bool contains(int row, int column) const {
        return row >= startRow && row <= endRow && column >= startColumn && column <= endColumn;
    }

    bool operator==(const CellRange& other) const {
        return startRow == other.startRow && endRow == other.endRow
            && startColumn == other.startColumn && endColumn == other.endColumn;
    }
    bool operator!=(const CellRange& other) const { return !(*this == other); }
};

// Axis-generic accessors used by the structural mutations.
inline int& rangeStart(CellRange& range, Axis axis) {
    return axis == Axis::Row ? range.startRow : range.startColumn;
}
inline int& rangeEnd(CellRange& range, Axis axis) {
    return axis == Axis::Row ? range.endRow : range.endColumn;
}
inline int rangeStart(const CellRange& range, Axis axis) {
    return axis == Axis::Row ? range.startRow : range.startColumn;
}
inline int rangeEnd(const CellRange& range, Axis axis) {
    return axis == Axis::Row ? range.endRow : range.endColumn;
}

} // namespace gridcore
