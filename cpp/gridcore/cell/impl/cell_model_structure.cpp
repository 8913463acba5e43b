// CellModel insert / delete methods
// Part of the cell_model.h class split

#include "gridcore/cell/cell_model.h"
#include "gridcore/core/logging.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace gridcore {

void CellModel::insertRows(int insertBeforeIndex, int count, const CellInitializer& cellInitializer) {
    insert(Axis::Row, insertBeforeIndex, count, cellInitializer);
}

void CellModel::insertColumns(int insertBeforeIndex, int count, const CellInitializer& cellInitializer) {
    insert(Axis::Column, insertBeforeIndex, count, cellInitializer);
}

void CellModel::deleteRows(int fromIndex, int count) {
    remove(Axis::Row, fromIndex, count);
}

void CellModel::deleteColumns(int fromIndex, int count) {
    remove(Axis::Column, fromIndex, count);
}

void CellModel::insert(Axis axis, int insertBeforeIndex, int count, const CellInitializer& cellInitializer) {
    AxisState& state = axisState(axis);
    const int length = static_cast<int>(state.sizes.size());
    if (insertBeforeIndex < 0 || insertBeforeIndex > length) {
        throw std::out_of_range("CellModel::insert: index " + std::to_string(insertBeforeIndex) + " out of range");
    }
    if (count < 0) {
        throw std::invalid_argument("CellModel::insert: negative count");
    }
    if (count == 0) return;

    // New indices copy the size of their neighbour.
    double size = axis == Axis::Row ? kDefaultRowSize : kDefaultColumnSize;
    if (insertBeforeIndex > 0) {
        size = state.sizes[static_cast<std::size_t>(insertBeforeIndex - 1)];
    } else if (length > 0) {
        size = state.sizes[0];
    }
    state.sizes.insert(state.sizes.begin() + insertBeforeIndex, static_cast<std::size_t>(count), size);
    state.offsets.insert(state.offsets.begin() + insertBeforeIndex, static_cast<std::size_t>(count), 0.0);

    std::set<int> hidden;
    for (int index : state.hidden) {
        hidden.insert(index >= insertBeforeIndex ? index + count : index);
    }
    state.hidden.swap(hidden);

    // Shift cells behind the insertion point, grow merges straddling it.
    for (CellId id = 0; id < static_cast<CellId>(cells_.size()); ++id) {
        if (!isAlive(id)) continue;
        CellRange& range = cells_[id].range;
        int& start = rangeStart(range, axis);
        int& end = rangeEnd(range, axis);
        if (start >= insertBeforeIndex) {
            start += count;
            end += count;
        } else if (end >= insertBeforeIndex) {
            end += count;
        }
    }

    int otherLength = 0;
    if (axis == Axis::Row) {
        otherLength = getColumnCount();
        lookup_.insert(
            lookup_.begin() + insertBeforeIndex,
            static_cast<std::size_t>(count),
            std::vector<CellId>(static_cast<std::size_t>(otherLength), kNoCell)
        );
    } else {
        otherLength = getRowCount();
        for (std::vector<CellId>& row : lookup_) {
            row.insert(row.begin() + insertBeforeIndex, static_cast<std::size_t>(count), kNoCell);
        }
    }

    for (int index = insertBeforeIndex; index < insertBeforeIndex + count; ++index) {
        for (int other = 0; other < otherLength; ++other) {
            const int row = axis == Axis::Row ? index : other;
            const int column = axis == Axis::Row ? other : index;

            if (insertBeforeIndex > 0) {
                const CellId before = slotOnAxis(axis, insertBeforeIndex - 1, other);
                if (before != kNoCell && cells_[before].range.contains(row, column)) {
                    slotOnAxis(axis, index, other) = before;
                    continue;
                }
            }

            if (!cellInitializer) continue;
            std::optional<Cell> cell = cellInitializer(row, column);
            if (!cell) continue;
            cell->range = CellRange::fromSingleRowColumn(row, column);
            slotOnAxis(axis, index, other) = allocateCell(std::move(*cell));
        }
    }

    recalculateOffsets(state, insertBeforeIndex);

    GRIDCORE_LOG_DEBUG("insert %s: %d before %d", axis == Axis::Row ? "rows" : "columns", count, insertBeforeIndex);

    CellModelEvent event{CellModelEventType::Inserted};
    event.isRow = axis == Axis::Row;
    event.startIndex = insertBeforeIndex;
    event.count = count;
    emit(event);
}

void CellModel::remove(Axis axis, int fromIndex, int count) {
    AxisState& state = axisState(axis);
    const int length = static_cast<int>(state.sizes.size());
    if (fromIndex < 0 || fromIndex >= length) {
        throw std::out_of_range("CellModel::delete: index " + std::to_string(fromIndex) + " out of range");
    }
    if (count < 0) {
        throw std::invalid_argument("CellModel::delete: negative count");
    }
    count = std::min(count, length - fromIndex);
    if (count == 0) return;

    CellModelEvent beforeDelete{CellModelEventType::BeforeDelete};
    beforeDelete.isRow = axis == Axis::Row;
    beforeDelete.startIndex = fromIndex;
    beforeDelete.count = count;
    emit(beforeDelete);

    const int lastIndex = fromIndex + count - 1;
    for (CellId id = 0; id < static_cast<CellId>(cells_.size()); ++id) {
        if (!isAlive(id)) continue;
        CellRange& range = cells_[id].range;
        int& start = rangeStart(range, axis);
        int& end = rangeEnd(range, axis);

        if (end < fromIndex) continue;

        if (start > lastIndex) {
            start -= count;
            end -= count;
        } else if (start >= fromIndex && end <= lastIndex) {
            releaseCell(id);
        } else if (start < fromIndex && end <= lastIndex) {
            end = fromIndex - 1;
        } else if (start < fromIndex) {
            end -= count;
        } else {
            // Starts inside the deleted span and reaches beyond it.
            start = fromIndex;
            end -= count;
        }
    }

    if (axis == Axis::Row) {
        lookup_.erase(lookup_.begin() + fromIndex, lookup_.begin() + fromIndex + count);
    } else {
        for (std::vector<CellId>& row : lookup_) {
            row.erase(row.begin() + fromIndex, row.begin() + fromIndex + count);
        }
    }

    state.sizes.erase(state.sizes.begin() + fromIndex, state.sizes.begin() + fromIndex + count);
    state.offsets.erase(state.offsets.begin() + fromIndex, state.offsets.begin() + fromIndex + count);

    std::set<int> hidden;
    for (int index : state.hidden) {
        if (index < fromIndex) {
            hidden.insert(index);
        } else if (index > lastIndex) {
            hidden.insert(index - count);
        }
    }
    state.hidden.swap(hidden);

    recalculateOffsets(state, fromIndex);

    GRIDCORE_LOG_DEBUG("delete %s: %d from %d", axis == Axis::Row ? "rows" : "columns", count, fromIndex);
}

} // namespace gridcore
