// SelectionModel keyboard navigation methods
// Part of the selection_model.h class split

#include "gridcore/selection/selection_model.h"
#include "gridcore/cell/cell_range_util.h"
#include "gridcore/core/logging.h"

#include <algorithm>

namespace gridcore {

namespace {

// Next position inside `range` in scan order; false when the scan leaves the range.
bool stepWithin(const CellRange& range, CellPosition& position, bool rowByRow, bool forward) {
    int& inner = rowByRow ? position.column : position.row;
    int& outer = rowByRow ? position.row : position.column;
    const int innerStart = rowByRow ? range.startColumn : range.startRow;
    const int innerEnd = rowByRow ? range.endColumn : range.endRow;
    const int outerStart = rowByRow ? range.startRow : range.startColumn;
    const int outerEnd = rowByRow ? range.endRow : range.endColumn;

    if (forward) {
        if (++inner > innerEnd) {
            inner = innerStart;
            if (++outer > outerEnd) return false;
        }
    } else {
        if (--inner < innerStart) {
            inner = innerEnd;
            if (--outer < outerStart) return false;
        }
    }
    return true;
}

CellPosition clampInto(const CellRange& range, CellPosition position) {
    position.row = std::min(std::max(position.row, range.startRow), range.endRow);
    position.column = std::min(std::max(position.column, range.startColumn), range.endColumn);
    return position;
}

} // namespace

int SelectionModel::count(Axis axis) const {
    return axis == Axis::Row ? cellModel_.getRowCount() : cellModel_.getColumnCount();
}

bool SelectionModel::isHidden(Axis axis, int index) const {
    return axis == Axis::Row ? cellModel_.isRowHidden(index) : cellModel_.isColumnHidden(index);
}

int SelectionModel::nextVisible(Axis axis, int from) const {
    return axis == Axis::Row ? cellModel_.findNextVisibleRow(from) : cellModel_.findNextVisibleColumn(from);
}

int SelectionModel::previousVisible(Axis axis, int from) const {
    return axis == Axis::Row ? cellModel_.findPreviousVisibleRow(from) : cellModel_.findPreviousVisibleColumn(from);
}

bool SelectionModel::moveSelection(Selection& selection, int deltaColumn, int deltaRow, bool jump) {
    if (deltaColumn == 0 && deltaRow == 0) return false;
    if (cellModel_.getRowCount() == 0 || cellModel_.getColumnCount() == 0) return false;

    const CellRange& range = selection.range;
    CellPosition target = selection.initialPosition();

    // One cell beyond the range edge (or the last visible index when jumping).
    const auto step = [&](Axis axis, int delta, int& index) {
        if (delta > 0) {
            const int next = jump ? previousVisible(axis, count(axis) - 1) : nextVisible(axis, rangeEnd(range, axis) + 1);
            if (next == kNoIndex || next <= rangeEnd(range, axis)) return false;
            index = next;
        } else {
            const int next = jump ? nextVisible(axis, 0) : previousVisible(axis, rangeStart(range, axis) - 1);
            if (next == kNoIndex || next >= rangeStart(range, axis)) return false;
            index = next;
        }
        return true;
    };

    if (deltaColumn != 0 && !step(Axis::Column, deltaColumn, target.column)) return false;
    if (deltaRow != 0 && !step(Axis::Row, deltaRow, target.row)) return false;

    Selection moved{cellRangeAt(target.row, target.column), target};
    if (options_.selectionTransform && !options_.selectionTransform(moved, cellModel_, true)) {
        GRIDCORE_LOG_DEBUG("moveSelection: rejected by selection transform");
        return false;
    }
    if (moved == selection) return false;

    selection = moved;
    ++generation_;
    return true;
}

bool SelectionModel::extendSelection(Selection& selection, int deltaColumn, int deltaRow, bool jump) {
    if (deltaColumn == 0 && deltaRow == 0) return false;
    if (!options_.allowRangeSelection) return false;
    if (cellModel_.getRowCount() == 0 || cellModel_.getColumnCount() == 0) return false;

    const CellPosition initial = selection.initialPosition();
    const CellRange initialSpan = cellRangeAt(initial.row, initial.column);

    CellRange range = selection.range;
    bool changed = false;
    if (deltaColumn != 0) {
        changed = extendAlong(Axis::Column, deltaColumn, jump, initialSpan, range) || changed;
    }
    if (deltaRow != 0) {
        changed = extendAlong(Axis::Row, deltaRow, jump, initialSpan, range) || changed;
    }
    if (!changed) return false;

    Selection extended{range, initial};
    if (options_.selectionTransform && !options_.selectionTransform(extended, cellModel_, true)) {
        GRIDCORE_LOG_DEBUG("extendSelection: rejected by selection transform");
        return false;
    }
    if (extended == selection) return false;

    selection = extended;
    ++generation_;
    return true;
}

bool SelectionModel::extendAlong(Axis axis, int delta, bool jump, const CellRange& initialSpan, CellRange& range) const {
    const int start = rangeStart(range, axis);
    const int end = rangeEnd(range, axis);
    const int spanStart = rangeStart(initialSpan, axis);
    const int spanEnd = rangeEnd(initialSpan, axis);

    if (delta > 0) {
        if (start < spanStart) {
            // Shrink the leading side; a merged cell may pull it back, so keep trying further in.
            CellRange result = range;
            int newStart = start;
            do {
                int next = jump ? spanStart : nextVisible(axis, newStart + 1);
                if (next == kNoIndex || next > spanStart) next = spanStart;
                newStart = next;

                CellRange candidate = range;
                rangeStart(candidate, axis) = newStart;
                result = expandToMerges(candidate);
            } while (rangeStart(result, axis) <= start && newStart < spanStart);

            if (result != range) {
                range = result;
                return true;
            }
            // Nothing to shrink, grow the trailing side instead.
        }

        const int next = jump ? previousVisible(axis, count(axis) - 1) : nextVisible(axis, end + 1);
        if (next == kNoIndex || next <= end) return false;
        rangeEnd(range, axis) = next;
        range = expandToMerges(range);
        return true;
    }

    if (end > spanEnd) {
        CellRange result = range;
        int newEnd = end;
        do {
            int next = jump ? spanEnd : previousVisible(axis, newEnd - 1);
            if (next == kNoIndex || next < spanEnd) next = spanEnd;
            newEnd = next;

            CellRange candidate = range;
            rangeEnd(candidate, axis) = newEnd;
            result = expandToMerges(candidate);
        } while (rangeEnd(result, axis) >= end && newEnd > spanEnd);

        if (result != range) {
            range = result;
            return true;
        }
    }

    const int next = jump ? nextVisible(axis, 0) : previousVisible(axis, start - 1);
    if (next == kNoIndex || next >= start) return false;
    rangeStart(range, axis) = next;
    range = expandToMerges(range);
    return true;
}

bool SelectionModel::moveInitial(int deltaColumn, int deltaRow) {
    if (primaryIndex_ < 0) return false;
    if (deltaColumn == 0 && deltaRow == 0) return false;

    const bool rowByRow = deltaColumn != 0;
    const bool forward = rowByRow ? deltaColumn > 0 : deltaRow > 0;
    const int selectionCount = static_cast<int>(selections_.size());

    const int startIndex = primaryIndex_;
    const CellPosition startPosition = selections_[static_cast<std::size_t>(startIndex)].initialPosition();

    // A merged cell is visited at its top-left cell only.
    const auto isTarget = [this](const CellPosition& position) {
        if (position.row < 0 || position.row >= count(Axis::Row)) return false;
        if (position.column < 0 || position.column >= count(Axis::Column)) return false;
        if (isHidden(Axis::Row, position.row) || isHidden(Axis::Column, position.column)) return false;
        const CellRange span = cellRangeAt(position.row, position.column);
        return span.startRow == position.row && span.startColumn == position.column;
    };

    std::size_t budget = 1;
    for (const Selection& selection : selections_) {
        budget += CellRangeUtil::cellCount(selection.range);
    }

    int index = startIndex;
    CellPosition position = clampInto(selections_[static_cast<std::size_t>(index)].range, startPosition);
    for (std::size_t i = 0; i < budget; ++i) {
        if (!stepWithin(selections_[static_cast<std::size_t>(index)].range, position, rowByRow, forward)) {
            index = forward ? (index + 1) % selectionCount : (index + selectionCount - 1) % selectionCount;
            const CellRange& next = selections_[static_cast<std::size_t>(index)].range;
            position = forward ? CellPosition{next.startRow, next.startColumn} : CellPosition{next.endRow, next.endColumn};
        }
        if (!isTarget(position)) continue;

        if (index == startIndex && position == startPosition) return false;

        selections_[static_cast<std::size_t>(index)].initial = position;
        primaryIndex_ = index;
        ++generation_;
        return true;
    }

    return false;
}

} // namespace gridcore
