#include "gridcore/selection/selection_model.h"
#include "gridcore/cell/cell_range_util.h"
#include "gridcore/core/logging.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace gridcore {

SelectionModel::SelectionModel(CellModel& cellModel, SelectionOptions options)
    : cellModel_(cellModel), options_(std::move(options)) {}

bool SelectionModel::addSelection(Selection selection, bool validate, bool subtract) {
    ValidationResult result = plan(selection, validate, subtract);
    if (!result.accepted) {
        GRIDCORE_LOG_DEBUG("addSelection: rejected by selection transform");
        return false;
    }

    std::sort(result.toRemove.begin(), result.toRemove.end());
    for (auto it = result.toRemove.rbegin(); it != result.toRemove.rend(); ++it) {
        selections_.erase(selections_.begin() + static_cast<std::ptrdiff_t>(*it));
    }
    for (Selection& added : result.toAdd) {
        selections_.push_back(std::move(added));
    }

    if (selections_.empty()) {
        primaryIndex_ = -1;
    } else if (result.toAdd.empty()) {
        primaryIndex_ = static_cast<int>(selections_.size()) - 1;
    } else {
        primaryIndex_ = static_cast<int>(selections_.size() - result.toAdd.size());
    }
    ++generation_;
    return true;
}

ValidationResult SelectionModel::validate(const Selection& selection, bool subtract) const {
    return plan(selection, true, subtract);
}

ValidationResult SelectionModel::plan(const Selection& selection, bool validate, bool subtract) const {
    ValidationResult result;

    Selection candidate = selection;
    if (!prepare(candidate, validate, false)) {
        result.accepted = false;
        return result;
    }

    if (!options_.allowMultiSelection) {
        for (std::size_t i = 0; i < selections_.size(); ++i) {
            result.toRemove.push_back(i);
        }
        result.toAdd.push_back(candidate);
        return result;
    }

    if (subtract) {
        for (std::size_t i = 0; i < selections_.size(); ++i) {
            const Selection& existing = selections_[i];
            if (!CellRangeUtil::contains(candidate.range, existing.range)) continue;

            // An equal range leaves nothing behind and the entry just goes away.
            result.toRemove.push_back(i);
            for (const CellRange& rest : CellRangeUtil::subtract(existing.range, candidate.range)) {
                result.toAdd.push_back(Selection{rest, std::nullopt});
            }
            return result;
        }
    }

    result.toAdd.push_back(candidate);
    return result;
}

// Normalize, transform, collapse and (optionally) expand a candidate selection.
bool SelectionModel::prepare(Selection& selection, bool validate, bool causedByMove) const {
    selection.range = CellRangeUtil::normalize(selection.range);
    if (!selection.initial) {
        selection.initial = CellPosition{selection.range.startRow, selection.range.startColumn};
    }

    if (options_.selectionTransform && !options_.selectionTransform(selection, cellModel_, causedByMove)) {
        return false;
    }

    if (!options_.allowRangeSelection) {
        const CellPosition initial = selection.initialPosition();
        selection.range = CellRange::fromSingleRowColumn(initial.row, initial.column);
    }

    if (validate) {
        selection.range = expandToMerges(selection.range);
    }
    return true;
}

void SelectionModel::removeSelection(std::size_t index) {
    if (index >= selections_.size()) {
        throw std::out_of_range("SelectionModel::removeSelection: no selection at index " + std::to_string(index));
    }
    selections_.erase(selections_.begin() + static_cast<std::ptrdiff_t>(index));

    const int removed = static_cast<int>(index);
    if (selections_.empty()) {
        primaryIndex_ = -1;
    } else if (primaryIndex_ > removed) {
        --primaryIndex_;
    } else if (primaryIndex_ == removed) {
        primaryIndex_ = std::min(primaryIndex_, static_cast<int>(selections_.size()) - 1);
    }
    ++generation_;
}

bool SelectionModel::modifySelection(std::size_t index, Selection selection, bool validate) {
    if (index >= selections_.size()) {
        throw std::out_of_range("SelectionModel::modifySelection: no selection at index " + std::to_string(index));
    }
    if (!prepare(selection, validate, false)) {
        return false;
    }
    selections_[index] = std::move(selection);
    ++generation_;
    return true;
}

void SelectionModel::clear() {
    if (selections_.empty()) return;
    selections_.clear();
    primaryIndex_ = -1;
    ++generation_;
}

Selection* SelectionModel::getPrimary() {
    if (primaryIndex_ < 0) return nullptr;
    return &selections_[static_cast<std::size_t>(primaryIndex_)];
}

const Selection* SelectionModel::getPrimary() const {
    if (primaryIndex_ < 0) return nullptr;
    return &selections_[static_cast<std::size_t>(primaryIndex_)];
}

void SelectionModel::setPrimary(int index) {
    if (index < 0 || index >= static_cast<int>(selections_.size())) {
        throw std::out_of_range("SelectionModel::setPrimary: no selection at index " + std::to_string(index));
    }
    if (primaryIndex_ == index) return;
    primaryIndex_ = index;
    ++generation_;
}

bool SelectionModel::isSelected(int row, int column) const {
    for (const Selection& selection : selections_) {
        if (selection.range.contains(row, column)) return true;
    }
    return false;
}

CellRange SelectionModel::cellRangeAt(int row, int column) const {
    const CellModel& model = cellModel_;
    const Cell* cell = model.getCell(row, column);
    return cell ? cell->range : CellRange::fromSingleRowColumn(row, column);
}

// Grow until no merged cell sticks out of the range.
CellRange SelectionModel::expandToMerges(CellRange range) const {
    const CellModel& model = cellModel_;

    bool changed = true;
    while (changed) {
        changed = false;

        const int startRow = std::max(range.startRow, 0);
        const int endRow = std::min(range.endRow, model.getRowCount() - 1);
        const int startColumn = std::max(range.startColumn, 0);
        const int endColumn = std::min(range.endColumn, model.getColumnCount() - 1);

        for (int row = startRow; row <= endRow && !changed; ++row) {
            for (int column = startColumn; column <= endColumn; ++column) {
                const Cell* cell = model.getCell(row, column);
                if (!cell || CellRangeUtil::contains(cell->range, range)) continue;

                range = CellRangeUtil::unite(range, cell->range);
                changed = true;
                break;
            }
        }
    }

    return range;
}

} // namespace gridcore
