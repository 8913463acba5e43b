#include "gridcore/selection/selection_options.h"
#include "gridcore/cell/cell_model.h"

namespace gridcore {

bool rowColumnHeaderTransform(Selection& selection, const CellModel& cellModel, bool causedByMove) {
    CellPosition initial = selection.initialPosition();
    CellRange& range = selection.range;

    if (causedByMove) {
        if (initial.row == 0) initial.row = 1;
        if (initial.column == 0) initial.column = 1;
        if (range.startRow == 0) range.startRow = 1;
        if (range.endRow == 0) range.endRow = 1;
        if (range.startColumn == 0) range.startColumn = 1;
        if (range.endColumn == 0) range.endColumn = 1;
    } else if (initial.row == 0 && initial.column == 0) {
        range = CellRange{1, cellModel.getRowCount() - 1, 1, cellModel.getColumnCount() - 1};
        initial = CellPosition{1, 1};
    } else if (initial.row == 0) {
        range.startRow = 1;
        range.endRow = cellModel.getRowCount() - 1;
        initial.row = 1;
    } else if (initial.column == 0) {
        range.startColumn = 1;
        range.endColumn = cellModel.getColumnCount() - 1;
        initial.column = 1;
    }

    selection.initial = initial;
    return true;
}

} // namespace gridcore
