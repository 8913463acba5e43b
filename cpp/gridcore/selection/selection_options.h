#pragma once

#include "gridcore/selection/selection.h"
#include <functional>

namespace gridcore {

class CellModel;

// May rewrite the selection in place; returning false rejects it.
using SelectionTransform = std::function<bool(Selection& selection, const CellModel& cellModel, bool causedByMove)>;

struct SelectionOptions {
    // When false only single cells can be selected.
    bool allowRangeSelection = true;
    bool allowMultiSelection = true;
    SelectionTransform selectionTransform;
};

/**
 * Treats row 0 and column 0 as headers.
 * Navigation never lands on a header. Selecting a header cell selects the whole
 * column (row 0), the whole row (column 0) or everything (corner cell).
 */
bool rowColumnHeaderTransform(Selection& selection, const CellModel& cellModel, bool causedByMove);

} // namespace gridcore
