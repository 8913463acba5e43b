#pragma once

#include "gridcore/cell/cell_model.h"
#include "gridcore/selection/selection.h"
#include "gridcore/selection/selection_options.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace gridcore {

/**
 * SelectionModel: ordered list of selections over a CellModel with one
 * primary entry (the one keyboard navigation works on).
 */
class SelectionModel {
public:
    SelectionModel(CellModel& cellModel, SelectionOptions options);

    /**
     * Add a selection and make it (or the first range it turned into) primary.
     * @param validate grow the range until it fully encloses every merged cell it touches
     * @param subtract cut the range out of an existing selection that contains it
     * @return false when the selection transform rejected the selection
     */
    bool addSelection(Selection selection, bool validate, bool subtract);

    // What addSelection(selection, true, subtract) would do, without doing it.
    ValidationResult validate(const Selection& selection, bool subtract) const;

    void removeSelection(std::size_t index);
    bool modifySelection(std::size_t index, Selection selection, bool validate);
    void clear();

    const std::vector<Selection>& getSelections() const { return selections_; }
    Selection* getPrimary();
    const Selection* getPrimary() const;
    int getPrimaryIndex() const { return primaryIndex_; }
    void setPrimary(int index);

    bool isSelected(int row, int column) const;

    // Bumped on every change of the selection list or the primary entry.
    std::uint32_t getGeneration() const { return generation_; }

    // ==========================================================================
    // Keyboard navigation (only the sign of each delta is used)
    // ==========================================================================

    /**
     * Move the selection one cell beyond its range, or to the table
     * boundary when `jump`. Hidden rows/columns are skipped.
     * @return false when the selection could not move
     */
    bool moveSelection(Selection& selection, int deltaColumn, int deltaRow, bool jump);

    /**
     * Shrink the side of the range away from the initial cell, or grow the range
     * when there is nothing to shrink.
     * @return false when the range did not change
     */
    bool extendSelection(Selection& selection, int deltaColumn, int deltaRow, bool jump);

    /**
     * Move the initial cell of the primary selection inside its range. Horizontal
     * moves scan row by row, vertical moves column by column. A merged cell is
     * only stopped at on its top-left cell; its other slots are skipped rather
     * than snapped to it. Leaving the range continues in the next (or previous)
     * selection, which becomes primary.
     */
    bool moveInitial(int deltaColumn, int deltaRow);

    const SelectionOptions& getOptions() const { return options_; }

private:
    ValidationResult plan(const Selection& selection, bool validate, bool subtract) const;
    bool prepare(Selection& selection, bool validate, bool causedByMove) const;
    CellRange expandToMerges(CellRange range) const;
    CellRange cellRangeAt(int row, int column) const;

    // Axis helpers for navigation
    int count(Axis axis) const;
    bool isHidden(Axis axis, int index) const;
    int nextVisible(Axis axis, int from) const;
    int previousVisible(Axis axis, int from) const;
    bool extendAlong(Axis axis, int delta, bool jump, const CellRange& initialSpan, CellRange& range) const;

    CellModel& cellModel_;
    SelectionOptions options_;
    std::vector<Selection> selections_;
    int primaryIndex_ = -1;
    std::uint32_t generation_ = 0;
};

} // namespace gridcore
