#pragma once

#include "gridcore/border/border.h"
#include "gridcore/border/border_options.h"
#include "gridcore/cell/cell_model.h"
#include "gridcore/cell/cell_range.h"
#include <cstdint>
#include <vector>

namespace gridcore {

/**
 * BorderModel: writes border sides onto the cells of a CellModel and
 * derives the visible border of every slot in a range.
 *
 * Each set call draws a new priority from a counter owned by this instance.
 * When two neighbouring cells both assert a side on their shared edge, the
 * configured collision resolver picks the one to show.
 */
class BorderModel {
public:
    // Throws std::invalid_argument when options carry no collision resolver.
    BorderModel(CellModel& cellModel, BorderOptions options);

    // Stamps the sides of `border` on the outline of `range`.
    // Throws std::out_of_range, before touching any cell, when `range` leaves the grid.
    void setBorder(const Border& border, const CellRange& range);

    // Stamps `side` on the masked sides of a single cell.
    void setBorderLine(int row, int column, const BorderSide& side, const BorderMask& mask);

    /**
     * Borders as displayed for every slot of the range.
     * @return matrix indexed [row - range.startRow][column - range.startColumn]
     */
    std::vector<std::vector<Border>> getBorders(const CellRange& range) const;

    std::uint32_t getPriorityCounter() const noexcept { return priorityCounter_; }
    const BorderOptions& getOptions() const noexcept { return options_; }

private:
    Border& cellBorder(int row, int column);
    Border defaultBorderAt(int row, int column) const;
    const std::optional<BorderSide>& storedSide(int row, int column, std::optional<BorderSide> Border::*side) const;

    CellModel& cellModel_;
    BorderOptions options_;
    std::uint32_t priorityCounter_ = 0;
};

} // namespace gridcore
