#pragma once

#include "gridcore/cell/cell_range.h"
#include <cstddef>
#include <optional>
#include <vector>

namespace gridcore {

// Pure geometry on cell ranges. None of these touch a cell model.
class CellRangeUtil {
public:
    static bool isSingleRowColumnRange(const CellRange& range);

    // Whether `range` lies completely inside `containedIn`.
    static bool contains(const CellRange& range, const CellRange& containedIn);

    static bool equals(const CellRange& a, const CellRange& b);
    static bool overlaps(const CellRange& a, const CellRange& b);

    // Range covered by both a and b (AND), empty when they are disjoint.
    static std::optional<CellRange> intersect(const CellRange& a, const CellRange& b);

    /**
     * Cells of `outer` that are not in `inner`, as up to four disjoint ranges:
     * top strip and bottom strip span the full width of outer, left and right
     * strip only the rows of inner. Strips without extent are left out.
     * Unless inner lies completely inside outer the result is {outer}.
     */
    static std::vector<CellRange> subtract(const CellRange& outer, const CellRange& inner);

    // Cells in exactly one of a and b (XOR), as disjoint ranges.
    static std::vector<CellRange> symmetricDifference(const CellRange& a, const CellRange& b);

    static int rowCount(const CellRange& range);
    static int columnCount(const CellRange& range);
    static std::size_t cellCount(const CellRange& range);

    // Swaps start/end where they are reversed.
    static CellRange normalize(const CellRange& range);

    // Smallest range covering both.
    static CellRange unite(const CellRange& a, const CellRange& b);
};

} // namespace gridcore
