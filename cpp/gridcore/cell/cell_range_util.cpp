#include "gridcore/cell/cell_range_util.h"
#include <algorithm>

namespace gridcore {

bool CellRangeUtil::isSingleRowColumnRange(const CellRange& range) {
    return range.startRow == range.endRow && range.startColumn == range.endColumn;
}

bool CellRangeUtil::contains(const CellRange& range, const CellRange& containedIn) {
    return range.startRow >= containedIn.startRow
        && range.startColumn >= containedIn.startColumn
        && range.endRow <= containedIn.endRow
        && range.endColumn <= containedIn.endColumn;
}

bool CellRangeUtil::equals(const CellRange& a, const CellRange& b) {
    return a == b;
}

bool CellRangeUtil::overlaps(const CellRange& a, const CellRange& b) {
    return a.startRow <= b.endRow && b.startRow <= a.endRow
        && a.startColumn <= b.endColumn && b.startColumn <= a.endColumn;
}

std::optional<CellRange> CellRangeUtil::intersect(const CellRange& a, const CellRange& b) {
    if (!overlaps(a, b)) return std::nullopt;
    return CellRange{
        std::max(a.startRow, b.startRow),
        std::min(a.endRow, b.endRow),
        std::max(a.startColumn, b.startColumn),
        std::min(a.endColumn, b.endColumn)
    };
}

std::vector<CellRange> CellRangeUtil::subtract(const CellRange& outer, const CellRange& inner) {
    if (!contains(inner, outer)) return { outer };
    const CellRange& cut = inner;

    std::vector<CellRange> result;
    result.reserve(4);

    // Top strip
    if (cut.startRow > outer.startRow) {
        result.push_back(CellRange{outer.startRow, cut.startRow - 1, outer.startColumn, outer.endColumn});
    }
    // Bottom strip
    if (cut.endRow < outer.endRow) {
        result.push_back(CellRange{cut.endRow + 1, outer.endRow, outer.startColumn, outer.endColumn});
    }
    // Left strip
    if (cut.startColumn > outer.startColumn) {
        result.push_back(CellRange{cut.startRow, cut.endRow, outer.startColumn, cut.startColumn - 1});
    }
    // Right strip
    if (cut.endColumn < outer.endColumn) {
        result.push_back(CellRange{cut.startRow, cut.endRow, cut.endColumn + 1, outer.endColumn});
    }

    return result;
}

std::vector<CellRange> CellRangeUtil::symmetricDifference(const CellRange& a, const CellRange& b) {
    if (!overlaps(a, b)) return { a, b };

    const CellRange common = *intersect(a, b);
    std::vector<CellRange> result = subtract(a, common);
    const std::vector<CellRange> rest = subtract(b, common);
    result.insert(result.end(), rest.begin(), rest.end());
    return result;
}

int CellRangeUtil::rowCount(const CellRange& range) {
    return range.endRow - range.startRow + 1;
}

int CellRangeUtil::columnCount(const CellRange& range) {
    return range.endColumn - range.startColumn + 1;
}

std::size_t CellRangeUtil::cellCount(const CellRange& range) {
    const int rows = rowCount(range);
    const int columns = columnCount(range);
    if (rows <= 0 || columns <= 0) return 0;
    return static_cast<std::size_t>(rows) * static_cast<std::size_t>(columns);
}

CellRange CellRangeUtil::normalize(const CellRange& range) {
    return CellRange{
        std::min(range.startRow, range.endRow),
        std::max(range.startRow, range.endRow),
        std::min(range.startColumn, range.endColumn),
        std::max(range.startColumn, range.endColumn)
    };
}

CellRange CellRangeUtil::unite(const CellRange& a, const CellRange& b) {
    return CellRange{
        std::min(a.startRow, b.startRow),
        std::max(a.endRow, b.endRow),
        std::min(a.startColumn, b.startColumn),
        std::max(a.endColumn, b.endColumn)
    };
}

} // namespace gridcore
