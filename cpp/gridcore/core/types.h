#ifndef GRIDCORE_CORE_TYPES_H
#define GRIDCORE_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight value types shared by the grid models.

namespace gridcore {

// Default sizes used when a row/column has no neighbour to copy its size from.
static constexpr double kDefaultRowSize = 30.0;
static constexpr double kDefaultColumnSize = 100.0;

// Returned by the visibility lookups when no matching index exists.
static constexpr int kNoIndex = -1;

// Pixel rectangle (top-left origin).
struct Rect {
    double left;
    double top;
    double width;
    double height;
};

struct Point {
    double x;
    double y;
};

struct CellPosition {
    int row;
    int column;

    bool operator==(const CellPosition& other) const {
        return row == other.row && column == other.column;
    }
    bool operator!=(const CellPosition& other) const { return !(*this == other); }
};

enum class Axis : std::uint8_t {
    Row = 0,
    Column = 1,
};

} // namespace gridcore

#endif // GRIDCORE_CORE_TYPES_H
