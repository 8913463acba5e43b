#include "gridcore/border/border_model.h"
#include "gridcore/core/logging.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace gridcore {

namespace {

const std::optional<BorderSide> kNoSide;

BorderSide stamp(const BorderSide& side, std::uint32_t priority) {
    BorderSide result = side;
    result.priority = priority;
    result.isDefault = false;
    return result;
}

// Stamp `side` unless the slot was already reached in this call (merged cells).
void stampSide(std::optional<BorderSide>& target, const BorderSide& side, std::uint32_t priority) {
    if (target && target->priority == priority) return;
    target = stamp(side, priority);
}

void checkRange(const CellModel& model, const CellRange& range, const char* where) {
    if (range.startRow < 0 || range.startColumn < 0
        || range.endRow >= model.getRowCount() || range.endColumn >= model.getColumnCount()
        || range.startRow > range.endRow || range.startColumn > range.endColumn) {
        throw std::out_of_range(std::string(where) + ": range is outside the grid");
    }
}

} // namespace

BorderModel::BorderModel(CellModel& cellModel, BorderOptions options)
    : cellModel_(cellModel), options_(std::move(options)) {
    if (!options_.borderCollisionResolver) {
        throw std::invalid_argument("BorderModel: a border collision resolver is required");
    }
}

void BorderModel::setBorder(const Border& border, const CellRange& range) {
    checkRange(cellModel_, range, "BorderModel::setBorder");
    if (border.empty()) {
        GRIDCORE_LOG_DEBUG("setBorder: no sides given, ignored");
        return;
    }

    const std::uint32_t priority = ++priorityCounter_;

    for (int row = range.startRow; row <= range.endRow; ++row) {
        if (border.left) {
            stampSide(cellBorder(row, range.startColumn).left, *border.left, priority);
        }
        if (border.right) {
            stampSide(cellBorder(row, range.endColumn).right, *border.right, priority);
        }
    }
    for (int column = range.startColumn; column <= range.endColumn; ++column) {
        if (border.top) {
            stampSide(cellBorder(range.startRow, column).top, *border.top, priority);
        }
        if (border.bottom) {
            stampSide(cellBorder(range.endRow, column).bottom, *border.bottom, priority);
        }
    }
}

void BorderModel::setBorderLine(int row, int column, const BorderSide& side, const BorderMask& mask) {
    checkRange(cellModel_, CellRange::fromSingleRowColumn(row, column), "BorderModel::setBorderLine");
    Border& border = cellBorder(row, column);
    const std::uint32_t priority = ++priorityCounter_;

    if (mask.top) border.top = stamp(side, priority);
    if (mask.bottom) border.bottom = stamp(side, priority);
    if (mask.left) border.left = stamp(side, priority);
    if (mask.right) border.right = stamp(side, priority);
}

std::vector<std::vector<Border>> BorderModel::getBorders(const CellRange& range) const {
    checkRange(cellModel_, range, "BorderModel::getBorders");
    const int rowCount = cellModel_.getRowCount();
    const int columnCount = cellModel_.getColumnCount();

    const auto resolve = [this](const std::optional<BorderSide>& mine, const std::optional<BorderSide>& theirs) {
        if (!theirs) return mine;
        if (!mine) return theirs;
        return std::optional<BorderSide>(options_.borderCollisionResolver(*mine, *theirs));
    };

    std::vector<std::vector<Border>> result(
        static_cast<std::size_t>(range.endRow - range.startRow + 1),
        std::vector<Border>(static_cast<std::size_t>(range.endColumn - range.startColumn + 1))
    );

    const CellModel& model = cellModel_;
    for (int row = range.startRow; row <= range.endRow; ++row) {
        for (int column = range.startColumn; column <= range.endColumn; ++column) {
            const Cell* cell = model.getCell(row, column);
            const CellRange cellRange = cell ? cell->range : CellRange::fromSingleRowColumn(row, column);

            Border own = defaultBorderAt(cellRange.startRow, cellRange.startColumn);
            if (cell && cell->border) {
                if (cell->border->top) own.top = cell->border->top;
                if (cell->border->bottom) own.bottom = cell->border->bottom;
                if (cell->border->left) own.left = cell->border->left;
                if (cell->border->right) own.right = cell->border->right;
            }

            Border& out = result[static_cast<std::size_t>(row - range.startRow)][static_cast<std::size_t>(column - range.startColumn)];
            if (row == cellRange.startRow) {
                out.top = resolve(own.top, row > 0 ? storedSide(row - 1, column, &Border::bottom) : kNoSide);
            }
            if (row == cellRange.endRow) {
                out.bottom = resolve(own.bottom, row < rowCount - 1 ? storedSide(row + 1, column, &Border::top) : kNoSide);
            }
            if (column == cellRange.startColumn) {
                out.left = resolve(own.left, column > 0 ? storedSide(row, column - 1, &Border::right) : kNoSide);
            }
            if (column == cellRange.endColumn) {
                out.right = resolve(own.right, column < columnCount - 1 ? storedSide(row, column + 1, &Border::left) : kNoSide);
            }
        }
    }

    return result;
}

Border& BorderModel::cellBorder(int row, int column) {
    Cell* cell = cellModel_.getCell(row, column, true);
    if (!cell->border) {
        cell->border.emplace();
    }
    return *cell->border;
}

Border BorderModel::defaultBorderAt(int row, int column) const {
    if (options_.defaultBorderSupplier) {
        return options_.defaultBorderSupplier(row, column);
    }
    if (options_.defaultBorder) {
        return *options_.defaultBorder;
    }
    return Border{};
}

const std::optional<BorderSide>& BorderModel::storedSide(int row, int column, std::optional<BorderSide> Border::*side) const {
    const CellModel& model = cellModel_;
    const Cell* cell = model.getCell(row, column);
    if (!cell || !cell->border) return kNoSide;
    return (*cell->border).*side;
}

} // namespace gridcore
