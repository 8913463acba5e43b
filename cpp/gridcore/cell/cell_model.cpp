#include "gridcore/cell/cell_model.h"
#include "gridcore/cell/cell_range_util.h"
#include "gridcore/core/logging.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace gridcore {

CellModel CellModel::generate(
    const std::vector<Cell>& cells,
    const EmptyValueSupplier& emptyValueSupplier,
    const EmptyRendererSupplier& emptyRendererSupplier,
    const SizeSupplier& rowSizeSupplier,
    const SizeSupplier& columnSizeSupplier,
    const std::set<int>& hiddenRows,
    const std::set<int>& hiddenColumns
) {
    CellModel model;

    int rowCount = 0;
    int columnCount = 0;
    for (const Cell& cell : cells) {
        const CellRange& r = cell.range;
        if (r.startRow < 0 || r.startColumn < 0 || r.startRow > r.endRow || r.startColumn > r.endColumn) {
            throw std::invalid_argument("CellModel::generate: invalid cell range");
        }
        rowCount = std::max(rowCount, r.endRow + 1);
        columnCount = std::max(columnCount, r.endColumn + 1);
    }

    model.rows_.sizes.resize(static_cast<std::size_t>(rowCount));
    for (int row = 0; row < rowCount; ++row) {
        model.rows_.sizes[static_cast<std::size_t>(row)] = rowSizeSupplier ? rowSizeSupplier(row) : kDefaultRowSize;
    }
    model.columns_.sizes.resize(static_cast<std::size_t>(columnCount));
    for (int column = 0; column < columnCount; ++column) {
        model.columns_.sizes[static_cast<std::size_t>(column)] = columnSizeSupplier ? columnSizeSupplier(column) : kDefaultColumnSize;
    }

    for (int index : hiddenRows) {
        if (index >= 0 && index < rowCount) model.rows_.hidden.insert(index);
    }
    for (int index : hiddenColumns) {
        if (index >= 0 && index < columnCount) model.columns_.hidden.insert(index);
    }

    model.rows_.offsets.assign(model.rows_.sizes.size(), 0.0);
    model.columns_.offsets.assign(model.columns_.sizes.size(), 0.0);
    recalculateOffsets(model.rows_, 0);
    recalculateOffsets(model.columns_, 0);

    model.lookup_.assign(
        static_cast<std::size_t>(rowCount),
        std::vector<CellId>(static_cast<std::size_t>(columnCount), kNoCell)
    );

    // Given cells first. A cell overlapping a slot that is already taken is dropped.
    for (const Cell& cell : cells) {
        bool free = true;
        for (int row = cell.range.startRow; row <= cell.range.endRow && free; ++row) {
            for (int column = cell.range.startColumn; column <= cell.range.endColumn; ++column) {
                if (model.slot(row, column) != kNoCell) {
                    free = false;
                    break;
                }
            }
        }
        if (!free) {
            GRIDCORE_LOG_WARN("generate: dropping cell at (%d, %d) overlapping an earlier cell",
                cell.range.startRow, cell.range.startColumn);
            continue;
        }

        const CellId id = model.allocateCell(cell);
        for (int row = cell.range.startRow; row <= cell.range.endRow; ++row) {
            for (int column = cell.range.startColumn; column <= cell.range.endColumn; ++column) {
                model.slot(row, column) = id;
            }
        }
    }

    // Remaining slots: only materialize a cell when there is something to show.
    for (int row = 0; row < rowCount; ++row) {
        for (int column = 0; column < columnCount; ++column) {
            if (model.slot(row, column) != kNoCell) continue;

            CellValue value = emptyValueSupplier ? emptyValueSupplier(row, column) : CellValue{};
            std::string rendererName = emptyRendererSupplier ? emptyRendererSupplier(row, column) : std::string{};
            if (!hasValue(value) && rendererName.empty()) continue;

            Cell cell;
            cell.range = CellRange::fromSingleRowColumn(row, column);
            cell.rendererName = std::move(rendererName);
            cell.value = std::move(value);
            model.slot(row, column) = model.allocateCell(std::move(cell));
        }
    }

    GRIDCORE_LOG_DEBUG("generate: %d rows, %d columns, %zu cells", rowCount, columnCount, model.cells_.size());
    return model;
}

// ==============================================================================
// Arena
// ==============================================================================

CellId CellModel::allocateCell(Cell cell) {
    if (!freeIds_.empty()) {
        const CellId id = freeIds_.back();
        freeIds_.pop_back();
        cells_[id] = std::move(cell);
        alive_[id] = true;
        return id;
    }
    const CellId id = static_cast<CellId>(cells_.size());
    cells_.push_back(std::move(cell));
    alive_.push_back(true);
    return id;
}

void CellModel::releaseCell(CellId id) {
    if (!isAlive(id)) return;
    cells_[id] = Cell{};
    alive_[id] = false;
    freeIds_.push_back(id);
}

bool CellModel::inBounds(int row, int column) const {
    return row >= 0 && row < getRowCount() && column >= 0 && column < getColumnCount();
}

void CellModel::requireInBounds(int row, int column, const char* operation) const {
    if (!inBounds(row, column)) {
        throw std::out_of_range(std::string(operation) + ": position (" + std::to_string(row) + ", "
            + std::to_string(column) + ") is outside the grid");
    }
}

// ==============================================================================
// Cell access
// ==============================================================================

Cell* CellModel::getCell(int row, int column, bool fill) {
    if (!inBounds(row, column)) {
        if (fill) requireInBounds(row, column, "CellModel::getCell");
        return nullptr;
    }

    CellId& id = slot(row, column);
    if (id == kNoCell) {
        if (!fill) return nullptr;
        Cell cell;
        cell.range = CellRange::fromSingleRowColumn(row, column);
        id = allocateCell(std::move(cell));
    }
    return &cells_[id];
}

const Cell* CellModel::getCell(int row, int column) const {
    return cellById(getCellId(row, column));
}

CellId CellModel::getCellId(int row, int column) const {
    if (!inBounds(row, column)) return kNoCell;
    return lookup_[static_cast<std::size_t>(row)][static_cast<std::size_t>(column)];
}

const Cell* CellModel::cellById(CellId id) const {
    if (!isAlive(id)) return nullptr;
    return &cells_[id];
}

void CellModel::setValue(int row, int column, CellValue value) {
    requireInBounds(row, column, "CellModel::setValue");
    getCell(row, column, true)->value = std::move(value);
}

void CellModel::setRenderer(int row, int column, const std::string& rendererName) {
    requireInBounds(row, column, "CellModel::setRenderer");
    getCell(row, column, true)->rendererName = rendererName;
}

std::vector<Cell*> CellModel::getCells(const CellRange& range, const GetCellsOptions& options) {
    std::vector<Cell*> result;

    const int startRow = std::max(range.startRow, 0);
    const int endRow = std::min(range.endRow, getRowCount() - 1);
    const int startColumn = std::max(range.startColumn, 0);
    const int endColumn = std::min(range.endColumn, getColumnCount() - 1);

    std::unordered_set<CellId> seen;
    for (int row = startRow; row <= endRow; ++row) {
        if (!options.includeHidden && isRowHidden(row)) continue;

        for (int column = startColumn; column <= endColumn; ++column) {
            if (!options.includeHidden && isColumnHidden(column)) continue;

            const CellId id = slot(row, column);
            if (id == kNoCell) continue;
            if (seen.insert(id).second) {
                result.push_back(&cells_[id]);
            }
        }
    }

    return result;
}

std::vector<Cell*> CellModel::getCellsForRect(const Rect& rect) {
    return getCells(getRangeForRect(rect));
}

CellRange CellModel::getRangeForRect(const Rect& rect) const {
    return CellRange{
        getRowAtOffset(rect.top),
        getRowAtOffset(rect.top + rect.height),
        getColumnAtOffset(rect.left),
        getColumnAtOffset(rect.left + rect.width)
    };
}

Cell* CellModel::getCellAtOffset(double x, double y) {
    const int row = getRowAtOffset(y);
    const int column = getColumnAtOffset(x);
    return getCell(row, column);
}

int CellModel::getRowAtOffset(double offset) const {
    return indexAtOffset(rows_, offset);
}

int CellModel::getColumnAtOffset(double offset) const {
    return indexAtOffset(columns_, offset);
}

Rect CellModel::getBounds(const CellRange& range) const {
    if (range.startRow < 0 || range.endRow >= getRowCount()
        || range.startColumn < 0 || range.endColumn >= getColumnCount()
        || range.startRow > range.endRow || range.startColumn > range.endColumn) {
        throw std::out_of_range("CellModel::getBounds: range is outside the grid");
    }

    const double top = offsetOf(rows_, range.startRow);
    const double left = offsetOf(columns_, range.startColumn);
    return Rect{
        left,
        top,
        columns_.offsets[static_cast<std::size_t>(range.endColumn)] - left,
        rows_.offsets[static_cast<std::size_t>(range.endRow)] - top
    };
}

// ==============================================================================
// Geometry
// ==============================================================================

double CellModel::getWidth() const noexcept {
    return columns_.offsets.empty() ? 0.0 : columns_.offsets.back();
}

double CellModel::getHeight() const noexcept {
    return rows_.offsets.empty() ? 0.0 : rows_.offsets.back();
}

double CellModel::getRowSize(int index) const {
    return rows_.sizes.at(static_cast<std::size_t>(index));
}

double CellModel::getColumnSize(int index) const {
    return columns_.sizes.at(static_cast<std::size_t>(index));
}

double CellModel::getRowOffset(int index) const {
    return offsetOf(rows_, index);
}

double CellModel::getColumnOffset(int index) const {
    return offsetOf(columns_, index);
}

void CellModel::recalculateOffsets(AxisState& state, int from) {
    const int count = static_cast<int>(state.sizes.size());
    state.offsets.resize(state.sizes.size());
    if (from < 0) from = 0;

    double current = from > 0 ? state.offsets[static_cast<std::size_t>(from - 1)] : 0.0;
    for (int i = from; i < count; ++i) {
        if (state.hidden.count(i) == 0) {
            current += state.sizes[static_cast<std::size_t>(i)];
        }
        state.offsets[static_cast<std::size_t>(i)] = current;
    }
}

// Deltas must be sorted by index; each delta applies to its own offset and all after it.
void CellModel::applyOffsetDeltas(AxisState& state, const std::vector<std::pair<int, double>>& deltas) {
    if (deltas.empty()) return;

    double sum = 0.0;
    std::size_t next = 0;
    for (std::size_t i = static_cast<std::size_t>(deltas.front().first); i < state.offsets.size(); ++i) {
        while (next < deltas.size() && static_cast<std::size_t>(deltas[next].first) == i) {
            sum += deltas[next].second;
            ++next;
        }
        state.offsets[i] += sum;
    }
}

void CellModel::normalizeIndices(const AxisState& state, std::vector<int>& indices, const char* operation) {
    std::sort(indices.begin(), indices.end());
    indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

    const int count = static_cast<int>(state.sizes.size());
    if (!indices.empty() && (indices.front() < 0 || indices.back() >= count)) {
        throw std::out_of_range(std::string(operation) + ": index out of range");
    }
}

double CellModel::offsetOf(const AxisState& state, int index) {
    if (index < 0 || index > static_cast<int>(state.offsets.size())) {
        throw std::out_of_range("CellModel: offset index out of range");
    }
    if (index == 0) return 0.0;
    return state.offsets[static_cast<std::size_t>(index - 1)];
}

/**
 * Estimate the index from the average size and walk towards the
 * interval [offset(i), offset(i + 1)) containing the offset.
 * Offsets outside the table clamp to the first/last index.
 */
int CellModel::indexAtOffset(const AxisState& state, double offset) {
    const int count = static_cast<int>(state.sizes.size());
    if (count == 0) {
        throw std::runtime_error("CellModel: cannot resolve an offset without rows or columns");
    }

    const double total = state.offsets.back();
    const double averageSize = total / count;

    int index = 0;
    if (averageSize > 0.0 && offset > 0.0) {
        const double guess = offset / averageSize;
        index = guess >= static_cast<double>(count - 1) ? count - 1 : static_cast<int>(guess);
    }

    while (true) {
        const double start = index == 0 ? 0.0 : state.offsets[static_cast<std::size_t>(index - 1)];
        const double end = state.offsets[static_cast<std::size_t>(index)];

        if (offset < start && index > 0) {
            --index;
        } else if (offset >= end && index < count - 1) {
            ++index;
        } else {
            break;
        }
    }

    return index;
}

// ==============================================================================
// Visibility queries
// ==============================================================================

bool CellModel::isRowHidden(int index) const {
    return rows_.hidden.count(index) > 0;
}

bool CellModel::isColumnHidden(int index) const {
    return columns_.hidden.count(index) > 0;
}

bool CellModel::isRangeVisible(const CellRange& range) const {
    const int row = findNextVisible(rows_, range.startRow);
    if (row == kNoIndex || row > range.endRow) return false;

    const int column = findNextVisible(columns_, range.startColumn);
    return column != kNoIndex && column <= range.endColumn;
}

int CellModel::findNextVisibleRow(int from) const {
    return findNextVisible(rows_, from);
}

int CellModel::findNextVisibleColumn(int from) const {
    return findNextVisible(columns_, from);
}

int CellModel::findPreviousVisibleRow(int from) const {
    return findPreviousVisible(rows_, from);
}

int CellModel::findPreviousVisibleColumn(int from) const {
    return findPreviousVisible(columns_, from);
}

int CellModel::findNextVisible(const AxisState& state, int from) {
    const int count = static_cast<int>(state.sizes.size());
    for (int i = std::max(from, 0); i < count; ++i) {
        if (state.hidden.count(i) == 0) return i;
    }
    return kNoIndex;
}

int CellModel::findPreviousVisible(const AxisState& state, int from) {
    const int count = static_cast<int>(state.sizes.size());
    for (int i = std::min(from, count - 1); i >= 0; --i) {
        if (state.hidden.count(i) == 0) return i;
    }
    return kNoIndex;
}

} // namespace gridcore
