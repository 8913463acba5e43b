#pragma once

#include "gridcore/core/types.h"
#include "gridcore/cell/cell.h"
#include "gridcore/cell/cell_model_event.h"
#include "gridcore/cell/cell_range.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace gridcore {

struct GetCellsOptions {
    // Include cells that only lie in hidden rows/columns.
    bool includeHidden = false;
};

using EmptyValueSupplier = std::function<CellValue(int row, int column)>;
using EmptyRendererSupplier = std::function<std::string(int row, int column)>;
using SizeSupplier = std::function<double(int index)>;
using CellInitializer = std::function<std::optional<Cell>(int row, int column)>;

/**
 * CellModel: owns the grid.
 *
 * Cells are kept in an arena and addressed by CellId. The lookup matrix holds
 * one CellId per row/column slot; a merged cell's id is repeated in every slot
 * it covers, and kNoCell marks an empty slot.
 *
 * Row/column geometry is kept as sizes plus cumulative offsets. offsets[i] is
 * the summed size of all visible indices up to and including i, so hidden
 * indices contribute nothing while their size is retained.
 *
 * Pointers returned by getCell()/getCells() stay valid until the cell is
 * released (deleted rows/columns, merged over, split away).
 */
class CellModel {
public:
    static CellModel generate(
        const std::vector<Cell>& cells,
        const EmptyValueSupplier& emptyValueSupplier,
        const EmptyRendererSupplier& emptyRendererSupplier,
        const SizeSupplier& rowSizeSupplier,
        const SizeSupplier& columnSizeSupplier,
        const std::set<int>& hiddenRows,
        const std::set<int>& hiddenColumns
    );

    CellModel(CellModel&&) = default;
    CellModel& operator=(CellModel&&) = default;
    CellModel(const CellModel&) = delete;
    CellModel& operator=(const CellModel&) = delete;

    // ==========================================================================
    // Cell access
    // ==========================================================================

    /**
     * Get the cell at the given row and column.
     * @param fill materialize an empty single cell when the slot is empty
     * @return the cell, or nullptr for an empty slot or a position outside the grid
     */
    Cell* getCell(int row, int column, bool fill = false);
    const Cell* getCell(int row, int column) const;

    CellId getCellId(int row, int column) const;
    const Cell* cellById(CellId id) const;

    void setValue(int row, int column, CellValue value);
    void setRenderer(int row, int column, const std::string& rendererName);

    // Cells in the range, each merged cell once.
    std::vector<Cell*> getCells(const CellRange& range, const GetCellsOptions& options = {});
    std::vector<Cell*> getCellsForRect(const Rect& rect);
    CellRange getRangeForRect(const Rect& rect) const;

    Cell* getCellAtOffset(double x, double y);
    int getRowAtOffset(double offset) const;
    int getColumnAtOffset(double offset) const;

    Rect getBounds(const CellRange& range) const;

    // ==========================================================================
    // Geometry
    // ==========================================================================

    int getRowCount() const noexcept { return static_cast<int>(rows_.sizes.size()); }
    int getColumnCount() const noexcept { return static_cast<int>(columns_.sizes.size()); }
    double getWidth() const noexcept;
    double getHeight() const noexcept;

    double getRowSize(int index) const;
    double getColumnSize(int index) const;
    double getRowOffset(int index) const;
    double getColumnOffset(int index) const;

    // ==========================================================================
    // Visibility
    // ==========================================================================

    bool isRowHidden(int index) const;
    bool isColumnHidden(int index) const;
    // At least one row and one column of the range are visible.
    bool isRangeVisible(const CellRange& range) const;

    // First visible index >= from (or <= from), kNoIndex if there is none.
    int findNextVisibleRow(int from) const;
    int findNextVisibleColumn(int from) const;
    int findPreviousVisibleRow(int from) const;
    int findPreviousVisibleColumn(int from) const;

    void hideRows(std::vector<int> indices);
    void hideColumns(std::vector<int> indices);
    void showRows(std::vector<int> indices);
    void showColumns(std::vector<int> indices);
    void showAll();

    // ==========================================================================
    // Structure
    // ==========================================================================

    void resizeRows(std::vector<int> indices, double size);
    void resizeColumns(std::vector<int> indices, double size);

    void insertRows(int insertBeforeIndex, int count, const CellInitializer& cellInitializer = {});
    void insertColumns(int insertBeforeIndex, int count, const CellInitializer& cellInitializer = {});
    void deleteRows(int fromIndex, int count);
    void deleteColumns(int fromIndex, int count);

    /**
     * Merge the range into a single cell. The top-left cell is expanded.
     * @return false (and nothing changed) when the range touches a cell that
     *         already spans multiple rows or columns
     */
    bool mergeCells(const CellRange& range);

    /**
     * Split the merged cell at the given position back into single cells.
     * Only the top-left cell keeps its value; border sides on the outline of
     * the former merge stay where they were drawn.
     */
    void splitCell(int row, int column);

    // ==========================================================================
    // Events
    // ==========================================================================

    // Listeners run synchronously inside the mutating call.
    SubscriptionId subscribe(CellModelListener listener);
    bool unsubscribe(SubscriptionId id);
    std::size_t getListenerCount() const noexcept { return listeners_.size(); }

    void cleanup();

private:
    struct AxisState {
        std::vector<double> sizes;
        std::vector<double> offsets;
        std::set<int> hidden;
    };

    CellModel() = default;

    AxisState& axisState(Axis axis) { return axis == Axis::Row ? rows_ : columns_; }
    const AxisState& axisState(Axis axis) const { return axis == Axis::Row ? rows_ : columns_; }

    // Arena
    CellId allocateCell(Cell cell);
    void releaseCell(CellId id);
    bool isAlive(CellId id) const { return id < alive_.size() && alive_[id]; }
    CellId& slot(int row, int column) { return lookup_[static_cast<std::size_t>(row)][static_cast<std::size_t>(column)]; }
    // Slot addressed by an index on `axis` and an index on the other axis.
    CellId& slotOnAxis(Axis axis, int index, int other) {
        return axis == Axis::Row ? slot(index, other) : slot(other, index);
    }
    bool inBounds(int row, int column) const;
    void requireInBounds(int row, int column, const char* operation) const;

    // Geometry helpers (shared by rows and columns)
    static void recalculateOffsets(AxisState& state, int from);
    static void applyOffsetDeltas(AxisState& state, const std::vector<std::pair<int, double>>& deltas);
    static void normalizeIndices(const AxisState& state, std::vector<int>& indices, const char* operation);
    static double offsetOf(const AxisState& state, int index);
    static int indexAtOffset(const AxisState& state, double offset);
    static int findNextVisible(const AxisState& state, int from);
    static int findPreviousVisible(const AxisState& state, int from);
    void resize(Axis axis, std::vector<int> indices, double size);
    void setHidden(Axis axis, std::vector<int> indices, bool hidden);

    // Structural helpers
    void insert(Axis axis, int insertBeforeIndex, int count, const CellInitializer& cellInitializer);
    void remove(Axis axis, int fromIndex, int count);

    void emit(const CellModelEvent& event);

    std::deque<Cell> cells_;
    std::vector<bool> alive_;
    std::vector<CellId> freeIds_;
    std::vector<std::vector<CellId>> lookup_;

    AxisState rows_;
    AxisState columns_;

    std::vector<std::pair<SubscriptionId, CellModelListener>> listeners_;
    SubscriptionId nextSubscriptionId_ = 1;
};

} // namespace gridcore
