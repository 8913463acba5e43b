#pragma once

#include "gridcore/border/border_model.h"
#include "gridcore/cell/cell_model.h"
#include "gridcore/options.h"
#include "gridcore/selection/selection_model.h"

namespace gridcore {

/**
 * GridEngine: one grid. Owns the cell model and the selection and border
 * models built on top of it.
 * Not copyable or movable; the models hold a reference to the cell model.
 */
class GridEngine {
public:
    // Throws std::invalid_argument when options.border has no collision resolver.
    GridEngine(CellModel cellModel, GridOptions options);
    ~GridEngine();

    GridEngine(const GridEngine&) = delete;
    GridEngine& operator=(const GridEngine&) = delete;
    GridEngine(GridEngine&&) = delete;
    GridEngine& operator=(GridEngine&&) = delete;

    CellModel& getCellModel() { return cellModel_; }
    const CellModel& getCellModel() const { return cellModel_; }
    SelectionModel& getSelectionModel() { return selectionModel_; }
    const SelectionModel& getSelectionModel() const { return selectionModel_; }
    BorderModel& getBorderModel() { return borderModel_; }
    const BorderModel& getBorderModel() const { return borderModel_; }
    const GridOptions& getOptions() const { return options_; }

    // Releases cell model subscribers. Safe to call more than once.
    void cleanup();

private:
    CellModel cellModel_;
    GridOptions options_;
    SelectionModel selectionModel_;
    BorderModel borderModel_;
};

} // namespace gridcore
