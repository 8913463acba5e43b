#include "gridcore/grid_engine.h"
#include "gridcore/core/logging.h"

#include <utility>

namespace gridcore {

namespace {

[[maybe_unused]] const char* eventName(CellModelEventType type) {
    switch (type) {
        case CellModelEventType::BeforeDelete: return "before-delete";
        case CellModelEventType::Inserted: return "inserted";
        case CellModelEventType::Hidden: return "hidden";
        case CellModelEventType::Shown: return "shown";
        case CellModelEventType::Resized: return "resized";
        case CellModelEventType::Merged: return "merged";
        case CellModelEventType::Split: return "split";
    }
    return "unknown";
}

} // namespace

GridEngine::GridEngine(CellModel cellModel, GridOptions options)
    : cellModel_(std::move(cellModel)),
      options_(fillOptions(std::move(options))),
      selectionModel_(cellModel_, options_.selection),
      borderModel_(cellModel_, options_.border) {
    if (options_.misc.debug) {
        cellModel_.subscribe([]([[maybe_unused]] const CellModelEvent& event) {
            GRIDCORE_LOG_DEBUG("cell model event %s (%s, start %d, count %d, %zu indices)",
                eventName(event.type), event.isRow ? "rows" : "columns",
                event.startIndex, event.count, event.indices.size());
        });
    }
}

GridEngine::~GridEngine() {
    cleanup();
}

void GridEngine::cleanup() {
    cellModel_.cleanup();
}

} // namespace gridcore
