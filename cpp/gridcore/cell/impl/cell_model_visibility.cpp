// CellModel resize / hide / show methods
// Part of the cell_model.h class split

#include "gridcore/cell/cell_model.h"
#include "gridcore/core/logging.h"

namespace gridcore {

void CellModel::resizeRows(std::vector<int> indices, double size) {
    resize(Axis::Row, std::move(indices), size);
}

void CellModel::resizeColumns(std::vector<int> indices, double size) {
    resize(Axis::Column, std::move(indices), size);
}

void CellModel::hideRows(std::vector<int> indices) {
    setHidden(Axis::Row, std::move(indices), true);
}

void CellModel::hideColumns(std::vector<int> indices) {
    setHidden(Axis::Column, std::move(indices), true);
}

void CellModel::showRows(std::vector<int> indices) {
    setHidden(Axis::Row, std::move(indices), false);
}

void CellModel::showColumns(std::vector<int> indices) {
    setHidden(Axis::Column, std::move(indices), false);
}

void CellModel::showAll() {
    showRows(std::vector<int>(rows_.hidden.begin(), rows_.hidden.end()));
    showColumns(std::vector<int>(columns_.hidden.begin(), columns_.hidden.end()));
}

void CellModel::resize(Axis axis, std::vector<int> indices, double size) {
    AxisState& state = axisState(axis);
    normalizeIndices(state, indices, axis == Axis::Row ? "CellModel::resizeRows" : "CellModel::resizeColumns");
    if (indices.empty()) return;

    // Hidden indices take the new size but do not move any offset.
    std::vector<std::pair<int, double>> deltas;
    deltas.reserve(indices.size());
    for (int index : indices) {
        double& current = state.sizes[static_cast<std::size_t>(index)];
        if (state.hidden.count(index) == 0) {
            deltas.emplace_back(index, size - current);
        }
        current = size;
    }
    applyOffsetDeltas(state, deltas);

    CellModelEvent event{CellModelEventType::Resized};
    event.isRow = axis == Axis::Row;
    event.indices = std::move(indices);
    emit(event);
}

void CellModel::setHidden(Axis axis, std::vector<int> indices, bool hidden) {
    AxisState& state = axisState(axis);
    const char* operation = axis == Axis::Row
        ? (hidden ? "CellModel::hideRows" : "CellModel::showRows")
        : (hidden ? "CellModel::hideColumns" : "CellModel::showColumns");
    normalizeIndices(state, indices, operation);

    std::vector<int> changed;
    std::vector<std::pair<int, double>> deltas;
    for (int index : indices) {
        const bool isHidden = state.hidden.count(index) > 0;
        if (isHidden == hidden) continue;

        const double size = state.sizes[static_cast<std::size_t>(index)];
        if (hidden) {
            state.hidden.insert(index);
            deltas.emplace_back(index, -size);
        } else {
            state.hidden.erase(index);
            deltas.emplace_back(index, size);
        }
        changed.push_back(index);
    }

    if (changed.empty()) {
        GRIDCORE_LOG_DEBUG("%s: nothing to change", operation);
        return;
    }

    applyOffsetDeltas(state, deltas);

    CellModelEvent event{hidden ? CellModelEventType::Hidden : CellModelEventType::Shown};
    event.isRow = axis == Axis::Row;
    event.indices = std::move(changed);
    emit(event);
}

} // namespace gridcore
