// CellModel event subscription methods
// Part of the cell_model.h class split

#include "gridcore/cell/cell_model.h"

#include <algorithm>

namespace gridcore {

SubscriptionId CellModel::subscribe(CellModelListener listener) {
    const SubscriptionId id = nextSubscriptionId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool CellModel::unsubscribe(SubscriptionId id) {
    const auto it = std::find_if(listeners_.begin(), listeners_.end(),
        [id](const std::pair<SubscriptionId, CellModelListener>& entry) { return entry.first == id; });
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

void CellModel::emit(const CellModelEvent& event) {
    // Copy so that a listener may unsubscribe itself.
    const auto listeners = listeners_;
    for (const auto& entry : listeners) {
        if (entry.second) entry.second(event);
    }
}

void CellModel::cleanup() {
    listeners_.clear();
}

} // namespace gridcore
