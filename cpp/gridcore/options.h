#pragma once

#include "gridcore/border/border_options.h"
#include "gridcore/selection/selection_options.h"
#include <utility>

namespace gridcore {

struct MiscOptions {
    // Log every cell model event through GRIDCORE_LOG_DEBUG.
    bool debug = false;
};

struct GridOptions {
    SelectionOptions selection;
    BorderOptions border;
    MiscOptions misc;
};

// Fills unset values with defaults. The border collision resolver must still be provided.
inline GridOptions fillOptions(GridOptions options) {
    options.border = fillBorderOptions(std::move(options.border));
    return options;
}

} // namespace gridcore
