#pragma once

#include "gridcore/border/border.h"
#include <functional>
#include <optional>

namespace gridcore {

// Picks the side to show when two neighbouring cells assert different sides on a shared edge.
using BorderCollisionResolver = std::function<BorderSide(const BorderSide& mine, const BorderSide& theirs)>;
using DefaultBorderSupplier = std::function<Border(int row, int column)>;

struct BorderOptions {
    // Required. BorderModel refuses to work without one.
    BorderCollisionResolver borderCollisionResolver;

    // Border of cells without a border of their own. Ignored when a supplier is set.
    std::optional<Border> defaultBorder;
    DefaultBorderSupplier defaultBorderSupplier;
};

// Later (higher priority) side wins; on equal priority the neighbour's side wins.
BorderSide highestPriorityResolver(const BorderSide& mine, const BorderSide& theirs);

// Thin light-grey solid lines on all four sides, flagged as default.
BorderSide makeDefaultBorderSide();
Border makeDefaultBorder();

// Fills unset values with defaults. The collision resolver is left as given.
BorderOptions fillBorderOptions(BorderOptions options);

} // namespace gridcore
