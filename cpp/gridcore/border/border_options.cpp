#include "gridcore/border/border_options.h"

namespace gridcore {

BorderSide highestPriorityResolver(const BorderSide& mine, const BorderSide& theirs) {
    return mine.priority > theirs.priority ? mine : theirs;
}

BorderSide makeDefaultBorderSide() {
    BorderSide side;
    side.style = BorderStyle::Solid;
    side.size = 1.0;
    side.color = Color{230, 230, 230, 1.0f};
    side.priority = 0;
    side.isDefault = true;
    return side;
}

Border makeDefaultBorder() {
    const BorderSide side = makeDefaultBorderSide();
    Border border;
    border.top = side;
    border.bottom = side;
    border.left = side;
    border.right = side;
    return border;
}

BorderOptions fillBorderOptions(BorderOptions options) {
    if (!options.defaultBorder) {
        options.defaultBorder = makeDefaultBorder();
    }
    return options;
}

} // namespace gridcore
