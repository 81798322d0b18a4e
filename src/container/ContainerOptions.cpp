#include "tiledash/container/ContainerOptions.hpp"
#include <algorithm>

namespace tdash {

std::string splitAxisToString(SplitAxis axis) {
    switch (axis) {
        case SplitAxis::Vertical: return "vertical";
        case SplitAxis::Horizontal: return "horizontal";
        default: return "unknown";
    }
}

std::string sideToString(Side side) {
    switch (side) {
        case Side::Top: return "Top";
        case Side::Right: return "Right";
        case Side::Bottom: return "Bottom";
        case Side::Left: return "Left";
        default: return "Unknown";
    }
}

// ============================================================================
// Spacing
// ============================================================================

bool Spacing::isSet() const {
    auto non_zero = [](int v) { return v != 0; };
    return std::any_of(cells.begin(), cells.end(), non_zero) ||
           std::any_of(percent.begin(), percent.end(), non_zero);
}

Result<Rect> Spacing::apply(const Rect& rect) const {
    if (!isSet()) {
        return rect;
    }

    // Cells win over percent on a side, options never set both
    auto amount = [this](Side side, int dimension) {
        int c = cellsAt(side);
        if (c > 0) return c;
        return percentOf(dimension, percentAt(side));
    };

    return shrink(rect,
                  amount(Side::Top, rect.height),
                  amount(Side::Right, rect.width),
                  amount(Side::Bottom, rect.height),
                  amount(Side::Left, rect.width));
}

// ============================================================================
// Focus groups
// ============================================================================

std::optional<FocusGroup> firstMatchingGroup(const std::set<FocusGroup>& key_groups,
                                             const std::vector<FocusGroup>& container_groups) {
    for (FocusGroup group : container_groups) {
        if (key_groups.count(group) > 0) {
            return group;
        }
    }
    return std::nullopt;
}

bool ContainerOptions::inFocusGroup(FocusGroup group) const {
    return std::find(key_focus_groups.begin(), key_focus_groups.end(), group) !=
           key_focus_groups.end();
}

ContainerOptions ContainerOptions::defaults(const ContainerOptions* parent) {
    ContainerOptions opts;
    opts.inherited.focused_color = DEFAULT_FOCUSED_COLOR;

    if (parent) {
        opts.global = parent->global;
        opts.inherited = parent->inherited;
    } else {
        opts.global = std::make_shared<GlobalOptions>();
    }
    return opts;
}

} // namespace tdash
