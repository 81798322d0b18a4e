#pragma once

/**
 * @file LayoutResolver.hpp
 * @brief Turns a container tree and a root rectangle into areas
 *
 * Resolution runs top-down. For every container the margin is removed
 * from the available rectangle first, then the border (one cell on each
 * side) if the container has one. Split containers divide what is left
 * between their children, widget containers remove the padding and hand
 * the rest to the widget.
 */

#include <string>
#include <utility>
#include <vector>
#include "tiledash/container/ContainerOptions.hpp"
#include "tiledash/core/Error.hpp"
#include "tiledash/geometry/Rect.hpp"

namespace tdash {

class Container;

struct SplitSizes {
    int first{0};
    int second{0};
};

// Divides length between the two halves of a split
SplitSizes splitLength(int length, const ContainerOptions& opts);

// Splits rect along the container's axis: vertical splits divide the width,
// horizontal splits divide the height
std::pair<Rect, Rect> splitRect(const Rect& rect, const ContainerOptions& opts);

class LayoutResolver {
public:
    LayoutResolver() = default;

    // Resolves the subtree. A geometry error leaves the failing subtree
    // without areas, the remaining containers are still resolved and all
    // errors are returned together.
    Status resolve(Container& container, const Rect& available);

private:
    std::vector<Error> errors_;

    void resolveNode(Container& node, const Rect& available);
};

}
