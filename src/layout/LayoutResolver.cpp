#include "tiledash/layout/LayoutResolver.hpp"
#include "tiledash/container/Container.hpp"
#include "tiledash/utils/Debug.hpp"
#include <algorithm>
#include <iostream>

namespace tdash {

// ============================================================================
// Split arithmetic
// ============================================================================

SplitSizes splitLength(int length, const ContainerOptions& opts) {
    if (length <= 0) {
        return {0, 0};
    }

    int sized = 0;
    if (opts.split_fixed) {
        // Degenerates to all-or-nothing when the value exceeds the length
        sized = std::min(*opts.split_fixed, length);
    } else {
        sized = (length * opts.effectiveSplitPercent() + 50) / 100;
        if (length >= 2) {
            sized = std::clamp(sized, 1, length - 1);
        }
    }

    if (opts.split_reversed) {
        return {length - sized, sized};
    }
    return {sized, length - sized};
}

std::pair<Rect, Rect> splitRect(const Rect& rect, const ContainerOptions& opts) {
    Rect first = rect;
    Rect second = rect;

    if (opts.split == SplitAxis::Vertical) {
        SplitSizes sizes = splitLength(rect.width, opts);
        first.width = sizes.first;
        second.x = rect.x + sizes.first;
        second.width = sizes.second;
    } else {
        SplitSizes sizes = splitLength(rect.height, opts);
        first.height = sizes.first;
        second.y = rect.y + sizes.first;
        second.height = sizes.second;
    }
    return {first, second};
}

// ============================================================================
// LayoutResolver
// ============================================================================

Status LayoutResolver::resolve(Container& container, const Rect& available) {
    errors_.clear();

    // Stale areas from a previous resolve must not survive a failure
    container.visitPreOrder([](Container& node) { node.clearGeometry(); });

    resolveNode(container, available);

    if (errors_.empty()) {
        return Status::ok();
    }
    if (errors_.size() == 1) {
        return errors_.front();
    }

    std::string message;
    for (const auto& error : errors_) {
        if (!message.empty()) message += "; ";
        if (!error.container_id.empty()) {
            message += "\"" + error.container_id + "\": ";
        }
        message += error.message;
    }
    return geometryError(message, container.id());
}

void LayoutResolver::resolveNode(Container& node, const Rect& available) {
    const ContainerOptions& opts = node.options();

    auto fail = [&](const char* stage, const Error& error) {
        errors_.push_back(geometryError(std::string(stage) + ": " + error.message, opts.id));
        if (debugEnabled()) {
            std::cerr << "[DEBUG] Layout of \"" << opts.id << "\" failed at " << stage
                      << " for " << available << std::endl;
        }
    };

    Result<Rect> area = opts.margin.apply(available);
    if (!area) {
        fail("margin", area.error());
        return;
    }
    node.area_ = area.value();

    Rect usable = area.value();
    if (opts.hasBorder()) {
        Result<Rect> inner = shrink(usable, 1, 1, 1, 1);
        if (!inner) {
            fail("border", inner.error());
            return;
        }
        usable = inner.value();
    }
    node.usable_area_ = usable;

    if (!node.isLeaf()) {
        auto [first, second] = splitRect(usable, opts);
        resolveNode(*node.first_, first);
        resolveNode(*node.second_, second);
        return;
    }

    if (node.hasWidget()) {
        Result<Rect> widget_area = opts.padding.apply(usable);
        if (!widget_area) {
            fail("padding", widget_area.error());
            return;
        }
        node.widget_area_ = widget_area.value();
    }
}

} // namespace tdash
