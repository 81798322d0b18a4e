#pragma once

/**
 * @file Container.hpp
 * @brief Node of the binary container tree
 *
 * A container either holds two sub containers (first and second) or a
 * single widget, never both. A freshly created container holds neither.
 * Children are owned by their parent; the parent pointer and the focus
 * tracker's reference to the focused container are non-owning.
 */

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tiledash/container/ContainerOptions.hpp"
#include "tiledash/container/Option.hpp"
#include "tiledash/core/Error.hpp"
#include "tiledash/core/Types.hpp"
#include "tiledash/geometry/Rect.hpp"

namespace tdash {

class FocusTracker;
class LayoutResolver;

class Container {
    // Passkey for the public constructor, only Container can create one
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    // Creates a root container, applies the options and validates the tree
    static Result<std::unique_ptr<Container>> create(const std::vector<Option>& options = {});

    Container(ConstructionKey, Container* parent, std::shared_ptr<FocusTracker> focus_tracker);
    ~Container();

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;

    // Applies the options in order, stops at the first failure without
    // undoing the options applied before it
    Status configure(const std::vector<Option>& options);

    // Finds the container with the id anywhere in this tree, applies the
    // options and validates the tree. The options may destroy this container.
    Status update(const std::string& id, const std::vector<Option>& options);

    Status validate() const;

    // Recomputes the areas of every container in this subtree
    Status resolve(const Rect& area);

    inline bool isLeaf() const { return !first_ && !second_; }
    inline bool isRoot() const { return parent_ == nullptr; }
    inline bool hasWidget() const { return widget_ != nullptr; }

    inline Container* first() const { return first_.get(); }
    inline Container* second() const { return second_.get(); }
    inline Container* parent() const { return parent_; }
    Container* root();
    const Container* root() const;

    inline const std::shared_ptr<Widget>& widget() const { return widget_; }

    inline const std::string& id() const { return opts_.id; }
    inline const ContainerOptions& options() const { return opts_; }

    Container* findById(const std::string& id);
    const Container* findById(const std::string& id) const;

    // Area after margin, empty until resolved
    inline const std::optional<Rect>& area() const { return area_; }
    // Area inside the border, children are split from this one
    inline const std::optional<Rect>& usableArea() const { return usable_area_; }
    // Area handed to the widget after padding
    inline const std::optional<Rect>& widgetArea() const { return widget_area_; }

    FocusTracker& focusTracker() const { return *focus_tracker_; }
    bool isFocused() const;

    // Human readable dump of the subtree, one container per line
    std::string describe() const;

    // Pre-order walk, parent before first before second
    template <typename Visitor>
    void visitPreOrder(Visitor&& visitor) {
        visitor(*this);
        if (first_) first_->visitPreOrder(visitor);
        if (second_) second_->visitPreOrder(visitor);
    }

    template <typename Visitor>
    void visitPreOrder(Visitor&& visitor) const {
        visitor(*this);
        if (first_) static_cast<const Container&>(*first_).visitPreOrder(visitor);
        if (second_) static_cast<const Container&>(*second_).visitPreOrder(visitor);
    }

private:
    friend class Option;
    friend class LayoutResolver;

    std::unique_ptr<Container> createChild();

    Status split(const option_data::Split& split);
    void placeWidget(std::shared_ptr<Widget> widget);
    void clear();

    // Drops both children, moving focus here if it was inside them
    void dropChildren();

    void clearGeometry();

    void describeInto(std::string& out, int depth) const;

    Container* parent_{nullptr};
    std::unique_ptr<Container> first_;
    std::unique_ptr<Container> second_;
    std::shared_ptr<Widget> widget_;

    ContainerOptions opts_;
    std::shared_ptr<FocusTracker> focus_tracker_;

    std::optional<Rect> area_;
    std::optional<Rect> usable_area_;
    std::optional<Rect> widget_area_;
};

}
