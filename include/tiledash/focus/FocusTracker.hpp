#pragma once

/**
 * @file FocusTracker.hpp
 * @brief Keyboard focus within one container tree
 *
 * Exactly one container holds the keyboard focus. The tracker keeps a
 * non-owning pointer to it; containers that drop a subtree holding the
 * focused container move the focus to themselves first.
 *
 * Keyboard navigation visits leaf containers in DFS order (first child
 * before second child) and wraps around at both ends.
 */

#include <set>
#include <vector>
#include "tiledash/core/Types.hpp"

namespace tdash {

class Container;

class FocusTracker {
public:
    explicit FocusTracker(Container* root);

    FocusTracker(const FocusTracker&) = delete;
    FocusTracker& operator=(const FocusTracker&) = delete;

    inline Container* active() const { return active_; }
    inline Container* root() const { return root_; }

    bool isActive(const Container* container) const { return container == active_; }

    void setActive(Container* container);

    // Next / previous leaf, skipping containers configured with keyFocusSkip
    Container* next();
    Container* previous();

    // Next / previous leaf within the first group of the focused container
    // that is also in groups. Does nothing if there is no such group.
    Container* nextInGroups(const std::set<FocusGroup>& groups);
    Container* previousInGroups(const std::set<FocusGroup>& groups);

    // Moves the focus if the key is one of the tree's focus keys, returns
    // whether the key was a focus key
    bool processKey(Key key);

    // Focuses the deepest resolved container whose area contains the point
    Container* focusAt(int x, int y);

    std::vector<Container*> collectLeavesDFS() const;

private:
    Container* root_;
    Container* active_;

    void collectLeavesDFSHelper(Container* node, std::vector<Container*>& leaves) const;

    // Returns the leaf after (or before) the focused one among those matching
    // the predicate, wrapping around; nullptr if none match
    template <typename Predicate>
    Container* neighbour(bool forward, Predicate&& eligible) const;

    Container* moveTo(Container* target, const char* reason);
};

}
