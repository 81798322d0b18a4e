#include "tiledash/focus/FocusTracker.hpp"
#include "tiledash/container/Container.hpp"
#include "tiledash/utils/Debug.hpp"
#include <iostream>

namespace tdash {

FocusTracker::FocusTracker(Container* root)
    : root_(root)
    , active_(root) {}

void FocusTracker::setActive(Container* container) {
    if (!container) return;
    moveTo(container, "direct");
}

// ============================================================================
// DFS leaf traversal
// ============================================================================

void FocusTracker::collectLeavesDFSHelper(Container* node, std::vector<Container*>& leaves) const {
    if (!node) return;

    if (node->isLeaf()) {
        leaves.push_back(node);
    } else {
        // DFS: first before second
        collectLeavesDFSHelper(node->first(), leaves);
        collectLeavesDFSHelper(node->second(), leaves);
    }
}

std::vector<Container*> FocusTracker::collectLeavesDFS() const {
    std::vector<Container*> leaves;
    collectLeavesDFSHelper(root_, leaves);
    return leaves;
}

template <typename Predicate>
Container* FocusTracker::neighbour(bool forward, Predicate&& eligible) const {
    std::vector<Container*> leaves = collectLeavesDFS();
    if (leaves.empty()) return nullptr;

    const size_t count = leaves.size();
    size_t current_idx = count;
    for (size_t i = 0; i < count; ++i) {
        if (leaves[i] == active_) {
            current_idx = i;
            break;
        }
    }

    // Focus on a split container: start from the first (or last) leaf
    if (current_idx == count) {
        for (size_t n = 0; n < count; ++n) {
            Container* candidate = leaves[forward ? n : count - 1 - n];
            if (eligible(*candidate)) return candidate;
        }
        return nullptr;
    }

    for (size_t step = 1; step <= count; ++step) {
        size_t idx = forward ? (current_idx + step) % count
                             : (current_idx + count - step) % count;
        if (eligible(*leaves[idx])) return leaves[idx];
    }
    return nullptr;
}

Container* FocusTracker::next() {
    Container* target = neighbour(true, [](const Container& c) {
        return !c.options().key_focus_skip;
    });
    return moveTo(target, "next");
}

Container* FocusTracker::previous() {
    Container* target = neighbour(false, [](const Container& c) {
        return !c.options().key_focus_skip;
    });
    return moveTo(target, "previous");
}

Container* FocusTracker::nextInGroups(const std::set<FocusGroup>& groups) {
    auto group = firstMatchingGroup(groups, active_->options().key_focus_groups);
    if (!group) return active_;

    Container* target = neighbour(true, [g = *group](const Container& c) {
        return c.options().inFocusGroup(g);
    });
    return moveTo(target, "next in group");
}

Container* FocusTracker::previousInGroups(const std::set<FocusGroup>& groups) {
    auto group = firstMatchingGroup(groups, active_->options().key_focus_groups);
    if (!group) return active_;

    Container* target = neighbour(false, [g = *group](const Container& c) {
        return c.options().inFocusGroup(g);
    });
    return moveTo(target, "previous in group");
}

// ============================================================================
// Input
// ============================================================================

bool FocusTracker::processKey(Key key) {
    const GlobalOptions& global = *root_->options().global;

    if (global.key_focus_next && *global.key_focus_next == key) {
        next();
        return true;
    }
    if (global.key_focus_previous && *global.key_focus_previous == key) {
        previous();
        return true;
    }

    auto it = global.key_focus_groups_next.find(key);
    if (it != global.key_focus_groups_next.end()) {
        nextInGroups(it->second);
        return true;
    }

    it = global.key_focus_groups_previous.find(key);
    if (it != global.key_focus_groups_previous.end()) {
        previousInGroups(it->second);
        return true;
    }
    return false;
}

Container* FocusTracker::focusAt(int x, int y) {
    Container* node = root_;
    if (!node->area() || !node->area()->contains(x, y)) {
        return nullptr;
    }

    // Descend while a child also contains the point
    while (!node->isLeaf()) {
        Container* child = nullptr;
        for (Container* c : {node->first(), node->second()}) {
            if (c->area() && c->area()->contains(x, y)) {
                child = c;
                break;
            }
        }
        if (!child) break;
        node = child;
    }
    return moveTo(node, "pointer");
}

Container* FocusTracker::moveTo(Container* target, const char* reason) {
    if (!target) return active_;

    if (target != active_ && debugEnabled()) {
        std::cerr << "[DEBUG] Focus (" << reason << "): "
                  << (active_->id().empty() ? "<container>" : active_->id()) << " -> "
                  << (target->id().empty() ? "<container>" : target->id()) << std::endl;
    }
    active_ = target;
    return active_;
}

} // namespace tdash
