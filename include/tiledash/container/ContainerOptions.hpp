#pragma once

/**
 * @file ContainerOptions.hpp
 * @brief Per-container configuration record
 *
 * Options come in three scopes:
 * - local options belong to one container only,
 * - inherited options are copied into a child when a split creates it
 *   and may be changed there afterwards without touching the parent,
 * - global options exist once per tree and every container holds the
 *   same instance, so a change through any container applies everywhere.
 */

#include <array>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "tiledash/core/Types.hpp"
#include "tiledash/geometry/Rect.hpp"

namespace tdash {

/**
 * @brief Split direction of a container
 *
 * Vertical splits divide the width into a left (first) and right (second)
 * container, horizontal splits divide the height into top and bottom.
 */
enum class SplitAxis {
    Vertical,
    Horizontal
};

std::string splitAxisToString(SplitAxis axis);

enum class Side {
    Top = 0,
    Right = 1,
    Bottom = 2,
    Left = 3
};

std::string sideToString(Side side);

/**
 * @brief Margin or padding of a container
 *
 * Each side is either a number of cells or a percentage of the relevant
 * dimension (height for top/bottom, width for left/right). At most one of
 * the two is non-zero per side.
 */
struct Spacing {
    std::array<int, 4> cells{};
    std::array<int, 4> percent{};

    inline int cellsAt(Side side) const { return cells[static_cast<size_t>(side)]; }
    inline int percentAt(Side side) const { return percent[static_cast<size_t>(side)]; }

    bool isSet() const;

    Result<Rect> apply(const Rect& rect) const;
};

struct InheritedOptions {
    Color border_color;
    Color focused_color;
    std::optional<Color> title_color;
    std::optional<Color> title_focused_color;
};

struct GlobalOptions {
    std::optional<Key> key_focus_next;
    std::optional<Key> key_focus_previous;

    // Group sets are ordered, the tie-break comes from the container's own list
    std::unordered_map<Key, std::set<FocusGroup>> key_focus_groups_next;
    std::unordered_map<Key, std::set<FocusGroup>> key_focus_groups_previous;
};

// First group in container_groups (declaration order) that key_groups contains
std::optional<FocusGroup> firstMatchingGroup(const std::set<FocusGroup>& key_groups,
                                             const std::vector<FocusGroup>& container_groups);

struct ContainerOptions {
    static constexpr int DEFAULT_SPLIT_PERCENT = 50;
    static constexpr bool DEFAULT_SPLIT_REVERSED = false;
    static constexpr Color DEFAULT_FOCUSED_COLOR = colors::Yellow;

    std::string id;

    std::shared_ptr<GlobalOptions> global;
    InheritedOptions inherited;

    SplitAxis split{SplitAxis::Vertical};
    bool split_reversed{DEFAULT_SPLIT_REVERSED};
    std::optional<int> split_percent;
    std::optional<int> split_fixed;

    HorizontalAlign h_align{HorizontalAlign::Center};
    VerticalAlign v_align{VerticalAlign::Middle};

    LineStyle border{LineStyle::None};
    std::string border_title;
    HorizontalAlign border_title_align{HorizontalAlign::Left};

    Spacing margin;
    Spacing padding;

    bool key_focus_skip{false};
    std::vector<FocusGroup> key_focus_groups;

    inline int effectiveSplitPercent() const {
        return split_percent.value_or(DEFAULT_SPLIT_PERCENT);
    }

    inline bool hasBorder() const { return border != LineStyle::None; }

    bool inFocusGroup(FocusGroup group) const;

    // Defaults for a root container, or a child of parent: the child copies
    // the inherited scope and shares the global scope
    static ContainerOptions defaults(const ContainerOptions* parent = nullptr);
};

}
