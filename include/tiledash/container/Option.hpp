#pragma once

/**
 * @file Option.hpp
 * @brief Configuration mutations applied to containers
 *
 * An Option is a small command carrying its parameters. Building one
 * never fails; the parameters are validated when the option is applied
 * to a container, and applying stops at the first option that fails.
 *
 * Splits carry the option lists for both new containers:
 *
 * @code
 *   auto root = Container::create({
 *       splitVertical(
 *           Left{{placeWidget(menu), id("menu")}},
 *           Right{{placeWidget(chart), focused()}},
 *           {splitFixed(20)}),
 *       keyFocusNext(keys::Tab),
 *   });
 * @endcode
 */

#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "tiledash/container/ContainerOptions.hpp"
#include "tiledash/core/Error.hpp"
#include "tiledash/core/Types.hpp"

namespace tdash {

class Container;
class Option;

/**
 * @brief Sizing of a split, applied before the child option lists
 */
class SplitOption {
public:
    enum class Kind {
        Percent,
        PercentFromEnd,
        Fixed,
        FixedFromEnd
    };

    SplitOption(Kind kind, int value) : kind_(kind), value_(value) {}

    inline Kind kind() const { return kind_; }
    inline int value() const { return value_; }

    std::string name() const;

    Status apply(ContainerOptions& opts) const;

private:
    Kind kind_;
    int value_;
};

// Size of the first container as a percentage of the space, 0 < p < 100
SplitOption splitPercent(int percent);

// Size of the second container as a percentage of the space, 0 < p < 100
SplitOption splitPercentFromEnd(int percent);

// Size of the first container in cells, 0 <= cells
SplitOption splitFixed(int cells);

// Size of the second container in cells, 0 <= cells
SplitOption splitFixedFromEnd(int cells);

// Option lists for the two containers created by a split
struct Left { std::vector<Option> options; };
struct Right { std::vector<Option> options; };
struct Top { std::vector<Option> options; };
struct Bottom { std::vector<Option> options; };

namespace option_data {

struct SetId { std::string id; };
struct Clear {};
struct PlaceWidget { std::shared_ptr<Widget> widget; };

struct Split {
    SplitAxis axis;
    std::vector<Option> first;
    std::vector<Option> second;
    std::vector<SplitOption> sizing;
};

struct SetMargin { Side side; int value; bool percent; };
struct SetPadding { Side side; int value; bool percent; };

struct SetAlignHorizontal { HorizontalAlign align; };
struct SetAlignVertical { VerticalAlign align; };

struct SetBorder { LineStyle style; };
struct SetBorderTitle { std::string title; };
struct SetBorderTitleAlign { HorizontalAlign align; };

struct SetBorderColor { Color color; };
struct SetFocusedColor { Color color; };
struct SetTitleColor { Color color; };
struct SetTitleFocusedColor { Color color; };

struct SetKeyFocusNext { Key key; };
struct SetKeyFocusPrevious { Key key; };
struct SetKeyFocusSkip {};
struct SetKeyFocusGroups { std::vector<FocusGroup> groups; };
struct SetKeyFocusGroupsNext { Key key; std::vector<FocusGroup> groups; };
struct SetKeyFocusGroupsPrevious { Key key; std::vector<FocusGroup> groups; };
struct SetFocused {};

}

class Option {
public:
    using Value = std::variant<
        option_data::SetId,
        option_data::Clear,
        option_data::PlaceWidget,
        option_data::Split,
        option_data::SetMargin,
        option_data::SetPadding,
        option_data::SetAlignHorizontal,
        option_data::SetAlignVertical,
        option_data::SetBorder,
        option_data::SetBorderTitle,
        option_data::SetBorderTitleAlign,
        option_data::SetBorderColor,
        option_data::SetFocusedColor,
        option_data::SetTitleColor,
        option_data::SetTitleFocusedColor,
        option_data::SetKeyFocusNext,
        option_data::SetKeyFocusPrevious,
        option_data::SetKeyFocusSkip,
        option_data::SetKeyFocusGroups,
        option_data::SetKeyFocusGroupsNext,
        option_data::SetKeyFocusGroupsPrevious,
        option_data::SetFocused
    >;

    explicit Option(Value value);

    const Value& value() const { return value_; }

    // Name of the option as written by the user, e.g. "MarginTopPercent"
    std::string name() const;

    Status apply(Container& container) const;

private:
    Value value_;
};

Status applyOptions(Container& container, const std::vector<Option>& options);

// Identifier, non-empty and unique within the tree
Option id(std::string id);

Option clear();
Option placeWidget(std::shared_ptr<Widget> widget);

Option splitVertical(Left left, Right right, std::vector<SplitOption> sizing = {});
Option splitHorizontal(Top top, Bottom bottom, std::vector<SplitOption> sizing = {});

Option marginTop(int cells);
Option marginRight(int cells);
Option marginBottom(int cells);
Option marginLeft(int cells);
Option marginTopPercent(int percent);
Option marginRightPercent(int percent);
Option marginBottomPercent(int percent);
Option marginLeftPercent(int percent);

Option paddingTop(int cells);
Option paddingRight(int cells);
Option paddingBottom(int cells);
Option paddingLeft(int cells);
Option paddingTopPercent(int percent);
Option paddingRightPercent(int percent);
Option paddingBottomPercent(int percent);
Option paddingLeftPercent(int percent);

Option alignHorizontal(HorizontalAlign align);
Option alignVertical(VerticalAlign align);

Option border(LineStyle style);
Option borderTitle(std::string title);
Option borderTitleAlignLeft();
Option borderTitleAlignCenter();
Option borderTitleAlignRight();

// Inherited by containers created by later splits
Option borderColor(Color color);
Option focusedColor(Color color);
Option titleColor(Color color);
Option titleFocusedColor(Color color);

// Global, apply to the whole tree regardless of the container they are set on
Option keyFocusNext(Key key);
Option keyFocusPrevious(Key key);
Option keyFocusGroupsNext(Key key, std::vector<FocusGroup> groups);
Option keyFocusGroupsPrevious(Key key, std::vector<FocusGroup> groups);

Option keyFocusSkip();

// Appends to the container's groups, an empty list removes it from all groups
Option keyFocusGroups(std::vector<FocusGroup> groups);

Option focused();

}
