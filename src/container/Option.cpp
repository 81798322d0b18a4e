#include "tiledash/container/Option.hpp"
#include "tiledash/container/Container.hpp"
#include "tiledash/focus/FocusTracker.hpp"
#include <type_traits>

namespace tdash {

namespace {

std::string groupsToString(const std::set<FocusGroup>& groups) {
    std::string out = "[";
    for (FocusGroup g : groups) {
        if (out.size() > 1) out += " ";
        out += std::to_string(g);
    }
    return out + "]";
}

std::string spacingOptionName(const char* kind, Side side, bool percent) {
    std::string name = std::string(kind) + sideToString(side);
    if (percent) name += "Percent";
    return name;
}

// Shared by margin and padding, which validate identically
Status applySpacing(Spacing& spacing, const char* kind, Side side, int value, bool percent,
                    const std::string& container_id) {
    const size_t index = static_cast<size_t>(side);
    const std::string name = spacingOptionName(kind, side, percent);
    const std::string other = spacingOptionName(kind, side, !percent);

    if (percent) {
        if (value < 0 || value > 100) {
            return configurationError("invalid " + name + "(" + std::to_string(value) +
                                      "), must be in range 0 <= value <= 100", container_id);
        }
        if (spacing.cells[index] > 0) {
            return configurationError("cannot specify both " + name + "(" + std::to_string(value) +
                                      ") and " + other + "(" +
                                      std::to_string(spacing.cells[index]) + ")", container_id);
        }
        spacing.percent[index] = value;
        return Status::ok();
    }

    if (value < 0) {
        return configurationError("invalid " + name + "(" + std::to_string(value) +
                                  "), must be in range 0 <= value", container_id);
    }
    if (spacing.percent[index] > 0) {
        return configurationError("cannot specify both " + name + "(" + std::to_string(value) +
                                  ") and " + other + "(" +
                                  std::to_string(spacing.percent[index]) + ")", container_id);
    }
    spacing.cells[index] = value;
    return Status::ok();
}

Status validateGroups(const std::vector<FocusGroup>& groups, const std::string& option,
                      const std::string& container_id) {
    for (FocusGroup g : groups) {
        if (g < 0) {
            return configurationError("invalid group " + std::to_string(g) + " in " + option +
                                      ", must be 0 <= group", container_id);
        }
    }
    return Status::ok();
}

// Adds groups to the key in target, refusing keys already bound in opposite
Status bindGroupKey(std::unordered_map<Key, std::set<FocusGroup>>& target,
                    const std::unordered_map<Key, std::set<FocusGroup>>& opposite,
                    Key key, const std::vector<FocusGroup>& groups,
                    const std::string& option, const std::string& opposite_option,
                    const std::string& container_id) {
    Status status = validateGroups(groups, option + " for key " + keyName(key), container_id);
    if (!status) {
        return status;
    }
    if (groups.empty()) {
        return Status::ok();
    }

    auto existing = opposite.find(key);
    if (existing != opposite.end()) {
        return configurationError("key " + keyName(key) + " is already assigned as a " +
                                  opposite_option + " for focus groups " +
                                  groupsToString(existing->second), container_id);
    }

    auto& bound = target[key];
    bound.insert(groups.begin(), groups.end());
    return Status::ok();
}

} // namespace

// ============================================================================
// SplitOption
// ============================================================================

std::string SplitOption::name() const {
    switch (kind_) {
        case Kind::Percent: return "SplitPercent";
        case Kind::PercentFromEnd: return "SplitPercentFromEnd";
        case Kind::Fixed: return "SplitFixed";
        case Kind::FixedFromEnd: return "SplitFixedFromEnd";
        default: return "SplitUnknown";
    }
}

Status SplitOption::apply(ContainerOptions& opts) const {
    switch (kind_) {
        case Kind::Percent:
        case Kind::PercentFromEnd:
            if (value_ <= 0 || value_ >= 100) {
                return configurationError("invalid split percentage " + std::to_string(value_) +
                                          ", must be in range 0 < p < 100", opts.id);
            }
            opts.split_percent = value_;
            break;

        case Kind::Fixed:
        case Kind::FixedFromEnd:
            if (value_ < 0) {
                return configurationError("invalid fixed value " + std::to_string(value_) +
                                          ", must be in range 0 <= cells", opts.id);
            }
            opts.split_fixed = value_;
            break;
    }

    if (kind_ == Kind::PercentFromEnd || kind_ == Kind::FixedFromEnd) {
        opts.split_reversed = true;
    }
    return Status::ok();
}

SplitOption splitPercent(int percent) {
    return SplitOption(SplitOption::Kind::Percent, percent);
}

SplitOption splitPercentFromEnd(int percent) {
    return SplitOption(SplitOption::Kind::PercentFromEnd, percent);
}

SplitOption splitFixed(int cells) {
    return SplitOption(SplitOption::Kind::Fixed, cells);
}

SplitOption splitFixedFromEnd(int cells) {
    return SplitOption(SplitOption::Kind::FixedFromEnd, cells);
}

// ============================================================================
// Option
// ============================================================================

Option::Option(Value value) : value_(std::move(value)) {}

std::string Option::name() const {
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        using namespace option_data;

        if constexpr (std::is_same_v<T, SetId>) return "ID";
        else if constexpr (std::is_same_v<T, Clear>) return "Clear";
        else if constexpr (std::is_same_v<T, PlaceWidget>) return "PlaceWidget";
        else if constexpr (std::is_same_v<T, Split>) {
            return arg.axis == SplitAxis::Vertical ? "SplitVertical" : "SplitHorizontal";
        }
        else if constexpr (std::is_same_v<T, SetMargin>) return spacingOptionName("Margin", arg.side, arg.percent);
        else if constexpr (std::is_same_v<T, SetPadding>) return spacingOptionName("Padding", arg.side, arg.percent);
        else if constexpr (std::is_same_v<T, SetAlignHorizontal>) return "AlignHorizontal";
        else if constexpr (std::is_same_v<T, SetAlignVertical>) return "AlignVertical";
        else if constexpr (std::is_same_v<T, SetBorder>) return "Border";
        else if constexpr (std::is_same_v<T, SetBorderTitle>) return "BorderTitle";
        else if constexpr (std::is_same_v<T, SetBorderTitleAlign>) {
            return "BorderTitleAlign" + std::string(
                arg.align == HorizontalAlign::Left ? "Left" :
                arg.align == HorizontalAlign::Right ? "Right" : "Center");
        }
        else if constexpr (std::is_same_v<T, SetBorderColor>) return "BorderColor";
        else if constexpr (std::is_same_v<T, SetFocusedColor>) return "FocusedColor";
        else if constexpr (std::is_same_v<T, SetTitleColor>) return "TitleColor";
        else if constexpr (std::is_same_v<T, SetTitleFocusedColor>) return "TitleFocusedColor";
        else if constexpr (std::is_same_v<T, SetKeyFocusNext>) return "KeyFocusNext";
        else if constexpr (std::is_same_v<T, SetKeyFocusPrevious>) return "KeyFocusPrevious";
        else if constexpr (std::is_same_v<T, SetKeyFocusSkip>) return "KeyFocusSkip";
        else if constexpr (std::is_same_v<T, SetKeyFocusGroups>) return "KeyFocusGroups";
        else if constexpr (std::is_same_v<T, SetKeyFocusGroupsNext>) return "KeyFocusGroupsNext";
        else if constexpr (std::is_same_v<T, SetKeyFocusGroupsPrevious>) return "KeyFocusGroupsPrevious";
        else return "Focused";
    }, value_);
}

Status Option::apply(Container& container) const {
    ContainerOptions& opts = container.opts_;
    const std::string& cid = opts.id;

    return std::visit([&](const auto& arg) -> Status {
        using T = std::decay_t<decltype(arg)>;
        using namespace option_data;

        if constexpr (std::is_same_v<T, SetId>) {
            if (arg.id.empty()) {
                return configurationError("the container ID cannot be an empty string", cid);
            }
            opts.id = arg.id;
        } else if constexpr (std::is_same_v<T, Clear>) {
            container.clear();
        } else if constexpr (std::is_same_v<T, PlaceWidget>) {
            if (!arg.widget) {
                return configurationError("PlaceWidget requires a widget, got null", cid);
            }
            container.placeWidget(arg.widget);
        } else if constexpr (std::is_same_v<T, Split>) {
            return container.split(arg);
        } else if constexpr (std::is_same_v<T, SetMargin>) {
            return applySpacing(opts.margin, "Margin", arg.side, arg.value, arg.percent, cid);
        } else if constexpr (std::is_same_v<T, SetPadding>) {
            return applySpacing(opts.padding, "Padding", arg.side, arg.value, arg.percent, cid);
        } else if constexpr (std::is_same_v<T, SetAlignHorizontal>) {
            opts.h_align = arg.align;
        } else if constexpr (std::is_same_v<T, SetAlignVertical>) {
            opts.v_align = arg.align;
        } else if constexpr (std::is_same_v<T, SetBorder>) {
            opts.border = arg.style;
        } else if constexpr (std::is_same_v<T, SetBorderTitle>) {
            opts.border_title = arg.title;
        } else if constexpr (std::is_same_v<T, SetBorderTitleAlign>) {
            opts.border_title_align = arg.align;
        } else if constexpr (std::is_same_v<T, SetBorderColor>) {
            opts.inherited.border_color = arg.color;
        } else if constexpr (std::is_same_v<T, SetFocusedColor>) {
            opts.inherited.focused_color = arg.color;
        } else if constexpr (std::is_same_v<T, SetTitleColor>) {
            opts.inherited.title_color = arg.color;
        } else if constexpr (std::is_same_v<T, SetTitleFocusedColor>) {
            opts.inherited.title_focused_color = arg.color;
        } else if constexpr (std::is_same_v<T, SetKeyFocusNext>) {
            opts.global->key_focus_next = arg.key;
        } else if constexpr (std::is_same_v<T, SetKeyFocusPrevious>) {
            opts.global->key_focus_previous = arg.key;
        } else if constexpr (std::is_same_v<T, SetKeyFocusSkip>) {
            opts.key_focus_skip = true;
        } else if constexpr (std::is_same_v<T, SetKeyFocusGroups>) {
            if (arg.groups.empty()) {
                opts.key_focus_groups.clear();
                return Status::ok();
            }
            Status status = validateGroups(arg.groups, "KeyFocusGroups", cid);
            if (!status) {
                return status;
            }
            opts.key_focus_groups.insert(opts.key_focus_groups.end(),
                                         arg.groups.begin(), arg.groups.end());
        } else if constexpr (std::is_same_v<T, SetKeyFocusGroupsNext>) {
            return bindGroupKey(opts.global->key_focus_groups_next,
                                opts.global->key_focus_groups_previous,
                                arg.key, arg.groups,
                                "KeyFocusGroupsNext", "KeyFocusGroupsPrevious", cid);
        } else if constexpr (std::is_same_v<T, SetKeyFocusGroupsPrevious>) {
            return bindGroupKey(opts.global->key_focus_groups_previous,
                                opts.global->key_focus_groups_next,
                                arg.key, arg.groups,
                                "KeyFocusGroupsPrevious", "KeyFocusGroupsNext", cid);
        } else if constexpr (std::is_same_v<T, SetFocused>) {
            container.focusTracker().setActive(&container);
        }
        return Status::ok();
    }, value_);
}

Status applyOptions(Container& container, const std::vector<Option>& options) {
    for (const auto& option : options) {
        Status status = option.apply(container);
        if (!status) {
            return status;
        }
    }
    return Status::ok();
}

// ============================================================================
// Option factories
// ============================================================================

Option id(std::string id) {
    return Option(option_data::SetId{std::move(id)});
}

Option clear() {
    return Option(option_data::Clear{});
}

Option placeWidget(std::shared_ptr<Widget> widget) {
    return Option(option_data::PlaceWidget{std::move(widget)});
}

Option splitVertical(Left left, Right right, std::vector<SplitOption> sizing) {
    return Option(option_data::Split{SplitAxis::Vertical, std::move(left.options),
                                     std::move(right.options), std::move(sizing)});
}

Option splitHorizontal(Top top, Bottom bottom, std::vector<SplitOption> sizing) {
    return Option(option_data::Split{SplitAxis::Horizontal, std::move(top.options),
                                     std::move(bottom.options), std::move(sizing)});
}

Option marginTop(int cells) { return Option(option_data::SetMargin{Side::Top, cells, false}); }
Option marginRight(int cells) { return Option(option_data::SetMargin{Side::Right, cells, false}); }
Option marginBottom(int cells) { return Option(option_data::SetMargin{Side::Bottom, cells, false}); }
Option marginLeft(int cells) { return Option(option_data::SetMargin{Side::Left, cells, false}); }
Option marginTopPercent(int percent) { return Option(option_data::SetMargin{Side::Top, percent, true}); }
Option marginRightPercent(int percent) { return Option(option_data::SetMargin{Side::Right, percent, true}); }
Option marginBottomPercent(int percent) { return Option(option_data::SetMargin{Side::Bottom, percent, true}); }
Option marginLeftPercent(int percent) { return Option(option_data::SetMargin{Side::Left, percent, true}); }

Option paddingTop(int cells) { return Option(option_data::SetPadding{Side::Top, cells, false}); }
Option paddingRight(int cells) { return Option(option_data::SetPadding{Side::Right, cells, false}); }
Option paddingBottom(int cells) { return Option(option_data::SetPadding{Side::Bottom, cells, false}); }
Option paddingLeft(int cells) { return Option(option_data::SetPadding{Side::Left, cells, false}); }
Option paddingTopPercent(int percent) { return Option(option_data::SetPadding{Side::Top, percent, true}); }
Option paddingRightPercent(int percent) { return Option(option_data::SetPadding{Side::Right, percent, true}); }
Option paddingBottomPercent(int percent) { return Option(option_data::SetPadding{Side::Bottom, percent, true}); }
Option paddingLeftPercent(int percent) { return Option(option_data::SetPadding{Side::Left, percent, true}); }

Option alignHorizontal(HorizontalAlign align) {
    return Option(option_data::SetAlignHorizontal{align});
}

Option alignVertical(VerticalAlign align) {
    return Option(option_data::SetAlignVertical{align});
}

Option border(LineStyle style) {
    return Option(option_data::SetBorder{style});
}

Option borderTitle(std::string title) {
    return Option(option_data::SetBorderTitle{std::move(title)});
}

Option borderTitleAlignLeft() {
    return Option(option_data::SetBorderTitleAlign{HorizontalAlign::Left});
}

Option borderTitleAlignCenter() {
    return Option(option_data::SetBorderTitleAlign{HorizontalAlign::Center});
}

Option borderTitleAlignRight() {
    return Option(option_data::SetBorderTitleAlign{HorizontalAlign::Right});
}

Option borderColor(Color color) { return Option(option_data::SetBorderColor{color}); }
Option focusedColor(Color color) { return Option(option_data::SetFocusedColor{color}); }
Option titleColor(Color color) { return Option(option_data::SetTitleColor{color}); }
Option titleFocusedColor(Color color) { return Option(option_data::SetTitleFocusedColor{color}); }

Option keyFocusNext(Key key) {
    return Option(option_data::SetKeyFocusNext{key});
}

Option keyFocusPrevious(Key key) {
    return Option(option_data::SetKeyFocusPrevious{key});
}

Option keyFocusGroupsNext(Key key, std::vector<FocusGroup> groups) {
    return Option(option_data::SetKeyFocusGroupsNext{key, std::move(groups)});
}

Option keyFocusGroupsPrevious(Key key, std::vector<FocusGroup> groups) {
    return Option(option_data::SetKeyFocusGroupsPrevious{key, std::move(groups)});
}

Option keyFocusSkip() {
    return Option(option_data::SetKeyFocusSkip{});
}

Option keyFocusGroups(std::vector<FocusGroup> groups) {
    return Option(option_data::SetKeyFocusGroups{std::move(groups)});
}

Option focused() {
    return Option(option_data::SetFocused{});
}

} // namespace tdash
