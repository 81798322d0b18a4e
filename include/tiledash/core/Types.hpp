#pragma once

/**
 * @file Types.hpp
 * @brief Value types the container tree stores and compares
 *
 * Keys, colors, alignments and line styles are supplied by the terminal
 * layer. The container tree only stores them, compares them and uses
 * keys as map keys, so they are kept as small comparable values here.
 */

#include <cstdint>
#include <optional>
#include <string>

namespace tdash {

/**
 * @brief A keyboard key
 *
 * Printable characters are their Unicode code point. Keys without a
 * character representation use the negative constants in tdash::keys.
 */
using Key = std::int32_t;

namespace keys {
    constexpr Key Backspace = 8;
    constexpr Key Tab = 9;
    constexpr Key Enter = 13;
    constexpr Key Esc = 27;
    constexpr Key Space = 32;
    constexpr Key Delete = 127;

    constexpr Key F1 = -1;
    constexpr Key F2 = -2;
    constexpr Key F3 = -3;
    constexpr Key F4 = -4;
    constexpr Key F5 = -5;
    constexpr Key F6 = -6;
    constexpr Key F7 = -7;
    constexpr Key F8 = -8;
    constexpr Key F9 = -9;
    constexpr Key F10 = -10;
    constexpr Key F11 = -11;
    constexpr Key F12 = -12;
    constexpr Key Insert = -13;
    constexpr Key Home = -14;
    constexpr Key End = -15;
    constexpr Key PageUp = -16;
    constexpr Key PageDown = -17;
    constexpr Key ArrowUp = -18;
    constexpr Key ArrowDown = -19;
    constexpr Key ArrowLeft = -20;
    constexpr Key ArrowRight = -21;
    constexpr Key BackTab = -22;
}

std::string keyName(Key key);

// Accepts key names ("Tab", "pgdn", "F5", case-insensitive) or a single character.
std::optional<Key> keyFromString(const std::string& name);

/**
 * @brief A terminal color
 *
 * Either the terminal default, one of the 256 indexed colors, or a
 * 24-bit RGB value.
 */
class Color {
public:
    enum class Kind : std::uint8_t { Default, Indexed, Rgb };

    constexpr Color() = default;

    static constexpr Color number(int index) {
        return Color(Kind::Indexed, static_cast<std::uint32_t>(index & 0xFF));
    }

    static constexpr Color rgb(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
        return Color(Kind::Rgb, (static_cast<std::uint32_t>(r) << 16) |
                                (static_cast<std::uint32_t>(g) << 8) |
                                static_cast<std::uint32_t>(b));
    }

    constexpr Kind kind() const { return kind_; }
    constexpr std::uint32_t value() const { return value_; }
    constexpr bool isDefault() const { return kind_ == Kind::Default; }

    constexpr bool operator==(const Color& other) const {
        return kind_ == other.kind_ && value_ == other.value_;
    }
    constexpr bool operator!=(const Color& other) const { return !(*this == other); }

    std::string toString() const;

private:
    constexpr Color(Kind kind, std::uint32_t value) : kind_(kind), value_(value) {}

    Kind kind_{Kind::Default};
    std::uint32_t value_{0};
};

namespace colors {
    inline constexpr Color Default{};
    inline constexpr Color Black = Color::number(0);
    inline constexpr Color Red = Color::number(1);
    inline constexpr Color Green = Color::number(2);
    inline constexpr Color Yellow = Color::number(3);
    inline constexpr Color Blue = Color::number(4);
    inline constexpr Color Magenta = Color::number(5);
    inline constexpr Color Cyan = Color::number(6);
    inline constexpr Color White = Color::number(7);
}

enum class HorizontalAlign {
    Left,
    Center,
    Right
};

enum class VerticalAlign {
    Top,
    Middle,
    Bottom
};

enum class LineStyle {
    None,
    Light,
    Double,
    Round
};

std::string horizontalAlignToString(HorizontalAlign align);
std::string verticalAlignToString(VerticalAlign align);
std::string lineStyleToString(LineStyle style);

/**
 * @brief Tag for scoped keyboard focus navigation, must be >= 0
 */
using FocusGroup = int;

/**
 * @brief Widget capability placed into a leaf container
 *
 * The container tree never looks inside a widget, it only tracks
 * whether a leaf holds one. Implementations live in the widget layer.
 */
class Widget {
public:
    virtual ~Widget() = default;
};

}
