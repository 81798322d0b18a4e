#pragma once

/**
 * @file Rect.hpp
 * @brief Terminal cell rectangles and the shrinking helpers
 *
 * Every size here is in terminal cells. Shrinking never clamps: asking
 * for more space than a rectangle has is reported as a GeometryError.
 */

#include <ostream>
#include "tiledash/core/Error.hpp"

namespace tdash {

struct Rect {
    int x{0};
    int y{0};
    int width{0};
    int height{0};

    inline int area() const { return width * height; }
    inline bool isEmpty() const { return width <= 0 || height <= 0; }

    inline bool contains(int px, int py) const {
        return px >= x && px < x + width &&
               py >= y && py < y + height;
    }

    inline int left() const { return x; }
    inline int right() const { return x + width; }
    inline int top() const { return y; }
    inline int bottom() const { return y + height; }

    inline bool operator==(const Rect& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }
    inline bool operator!=(const Rect& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Rect& rect);

std::string rectToString(const Rect& rect);

// Rounds down, percent is in 0..100
int percentOf(int length, int percent);

Result<Rect> shrink(const Rect& rect, int top, int right, int bottom, int left);

// Top and bottom are percentages of the height, left and right of the width
Result<Rect> shrinkPercent(const Rect& rect, int top_perc, int right_perc,
                           int bottom_perc, int left_perc);

}
