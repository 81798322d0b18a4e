#include "tiledash/geometry/Rect.hpp"
#include <sstream>

namespace tdash {

std::ostream& operator<<(std::ostream& os, const Rect& rect) {
    return os << "(" << rect.x << "," << rect.y << ") "
              << rect.width << "x" << rect.height;
}

std::string rectToString(const Rect& rect) {
    std::ostringstream ss;
    ss << rect;
    return ss.str();
}

int percentOf(int length, int percent) {
    return length * percent / 100;
}

Result<Rect> shrink(const Rect& rect, int top, int right, int bottom, int left) {
    if (top < 0 || right < 0 || bottom < 0 || left < 0) {
        return geometryError("invalid shrink values top=" + std::to_string(top) +
                             ", right=" + std::to_string(right) +
                             ", bottom=" + std::to_string(bottom) +
                             ", left=" + std::to_string(left) +
                             ", all must be in range 0 <= value");
    }

    int horizontal = left + right;
    int vertical = top + bottom;
    if (horizontal > rect.width || vertical > rect.height) {
        return geometryError("cannot shrink area " + rectToString(rect) +
                             " by top=" + std::to_string(top) +
                             ", right=" + std::to_string(right) +
                             ", bottom=" + std::to_string(bottom) +
                             ", left=" + std::to_string(left) +
                             ", the result would have a negative size");
    }

    Rect result = rect;
    result.x += left;
    result.y += top;
    result.width -= horizontal;
    result.height -= vertical;
    return result;
}

Result<Rect> shrinkPercent(const Rect& rect, int top_perc, int right_perc,
                           int bottom_perc, int left_perc) {
    for (int perc : {top_perc, right_perc, bottom_perc, left_perc}) {
        if (perc < 0 || perc > 100) {
            return geometryError("invalid shrink percentage " + std::to_string(perc) +
                                 ", must be in range 0 <= value <= 100");
        }
    }

    return shrink(rect,
                  percentOf(rect.height, top_perc),
                  percentOf(rect.width, right_perc),
                  percentOf(rect.height, bottom_perc),
                  percentOf(rect.width, left_perc));
}

} // namespace tdash
