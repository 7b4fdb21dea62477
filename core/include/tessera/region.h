#pragma once

/**
 * @file region.h
 * @brief Axis-aligned rectangles in pixel-buffer coordinates and quadrant splitting
 *
 * Region bounds are real-valued. Splitting uses exact midpoints, so after a
 * few generations a region edge usually falls between pixel centers. Pixel
 * ownership is decided by pixelSpan(): a pixel with integer coordinate i
 * belongs to [left, right) iff ceil(left) <= i < ceil(right). Two siblings
 * sharing an edge therefore never both claim (or both drop) a pixel.
 */

#include <array>
#include <string>

namespace tessera {

struct Region {
    double left = 0.0;
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;

    double width() const { return right - left; }
    double height() const { return bottom - top; }
    double area() const { return width() * height(); }

    bool operator==(const Region& o) const {
        return left == o.left && top == o.top && right == o.right && bottom == o.bottom;
    }
    bool operator!=(const Region& o) const { return !(*this == o); }

    /// @brief Full-image region for a width x height buffer
    static Region full(int width, int height) {
        return Region{0.0, 0.0, static_cast<double>(width), static_cast<double>(height)};
    }

    std::string toString() const;
};

/// @brief Index of a child within the array returned by split()
enum class Quadrant {
    TopLeft = 0,
    TopRight = 1,
    BottomLeft = 2,
    BottomRight = 3
};

/**
 * @brief Integer pixel rectangle selected by a region: columns [x0, x1), rows [y0, y1)
 */
struct PixelSpan {
    int x0 = 0;
    int y0 = 0;
    int x1 = 0;
    int y1 = 0;

    bool empty() const { return x1 <= x0 || y1 <= y0; }
    long long count() const {
        return empty() ? 0 : static_cast<long long>(x1 - x0) * (y1 - y0);
    }
};

/**
 * @brief Pixels enclosed by a region using the ceil/ceil rule
 * @param region Region to sample
 * @param width Buffer width used to clamp the span
 * @param height Buffer height used to clamp the span
 *
 * A region with a NaN or infinite bound selects no pixels.
 */
PixelSpan pixelSpan(const Region& region, int width, int height);

/**
 * @brief Split a region into four equal-area children
 * @return Children in order top-left, top-right, bottom-left, bottom-right
 *
 * Midpoints are not truncated to integers. Never fails.
 */
std::array<Region, 4> split(const Region& region);

/**
 * @brief True if every child of split(region) encloses at least one pixel
 *
 * Regions narrower or shorter than about two pixels produce a child with no
 * pixels. Such regions stay as leaves.
 */
bool isSplittable(const Region& region, int width, int height);

} // namespace tessera
