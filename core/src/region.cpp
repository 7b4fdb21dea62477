// Tessera - Region geometry

#include <tessera/region.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tessera {

std::string Region::toString() const {
    std::ostringstream ss;
    ss << "[" << left << ", " << top << " -> " << right << ", " << bottom << "]";
    return ss.str();
}

static int ceilClamped(double v, int limit) {
    double c = std::ceil(v);
    if (c <= 0.0) return 0;
    if (c >= static_cast<double>(limit)) return limit;
    return static_cast<int>(c);
}

PixelSpan pixelSpan(const Region& region, int width, int height) {
    PixelSpan span;
    if (!std::isfinite(region.left) || !std::isfinite(region.top) ||
        !std::isfinite(region.right) || !std::isfinite(region.bottom)) {
        return span;
    }
    span.x0 = ceilClamped(region.left, width);
    span.x1 = ceilClamped(region.right, width);
    span.y0 = ceilClamped(region.top, height);
    span.y1 = ceilClamped(region.bottom, height);
    return span;
}

std::array<Region, 4> split(const Region& r) {
    const double midX = r.left + (r.right - r.left) / 2.0;
    const double midY = r.top + (r.bottom - r.top) / 2.0;

    std::array<Region, 4> children;
    children[static_cast<size_t>(Quadrant::TopLeft)] = Region{r.left, r.top, midX, midY};
    children[static_cast<size_t>(Quadrant::TopRight)] = Region{midX, r.top, r.right, midY};
    children[static_cast<size_t>(Quadrant::BottomLeft)] = Region{r.left, midY, midX, r.bottom};
    children[static_cast<size_t>(Quadrant::BottomRight)] = Region{midX, midY, r.right, r.bottom};
    return children;
}

bool isSplittable(const Region& region, int width, int height) {
    auto children = split(region);
    return std::all_of(children.begin(), children.end(), [&](const Region& child) {
        return !pixelSpan(child, width, height).empty();
    });
}

} // namespace tessera
