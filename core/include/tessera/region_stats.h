#pragma once

/**
 * @file region_stats.h
 * @brief Mean color and non-uniformity score of a region
 */

#include <tessera/color.h>
#include <tessera/pixel_buffer.h>
#include <tessera/region.h>

namespace tessera {

struct RegionStats {
    Color avgColor;     ///< Per-channel arithmetic mean
    double score = 0.0; ///< Sum of per-channel population standard deviations
    long long pixelCount = 0;
};

/**
 * @brief Compute statistics over the pixels selected by pixelSpan()
 * @param buffer Source pixels
 * @param region Region to measure
 * @return Mean color and score; score is exactly 0 for a uniform region
 * @throw EmptyRegionError if the region encloses no pixel
 *
 * Two passes: mean first, then deviation. Pure; concurrent calls on the same
 * buffer are safe.
 */
RegionStats computeStats(const PixelBuffer& buffer, const Region& region);

} // namespace tessera
