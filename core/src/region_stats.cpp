// Tessera - Region statistics

#include <tessera/region_stats.h>
#include <tessera/errors.h>

#include <cmath>

namespace tessera {

RegionStats computeStats(const PixelBuffer& buffer, const Region& region) {
    const PixelSpan span = pixelSpan(region, buffer.width(), buffer.height());
    if (span.empty()) {
        throw EmptyRegionError("computeStats: region " + region.toString() +
                               " encloses no pixels");
    }

    double sum[3] = {0.0, 0.0, 0.0};
    for (int y = span.y0; y < span.y1; y++) {
        for (int x = span.x0; x < span.x1; x++) {
            sum[0] += buffer.channel(x, y, 0);
            sum[1] += buffer.channel(x, y, 1);
            sum[2] += buffer.channel(x, y, 2);
        }
    }

    const double n = static_cast<double>(span.count());
    const double mean[3] = {sum[0] / n, sum[1] / n, sum[2] / n};

    double sq[3] = {0.0, 0.0, 0.0};
    for (int y = span.y0; y < span.y1; y++) {
        for (int x = span.x0; x < span.x1; x++) {
            for (int c = 0; c < 3; c++) {
                double d = buffer.channel(x, y, c) - mean[c];
                sq[c] += d * d;
            }
        }
    }

    RegionStats stats;
    stats.avgColor = Color(static_cast<float>(mean[0]),
                           static_cast<float>(mean[1]),
                           static_cast<float>(mean[2]));
    stats.score = std::sqrt(sq[0] / n) + std::sqrt(sq[1] / n) + std::sqrt(sq[2] / n);
    stats.pixelCount = span.count();
    return stats;
}

} // namespace tessera
