#pragma once

/**
 * @file fragment.h
 * @brief A leaf region of the decomposition with cached statistics
 */

#include <tessera/region.h>
#include <tessera/region_stats.h>
#include <array>
#include <cstdint>

namespace tessera {

/// @brief Identifier assigned by the engine; 1 is the root after each reset
using FragmentId = uint64_t;

constexpr FragmentId InvalidFragmentId = 0;

struct Fragment {
    FragmentId id = InvalidFragmentId;
    Region region;
    RegionStats stats;
    double weightedScore = 0.0; ///< stats.score * sqrt(region area / image area)
    bool splittable = false;    ///< Every child would enclose at least one pixel
};

/**
 * @brief Outcome of RefinementEngine::step()
 *
 * When progress is false the engine was saturated and nothing changed;
 * removed and added hold default values.
 */
struct StepResult {
    bool progress = false;
    Fragment removed;
    std::array<Fragment, 4> added;

    explicit operator bool() const { return progress; }
};

} // namespace tessera
