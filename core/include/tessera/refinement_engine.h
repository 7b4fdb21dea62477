#pragma once

/**
 * @file refinement_engine.h
 * @brief Priority-driven progressive subdivision of an image into flat-color regions
 *
 * The engine keeps the current set of leaf fragments, which always tiles the
 * whole image exactly, and a priority queue of the fragments that can still
 * be split. Each step() pops the fragment with the highest weighted score and
 * replaces it with its four quadrants.
 *
 * @par Example
 * @code
 * RefinementEngine engine;
 * engine.reset(std::make_shared<const PixelBuffer>(io::toPixelBuffer(image)));
 * while (StepResult r = engine.step()) {
 *     layout.applyStep(r);
 * }
 * @endcode
 *
 * Not thread-safe: step() and reset() must be serialized by the caller.
 */

#include <tessera/fragment.h>
#include <tessera/pixel_buffer.h>
#include <cstddef>
#include <map>
#include <queue>
#include <vector>

namespace tessera {

struct EngineConfig {
    /// Upper bound on the number of active fragments
    size_t maxFragments = 2000;
};

class RefinementEngine {
public:
    explicit RefinementEngine(EngineConfig config = {});

    /**
     * @brief Discard all fragments and start over with one root fragment
     * @param buffer Image to decompose; kept alive by the engine
     * @throw InvalidBufferError if buffer is null or has a zero dimension.
     *        The engine is unchanged in that case.
     */
    void reset(PixelBufferPtr buffer);

    /**
     * @brief Split the highest-priority fragment into four
     * @return progress=false when saturated (count limit or nothing left to split)
     * @throw EmptyRegionError if a child statistics computation fails.
     *        The engine is unchanged in that case.
     *
     * Net fragment count change on progress is +3. The count never exceeds
     * maxFragments(); a split that would exceed it is not attempted.
     */
    StepResult step();

    /// @brief Number of active fragments (0 before the first reset)
    size_t fragmentCount() const { return m_fragments.size(); }

    size_t maxFragments() const { return m_config.maxFragments; }

    /// @brief Change the count limit. Existing fragments are kept.
    void setMaxFragments(size_t maxFragments) { m_config.maxFragments = maxFragments; }

    /// @brief Fragments still eligible for splitting
    size_t queuedCount() const { return m_queue.size(); }

    /// @brief Successful steps since the last reset
    size_t stepCount() const { return m_stepCount; }

    /// @brief True when step() cannot make progress
    bool isSaturated() const;

    /// @brief Fragment by id, or nullptr if it is not active
    const Fragment* find(FragmentId id) const;

    /// @brief Snapshot of all active fragments ordered by id
    std::vector<Fragment> fragments() const;

    /// @brief Active fragments keyed by id
    const std::map<FragmentId, Fragment>& activeFragments() const { return m_fragments; }

    /// @brief Current image, or nullptr before the first reset
    const PixelBufferPtr& buffer() const { return m_buffer; }

private:
    struct QueueEntry {
        double weightedScore;
        FragmentId id;

        // Max-heap on score; equal scores pop the lower (older) id first.
        bool operator<(const QueueEntry& other) const {
            if (weightedScore != other.weightedScore) {
                return weightedScore < other.weightedScore;
            }
            return id > other.id;
        }
    };

    Fragment makeFragment(const PixelBuffer& buffer, const Region& region, FragmentId id) const;

    EngineConfig m_config;
    PixelBufferPtr m_buffer;
    std::map<FragmentId, Fragment> m_fragments;
    std::priority_queue<QueueEntry> m_queue;
    FragmentId m_nextId = 1;
    size_t m_stepCount = 0;
};

} // namespace tessera
