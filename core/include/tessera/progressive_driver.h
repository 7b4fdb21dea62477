#pragma once

/**
 * @file progressive_driver.h
 * @brief Paces engine steps against an external frame cadence
 *
 * A host calls tick() once per frame. The driver performs one structural
 * change every `ticksPerStep` ticks, starting with the first tick, so the
 * decomposition animates at a steady rate. Pacing is purely presentational;
 * runToCompletion() ignores it.
 */

#include <tessera/fragment.h>
#include <cstddef>
#include <functional>
#include <utility>

namespace tessera {

class RefinementEngine;

class ProgressiveDriver {
public:
    using StepCallback = std::function<void(const StepResult&)>;

    /// @param ticksPerStep Frames per step; values below 1 are treated as 1
    explicit ProgressiveDriver(RefinementEngine& engine, int ticksPerStep = 2);

    /// @brief Advance one frame, stepping the engine when due
    StepResult tick();

    /**
     * @brief Step eagerly until the engine saturates
     * @param maxSteps Upper bound on steps (0 = unbounded)
     * @return Number of successful steps
     */
    size_t runToCompletion(size_t maxSteps = 0);

    /// @brief Suspend stepping, e.g. while a host swaps sources
    void pause() { m_paused = true; }
    void resume() { m_paused = false; }
    bool paused() const { return m_paused; }

    /// @brief Restart the cadence so the next tick steps
    void restart() { m_phase = 0; }

    /// @brief Invoked after every successful step
    void onStep(StepCallback callback) { m_onStep = std::move(callback); }

    int ticksPerStep() const { return m_ticksPerStep; }
    void setTicksPerStep(int ticks) {
        m_ticksPerStep = ticks < 1 ? 1 : ticks;
        m_phase %= m_ticksPerStep;
    }

    size_t tickCount() const { return m_ticks; }

private:
    RefinementEngine& m_engine;
    int m_ticksPerStep;
    int m_phase = 0;
    size_t m_ticks = 0;
    bool m_paused = false;
    StepCallback m_onStep;
};

} // namespace tessera
