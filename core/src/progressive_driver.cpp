// Tessera - Progressive Driver

#include <tessera/progressive_driver.h>
#include <tessera/refinement_engine.h>

namespace tessera {

ProgressiveDriver::ProgressiveDriver(RefinementEngine& engine, int ticksPerStep)
    : m_engine(engine), m_ticksPerStep(ticksPerStep < 1 ? 1 : ticksPerStep) {}

StepResult ProgressiveDriver::tick() {
    m_ticks++;
    if (m_paused || m_engine.isSaturated()) {
        return StepResult{};
    }

    StepResult result;
    if (m_phase == 0) {
        result = m_engine.step();
        if (result.progress && m_onStep) {
            m_onStep(result);
        }
    }
    m_phase = (m_phase + 1) % m_ticksPerStep;
    return result;
}

size_t ProgressiveDriver::runToCompletion(size_t maxSteps) {
    size_t steps = 0;
    while (maxSteps == 0 || steps < maxSteps) {
        StepResult result = m_engine.step();
        if (!result.progress) break;
        steps++;
        if (m_onStep) {
            m_onStep(result);
        }
    }
    return steps;
}

} // namespace tessera
