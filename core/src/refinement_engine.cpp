// Tessera - Refinement Engine Implementation

#include <tessera/refinement_engine.h>
#include <tessera/errors.h>

#include <cmath>
#include <string>
#include <utility>

namespace tessera {

RefinementEngine::RefinementEngine(EngineConfig config)
    : m_config(config) {}

Fragment RefinementEngine::makeFragment(const PixelBuffer& buffer, const Region& region,
                                        FragmentId id) const {
    Fragment fragment;
    fragment.id = id;
    fragment.region = region;
    fragment.stats = computeStats(buffer, region);
    fragment.weightedScore = fragment.stats.score * std::sqrt(region.area() / buffer.area());
    fragment.splittable = isSplittable(region, buffer.width(), buffer.height());
    return fragment;
}

void RefinementEngine::reset(PixelBufferPtr buffer) {
    if (!buffer) {
        throw InvalidBufferError("reset: null pixel buffer");
    }
    if (buffer->empty()) {
        throw InvalidBufferError("reset: pixel buffer has zero size (" +
                                 std::to_string(buffer->width()) + "x" +
                                 std::to_string(buffer->height()) + ")");
    }

    // Build the new state aside so a failure leaves the current one intact
    Fragment root = makeFragment(*buffer, Region::full(buffer->width(), buffer->height()), 1);

    std::map<FragmentId, Fragment> fragments;
    std::priority_queue<QueueEntry> queue;
    if (root.splittable) {
        queue.push({root.weightedScore, root.id});
    }
    fragments.emplace(root.id, std::move(root));

    m_buffer = std::move(buffer);
    m_fragments = std::move(fragments);
    m_queue = std::move(queue);
    m_nextId = 2;
    m_stepCount = 0;
}

bool RefinementEngine::isSaturated() const {
    return !m_buffer || m_queue.empty() || m_fragments.size() + 3 > m_config.maxFragments;
}

StepResult RefinementEngine::step() {
    StepResult result;
    if (isSaturated()) {
        return result;
    }

    const QueueEntry top = m_queue.top();
    auto it = m_fragments.find(top.id);
    const std::array<Region, 4> children = split(it->second.region);

    // Compute everything before touching the queue or the fragment map
    for (size_t i = 0; i < children.size(); i++) {
        result.added[i] = makeFragment(*m_buffer, children[i], m_nextId + i);
    }
    result.removed = it->second;
    result.progress = true;

    m_queue.pop();
    m_fragments.erase(it);
    for (const Fragment& child : result.added) {
        if (child.splittable) {
            m_queue.push({child.weightedScore, child.id});
        }
        m_fragments.emplace(child.id, child);
    }
    m_nextId += children.size();
    m_stepCount++;
    return result;
}

const Fragment* RefinementEngine::find(FragmentId id) const {
    auto it = m_fragments.find(id);
    return it == m_fragments.end() ? nullptr : &it->second;
}

std::vector<Fragment> RefinementEngine::fragments() const {
    std::vector<Fragment> out;
    out.reserve(m_fragments.size());
    for (const auto& [id, fragment] : m_fragments) {
        out.push_back(fragment);
    }
    return out;
}

} // namespace tessera
