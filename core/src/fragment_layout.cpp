// Tessera - Fragment Layout

#include <tessera/fragment_layout.h>
#include <tessera/refinement_engine.h>

namespace tessera {

FragmentLayout::FragmentLayout(LayoutConfig config)
    : m_config(config) {}

void FragmentLayout::applyReset(const RefinementEngine& engine) {
    m_boxes.clear();
    const PixelBufferPtr& buffer = engine.buffer();
    if (!buffer) {
        m_imageWidth = 0;
        m_imageHeight = 0;
        return;
    }

    m_imageWidth = buffer->width();
    m_imageHeight = buffer->height();
    for (const auto& [id, fragment] : engine.activeFragments()) {
        m_boxes.emplace(id, boxFor(fragment));
    }
}

bool FragmentLayout::applyStep(const StepResult& result) {
    if (!result.progress) return false;

    auto it = m_boxes.find(result.removed.id);
    if (it == m_boxes.end()) return false;
    m_boxes.erase(it);

    for (const Fragment& child : result.added) {
        m_boxes[child.id] = boxFor(child);
    }
    return true;
}

FragmentBox FragmentLayout::boxFor(const Fragment& fragment) const {
    FragmentBox box;
    box.id = fragment.id;
    box.color = fragment.stats.avgColor.toLinear();
    if (m_imageWidth <= 0 || m_imageHeight <= 0) {
        return box;
    }

    const Region& r = fragment.region;
    const float w = static_cast<float>(m_imageWidth);
    const float h = static_cast<float>(m_imageHeight);
    const float extent = m_config.extent;
    const float half = extent * 0.5f;

    const float centerX = static_cast<float>((r.left + r.right) * 0.5);
    const float centerY = static_cast<float>((r.top + r.bottom) * 0.5);
    const float depth = fragment.stats.avgColor.mean() * m_config.depthScale;

    box.position = glm::vec3(centerX / w * extent - half,
                             -(centerY / h * extent - half),
                             depth * 0.5f);
    box.scale = glm::vec3(static_cast<float>(r.width()) / w * extent - m_config.gap,
                          static_cast<float>(r.height()) / h * extent - m_config.gap,
                          depth);
    return box;
}

const FragmentBox* FragmentLayout::find(FragmentId id) const {
    auto it = m_boxes.find(id);
    return it == m_boxes.end() ? nullptr : &it->second;
}

} // namespace tessera
