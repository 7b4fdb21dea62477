#pragma once

/**
 * @file fragment_layout.h
 * @brief Maps active fragments to box instances for a 3D renderer
 *
 * FragmentLayout mirrors the engine's fragment set and is kept in sync from
 * step deltas alone: one box removed by id, four added. A full rebuild is
 * only needed after a reset or a source switch.
 *
 * The image occupies a square of side `extent` centered on the origin in
 * the XY plane, Y up. Each box is extruded along +Z proportionally to the
 * brightness of its average color and sits on the Z=0 plane.
 */

#include <tessera/color.h>
#include <tessera/fragment.h>
#include <glm/glm.hpp>
#include <cstddef>
#include <map>

namespace tessera {

class RefinementEngine;

struct LayoutConfig {
    float extent = 2.0f;      ///< Side length of the square the image maps onto
    float gap = 0.002f;       ///< Shrinks each box so neighbours stay visually separate
    float depthScale = 0.1f;  ///< Extrusion per unit of mean brightness
};

struct FragmentBox {
    FragmentId id = InvalidFragmentId;
    glm::vec3 position{0.0f};  ///< Box center
    glm::vec3 scale{1.0f};     ///< Box size along each axis
    Color color;               ///< Average color converted to linear light
};

class FragmentLayout {
public:
    explicit FragmentLayout(LayoutConfig config = {});

    /// @brief Rebuild every box from the engine's current fragment set
    void applyReset(const RefinementEngine& engine);

    /**
     * @brief Apply one step delta
     * @return false if the result made no progress or the removed id was unknown
     */
    bool applyStep(const StepResult& result);

    /// @brief Box for a single fragment
    FragmentBox boxFor(const Fragment& fragment) const;

    const FragmentBox* find(FragmentId id) const;
    size_t size() const { return m_boxes.size(); }
    void clear() { m_boxes.clear(); }

    const std::map<FragmentId, FragmentBox>& boxes() const { return m_boxes; }
    const LayoutConfig& config() const { return m_config; }

private:
    LayoutConfig m_config;
    int m_imageWidth = 0;
    int m_imageHeight = 0;
    std::map<FragmentId, FragmentBox> m_boxes;
};

} // namespace tessera
