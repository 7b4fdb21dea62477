#pragma once

/**
 * @file color.h
 * @brief RGB color in normalized 0-1 range
 *
 * Colors produced by the engine are averages of normalized pixel samples.
 * Color converts to glm::vec3 so layout code can feed it straight into
 * vector math.
 *
 * @par Example
 * @code
 * Color c = Color::fromBytes(255, 127, 80);
 * glm::vec3 linear = c.toLinear();
 * @endcode
 */

#include <glm/glm.hpp>
#include <cmath>
#include <cstdint>

namespace tessera {

class Color {
public:
    float r, g, b;

    /// @brief Default constructor (black)
    constexpr Color() : r(0.0f), g(0.0f), b(0.0f) {}

    constexpr Color(float r, float g, float b) : r(r), g(g), b(b) {}

    /// @brief Construct from glm::vec3
    constexpr Color(const glm::vec3& v) : r(v.r), g(v.g), b(v.b) {}

    constexpr operator glm::vec3() const {
        return glm::vec3(r, g, b);
    }

    /**
     * @brief Create color from 0-255 byte values
     * @param r Red (0-255)
     * @param g Green (0-255)
     * @param b Blue (0-255)
     */
    static constexpr Color fromBytes(uint8_t r, uint8_t g, uint8_t b) {
        return Color(r / 255.0f, g / 255.0f, b / 255.0f);
    }

    /// @brief Unweighted mean of the three channels
    constexpr float mean() const {
        return (r + g + b) / 3.0f;
    }

    /**
     * @brief Convert from sRGB encoding to linear light
     *
     * Average colors are computed on encoded sample values; renderers that
     * light in linear space convert them here.
     */
    Color toLinear() const {
        return Color(srgbToLinear(r), srgbToLinear(g), srgbToLinear(b));
    }

    constexpr bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b;
    }

    constexpr bool operator!=(const Color& o) const {
        return !(*this == o);
    }

    static float srgbToLinear(float c) {
        return (c < 0.04045f) ? c * 0.0773993808f
                              : std::pow(c * 0.9478672986f + 0.0521327014f, 2.4f);
    }

    static constexpr Color black() { return Color(0.0f, 0.0f, 0.0f); }
    static constexpr Color white() { return Color(1.0f, 1.0f, 1.0f); }
};

} // namespace tessera
