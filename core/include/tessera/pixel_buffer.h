#pragma once

/**
 * @file pixel_buffer.h
 * @brief Immutable grid of normalized RGB samples
 *
 * A PixelBuffer is created once per decoded source image and shared
 * read-only between the engine, the source switch and any worker that
 * computes region statistics.
 */

#include <tessera/color.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace tessera {

class PixelBuffer {
public:
    /// @brief Empty buffer (0 x 0). Rejected by RefinementEngine::reset().
    PixelBuffer() = default;

    /**
     * @brief Construct from interleaved normalized RGB samples
     * @param width Width in pixels
     * @param height Height in pixels
     * @param rgb width * height * 3 floats in 0-1 range, row-major
     * @throw InvalidBufferError if dimensions are negative or the sample
     *        count does not match
     */
    PixelBuffer(int width, int height, std::vector<float> rgb);

    /**
     * @brief Build from 8-bit interleaved data
     * @param data width * height * channels bytes, row-major
     * @param channels 3 (RGB) or 4 (RGBA, alpha ignored)
     */
    static PixelBuffer fromBytes(const uint8_t* data, int width, int height, int channels);

    /// @brief Buffer filled with one color
    static PixelBuffer filled(int width, int height, const Color& color);

    int width() const { return m_width; }
    int height() const { return m_height; }
    bool empty() const { return m_width <= 0 || m_height <= 0; }
    double area() const { return static_cast<double>(m_width) * m_height; }

    /// @brief Channel c (0=R, 1=G, 2=B) of pixel (x, y). No bounds check.
    float channel(int x, int y, int c) const {
        return m_rgb[(static_cast<size_t>(y) * m_width + x) * 3 + c];
    }

    Color at(int x, int y) const {
        const float* p = &m_rgb[(static_cast<size_t>(y) * m_width + x) * 3];
        return Color(p[0], p[1], p[2]);
    }

    const std::vector<float>& samples() const { return m_rgb; }

private:
    int m_width = 0;
    int m_height = 0;
    std::vector<float> m_rgb;
};

using PixelBufferPtr = std::shared_ptr<const PixelBuffer>;

} // namespace tessera
