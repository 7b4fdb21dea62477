// Tessera - Pixel Buffer Implementation

#include <tessera/pixel_buffer.h>
#include <tessera/errors.h>

#include <string>

namespace tessera {

PixelBuffer::PixelBuffer(int width, int height, std::vector<float> rgb)
    : m_width(width), m_height(height), m_rgb(std::move(rgb)) {
    if (width < 0 || height < 0) {
        throw InvalidBufferError("PixelBuffer: negative dimensions " +
                                 std::to_string(width) + "x" + std::to_string(height));
    }
    size_t expected = static_cast<size_t>(width) * height * 3;
    if (m_rgb.size() != expected) {
        throw InvalidBufferError("PixelBuffer: expected " + std::to_string(expected) +
                                 " samples, got " + std::to_string(m_rgb.size()));
    }
}

PixelBuffer PixelBuffer::fromBytes(const uint8_t* data, int width, int height, int channels) {
    if (channels != 3 && channels != 4) {
        throw InvalidBufferError("PixelBuffer: unsupported channel count " +
                                 std::to_string(channels));
    }
    if (width < 0 || height < 0) {
        throw InvalidBufferError("PixelBuffer: negative dimensions");
    }

    size_t count = static_cast<size_t>(width) * height;
    if (count > 0 && !data) {
        throw InvalidBufferError("PixelBuffer: null pixel data");
    }

    std::vector<float> rgb(count * 3);
    for (size_t i = 0; i < count; i++) {
        const uint8_t* p = data + i * channels;
        rgb[i * 3 + 0] = p[0] / 255.0f;
        rgb[i * 3 + 1] = p[1] / 255.0f;
        rgb[i * 3 + 2] = p[2] / 255.0f;
    }
    return PixelBuffer(width, height, std::move(rgb));
}

PixelBuffer PixelBuffer::filled(int width, int height, const Color& color) {
    if (width < 0 || height < 0) {
        throw InvalidBufferError("PixelBuffer: negative dimensions");
    }
    size_t count = static_cast<size_t>(width) * height;
    std::vector<float> rgb(count * 3);
    for (size_t i = 0; i < count; i++) {
        rgb[i * 3 + 0] = color.r;
        rgb[i * 3 + 1] = color.g;
        rgb[i * 3 + 2] = color.b;
    }
    return PixelBuffer(width, height, std::move(rgb));
}

} // namespace tessera
