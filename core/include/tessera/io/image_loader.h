#pragma once

/**
 * @file image_loader.h
 * @brief Decoding source images from disk into pixel buffers
 *
 * Relative paths are tried against the working directory first, then against
 * each search directory in order. Load failures are logged with a
 * `tessera-io:` prefix and reported as an invalid ImageData.
 */

#include <tessera/pixel_buffer.h>
#include <cstdint>
#include <string>
#include <vector>

namespace tessera::io {

/// Decoded 8-bit image, always four channels per pixel
struct ImageData {
    std::vector<uint8_t> rgba;
    int width = 0;
    int height = 0;

    bool valid() const {
        return width > 0 && height > 0 &&
               rgba.size() == static_cast<size_t>(width) * height * 4;
    }
};

/// Directories searched for relative image paths: images/, assets/images/, assets/
const std::vector<std::string>& defaultImageDirs();

/**
 * @brief Locate an image file
 * @return Absolute path of the first existing regular file, or empty string
 */
std::string resolvePath(const std::string& path, const std::vector<std::string>& searchDirs);

/// Load a PNG, JPG, BMP, TGA or PNM file. Returns an invalid ImageData on failure.
ImageData loadImage(const std::string& path,
                    const std::vector<std::string>& searchDirs = defaultImageDirs());

/**
 * @brief Convert decoded bytes into a normalized RGB buffer (alpha is dropped)
 * @throw InvalidBufferError if image is not valid
 */
PixelBuffer toPixelBuffer(const ImageData& image);

} // namespace tessera::io
