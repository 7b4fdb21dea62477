// Tessera I/O - Source image decoding

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#include <tessera/io/image_loader.h>
#include <tessera/errors.h>
#include <filesystem>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

namespace tessera::io {

namespace {

struct StbiFree {
    void operator()(stbi_uc* data) const { stbi_image_free(data); }
};

using StbiPixels = std::unique_ptr<stbi_uc, StbiFree>;

bool isImageFile(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

} // namespace

const std::vector<std::string>& defaultImageDirs() {
    static const std::vector<std::string> dirs = {"images", "assets/images", "assets"};
    return dirs;
}

std::string resolvePath(const std::string& path, const std::vector<std::string>& searchDirs) {
    if (path.empty()) {
        return "";
    }

    const fs::path requested(path);
    if (isImageFile(requested)) {
        return fs::absolute(requested).string();
    }
    if (requested.is_absolute()) {
        return "";
    }

    for (const auto& dir : searchDirs) {
        fs::path candidate = fs::path(dir) / requested;
        if (isImageFile(candidate)) {
            return fs::absolute(candidate).string();
        }
    }
    return "";
}

ImageData loadImage(const std::string& path, const std::vector<std::string>& searchDirs) {
    ImageData image;

    const std::string resolved = resolvePath(path, searchDirs);
    if (resolved.empty()) {
        std::cerr << "tessera-io: Image not found: " << path << std::endl;
        return image;
    }

    int width = 0;
    int height = 0;
    int fileChannels = 0;
    StbiPixels pixels(stbi_load(resolved.c_str(), &width, &height, &fileChannels, STBI_rgb_alpha));
    if (!pixels) {
        std::cerr << "tessera-io: Cannot decode " << resolved << ": "
                  << stbi_failure_reason() << std::endl;
        return image;
    }

    const size_t bytes = static_cast<size_t>(width) * height * 4;
    image.rgba.assign(pixels.get(), pixels.get() + bytes);
    image.width = width;
    image.height = height;
    return image;
}

PixelBuffer toPixelBuffer(const ImageData& image) {
    if (!image.valid()) {
        throw InvalidBufferError("toPixelBuffer: image has no pixels (" +
                                 std::to_string(image.width) + "x" +
                                 std::to_string(image.height) + ")");
    }
    return PixelBuffer::fromBytes(image.rgba.data(), image.width, image.height, 4);
}

} // namespace tessera::io
