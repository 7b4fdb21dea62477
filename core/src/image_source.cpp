// Tessera - Image Source Switch

#include <tessera/image_source.h>
#include <tessera/errors.h>

#include <iostream>

namespace tessera {

const char* imageSourceName(ImageSource source) {
    switch (source) {
        case ImageSource::Image1: return "image1";
        case ImageSource::Image2: return "image2";
        case ImageSource::Image3: return "image3";
    }
    return "unknown";
}

std::optional<ImageSource> parseImageSource(const std::string& name) {
    for (int i = 0; i < IMAGE_SOURCE_COUNT; i++) {
        ImageSource source = static_cast<ImageSource>(i);
        if (name == imageSourceName(source)) {
            return source;
        }
    }
    return std::nullopt;
}

ImageSourceSwitch::ImageSourceSwitch(RefinementEngine& engine)
    : m_engine(engine) {}

void ImageSourceSwitch::addSource(ImageSource id, PixelBufferPtr buffer) {
    m_sources[id] = std::move(buffer);
}

bool ImageSourceSwitch::hasSource(ImageSource id) const {
    auto it = m_sources.find(id);
    return it != m_sources.end() && it->second != nullptr;
}

void ImageSourceSwitch::selectSource(ImageSource id) {
    auto it = m_sources.find(id);
    if (it == m_sources.end() || !it->second) {
        throw UnknownSourceError(std::string("No image registered for source '") +
                                 imageSourceName(id) + "'");
    }

    m_engine.reset(it->second);
    m_current = id;
    m_generation++;

    std::cout << "[ImageSource] Switched to " << imageSourceName(id) << " ("
              << it->second->width() << "x" << it->second->height() << ")" << std::endl;
}

void ImageSourceSwitch::selectSource(PixelBufferPtr buffer) {
    m_engine.reset(std::move(buffer));
    m_current = std::nullopt;
    m_generation++;
}

} // namespace tessera
