#pragma once

/**
 * @file image_source.h
 * @brief Named source images and whole-decomposition switching
 *
 * The switch owns one decoded PixelBuffer per source identifier. Selecting a
 * source resets the engine against that buffer in a single operation: the
 * fragment set is either entirely the old one or entirely the new root.
 */

#include <tessera/pixel_buffer.h>
#include <tessera/refinement_engine.h>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace tessera {

enum class ImageSource {
    Image1 = 0,
    Image2,
    Image3
};

constexpr int IMAGE_SOURCE_COUNT = 3;

/// @brief Lowercase name used in config files and on the command line
const char* imageSourceName(ImageSource source);

/// @brief Parse "image1".."image3"; std::nullopt for anything else
std::optional<ImageSource> parseImageSource(const std::string& name);

class ImageSourceSwitch {
public:
    explicit ImageSourceSwitch(RefinementEngine& engine);

    /**
     * @brief Register (or replace) the buffer for a source
     *
     * Replacing the buffer of the current source does not reset the engine;
     * call selectSource() to apply it.
     */
    void addSource(ImageSource id, PixelBufferPtr buffer);

    bool hasSource(ImageSource id) const;

    /**
     * @brief Reset the engine against a registered source
     * @throw UnknownSourceError if no buffer is registered for id
     * @throw InvalidBufferError if the buffer is empty
     */
    void selectSource(ImageSource id);

    /**
     * @brief Reset the engine against an unregistered buffer
     *
     * current() becomes std::nullopt.
     */
    void selectSource(PixelBufferPtr buffer);

    /// @brief Source selected last, if it was selected by id
    std::optional<ImageSource> current() const { return m_current; }

    /// @brief Incremented on every successful switch
    uint64_t generation() const { return m_generation; }

    RefinementEngine& engine() { return m_engine; }
    const RefinementEngine& engine() const { return m_engine; }

private:
    RefinementEngine& m_engine;
    std::map<ImageSource, PixelBufferPtr> m_sources;
    std::optional<ImageSource> m_current;
    uint64_t m_generation = 0;
};

} // namespace tessera
