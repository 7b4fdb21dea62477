#pragma once

/**
 * @file config.h
 * @brief Application configuration loaded from JSON
 *
 * @par Example file
 * @code
 * {
 *   "maxFragments": 2000,
 *   "ticksPerStep": 2,
 *   "source": "image1",
 *   "images": { "image1": "images/image1.jpg" },
 *   "layout": { "extent": 2.0, "gap": 0.002, "depthScale": 0.1 }
 * }
 * @endcode
 *
 * Every key is optional. Unknown keys are ignored.
 */

#include <tessera/fragment_layout.h>
#include <tessera/image_source.h>
#include <nlohmann/json.hpp>
#include <map>
#include <string>

namespace tessera {

struct Config {
    int maxFragments = 2000;
    int ticksPerStep = 2;
    ImageSource source = ImageSource::Image1;
    std::map<ImageSource, std::string> images = {
        {ImageSource::Image1, "images/image1.jpg"},
        {ImageSource::Image2, "images/image2.jpg"},
        {ImageSource::Image3, "images/image3.jpg"},
    };
    LayoutConfig layout;

    EngineConfig engineConfig() const {
        EngineConfig ec;
        ec.maxFragments = static_cast<size_t>(maxFragments);
        return ec;
    }
};

/**
 * @brief Build a Config from parsed JSON, starting from defaults
 * @throw ConfigError on wrong types or out-of-range values
 */
Config configFromJson(const nlohmann::json& j);

/// @brief Serialize every field, including defaults
nlohmann::json toJson(const Config& config);

/**
 * @brief Read and parse a configuration file
 * @throw ConfigError if the file cannot be read or parsed
 */
Config loadConfig(const std::string& path);

} // namespace tessera
