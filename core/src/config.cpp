// Tessera - Configuration

#include <tessera/config.h>
#include <tessera/errors.h>

#include <fstream>

using json = nlohmann::json;

namespace tessera {

static ImageSource sourceFromName(const std::string& name) {
    auto source = parseImageSource(name);
    if (!source) {
        throw ConfigError("Unknown image source '" + name + "'");
    }
    return *source;
}

Config configFromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    Config config;
    try {
        config.maxFragments = j.value("maxFragments", config.maxFragments);
        config.ticksPerStep = j.value("ticksPerStep", config.ticksPerStep);

        if (j.contains("source")) {
            config.source = sourceFromName(j.at("source").get<std::string>());
        }

        if (j.contains("images")) {
            const json& images = j.at("images");
            if (!images.is_object()) {
                throw ConfigError("'images' must map source names to paths");
            }
            for (const auto& [name, path] : images.items()) {
                config.images[sourceFromName(name)] = path.get<std::string>();
            }
        }

        if (j.contains("layout")) {
            const json& layout = j.at("layout");
            config.layout.extent = layout.value("extent", config.layout.extent);
            config.layout.gap = layout.value("gap", config.layout.gap);
            config.layout.depthScale = layout.value("depthScale", config.layout.depthScale);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    if (config.maxFragments < 1) {
        throw ConfigError("maxFragments must be at least 1");
    }
    if (config.ticksPerStep < 1) {
        throw ConfigError("ticksPerStep must be at least 1");
    }
    if (config.layout.extent <= 0.0f) {
        throw ConfigError("layout.extent must be positive");
    }
    return config;
}

json toJson(const Config& config) {
    json j;
    j["maxFragments"] = config.maxFragments;
    j["ticksPerStep"] = config.ticksPerStep;
    j["source"] = imageSourceName(config.source);

    json images = json::object();
    for (const auto& [id, path] : config.images) {
        images[imageSourceName(id)] = path;
    }
    j["images"] = images;

    j["layout"] = {
        {"extent", config.layout.extent},
        {"gap", config.layout.gap},
        {"depthScale", config.layout.depthScale},
    };
    return j;
}

Config loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw ConfigError("Failed to parse " + path + ": " + e.what());
    }
    return configFromJson(j);
}

} // namespace tessera
