// Tessera CLI Commands
// Handles: tessera run, tessera stats, tessera config, tessera --help, tessera --version

#include "cli.h"

#include <tessera/tessera.h>
#include <tessera/config.h>
#include <tessera/io/image_loader.h>
#include <tessera/io/fragment_writer.h>
#include <CLI/CLI.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <set>

using json = nlohmann::json;

namespace tessera::cli {

void printUsage() {
    std::cout << "Tessera - Progressive flat-color image decomposition\n\n";
    std::cout << "Usage:\n";
    std::cout << "  tessera run [options]             Decompose a source image step by step\n";
    std::cout << "  tessera stats <image> [options]   Print mean color and score of a region\n";
    std::cout << "  tessera config [-c file]          Print the effective configuration\n";
    std::cout << "  tessera --help                    Show this help\n";
    std::cout << "  tessera --version                 Show version\n";
}

// "image2=photos/cat.png" -> config.images[Image2]
static void applyImageOverride(Config& config, const std::string& assignment) {
    size_t eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == assignment.size()) {
        throw ConfigError("Image override must look like name=path, got '" + assignment + "'");
    }
    std::string name = assignment.substr(0, eq);
    auto source = parseImageSource(name);
    if (!source) {
        throw ConfigError("Unknown image source '" + name + "'");
    }
    config.images[*source] = assignment.substr(eq + 1);
}

static ImageSource requireSource(const std::string& name) {
    auto source = parseImageSource(name);
    if (!source) {
        throw ConfigError("Unknown image source '" + name + "'");
    }
    return *source;
}

static PixelBufferPtr loadSourceImage(const Config& config, ImageSource id) {
    auto it = config.images.find(id);
    if (it == config.images.end()) {
        throw UnknownSourceError(std::string("No image path configured for ") + imageSourceName(id));
    }

    io::ImageData image = io::loadImage(it->second);
    if (!image.valid()) {
        throw InvalidBufferError("Could not load " + std::string(imageSourceName(id)) +
                                 " from " + it->second);
    }
    std::cout << "Loaded " << imageSourceName(id) << ": " << it->second
              << " (" << image.width << "x" << image.height << ")" << std::endl;
    return std::make_shared<const PixelBuffer>(io::toPixelBuffer(image));
}

int runRefinement(const RunOptions& options) {
    Config config = options.configPath.empty() ? Config{} : loadConfig(options.configPath);
    for (const auto& assignment : options.images) {
        applyImageOverride(config, assignment);
    }
    if (!options.source.empty()) {
        config.source = requireSource(options.source);
    }
    if (options.maxFragments > 0) {
        config.maxFragments = options.maxFragments;
    }

    std::optional<ImageSource> switchTarget;
    if (!options.switchTo.empty()) {
        switchTarget = requireSource(options.switchTo);
    }

    RefinementEngine engine(config.engineConfig());
    ImageSourceSwitch sources(engine);

    std::set<ImageSource> needed = {config.source};
    if (switchTarget) needed.insert(*switchTarget);
    for (ImageSource id : needed) {
        sources.addSource(id, loadSourceImage(config, id));
    }

    std::ofstream deltas;
    if (!options.deltasPath.empty()) {
        deltas.open(options.deltasPath);
        if (!deltas) {
            std::cerr << "Error: Cannot write deltas to " << options.deltasPath << std::endl;
            return 1;
        }
    }

    FragmentLayout layout(config.layout);
    ProgressiveDriver driver(engine, config.ticksPerStep);
    size_t stepIndex = 0;
    driver.onStep([&](const StepResult& result) {
        layout.applyStep(result);
        stepIndex++;
        if (deltas.is_open()) {
            io::writeStepLine(deltas, result, stepIndex);
        }
    });

    auto runPass = [&](ImageSource id) {
        driver.pause();
        sources.selectSource(id);
        layout.applyReset(engine);
        if (deltas.is_open()) {
            io::writeResetLine(deltas, engine, imageSourceName(id));
        }
        driver.restart();
        driver.resume();

        size_t steps = 0;
        if (options.ticks > 0) {
            for (int t = 0; t < options.ticks; t++) {
                if (driver.tick()) steps++;
            }
        } else {
            steps = driver.runToCompletion(static_cast<size_t>(options.steps));
        }

        std::cout << imageSourceName(id) << ": " << steps << " steps, "
                  << engine.fragmentCount() << "/" << engine.maxFragments() << " fragments"
                  << (engine.isSaturated() ? " (saturated)" : "") << std::endl;
    };

    runPass(config.source);
    if (switchTarget) {
        runPass(*switchTarget);
    }

    if (layout.size() != engine.fragmentCount()) {
        std::cerr << "Warning: layout holds " << layout.size() << " boxes for "
                  << engine.fragmentCount() << " fragments" << std::endl;
    }

    if (!options.snapshotPath.empty()) {
        if (!io::writeSnapshot(options.snapshotPath, engine)) {
            return 1;
        }
        std::cout << "Snapshot written to " << options.snapshotPath << std::endl;
    }
    return 0;
}

int printRegionStats(const std::string& imagePath, const std::vector<double>& region) {
    io::ImageData image = io::loadImage(imagePath);
    if (!image.valid()) {
        return 1;
    }
    PixelBuffer buffer = io::toPixelBuffer(image);

    Region r = Region::full(buffer.width(), buffer.height());
    if (!region.empty()) {
        if (region.size() != 4) {
            std::cerr << "Error: --region expects left,top,right,bottom\n";
            return 1;
        }
        r = Region{region[0], region[1], region[2], region[3]};
    }

    RegionStats stats = computeStats(buffer, r);
    json out = {
        {"region", {r.left, r.top, r.right, r.bottom}},
        {"pixels", stats.pixelCount},
        {"color", {stats.avgColor.r, stats.avgColor.g, stats.avgColor.b}},
        {"score", stats.score},
    };
    std::cout << out.dump(2) << std::endl;
    return 0;
}

int printConfig(const std::string& configPath) {
    Config config = configPath.empty() ? Config{} : loadConfig(configPath);
    std::cout << toJson(config).dump(2) << std::endl;
    return 0;
}

int handleCommand(int argc, char** argv) {
    CLI::App app{"Tessera - Progressive flat-color image decomposition"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");
    app.require_subcommand(0, 1);

    // 'run' subcommand
    RunOptions run;
    auto* runCmd = app.add_subcommand("run", "Decompose a source image step by step");
    runCmd->add_option("-c,--config", run.configPath, "JSON configuration file");
    runCmd->add_option("-s,--source", run.source, "Source to decompose: image1, image2, image3");
    runCmd->add_option("-i,--image", run.images, "Image path override, e.g. image1=photo.jpg");
    runCmd->add_option("-m,--max-fragments", run.maxFragments, "Maximum active fragments")
          ->check(CLI::PositiveNumber);
    runCmd->add_option("-n,--steps", run.steps, "Steps per pass (default: until saturated)")
          ->check(CLI::NonNegativeNumber);
    runCmd->add_option("-t,--ticks", run.ticks, "Simulate this many frames instead of stepping eagerly")
          ->check(CLI::NonNegativeNumber);
    runCmd->add_option("-o,--output", run.snapshotPath, "Write final fragment snapshot (JSON)");
    runCmd->add_option("-d,--deltas", run.deltasPath, "Write every reset and step delta (JSON Lines)");
    runCmd->add_option("--switch-to", run.switchTo, "Switch to this source after the first pass");

    // 'stats' subcommand
    std::string statsImage;
    std::vector<double> statsRegion;
    auto* statsCmd = app.add_subcommand("stats", "Print mean color and score of a region");
    statsCmd->add_option("image", statsImage, "Image file")->required();
    statsCmd->add_option("-r,--region", statsRegion, "left,top,right,bottom (default: whole image)")
            ->delimiter(',');

    // 'config' subcommand
    std::string configPath;
    auto* configCmd = app.add_subcommand("config", "Print the effective configuration");
    configCmd->add_option("-c,--config", configPath, "JSON configuration file");

    if (argc < 2) {
        printUsage();
        return 0;
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    try {
        if (runCmd->parsed()) {
            return runRefinement(run);
        }
        if (statsCmd->parsed()) {
            return printRegionStats(statsImage, statsRegion);
        }
        if (configCmd->parsed()) {
            return printConfig(configPath);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    printUsage();
    return 0;
}

} // namespace tessera::cli
