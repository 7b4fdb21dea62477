// Tessera CLI Commands
// Handles: tessera run, tessera stats, tessera config, --help, --version

#pragma once

#include <string>
#include <vector>

namespace tessera::cli {

// Options for 'tessera run', filled from command-line arguments
struct RunOptions {
    std::string configPath;
    std::string source;                   // empty = use config
    std::vector<std::string> images;      // "name=path" overrides
    int maxFragments = 0;                 // 0 = use config
    int steps = 0;                        // 0 = until saturated
    int ticks = 0;                        // >0 = paced by frame ticks instead of eager steps
    std::string snapshotPath;
    std::string deltasPath;
    std::string switchTo;                 // source to switch to after the first pass
};

// Parse arguments and run the selected subcommand
// Returns process exit code
int handleCommand(int argc, char** argv);

int runRefinement(const RunOptions& options);

// Print mean color and score of a region (whole image if region is empty)
int printRegionStats(const std::string& imagePath, const std::vector<double>& region);

int printConfig(const std::string& configPath);

void printUsage();

} // namespace tessera::cli
