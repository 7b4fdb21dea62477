// Tessera - Entry Point
// Parses command-line arguments and runs the selected command

#include "cli.h"

int main(int argc, char** argv) {
    return tessera::cli::handleCommand(argc, argv);
}
