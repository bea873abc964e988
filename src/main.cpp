#include "cli.hpp"
#include "storage.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

struct Config {
    std::string              dataDir = ".";
    bool                     verbose = false;
    std::vector<std::string> commandArgs;
};

// Global options come before the command word; everything from the command
// word on is handed to the command parser untouched.
static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    if (const char* envDir = std::getenv("STOCK_CONTROL_DATA_DIR")) {
        if (*envDir != '\0') {
            cfg.dataDir = envDir;
        }
    }

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--data-dir") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--data-dir requires a value");
            }
            cfg.dataDir = argv[++i];
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else {
            break;
        }
    }

    cfg.commandArgs.assign(argv + i, argv + argc);
    return cfg;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.verbose) {
            std::cerr << "[stock_control] Data directory: " << cfg.dataDir << "\n";
        }

        stock_control::JsonFileStorage storage(cfg.dataDir, cfg.verbose);
        return stock_control::runCommand(cfg.commandArgs, storage, cfg.verbose,
                                         std::cout, std::cerr);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
