// File: src/cli/main.cpp
//
// careledger_cli [--config file.yaml] [--db path]

#include "cli/careledger_cli.hpp"
#include "core/logging.hpp"
#include <cstring>
#include <iostream>

using namespace careledger;

static void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config file.yaml] [--db path]\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string db_path;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0) {
            PrintUsage(argv[0]);
            return 0;
        } else {
            PrintUsage(argv[0]);
            return 2;
        }
    }

    CliConfig config = CliConfig::Default();
    if (!config_path.empty()) {
        auto loaded = CliConfig::LoadFromFile(config_path);
        if (!loaded) {
            std::cerr << "Could not load configuration from " << config_path << "\n";
            return 1;
        }
        config = *loaded;
    }
    if (!db_path.empty()) {
        config.storage.db_path = db_path;
    }

    if (!ConfigureLogging(config.logging.level, config.logging.pattern)) {
        std::cerr << "Unknown log level '" << config.logging.level << "', keeping default\n";
    }

    try {
        CareLedgerCli cli(config);
        cli.Run(std::cin);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
