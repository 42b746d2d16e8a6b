#include "backup_api.hpp"
#include <iostream>
#include <optional>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " {backup|restore} -c <config.json> [--path <file|directory/>] [-v|-q]" << std::endl;
}

}

int main(int argc, char* argv[]) {
    std::string command;
    std::string configFile;
    std::string path;
    std::optional<bool> verbose;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--configuration") && i + 1 < argc) {
            configFile = argv[++i];
        } else if ((arg == "-p" || arg == "--path") && i + 1 < argc) {
            path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            if (verbose && !*verbose) {
                std::cerr << "Error: --verbose and --quiet are mutually exclusive" << std::endl;
                return 1;
            }
            verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            if (verbose && *verbose) {
                std::cerr << "Error: --verbose and --quiet are mutually exclusive" << std::endl;
                return 1;
            }
            verbose = false;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if ((command != "backup" && command != "restore") || configFile.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    auto result = command == "backup"
        ? BackupAPI::startBackup(configFile, path, verbose)
        : BackupAPI::startRestore(configFile, path, verbose);
    if (!result) {
        std::cerr << "Error: " << result.error() << std::endl;
        return 1;
    }
    return 0;
}
