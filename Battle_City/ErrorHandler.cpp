#include "ErrorHandler.h"

#include <cstdlib>
#include <iostream>

bool ErrorHandler::verbose_ = false;

void ErrorHandler::setVerbose(bool verbose) {
    verbose_ = verbose;
}

bool ErrorHandler::isVerbose() {
    return verbose_;
}

void ErrorHandler::logInfo(const std::string& message) {
    std::cout << "[INFO] " << message << std::endl;
}

void ErrorHandler::logDebug(const std::string& message) {
    if (!verbose_) {
        return;
    }
    std::cout << "[DEBUG] " << message << std::endl;
}

void ErrorHandler::logWarning(const std::string& message) {
    std::cerr << "[WARNING] " << message << std::endl;
}

void ErrorHandler::logError(const std::string& message) {
    std::cerr << "[ERROR] " << message << std::endl;
}

void ErrorHandler::handleAssetLoadFailure(const std::string& assetKind, const std::string& path) {
    std::cerr << "\n========================================" << std::endl;
    std::cerr << "[CRITICAL ERROR] " << assetKind << " Loading Failed" << std::endl;
    std::cerr << "========================================" << std::endl;
    std::cerr << "Could not load: " << path << std::endl;
    std::cerr << "\nPossible causes:" << std::endl;
    std::cerr << "  - The game was started outside the directory holding its assets" << std::endl;
    std::cerr << "  - The file is missing or not a supported format" << std::endl;
    std::cerr << "\nAction required:" << std::endl;
    std::cerr << "  - Run the game from the project root" << std::endl;
    std::cerr << "========================================\n" << std::endl;

    // Exit with error code
    std::exit(1);
}
