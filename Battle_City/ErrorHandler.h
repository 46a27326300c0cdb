#pragma once

#include <string>

// ========================
// Error Handling and Logging Functions
// ========================

class ErrorHandler {
public:
    // Enable or disable [DEBUG] output
    static void setVerbose(bool verbose);
    static bool isVerbose();

    // Log general info
    static void logInfo(const std::string& message);

    // Log detailed trace output (collision pairs, spawn attempts), only in verbose mode
    static void logDebug(const std::string& message);

    // Log warnings
    static void logWarning(const std::string& message);

    // Log recoverable errors
    static void logError(const std::string& message);

    // Handle a startup asset that could not be loaded (texture atlas, font).
    // Prints a diagnostic banner and exits with status 1.
    [[noreturn]] static void handleAssetLoadFailure(const std::string& assetKind, const std::string& path);

private:
    static bool verbose_;
};
