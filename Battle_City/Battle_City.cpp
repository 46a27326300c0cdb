#include "Constants.h"
#include "ErrorHandler.h"
#include "Game.h"
#include "KeyboardInput.h"
#include "LevelConfig.h"
#include "Renderer.h"
#include "TextureAtlas.h"

#include <SFML/Graphics.hpp>

#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <string>

namespace {

struct CommandLine {
    bool verbose = false;
    bool hasSeed = false;
    unsigned int seed = 0;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--verbose] [--seed <n>]" << std::endl;
}

// Returns false on unknown or malformed arguments
bool parseCommandLine(int argc, char* argv[], CommandLine& options) {
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--seed" && i + 1 < argc) {
            try {
                options.seed = static_cast<unsigned int>(std::stoul(argv[++i]));
                options.hasSeed = true;
            } catch (const std::exception& e) {
                ErrorHandler::logError("Invalid seed '" + std::string(argv[i]) + "': " + e.what());
                return false;
            }
        } else {
            ErrorHandler::logError("Unknown argument: " + arg);
            return false;
        }
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    CommandLine options;
    if (!parseCommandLine(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }
    ErrorHandler::setVerbose(options.verbose);

    const unsigned int seed = options.hasSeed ? options.seed : static_cast<unsigned int>(std::time(nullptr));
    ErrorHandler::logInfo("Starting Battle City, seed " + std::to_string(seed));

    sf::RenderWindow window(sf::VideoMode(WINDOW_WIDTH, WINDOW_HEIGHT), WINDOW_TITLE,
                            sf::Style::Titlebar | sf::Style::Close);
    window.setFramerateLimit(FPS);

    TextureAtlas atlas;
    if (!atlas.loadFromFile(TEXTURE_ATLAS_PATH)) {
        ErrorHandler::handleAssetLoadFailure("texture atlas", TEXTURE_ATLAS_PATH);
    }

    sf::Font font;
    if (!font.loadFromFile(FONT_PATH)) {
        ErrorHandler::handleAssetLoadFailure("font", FONT_PATH);
    }

    Game game(LevelConfig(), seed);
    KeyboardInput keyboard;
    Renderer renderer(window, atlas, font);

    while (window.isOpen()) {
        sf::Event event;
        while (window.pollEvent(event)) {
            keyboard.handleEvent(event);
        }

        // Fixed timestep: one logical update per rendered frame
        game.update(FRAME_TIME, keyboard.collect(window.hasFocus()));

        if (game.isFinished()) {
            window.close();
            break;
        }

        renderer.render(game);
    }

    ErrorHandler::logInfo("Exiting Battle City");
    return 0;
}
