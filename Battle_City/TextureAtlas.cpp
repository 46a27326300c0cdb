#include "TextureAtlas.h"

#include "Constants.h"
#include "ErrorHandler.h"

TextureAtlas::TextureAtlas() {
    // Tanks: four facings, two animation frames each
    const char* facings[] = {"up", "right", "down", "left"};
    for (int i = 0; i < 4; i++) {
        const std::string facing = facings[i];
        addSprite("player_tank_" + facing + "_1", 40 + i * 2, 0, 2, 2);
        addSprite("player_tank_" + facing + "_2", 40 + i * 2, 2, 2, 2);
        addSprite("enemy_tank_" + facing + "_1", 8 + i * 2, 0, 2, 2);
        addSprite("enemy_tank_" + facing + "_2", 8 + i * 2, 2, 2, 2);
    }

    // Terrain
    addSprite("brick", 58, 0, 1, 1);
    addSprite("steel", 58, 2, 1, 1);
    addSprite("bush", 58, 4, 1, 1);
    addSprite("ice", 58, 6, 1, 1);
    addSprite("water_1", 58, 10, 1, 1);
    addSprite("water_2", 58, 11, 1, 1);
    addSprite("base", 59, 0, 2, 2);
    addSprite("base_destroyed", 59, 2, 2, 2);
}

bool TextureAtlas::loadFromFile(const std::string& path) {
    loaded_ = texture_.loadFromFile(path);
    if (loaded_) {
        ErrorHandler::logInfo("Loaded sprite sheet " + path + " (" +
                              std::to_string(texture_.getSize().x) + "x" +
                              std::to_string(texture_.getSize().y) + ")");
    }
    return loaded_;
}

bool TextureAtlas::hasSprite(const std::string& name) const {
    return rects_.count(name) > 0;
}

sf::IntRect TextureAtlas::sourceRect(const std::string& name) const {
    auto it = rects_.find(name);
    if (it != rects_.end()) {
        return it->second;
    }

    if (reportedMissing_.insert(name).second) {
        ErrorHandler::logWarning("Sprite '" + name + "' not found in atlas, drawing fallback");
    }
    return sf::IntRect();
}

void TextureAtlas::addSprite(const std::string& name, int cellX, int cellY, int cellsWide, int cellsHigh) {
    rects_[name] = sf::IntRect(cellX * SOURCE_TILE_SIZE, cellY * SOURCE_TILE_SIZE,
                               cellsWide * SOURCE_TILE_SIZE, cellsHigh * SOURCE_TILE_SIZE);
}
