#include "GameMap.h"

#include "ErrorHandler.h"

#include <stdexcept>

GameMap::GameMap(int width, int height, float tileSize)
    : width_(width), height_(height), tileSize_(tileSize) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Map dimensions must be positive.");
    }
    if (tileSize <= 0.0f) {
        throw std::invalid_argument("Tile size must be positive.");
    }

    grid_.resize(width_);
    for (int x = 0; x < width_; x++) {
        grid_[x].reserve(height_);
        for (int y = 0; y < height_; y++) {
            grid_[x].emplace_back(TileType::Empty, x, y, tileSize_);
        }
    }
}

Tile* GameMap::tileAt(int gridX, int gridY) {
    if (gridX < 0 || gridX >= width_ || gridY < 0 || gridY >= height_) {
        return nullptr;
    }
    return &grid_[gridX][gridY];
}

const Tile* GameMap::tileAt(int gridX, int gridY) const {
    if (gridX < 0 || gridX >= width_ || gridY < 0 || gridY >= height_) {
        return nullptr;
    }
    return &grid_[gridX][gridY];
}

std::vector<Tile*> GameMap::tilesByType(const std::set<TileType>& types) {
    std::vector<Tile*> result;
    for (int y = 0; y < height_; y++) {
        for (int x = 0; x < width_; x++) {
            if (types.count(grid_[x][y].type)) {
                result.push_back(&grid_[x][y]);
            }
        }
    }
    return result;
}

std::vector<sf::FloatRect> GameMap::collidableTiles() const {
    std::vector<sf::FloatRect> result;
    for (int y = 0; y < height_; y++) {
        for (int x = 0; x < width_; x++) {
            if (blocksTanks(grid_[x][y].type)) {
                result.push_back(grid_[x][y].bounds());
            }
        }
    }
    return result;
}

Tile* GameMap::baseTile() {
    for (auto& column : grid_) {
        for (auto& tile : column) {
            if (tile.type == TileType::Base) return &tile;
        }
    }
    return nullptr;
}

const Tile* GameMap::baseTile() const {
    for (const auto& column : grid_) {
        for (const auto& tile : column) {
            if (tile.type == TileType::Base) return &tile;
        }
    }
    return nullptr;
}

void GameMap::setType(Tile& tile, TileType type) {
    if (type == TileType::Base) {
        const Tile* existing = baseTile();
        if (existing != nullptr && existing != &tile) {
            throw std::invalid_argument("Map already has a base at (" +
                                        std::to_string(existing->gridX) + ", " +
                                        std::to_string(existing->gridY) + ")");
        }
    }

    tile.type = type;
    tile.animationFrame = 0;
    tile.animationTimer = 0.0f;
}

void GameMap::clear() {
    for (auto& column : grid_) {
        for (auto& tile : column) {
            setType(tile, TileType::Empty);
        }
    }
}

// Build the default level
//
// LAYOUT (16x16):
// - Brick border around the whole playfield
// - 3x3 steel block in the upper-left quarter
// - Brick walls between the spawn row and the middle of the map
// - Water strip on the right, bush strip on the left, ice patch in the lower right
// - Base at the bottom centre, guarded by bricks on its top and right side
//   (the player starts left of the base and leaves the fort upwards)
//
// The spawn row (y = 1) is kept clear so enemies can enter.
void GameMap::buildDefaultLayout() {
    clear();

    auto place = [this](int x, int y, TileType type) {
        Tile* tile = tileAt(x, y);
        if (tile != nullptr) {
            setType(*tile, type);
        }
    };

    // Border
    for (int x = 0; x < width_; x++) {
        place(x, 0, TileType::Brick);
        place(x, height_ - 1, TileType::Brick);
    }
    for (int y = 0; y < height_; y++) {
        place(0, y, TileType::Brick);
        place(width_ - 1, y, TileType::Brick);
    }

    // Steel block
    for (int x = 5; x < 8; x++) {
        for (int y = 5; y < 8; y++) {
            place(x, y, TileType::Steel);
        }
    }

    // Brick walls
    for (int x = 10; x < 14; x++) {
        place(x, 4, TileType::Brick);
    }
    for (int y = 9; y < 12; y++) {
        place(4, y, TileType::Brick);
    }

    // Water, bush and ice
    for (int y = 7; y < 10; y++) {
        place(12, y, TileType::Water);
    }
    for (int x = 1; x < 4; x++) {
        place(x, 12, TileType::Bush);
    }
    for (int x = 10; x < 13; x++) {
        place(x, 12, TileType::Ice);
    }

    // Base with its fort
    const int baseX = width_ / 2;
    const int baseY = height_ - 2;
    place(baseX, baseY, TileType::Base);
    place(baseX, baseY - 1, TileType::Brick);
    place(baseX + 1, baseY - 1, TileType::Brick);
    place(baseX + 1, baseY, TileType::Brick);

    ErrorHandler::logDebug("Default map built: " + std::to_string(width_) + "x" +
                           std::to_string(height_) + ", base at (" +
                           std::to_string(baseX) + ", " + std::to_string(baseY) + ")");
}

void GameMap::update(float deltaTime) {
    for (auto& column : grid_) {
        for (auto& tile : column) {
            if (tile.isAnimated()) {
                tile.update(deltaTime);
            }
        }
    }
}
