#include "Tile.h"

#include "Constants.h"

std::string tileTypeName(TileType type) {
    switch (type) {
        case TileType::Empty: return "EMPTY";
        case TileType::Brick: return "BRICK";
        case TileType::Steel: return "STEEL";
        case TileType::Water: return "WATER";
        case TileType::Bush: return "BUSH";
        case TileType::Ice: return "ICE";
        case TileType::Base: return "BASE";
        case TileType::BaseDestroyed: return "BASE_DESTROYED";
    }
    return "UNKNOWN";
}

bool blocksTanks(TileType type) {
    return type == TileType::Brick || type == TileType::Steel ||
           type == TileType::Water || type == TileType::Base;
}

bool stopsBullets(TileType type) {
    return type == TileType::Brick || type == TileType::Steel || type == TileType::Base;
}

bool isDestructible(TileType type) {
    return type == TileType::Brick;
}

Tile::Tile(TileType tileType, int x, int y, float tileSize)
    : type(tileType), gridX(x), gridY(y), size(tileSize) {}

void Tile::update(float deltaTime) {
    if (!isAnimated()) {
        animationFrame = 0;
        animationTimer = 0.0f;
        return;
    }

    animationTimer += deltaTime;
    if (animationTimer >= TILE_ANIMATION_INTERVAL) {
        animationTimer -= TILE_ANIMATION_INTERVAL;
        animationFrame = (animationFrame + 1) % 2;
    }
}

std::string Tile::spriteName() const {
    switch (type) {
        case TileType::Empty: return "";
        case TileType::Brick: return "brick";
        case TileType::Steel: return "steel";
        case TileType::Water: return animationFrame == 0 ? "water_1" : "water_2";
        case TileType::Bush: return "bush";
        case TileType::Ice: return "ice";
        case TileType::Base: return "base";
        case TileType::BaseDestroyed: return "base_destroyed";
    }
    return "";
}
