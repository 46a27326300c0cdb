#pragma once

#include <SFML/Graphics/Rect.hpp>

#include <cstdint>
#include <string>

// Tile types
enum class TileType : uint8_t {
    Empty = 0,
    Brick = 1,          // Destroyed by any bullet
    Steel = 2,          // Stops bullets, never destroyed
    Water = 3,          // Blocks tanks, bullets fly over it
    Bush = 4,           // Tanks drive under it
    Ice = 5,
    Base = 6,           // Losing it ends the game
    BaseDestroyed = 7
};

std::string tileTypeName(TileType type);

// Brick, Steel, Water and Base stop tank movement
bool blocksTanks(TileType type);

// Brick, Steel and Base consume bullets
bool stopsBullets(TileType type);

bool isDestructible(TileType type);

// A single cell of the map grid.
// Grid position is fixed at map build time, only the type changes afterwards.
struct Tile {
    TileType type = TileType::Empty;
    int gridX = 0;
    int gridY = 0;
    float size = 32.0f;

    // Water animation
    int animationFrame = 0;
    float animationTimer = 0.0f;

    Tile() = default;
    Tile(TileType tileType, int x, int y, float tileSize);

    sf::FloatRect bounds() const {
        return sf::FloatRect(gridX * size, gridY * size, size, size);
    }

    bool isAnimated() const { return type == TileType::Water; }

    // Advance the water frame every TILE_ANIMATION_INTERVAL seconds
    void update(float deltaTime);

    // Atlas sprite for the current type and frame, empty for tiles drawn as background
    std::string spriteName() const;
};
