#pragma once

#include "Tile.h"

#include <SFML/Graphics/Rect.hpp>

#include <set>
#include <vector>

// Tile grid of the level.
// Tiles are indexed grid_[x][y] and live for the whole lifetime of the map;
// collision handling changes their type in place through setType().
class GameMap {
public:
    GameMap(int width, int height, float tileSize);

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    float getTileSize() const { return tileSize_; }

    // Whole playfield in world coordinates
    sf::FloatRect playfield() const {
        return sf::FloatRect(0.0f, 0.0f, width_ * tileSize_, height_ * tileSize_);
    }

    // Bounds-checked lookup, nullptr outside the grid
    Tile* tileAt(int gridX, int gridY);
    const Tile* tileAt(int gridX, int gridY) const;

    std::vector<Tile*> tilesByType(const std::set<TileType>& types);

    // Rectangles of every tile that blocks tank movement (Brick, Steel, Water, Base)
    std::vector<sf::FloatRect> collidableTiles() const;

    // The intact base, nullptr once it has been destroyed
    Tile* baseTile();
    const Tile* baseTile() const;

    // The only way to change a tile after the map is built.
    // Throws std::invalid_argument when a second Base would be created.
    void setType(Tile& tile, TileType type);

    // Reset every tile to Empty
    void clear();

    // Procedural level used by the game: brick border, steel block,
    // brick fort around the base, water, bush and ice patches
    void buildDefaultLayout();

    // Advance tile animations
    void update(float deltaTime);

private:
    int width_;
    int height_;
    float tileSize_;
    std::vector<std::vector<Tile>> grid_;
};
