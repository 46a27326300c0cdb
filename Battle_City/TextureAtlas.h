#pragma once

#include <SFML/Graphics/Rect.hpp>
#include <SFML/Graphics/Texture.hpp>

#include <map>
#include <set>
#include <string>

// Named sub-rectangles of the sprite sheet.
// Sheet coordinates are in 16 px cells; tanks and the base span 2x2 cells,
// terrain tiles one cell. Every sprite is drawn scaled to one game tile.
class TextureAtlas {
public:
    TextureAtlas();

    // False when the image cannot be read
    bool loadFromFile(const std::string& path);

    bool isLoaded() const { return loaded_; }
    const sf::Texture& getTexture() const { return texture_; }

    bool hasSprite(const std::string& name) const;

    // Source rectangle for `name`. Unknown names yield an empty rectangle and a
    // warning, logged once per name.
    sf::IntRect sourceRect(const std::string& name) const;

    std::size_t getSpriteCount() const { return rects_.size(); }

private:
    void addSprite(const std::string& name, int cellX, int cellY, int cellsWide, int cellsHigh);

    sf::Texture texture_;
    bool loaded_ = false;
    std::map<std::string, sf::IntRect> rects_;
    mutable std::set<std::string> reportedMissing_;
};
