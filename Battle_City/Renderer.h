#pragma once

#include "Game.h"
#include "TextureAtlas.h"

#include <SFML/Graphics.hpp>

#include <string>

// ========================
// Renderer
// ========================
//
// Draws the read-only game state: the playfield in a 512x512 logical view scaled
// to the window, then HUD text and state overlays in window coordinates.
class Renderer {
public:
    Renderer(sf::RenderWindow& window, const TextureAtlas& atlas, const sf::Font& font);

    void render(const Game& game);

private:
    void drawTiles(const GameMap& map, bool coverLayer);
    void drawTank(const Tank& tank, const std::string& spritePrefix, const sf::Color& fallback,
                  unsigned long frame);
    void drawBullet(const Bullet& bullet);
    void drawSprite(const std::string& name, const sf::Vector2f& position, float size,
                    const sf::Color& fallback);
    void drawHud(const Game& game);
    void drawOverlay(const std::string& title, const std::string& hint, const sf::Color& titleColor);

    sf::RenderWindow& window_;
    const TextureAtlas& atlas_;
    const sf::Font& font_;
    sf::View playfieldView_;
};
