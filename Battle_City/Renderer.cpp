#include "Renderer.h"

#include "Constants.h"

#include <sstream>
#include <iomanip>

namespace {

std::string facingName(Direction direction) {
    switch (direction) {
        case Direction::Up: return "up";
        case Direction::Down: return "down";
        case Direction::Left: return "left";
        case Direction::Right: return "right";
    }
    return "up";
}

// Fallback colours when a sprite is missing
sf::Color tileColor(TileType type) {
    switch (type) {
        case TileType::Brick: return sf::Color(170, 80, 40);
        case TileType::Steel: return sf::Color(180, 180, 180);
        case TileType::Water: return sf::Color(40, 80, 200);
        case TileType::Bush: return sf::Color(30, 140, 30);
        case TileType::Ice: return sf::Color(210, 230, 255);
        case TileType::Base: return sf::Color(255, 215, 0);
        case TileType::BaseDestroyed: return sf::Color(90, 60, 30);
        case TileType::Empty: break;
    }
    return sf::Color::Black;
}

}  // namespace

Renderer::Renderer(sf::RenderWindow& window, const TextureAtlas& atlas, const sf::Font& font)
    : window_(window),
      atlas_(atlas),
      font_(font),
      playfieldView_(sf::FloatRect(0.0f, 0.0f, LOGICAL_WIDTH, LOGICAL_HEIGHT)) {}

void Renderer::render(const Game& game) {
    const World& world = game.getWorld();
    const unsigned long frame = game.getFrameCount();

    window_.clear(sf::Color::Black);
    window_.setView(playfieldView_);

    drawTiles(world.getMap(), false);

    const PlayerTank& player = world.getPlayer();
    if (!player.isDestroyed() && player.isVisible()) {
        drawTank(player, "player_tank_", sf::Color(230, 200, 40), frame);
    }
    for (const auto& enemy : world.getEnemies()) {
        drawTank(enemy, "enemy_tank_", enemy.getStats().color, frame);
    }

    if (player.hasActiveBullet()) {
        drawBullet(*player.getBullet());
    }
    for (const auto& enemy : world.getEnemies()) {
        if (enemy.hasActiveBullet()) {
            drawBullet(*enemy.getBullet());
        }
    }

    // Bushes hide whatever drives under them
    drawTiles(world.getMap(), true);

    window_.setView(window_.getDefaultView());
    drawHud(game);

    if (game.getState() == GameState::GameOver) {
        drawOverlay("GAME OVER", "Press R to Restart", sf::Color::Red);
    } else if (game.getState() == GameState::Victory) {
        drawOverlay("VICTORY!", "Press R to Play Again", sf::Color::Green);
    }

    window_.display();
}

void Renderer::drawTiles(const GameMap& map, bool coverLayer) {
    for (int y = 0; y < map.getHeight(); y++) {
        for (int x = 0; x < map.getWidth(); x++) {
            const Tile* tile = map.tileAt(x, y);
            if (tile->type == TileType::Empty || (tile->type == TileType::Bush) != coverLayer) {
                continue;
            }
            drawSprite(tile->spriteName(), sf::Vector2f(tile->bounds().left, tile->bounds().top),
                       tile->size, tileColor(tile->type));
        }
    }
}

void Renderer::drawTank(const Tank& tank, const std::string& spritePrefix, const sf::Color& fallback,
                        unsigned long frame) {
    // Tracks alternate every 8 frames
    const std::string animation = ((frame / 8) % 2 == 0) ? "_1" : "_2";
    drawSprite(spritePrefix + facingName(tank.getDirection()) + animation, tank.getPosition(),
               tank.getTileSize(), fallback);
}

void Renderer::drawBullet(const Bullet& bullet) {
    sf::RectangleShape shape(sf::Vector2f(bullet.width, bullet.height));
    shape.setPosition(bullet.x, bullet.y);
    shape.setFillColor(sf::Color::White);
    window_.draw(shape);
}

void Renderer::drawSprite(const std::string& name, const sf::Vector2f& position, float size,
                          const sf::Color& fallback) {
    const sf::IntRect source = atlas_.sourceRect(name);
    if (!atlas_.isLoaded() || source.width == 0 || source.height == 0) {
        sf::RectangleShape shape(sf::Vector2f(size, size));
        shape.setPosition(position);
        shape.setFillColor(fallback);
        window_.draw(shape);
        return;
    }

    sf::Sprite sprite(atlas_.getTexture(), source);
    sprite.setPosition(position);
    sprite.setScale(size / source.width, size / source.height);
    window_.draw(sprite);
}

void Renderer::drawHud(const Game& game) {
    const PlayerTank& player = game.getWorld().getPlayer();

    std::ostringstream hud;
    hud << "Lives: " << player.getLives() << "   Enemies: " << game.getEnemiesRemaining();
    if (player.isInvincible()) {
        hud << "   Shield: " << std::fixed << std::setprecision(1) << player.getInvincibilityRemaining() << "s";
    }

    sf::Text text;
    text.setFont(font_);
    text.setString(hud.str());
    text.setCharacterSize(24);
    text.setFillColor(sf::Color::White);
    text.setOutlineColor(sf::Color::Black);
    text.setOutlineThickness(2.0f);
    text.setPosition(12.0f, 8.0f);
    window_.draw(text);
}

void Renderer::drawOverlay(const std::string& title, const std::string& hint, const sf::Color& titleColor) {
    sf::Vector2u windowSize = window_.getSize();

    sf::RectangleShape shade(sf::Vector2f(static_cast<float>(windowSize.x), static_cast<float>(windowSize.y)));
    shade.setFillColor(sf::Color(0, 0, 0, 160));
    window_.draw(shade);

    sf::Text titleText;
    titleText.setFont(font_);
    titleText.setString(title);
    titleText.setCharacterSize(72);
    titleText.setFillColor(titleColor);
    titleText.setOutlineColor(sf::Color::Black);
    titleText.setOutlineThickness(3.0f);
    sf::FloatRect titleBounds = titleText.getLocalBounds();
    titleText.setPosition(windowSize.x / 2.0f - titleBounds.width / 2.0f - titleBounds.left,
                          windowSize.y / 2.0f - 80.0f);
    window_.draw(titleText);

    sf::Text hintText;
    hintText.setFont(font_);
    hintText.setString(hint);
    hintText.setCharacterSize(32);
    hintText.setFillColor(sf::Color::White);
    sf::FloatRect hintBounds = hintText.getLocalBounds();
    hintText.setPosition(windowSize.x / 2.0f - hintBounds.width / 2.0f - hintBounds.left,
                         windowSize.y / 2.0f + 20.0f);
    window_.draw(hintText);
}
