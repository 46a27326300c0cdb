#pragma once

#include "Direction.h"

#include <SFML/Graphics/Rect.hpp>
#include <SFML/System/Vector2.hpp>

// Projectile fired by a tank.
// `active` is the only destruction signal: once false the bullet never comes back,
// the owning tank drops it at the next cleanup or replaces it on the next shot.
struct Bullet {
    OwnerType ownerType = OwnerType::Player;   // Side that fired it
    Direction direction = Direction::Up;
    float x = 0.0f;
    float y = 0.0f;                            // Top-left corner
    float width = 8.0f;
    float height = 8.0f;
    float speed = 360.0f;                      // Pixels per second
    bool active = true;

    Bullet() = default;
    Bullet(float startX, float startY, Direction dir, OwnerType owner, float bulletSpeed);

    sf::FloatRect bounds() const {
        return sf::FloatRect(x, y, width, height);
    }

    sf::Vector2f getPosition() const { return sf::Vector2f(x, y); }

    // Move along the direction vector and deactivate once outside the playfield
    void update(float deltaTime, const sf::FloatRect& playfield);

    // Check if the bullet has fully left the playfield
    bool isOutside(const sf::FloatRect& playfield) const;
};
