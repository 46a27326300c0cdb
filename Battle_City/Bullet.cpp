#include "Bullet.h"

#include "Constants.h"

Bullet::Bullet(float startX, float startY, Direction dir, OwnerType owner, float bulletSpeed)
    : ownerType(owner),
      direction(dir),
      x(startX),
      y(startY),
      width(BULLET_WIDTH),
      height(BULLET_HEIGHT),
      speed(bulletSpeed),
      active(true) {}

void Bullet::update(float deltaTime, const sf::FloatRect& playfield) {
    if (!active) {
        return;
    }

    sf::Vector2i delta = directionDelta(direction);
    x += delta.x * speed * deltaTime;
    y += delta.y * speed * deltaTime;

    if (isOutside(playfield)) {
        active = false;
    }
}

bool Bullet::isOutside(const sf::FloatRect& playfield) const {
    return x + width <= playfield.left || x >= playfield.left + playfield.width ||
           y + height <= playfield.top || y >= playfield.top + playfield.height;
}
