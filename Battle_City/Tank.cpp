#include "Tank.h"

#include "Constants.h"
#include "ErrorHandler.h"

#include <algorithm>
#include <cmath>

namespace {

// Snap a coordinate to the nearest grid line
float alignToGrid(float value, float tileSize) {
    return std::round(value / tileSize) * tileSize;
}

}  // namespace

// ========================
// Tank
// ========================

Tank::Tank(float x, float y, OwnerType owner, int health, int lives, float tileSize)
    : ownerType_(owner),
      x_(alignToGrid(x, tileSize)),
      y_(alignToGrid(y, tileSize)),
      prevX_(x_),
      prevY_(y_),
      width_(tileSize),
      height_(tileSize),
      tileSize_(tileSize),
      health_(health),
      maxHealth_(health),
      lives_(lives),
      moveDelay_(TANK_MOVE_DELAY),
      bulletSpeed_(BULLET_SPEED) {}

void Tank::setPosition(float x, float y) {
    x_ = x;
    y_ = y;
    prevX_ = x;
    prevY_ = y;
}

float Tank::getInvincibilityRemaining() const {
    if (!invincible_) {
        return 0.0f;
    }
    return std::max(0.0f, invincibilityDuration_ - invincibilityTimer_);
}

void Tank::makeInvincible(float duration) {
    invincible_ = true;
    invincibilityDuration_ = duration;
    invincibilityTimer_ = 0.0f;
    blinkTimer_ = 0.0f;
}

void Tank::clearInvincibility() {
    invincible_ = false;
    invincibilityTimer_ = 0.0f;
    blinkTimer_ = 0.0f;
}

bool Tank::isVisible() const {
    if (!invincible_) {
        return true;
    }
    return std::fmod(blinkTimer_, BLINK_INTERVAL * 2.0f) < BLINK_INTERVAL;
}

bool Tank::tryMove(int dx, int dy) {
    if (moveTimer_ < moveDelay_) {
        return false;  // Not ready to move yet
    }
    if (dx != 0 && dy != 0) {
        return false;  // One axis at a time
    }
    if (dx == 0 && dy == 0) {
        return false;
    }

    prevX_ = x_;
    prevY_ = y_;
    x_ += (dx > 0 ? 1 : (dx < 0 ? -1 : 0)) * tileSize_;
    y_ += (dy > 0 ? 1 : (dy < 0 ? -1 : 0)) * tileSize_;
    moveTimer_ = 0.0f;
    return true;
}

void Tank::revert() {
    x_ = prevX_;
    y_ = prevY_;
}

// Stop the tank flush against an obstacle
//
// ALGORITHM:
// 1. Derive the direction of travel from previous -> current position
// 2. Place the leading edge of the tank on the near edge of the obstacle
//    (moving up: tank top = obstacle bottom, moving right: tank right = obstacle left, ...)
// 3. Clamp each axis between the previous and the current position so the
//    tank never ends up behind where it started
//
// A tank that did not move this frame falls back to revert().
void Tank::revertToEdge(const sf::FloatRect& obstacle) {
    const float currentX = x_;
    const float currentY = y_;
    const float moveX = currentX - prevX_;
    const float moveY = currentY - prevY_;

    if (moveX == 0.0f && moveY == 0.0f) {
        revert();
        return;
    }

    if (moveY < 0.0f) {
        y_ = obstacle.top + obstacle.height;
    } else if (moveY > 0.0f) {
        y_ = obstacle.top - height_;
    } else if (moveX < 0.0f) {
        x_ = obstacle.left + obstacle.width;
    } else {
        x_ = obstacle.left - width_;
    }

    x_ = std::max(std::min(prevX_, currentX), std::min(x_, std::max(prevX_, currentX)));
    y_ = std::max(std::min(prevY_, currentY), std::min(y_, std::max(prevY_, currentY)));
}

bool Tank::takeDamage(int amount) {
    if (invincible_ || destroyed_) {
        return false;
    }

    health_ = std::max(0, health_ - amount);

    // Out of health: lose a life and refill, or die on the last one
    if (health_ <= 0) {
        lives_ = std::max(0, lives_ - 1);
        if (lives_ > 0) {
            health_ = maxHealth_;
            return false;
        }
        destroyed_ = true;
        return true;
    }
    return false;
}

bool Tank::shoot() {
    if (hasActiveBullet()) {
        return false;
    }

    float bulletX = x_ + width_ / 2.0f - BULLET_WIDTH / 2.0f;
    float bulletY = y_ + height_ / 2.0f - BULLET_HEIGHT / 2.0f;
    bullet_.emplace(bulletX, bulletY, direction_, ownerType_, bulletSpeed_);
    return true;
}

Bullet* Tank::getActiveBullet() {
    if (hasActiveBullet()) {
        return &*bullet_;
    }
    return nullptr;
}

void Tank::releaseSpentBullet() {
    if (bullet_.has_value() && !bullet_->active) {
        bullet_.reset();
    }
}

void Tank::update(float deltaTime, const sf::FloatRect& playfield) {
    // Position before any movement this frame
    prevX_ = x_;
    prevY_ = y_;

    if (invincible_) {
        invincibilityTimer_ += deltaTime;
        blinkTimer_ += deltaTime;
        if (invincibilityTimer_ >= invincibilityDuration_) {
            clearInvincibility();
        }
    }

    moveTimer_ += deltaTime;

    if (bullet_.has_value()) {
        bullet_->update(deltaTime, playfield);
    }
}

// ========================
// Player Tank
// ========================

PlayerTank::PlayerTank(float x, float y, float tileSize)
    : Tank(x, y, OwnerType::Player, PLAYER_HEALTH, PLAYER_LIVES, tileSize),
      initialPosition_(x_, y_) {
    ErrorHandler::logDebug("Creating PlayerTank at (" + std::to_string(static_cast<int>(x_)) +
                           ", " + std::to_string(static_cast<int>(y_)) + ")");
}

void PlayerTank::applyInput(const InputState& input) {
    if (invincible_) {
        return;  // No control while respawning
    }

    if (input.dx != 0 || input.dy != 0) {
        direction_ = directionFromMovement(input.dx, input.dy, direction_);
        tryMove(input.dx, input.dy);
    }

    if (input.fire && shoot()) {
        ErrorHandler::logDebug("Player fired " + directionName(direction_));
    }
}

void PlayerTank::respawn() {
    if (lives_ <= 0) {
        return;
    }

    ErrorHandler::logInfo("Player respawning. Lives: " + std::to_string(lives_));
    setPosition(initialPosition_.x, initialPosition_.y);
    direction_ = Direction::Up;
    moveTimer_ = 0.0f;
    makeInvincible(PLAYER_INVINCIBILITY_DURATION);
}

// ========================
// Enemy Tank Types
// ========================

const EnemyTypeStats& enemyTypeStats(EnemyType type) {
    static const EnemyTypeStats basic{0.75f, 1.0f, 1, 2.0f, 2.5f, sf::Color(128, 128, 128)};
    static const EnemyTypeStats fast{1.5f, 1.0f, 1, 1.8f, 1.5f, sf::Color(100, 100, 255)};
    static const EnemyTypeStats power{1.0f, 1.5f, 1, 1.0f, 2.0f, sf::Color(255, 165, 0)};
    static const EnemyTypeStats armor{1.0f, 1.0f, 4, 1.5f, 2.0f, sf::Color(0, 128, 0)};

    switch (type) {
        case EnemyType::Basic: return basic;
        case EnemyType::Fast: return fast;
        case EnemyType::Power: return power;
        case EnemyType::Armor: return armor;
    }
    return basic;
}

std::string enemyTypeName(EnemyType type) {
    switch (type) {
        case EnemyType::Basic: return "basic";
        case EnemyType::Fast: return "fast";
        case EnemyType::Power: return "power";
        case EnemyType::Armor: return "armor";
    }
    return "unknown";
}

// ========================
// Enemy Tank
// ========================

EnemyTank::EnemyTank(float x, float y, float tileSize, EnemyType type, Direction initialDirection)
    : Tank(x, y, OwnerType::Enemy, enemyTypeStats(type).health, 1, tileSize),
      type_(type) {
    const EnemyTypeStats& stats = enemyTypeStats(type);
    direction_ = initialDirection;
    moveDelay_ = TANK_MOVE_DELAY / stats.speedFactor;
    bulletSpeed_ = BULLET_SPEED * stats.bulletSpeedFactor;
}

void EnemyTank::think(float deltaTime, std::mt19937& rng) {
    const EnemyTypeStats& stats = getStats();

    directionTimer_ += deltaTime;
    shootTimer_ += deltaTime;

    if (directionTimer_ >= stats.directionChangeInterval) {
        direction_ = chooseNewDirection(direction_, rng);
        directionTimer_ = 0.0f;
    }

    if (shootTimer_ >= stats.shootInterval) {
        shoot();
        shootTimer_ = 0.0f;
    }

    sf::Vector2i step = directionDelta(direction_);
    tryMove(step.x, step.y);
}

void EnemyTank::forceDirectionChange(std::mt19937& rng) {
    direction_ = chooseNewDirection(direction_, rng);
    directionTimer_ = 0.0f;
}
