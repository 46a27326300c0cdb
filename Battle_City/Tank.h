#pragma once

#include "Bullet.h"
#include "Direction.h"
#include "InputState.h"

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Rect.hpp>
#include <SFML/System/Vector2.hpp>

#include <optional>
#include <random>
#include <string>

// ========================
// Tank Base Class
// ========================

// Grid-moving tank.
// Movement is optimistic: tryMove() applies a full-tile step right away and the
// collision pass later undoes it with revert() or revertToEdge() when it was invalid.
class Tank {
public:
    Tank(float x, float y, OwnerType owner, int health, int lives, float tileSize);
    virtual ~Tank() = default;

    OwnerType getOwnerType() const { return ownerType_; }

    sf::Vector2f getPosition() const { return sf::Vector2f(x_, y_); }
    sf::Vector2f getPreviousPosition() const { return sf::Vector2f(prevX_, prevY_); }
    sf::FloatRect bounds() const { return sf::FloatRect(x_, y_, width_, height_); }
    float getTileSize() const { return tileSize_; }

    // Teleport (spawn, respawn, test setup); also resets the rollback position
    void setPosition(float x, float y);

    Direction getDirection() const { return direction_; }
    void setDirection(Direction direction) { direction_ = direction; }

    int getHealth() const { return health_; }
    int getMaxHealth() const { return maxHealth_; }
    int getLives() const { return lives_; }
    void setLives(int lives) { lives_ = lives; }
    bool isDestroyed() const { return destroyed_; }

    bool isInvincible() const { return invincible_; }
    float getInvincibilityRemaining() const;
    void makeInvincible(float duration);
    void clearInvincibility();

    // False during the hidden half of the invincibility blink
    bool isVisible() const;

    float getMoveDelay() const { return moveDelay_; }
    void setMoveDelay(float delay) { moveDelay_ = delay; }
    float getMoveTimer() const { return moveTimer_; }

    float getBulletSpeed() const { return bulletSpeed_; }
    void setBulletSpeed(float speed) { bulletSpeed_ = speed; }

    // Attempt a one-tile step. Rejected (returns false, nothing changes) when the
    // move timer has not elapsed, on diagonal input and on a zero vector.
    bool tryMove(int dx, int dy);

    // Snap back to the position held before this frame's move
    void revert();

    // Stop flush against an obstacle along the direction of travel.
    // The result stays between the previous and the current position.
    void revertToEdge(const sf::FloatRect& obstacle);

    // Apply damage. Returns true when the tank ran out of lives and is destroyed.
    // Invincible tanks ignore damage.
    bool takeDamage(int amount = 1);

    // Fire a bullet from the tank centre. No-op (returns false) while the previous
    // bullet is still in flight.
    bool shoot();

    bool hasActiveBullet() const { return bullet_.has_value() && bullet_->active; }
    const std::optional<Bullet>& getBullet() const { return bullet_; }
    std::optional<Bullet>& getBullet() { return bullet_; }
    Bullet* getActiveBullet();

    // Drop a bullet that is no longer active
    void releaseSpentBullet();

    // Frame start: remember the rollback position, advance timers, move the bullet
    void update(float deltaTime, const sf::FloatRect& playfield);

protected:
    OwnerType ownerType_;
    float x_;
    float y_;
    float prevX_;
    float prevY_;
    float width_;
    float height_;
    float tileSize_;
    Direction direction_ = Direction::Up;

    int health_;
    int maxHealth_;
    int lives_;
    bool destroyed_ = false;

    float moveTimer_ = 0.0f;
    float moveDelay_;

    bool invincible_ = false;
    float invincibilityTimer_ = 0.0f;
    float invincibilityDuration_ = 0.0f;
    float blinkTimer_ = 0.0f;

    float bulletSpeed_;
    std::optional<Bullet> bullet_;
};

// ========================
// Player Tank
// ========================

class PlayerTank : public Tank {
public:
    PlayerTank(float x, float y, float tileSize);

    sf::Vector2f getInitialPosition() const { return initialPosition_; }

    // Turn, move and fire from the frame's input. Ignored while invincible.
    void applyInput(const InputState& input);

    // Back to the start position with a fresh invincibility window
    void respawn();

private:
    sf::Vector2f initialPosition_;
};

// ========================
// Enemy Tank Types
// ========================

enum class EnemyType : uint8_t {
    Basic = 0,
    Fast = 1,
    Power = 2,
    Armor = 3
};

struct EnemyTypeStats {
    float speedFactor;               // Divides the move delay
    float bulletSpeedFactor;
    int health;
    float shootInterval;             // Seconds
    float directionChangeInterval;   // Seconds
    sf::Color color;                 // Fallback colour when no sprite is available
};

const EnemyTypeStats& enemyTypeStats(EnemyType type);
std::string enemyTypeName(EnemyType type);

// ========================
// Enemy Tank
// ========================

class EnemyTank : public Tank {
public:
    EnemyTank(float x, float y, float tileSize, EnemyType type, Direction initialDirection);

    EnemyType getType() const { return type_; }
    const EnemyTypeStats& getStats() const { return enemyTypeStats(type_); }

    float getDirectionTimer() const { return directionTimer_; }
    float getShootTimer() const { return shootTimer_; }

    // AI step after update(): turn on the direction timer, fire on the shoot timer,
    // then try to advance one tile in the facing direction
    void think(float deltaTime, std::mt19937& rng);

    // Turn away immediately (after hitting a wall) and restart the direction timer
    void forceDirectionChange(std::mt19937& rng);

private:
    EnemyType type_;
    float directionTimer_ = 0.0f;
    float shootTimer_ = 0.0f;
};
