#pragma once

#include "EntityRef.h"
#include "GameMap.h"
#include "GameState.h"
#include "LevelConfig.h"
#include "Tank.h"

#include <SFML/Graphics/Rect.hpp>

#include <optional>
#include <vector>

// Entity together with the rectangle it occupies this frame
struct Collidable {
    EntityRef ref;
    sf::FloatRect bounds;
};

// Snapshot of every group the detector pairs against each other
struct CollisionGroups {
    std::optional<Collidable> playerTank;
    std::vector<Collidable> playerBullets;
    std::vector<Collidable> enemyTanks;
    std::vector<Collidable> enemyBullets;
    std::vector<Collidable> destructibleTiles;
    std::vector<Collidable> impassableTiles;
    std::optional<Collidable> base;
};

// Everything that lives on the playfield: tile grid, player, enemy roster and the
// game state. Owned and mutated by a single thread, one frame at a time.
class World {
public:
    explicit World(const LevelConfig& config);

    GameMap& getMap() { return map_; }
    const GameMap& getMap() const { return map_; }

    PlayerTank& getPlayer() { return player_; }
    const PlayerTank& getPlayer() const { return player_; }

    std::vector<EnemyTank>& getEnemies() { return enemies_; }
    const std::vector<EnemyTank>& getEnemies() const { return enemies_; }

    GameState getState() const { return state_; }
    void setState(GameState state);

    // Slot lookups, nullptr for slots that do not exist
    Tank* findTank(const TankRef& ref);
    Bullet* findBullet(const BulletRef& ref);
    Tile* findTile(const TileRef& ref);

    // Build this frame's detector input from the current positions
    CollisionGroups collisionGroups() const;

    // Erase tombstoned enemies in one pass. Returns how many were removed.
    std::size_t removeDestroyedEnemies();

    // Drop inactive bullets of every tank
    void releaseSpentBullets();

private:
    GameMap map_;
    PlayerTank player_;
    std::vector<EnemyTank> enemies_;
    GameState state_ = GameState::Running;
};
