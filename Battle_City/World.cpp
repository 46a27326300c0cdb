#include "World.h"

#include "ErrorHandler.h"

#include <algorithm>

World::World(const LevelConfig& config)
    : map_(config.gridWidth, config.gridHeight, config.tileSize),
      player_(config.playerStart.x * config.tileSize,
              config.playerStart.y * config.tileSize,
              config.tileSize) {
    if (config.useDefaultLayout) {
        map_.buildDefaultLayout();
    }
}

void World::setState(GameState state) {
    if (state_ == state) {
        return;
    }
    ErrorHandler::logInfo("Game state " + gameStateName(state_) + " -> " + gameStateName(state));
    state_ = state;
}

Tank* World::findTank(const TankRef& ref) {
    if (ref.owner == OwnerType::Player) {
        return &player_;
    }
    if (ref.index < enemies_.size()) {
        return &enemies_[ref.index];
    }
    return nullptr;
}

Bullet* World::findBullet(const BulletRef& ref) {
    Tank* owner = findTank(ownerOf(ref));
    if (owner == nullptr) {
        return nullptr;
    }
    std::optional<Bullet>& bullet = owner->getBullet();
    if (!bullet.has_value()) {
        return nullptr;
    }
    // Still returned while inactive: bullet-vs-bullet checks the flag
    return &*bullet;
}

Tile* World::findTile(const TileRef& ref) {
    return map_.tileAt(ref.gridX, ref.gridY);
}

CollisionGroups World::collisionGroups() const {
    CollisionGroups groups;

    if (!player_.isDestroyed()) {
        groups.playerTank = Collidable{TankRef{OwnerType::Player, 0}, player_.bounds()};
    }
    if (player_.hasActiveBullet()) {
        groups.playerBullets.push_back(
            Collidable{BulletRef{OwnerType::Player, 0}, player_.getBullet()->bounds()});
    }

    for (std::size_t i = 0; i < enemies_.size(); i++) {
        const EnemyTank& enemy = enemies_[i];
        if (enemy.isDestroyed()) {
            continue;
        }
        groups.enemyTanks.push_back(Collidable{TankRef{OwnerType::Enemy, i}, enemy.bounds()});
        if (enemy.hasActiveBullet()) {
            groups.enemyBullets.push_back(
                Collidable{BulletRef{OwnerType::Enemy, i}, enemy.getBullet()->bounds()});
        }
    }

    for (int y = 0; y < map_.getHeight(); y++) {
        for (int x = 0; x < map_.getWidth(); x++) {
            const Tile* tile = map_.tileAt(x, y);
            Collidable entry{TileRef{x, y}, tile->bounds()};
            if (isDestructible(tile->type)) {
                groups.destructibleTiles.push_back(entry);
            }
            if (blocksTanks(tile->type)) {
                groups.impassableTiles.push_back(entry);
            }
        }
    }

    if (const Tile* base = map_.baseTile()) {
        groups.base = Collidable{TileRef{base->gridX, base->gridY}, base->bounds()};
    }

    return groups;
}

std::size_t World::removeDestroyedEnemies() {
    const std::size_t before = enemies_.size();
    enemies_.erase(std::remove_if(enemies_.begin(), enemies_.end(),
                                  [](const EnemyTank& enemy) { return enemy.isDestroyed(); }),
                   enemies_.end());
    const std::size_t removed = before - enemies_.size();
    if (removed > 0) {
        ErrorHandler::logDebug("Removed " + std::to_string(removed) + " destroyed enemies, " +
                               std::to_string(enemies_.size()) + " remaining");
    }
    return removed;
}

void World::releaseSpentBullets() {
    player_.releaseSpentBullet();
    for (auto& enemy : enemies_) {
        enemy.releaseSpentBullet();
    }
}
