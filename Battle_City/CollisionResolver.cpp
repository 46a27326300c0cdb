#include "CollisionResolver.h"

#include "ErrorHandler.h"

// Dispatch table for one reported pair. Every combination of the three reference kinds
// has its own overload, so adding a reference kind fails to compile until handled here.
struct PairVisitor {
    CollisionResolver& resolver;
    World& world;
    std::mt19937& rng;

    void operator()(const BulletRef& a, const BulletRef& b) {
        if (!resolver.isProcessed(a)) {
            resolver.bulletHitsBullet(world, a, b);
        } else if (!resolver.isProcessed(b)) {
            resolver.bulletHitsBullet(world, b, a);
        }
    }

    void operator()(const BulletRef& bullet, const TankRef& tank) { hitTank(bullet, tank); }
    void operator()(const TankRef& tank, const BulletRef& bullet) { hitTank(bullet, tank); }
    void operator()(const BulletRef& bullet, const TileRef& tile) { hitTile(bullet, tile); }
    void operator()(const TileRef& tile, const BulletRef& bullet) { hitTile(bullet, tile); }

    void operator()(const TankRef& a, const TankRef& b) { resolver.tankHitsTank(world, a, b); }
    void operator()(const TankRef& tank, const TileRef& tile) { resolver.tankHitsTile(world, tank, tile, rng); }
    void operator()(const TileRef& tile, const TankRef& tank) { resolver.tankHitsTile(world, tank, tile, rng); }

    void operator()(const TileRef&, const TileRef&) {}

    void hitTank(const BulletRef& bullet, const TankRef& tank) {
        if (!resolver.isProcessed(bullet) && resolver.bulletHitsTank(world, bullet, tank)) {
            resolver.processedBullets_.insert(bullet);
        }
    }

    void hitTile(const BulletRef& bullet, const TileRef& tile) {
        if (!resolver.isProcessed(bullet) && resolver.bulletHitsTile(world, bullet, tile)) {
            resolver.processedBullets_.insert(bullet);
        }
    }
};

// Apply the outcome of every reported pair
//
// ALGORITHM:
// 1. Reset the per-frame processed-bullet and reverted-tank sets
// 2. For each pair, in report order, dispatch on both reference kinds:
//    - a pair holding an unprocessed bullet is a bullet hit (left bullet first);
//      a hit that consumes the bullet marks it processed
//    - tank vs tank reverts both tanks unless both were already reverted
//    - tank vs blocking tile stops the tank at the tile edge once per frame
// 3. Send back any tank not yet reverted whose move left the playfield
// 4. Erase enemies tombstoned during the pass
//
// Pairs whose bullet was already consumed, or whose tile changed type earlier in
// the pass, fall through as no-ops.
void CollisionResolver::resolve(World& world, const std::vector<CollisionPair>& events,
                                std::mt19937& rng) {
    processedBullets_.clear();
    revertedTanks_.clear();
    enemiesDestroyed_ = 0;

    PairVisitor visitor{*this, world, rng};
    for (const auto& event : events) {
        ErrorHandler::logDebug("Resolving " + describeEntity(event.first) + " vs " +
                               describeEntity(event.second));
        std::visit(visitor, event.first, event.second);
    }

    keepTanksInPlayfield(world, rng);
    world.removeDestroyedEnemies();
}

bool CollisionResolver::bulletHitsTank(World& world, const BulletRef& bulletRef, const TankRef& tankRef) {
    Bullet* bullet = world.findBullet(bulletRef);
    Tank* tank = world.findTank(tankRef);
    if (bullet == nullptr || tank == nullptr || !bullet->active) {
        return false;
    }

    // Player bullet vs enemy tank
    if (bullet->ownerType == OwnerType::Player && tank->getOwnerType() == OwnerType::Enemy) {
        bullet->active = false;
        if (tank->takeDamage(1)) {
            enemiesDestroyed_++;
            ErrorHandler::logInfo(describeEntity(tankRef) + " destroyed");
        } else {
            ErrorHandler::logDebug(describeEntity(tankRef) + " hit, health " +
                                   std::to_string(tank->getHealth()));
        }
        return true;
    }

    // Enemy bullet vs player tank
    if (bullet->ownerType == OwnerType::Enemy && tank->getOwnerType() == OwnerType::Player) {
        bullet->active = false;
        if (tank->isInvincible()) {
            ErrorHandler::logDebug("Player hit while invincible");
            return true;
        }

        PlayerTank& player = world.getPlayer();
        if (player.takeDamage(1)) {
            ErrorHandler::logInfo("Player destroyed, no lives left");
            world.setState(GameState::GameOver);
        } else {
            ErrorHandler::logInfo("Player hit. Lives left: " + std::to_string(player.getLives()));
            player.respawn();
        }
        return true;
    }

    return false;
}

bool CollisionResolver::bulletHitsBullet(World& world, const BulletRef& bulletRef, const BulletRef& otherRef) {
    if (bulletRef == otherRef) {
        return false;
    }

    Bullet* bullet = world.findBullet(bulletRef);
    Bullet* other = world.findBullet(otherRef);
    if (bullet == nullptr || other == nullptr || !bullet->active || !other->active) {
        return false;
    }

    bullet->active = false;
    other->active = false;
    processedBullets_.insert(bulletRef);
    processedBullets_.insert(otherRef);
    ErrorHandler::logDebug(describeEntity(bulletRef) + " and " + describeEntity(otherRef) + " cancelled");
    return true;
}

bool CollisionResolver::bulletHitsTile(World& world, const BulletRef& bulletRef, const TileRef& tileRef) {
    Bullet* bullet = world.findBullet(bulletRef);
    Tile* tile = world.findTile(tileRef);
    if (bullet == nullptr || tile == nullptr || !bullet->active) {
        return false;
    }

    switch (tile->type) {
        case TileType::Brick:
            bullet->active = false;
            world.getMap().setType(*tile, TileType::Empty);
            ErrorHandler::logDebug("Brick destroyed at (" + std::to_string(tile->gridX) + ", " +
                                   std::to_string(tile->gridY) + ")");
            return true;

        case TileType::Steel:
            bullet->active = false;
            return true;

        case TileType::Base:
            bullet->active = false;
            world.getMap().setType(*tile, TileType::BaseDestroyed);
            ErrorHandler::logInfo("Base destroyed by " + describeEntity(bulletRef));
            world.setState(GameState::GameOver);
            return true;

        default:
            // Bullets fly over water, bush, ice and rubble
            return false;
    }
}

void CollisionResolver::tankHitsTank(World& world, const TankRef& a, const TankRef& b) {
    if (isReverted(a) && isReverted(b)) {
        return;
    }

    Tank* tankA = world.findTank(a);
    Tank* tankB = world.findTank(b);
    if (tankA == nullptr || tankB == nullptr) {
        return;
    }

    tankA->revert();
    tankB->revert();
    revertedTanks_.insert(a);
    revertedTanks_.insert(b);
}

void CollisionResolver::tankHitsTile(World& world, const TankRef& tankRef, const TileRef& tileRef,
                                     std::mt19937& rng) {
    if (isReverted(tankRef)) {
        return;
    }

    Tank* tank = world.findTank(tankRef);
    Tile* tile = world.findTile(tileRef);
    if (tank == nullptr || tile == nullptr || !blocksTanks(tile->type)) {
        return;
    }

    tank->revertToEdge(tile->bounds());
    revertedTanks_.insert(tankRef);

    if (tankRef.owner == OwnerType::Enemy) {
        world.getEnemies()[tankRef.index].forceDirectionChange(rng);
    }
}

void CollisionResolver::keepTanksInPlayfield(World& world, std::mt19937& rng) {
    const sf::FloatRect field = world.getMap().playfield();
    auto isInside = [&field](const sf::FloatRect& r) {
        return r.left >= field.left && r.top >= field.top &&
               r.left + r.width <= field.left + field.width &&
               r.top + r.height <= field.top + field.height;
    };

    PlayerTank& player = world.getPlayer();
    const TankRef playerRef{OwnerType::Player, 0};
    if (!player.isDestroyed() && !isReverted(playerRef) && !isInside(player.bounds())) {
        player.revert();
        revertedTanks_.insert(playerRef);
    }

    auto& enemies = world.getEnemies();
    for (std::size_t i = 0; i < enemies.size(); i++) {
        const TankRef ref{OwnerType::Enemy, i};
        EnemyTank& enemy = enemies[i];
        if (enemy.isDestroyed() || isReverted(ref) || isInside(enemy.bounds())) {
            continue;
        }
        enemy.revert();
        enemy.forceDirectionChange(rng);
        revertedTanks_.insert(ref);
        ErrorHandler::logDebug(describeEntity(ref) + " stopped at the playfield edge");
    }
}
