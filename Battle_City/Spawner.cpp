#include "Spawner.h"

#include "ErrorHandler.h"

#include <stdexcept>
#include <utility>

Spawner::Spawner(std::vector<sf::Vector2i> spawnPoints, int maxSpawns, float spawnInterval,
                 std::vector<EnemyType> roster)
    : spawnPoints_(std::move(spawnPoints)),
      maxSpawns_(maxSpawns),
      spawnInterval_(spawnInterval),
      roster_(std::move(roster)) {
    if (spawnPoints_.empty()) {
        throw std::invalid_argument("Spawner needs at least one spawn point");
    }
    if (roster_.empty()) {
        throw std::invalid_argument("Spawner needs at least one enemy type");
    }
}

bool Spawner::trySpawn(World& world, std::mt19937& rng) {
    if (isExhausted()) {
        ErrorHandler::logDebug("Spawn skipped, cap of " + std::to_string(maxSpawns_) + " reached");
        return false;
    }

    std::uniform_int_distribution<size_t> pointDist(0, spawnPoints_.size() - 1);
    const sf::Vector2i point = spawnPoints_[pointDist(rng)];

    const float tileSize = world.getMap().getTileSize();
    const sf::FloatRect footprint(point.x * tileSize, point.y * tileSize, tileSize, tileSize);
    if (!isFootprintFree(world, footprint)) {
        ErrorHandler::logDebug("Spawn point (" + std::to_string(point.x) + ", " +
                               std::to_string(point.y) + ") blocked");
        return false;
    }

    std::uniform_int_distribution<size_t> typeDist(0, roster_.size() - 1);
    std::uniform_int_distribution<int> directionDist(0, 3);
    const EnemyType type = roster_[typeDist(rng)];
    const Direction direction = static_cast<Direction>(directionDist(rng));

    world.getEnemies().emplace_back(footprint.left, footprint.top, tileSize, type, direction);
    totalSpawns_++;

    ErrorHandler::logInfo("Spawned " + enemyTypeName(type) + " enemy at (" +
                          std::to_string(point.x) + ", " + std::to_string(point.y) + "), " +
                          std::to_string(totalSpawns_) + "/" + std::to_string(maxSpawns_));
    return true;
}

bool Spawner::update(float deltaTime, World& world, std::mt19937& rng) {
    spawnTimer_ += deltaTime;
    if (spawnTimer_ < spawnInterval_) {
        return false;
    }

    if (trySpawn(world, rng)) {
        spawnTimer_ = 0.0f;
        return true;
    }
    return false;
}

void Spawner::reset() {
    totalSpawns_ = 0;
    spawnTimer_ = 0.0f;
}

bool Spawner::isFootprintFree(const World& world, const sf::FloatRect& footprint) const {
    for (const auto& rect : world.getMap().collidableTiles()) {
        if (footprint.intersects(rect)) {
            return false;
        }
    }

    const PlayerTank& player = world.getPlayer();
    if (!player.isDestroyed() && footprint.intersects(player.bounds())) {
        return false;
    }

    for (const auto& enemy : world.getEnemies()) {
        if (!enemy.isDestroyed() && footprint.intersects(enemy.bounds())) {
            return false;
        }
    }
    return true;
}
