#pragma once

#include "Tank.h"
#include "World.h"

#include <SFML/System/Vector2.hpp>

#include <random>
#include <vector>

// ========================
// Spawner
// ========================
//
// Brings enemies in at fixed grid points on a timer, up to a cumulative cap.
class Spawner {
public:
    // Throws std::invalid_argument on an empty spawn point list or roster
    Spawner(std::vector<sf::Vector2i> spawnPoints, int maxSpawns, float spawnInterval,
            std::vector<EnemyType> roster);

    // Place one enemy at a random spawn point. False (and nothing changes) when the cap
    // is reached or the spot is occupied by a collidable tile or a tank.
    bool trySpawn(World& world, std::mt19937& rng);

    // Advance the timer and attempt a spawn when it elapses. The timer restarts only
    // after a successful spawn, so a blocked spawn is retried next frame.
    bool update(float deltaTime, World& world, std::mt19937& rng);

    void reset();

    int getTotalSpawns() const { return totalSpawns_; }
    int getMaxSpawns() const { return maxSpawns_; }
    bool isExhausted() const { return totalSpawns_ >= maxSpawns_; }
    float getSpawnTimer() const { return spawnTimer_; }
    const std::vector<sf::Vector2i>& getSpawnPoints() const { return spawnPoints_; }

private:
    bool isFootprintFree(const World& world, const sf::FloatRect& footprint) const;

    std::vector<sf::Vector2i> spawnPoints_;
    int maxSpawns_;
    float spawnInterval_;
    std::vector<EnemyType> roster_;

    int totalSpawns_ = 0;
    float spawnTimer_ = 0.0f;
};
