#pragma once

#include "Constants.h"
#include "Tank.h"

#include <SFML/System/Vector2.hpp>

#include <vector>

// Per-level parameters. Defaults describe the built-in level.
struct LevelConfig {
    int gridWidth = GRID_WIDTH;
    int gridHeight = GRID_HEIGHT;
    float tileSize = TILE_SIZE;

    // Grid coordinates of the player start (left of the base)
    sf::Vector2i playerStart = sf::Vector2i(GRID_WIDTH / 2 - 1, GRID_HEIGHT - 2);

    // Enemy entry points along the top row
    std::vector<sf::Vector2i> spawnPoints = {
        sf::Vector2i(3, 1),
        sf::Vector2i(GRID_WIDTH / 2, 1),
        sf::Vector2i(GRID_WIDTH - 4, 1)
    };

    int maxEnemySpawns = 5;          // Cumulative, not concurrent
    float spawnInterval = 5.0f;      // Seconds between spawn attempts

    // Types the spawner draws from
    std::vector<EnemyType> enemyRoster = {
        EnemyType::Basic, EnemyType::Basic, EnemyType::Fast, EnemyType::Power, EnemyType::Armor
    };

    bool useDefaultLayout = true;    // False leaves the map empty (tests build their own)
    bool initialSpawn = true;        // One enemy right after reset
};
