#include "Game.h"

#include "ErrorHandler.h"

Game::Game(const LevelConfig& config, unsigned int seed)
    : config_(config),
      rng_(seed),
      world_(config),
      spawner_(config.spawnPoints, config.maxEnemySpawns, config.spawnInterval, config.enemyRoster) {
    reset();
}

void Game::reset() {
    world_ = World(config_);
    spawner_.reset();
    detector_.clear();
    frameCount_ = 0;

    if (config_.initialSpawn) {
        spawner_.trySpawn(world_, rng_);
    }

    ErrorHandler::logInfo("Game reset. Lives: " + std::to_string(world_.getPlayer().getLives()) +
                          ", enemies to defeat: " + std::to_string(getEnemiesRemaining()));
}

// Run one frame
//
// ALGORITHM:
// 1. Quit wins over everything and ends the loop
// 2. Outside Running only restart is honoured
// 3. Drop bullets that went inactive last frame
// 4. Move everything tentatively (map animation, player, enemy AI), then spawn
// 5. Detect all overlaps, then resolve them as one batch
// 6. Check for victory (game over is decided inside the resolver)
void Game::update(float deltaTime, const InputState& input) {
    if (input.quit) {
        world_.setState(GameState::Exit);
        return;
    }

    const GameState state = world_.getState();
    if (state == GameState::Exit) {
        return;
    }
    if (state != GameState::Running) {
        if (input.restart) {
            ErrorHandler::logInfo("Restart requested from " + gameStateName(state));
            reset();
        }
        return;
    }

    frameCount_++;
    world_.releaseSpentBullets();

    updateEntities(deltaTime, input);
    spawner_.update(deltaTime, world_, rng_);

    detector_.detect(world_.collisionGroups());
    resolver_.resolve(world_, detector_.getEvents(), rng_);

    checkVictory();
}

int Game::getEnemiesRemaining() const {
    const int unspawned = spawner_.getMaxSpawns() - spawner_.getTotalSpawns();
    return static_cast<int>(world_.getEnemies().size()) + (unspawned > 0 ? unspawned : 0);
}

void Game::updateEntities(float deltaTime, const InputState& input) {
    GameMap& map = world_.getMap();
    const sf::FloatRect playfield = map.playfield();

    map.update(deltaTime);

    PlayerTank& player = world_.getPlayer();
    player.update(deltaTime, playfield);
    player.applyInput(input);

    for (auto& enemy : world_.getEnemies()) {
        enemy.update(deltaTime, playfield);
        enemy.think(deltaTime, rng_);
    }
}

void Game::checkVictory() {
    if (world_.getState() != GameState::Running) {
        return;
    }
    if (world_.getEnemies().empty() && spawner_.isExhausted()) {
        ErrorHandler::logInfo("All " + std::to_string(spawner_.getTotalSpawns()) + " enemies destroyed");
        world_.setState(GameState::Victory);
    }
}
