#pragma once

#include "CollisionDetector.h"
#include "CollisionResolver.h"
#include "GameState.h"
#include "InputState.h"
#include "LevelConfig.h"
#include "Spawner.h"
#include "World.h"

#include <random>

// ========================
// Game
// ========================
//
// Owns the world and runs one fixed-timestep frame at a time:
// entities -> spawner -> detector -> resolver -> terminal state.
class Game {
public:
    explicit Game(const LevelConfig& config = LevelConfig(), unsigned int seed = 0);

    // Rebuild the world from the level config and go back to Running
    void reset();

    // Advance one frame. Only quit/restart are handled outside Running.
    void update(float deltaTime, const InputState& input);

    GameState getState() const { return world_.getState(); }
    bool isFinished() const { return world_.getState() == GameState::Exit; }

    World& getWorld() { return world_; }
    const World& getWorld() const { return world_; }
    Spawner& getSpawner() { return spawner_; }
    const Spawner& getSpawner() const { return spawner_; }
    const CollisionDetector& getDetector() const { return detector_; }
    const CollisionResolver& getResolver() const { return resolver_; }
    std::mt19937& getRng() { return rng_; }
    const LevelConfig& getConfig() const { return config_; }

    // Enemies still to defeat: on the field plus not yet spawned
    int getEnemiesRemaining() const;

    unsigned long getFrameCount() const { return frameCount_; }

private:
    void updateEntities(float deltaTime, const InputState& input);
    void checkVictory();

    LevelConfig config_;
    std::mt19937 rng_;
    World world_;
    Spawner spawner_;
    CollisionDetector detector_;
    CollisionResolver resolver_;
    unsigned long frameCount_ = 0;
};
