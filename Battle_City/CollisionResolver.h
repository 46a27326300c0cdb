#pragma once

#include "EntityRef.h"
#include "World.h"

#include <random>
#include <set>
#include <vector>

// ========================
// Collision Resolver
// ========================
//
// Applies game rules to the detector's report. Bullets resolve at most once per frame,
// tanks revert at most once per frame, destroyed enemies are removed after the pass.
class CollisionResolver {
public:
    void resolve(World& world, const std::vector<CollisionPair>& events, std::mt19937& rng);

    // Bookkeeping of the last resolve() call
    const std::set<BulletRef>& getProcessedBullets() const { return processedBullets_; }
    const std::set<TankRef>& getRevertedTanks() const { return revertedTanks_; }
    std::size_t getEnemiesDestroyed() const { return enemiesDestroyed_; }

private:
    friend struct PairVisitor;

    bool isProcessed(const BulletRef& bullet) const { return processedBullets_.count(bullet) > 0; }
    bool isReverted(const TankRef& tank) const { return revertedTanks_.count(tank) > 0; }

    // Each returns true when the bullet was consumed by the hit
    bool bulletHitsTank(World& world, const BulletRef& bullet, const TankRef& tank);
    bool bulletHitsBullet(World& world, const BulletRef& bullet, const BulletRef& other);
    bool bulletHitsTile(World& world, const BulletRef& bullet, const TileRef& tile);

    void tankHitsTank(World& world, const TankRef& a, const TankRef& b);
    void tankHitsTile(World& world, const TankRef& tank, const TileRef& tile, std::mt19937& rng);

    // Off-grid cells block tanks like steel
    void keepTanksInPlayfield(World& world, std::mt19937& rng);

    std::set<BulletRef> processedBullets_;
    std::set<TankRef> revertedTanks_;
    std::size_t enemiesDestroyed_ = 0;
};
