#include "CollisionDetector.h"

#include "ErrorHandler.h"

// Find every overlapping pair for this frame
//
// ALGORITHM:
// 1. Drop last frame's events
// 2. Walk the group pairings in a fixed order (bullet pairings first so the
//    resolver settles projectiles before tank movement):
//      player bullets x enemy tanks, destructible tiles, enemy bullets, impassable tiles
//      enemy bullets  x base, player tank, destructible tiles, impassable tiles
//      all tanks      x impassable tiles
//      all tanks      x all tanks (each unordered pair once, i < j)
// 3. Record (a, b) for each strict rectangle overlap. Touching edges do not count.
//
// A brick is both destructible and impassable, so the same bullet/brick pair is
// reported twice. The resolver makes the second report a no-op.
void CollisionDetector::detect(const CollisionGroups& groups) {
    events_.clear();

    std::vector<Collidable> allTanks;
    allTanks.reserve(groups.enemyTanks.size() + 1);
    if (groups.playerTank) {
        allTanks.push_back(*groups.playerTank);
    }
    allTanks.insert(allTanks.end(), groups.enemyTanks.begin(), groups.enemyTanks.end());

    // Player bullets
    checkAll(groups.playerBullets, groups.enemyTanks);
    checkAll(groups.playerBullets, groups.destructibleTiles);
    checkAll(groups.playerBullets, groups.enemyBullets);
    checkAll(groups.playerBullets, groups.impassableTiles);

    // Enemy bullets
    if (groups.base) {
        for (const auto& bullet : groups.enemyBullets) {
            check(bullet, *groups.base);
        }
    }
    if (groups.playerTank) {
        for (const auto& bullet : groups.enemyBullets) {
            check(bullet, *groups.playerTank);
        }
    }
    checkAll(groups.enemyBullets, groups.destructibleTiles);
    checkAll(groups.enemyBullets, groups.impassableTiles);

    // Tanks
    checkAll(allTanks, groups.impassableTiles);
    for (size_t i = 0; i < allTanks.size(); i++) {
        for (size_t j = i + 1; j < allTanks.size(); j++) {
            check(allTanks[i], allTanks[j]);
        }
    }

    if (!events_.empty()) {
        ErrorHandler::logDebug("Collision check found " + std::to_string(events_.size()) + " events");
    }
}

void CollisionDetector::check(const Collidable& a, const Collidable& b) {
    if (a.bounds.intersects(b.bounds)) {
        events_.emplace_back(a.ref, b.ref);
    }
}

void CollisionDetector::checkAll(const std::vector<Collidable>& first,
                                 const std::vector<Collidable>& second) {
    for (const auto& a : first) {
        for (const auto& b : second) {
            check(a, b);
        }
    }
}
