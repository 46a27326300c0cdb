#pragma once

#include "Direction.h"

#include <cstddef>
#include <string>
#include <tuple>
#include <utility>
#include <variant>

// ========================
// Entity References
// ========================
//
// Collision reports name entities by slot, not by pointer. Slots stay valid for the
// whole detect/resolve pass because destroyed enemies are only erased afterwards.

// A tank: the player, or the enemy at `index` in the roster
struct TankRef {
    OwnerType owner = OwnerType::Player;
    std::size_t index = 0;
};

// The bullet owned by the tank with the same owner/index
struct BulletRef {
    OwnerType owner = OwnerType::Player;
    std::size_t index = 0;
};

struct TileRef {
    int gridX = 0;
    int gridY = 0;
};

inline bool operator==(const TankRef& a, const TankRef& b) {
    return a.owner == b.owner && a.index == b.index;
}
inline bool operator<(const TankRef& a, const TankRef& b) {
    return std::tie(a.owner, a.index) < std::tie(b.owner, b.index);
}
inline bool operator==(const BulletRef& a, const BulletRef& b) {
    return a.owner == b.owner && a.index == b.index;
}
inline bool operator<(const BulletRef& a, const BulletRef& b) {
    return std::tie(a.owner, a.index) < std::tie(b.owner, b.index);
}
inline bool operator==(const TileRef& a, const TileRef& b) {
    return a.gridX == b.gridX && a.gridY == b.gridY;
}

using EntityRef = std::variant<TankRef, BulletRef, TileRef>;
using CollisionPair = std::pair<EntityRef, EntityRef>;

inline TankRef ownerOf(const BulletRef& bullet) {
    return TankRef{bullet.owner, bullet.index};
}

std::string describeEntity(const EntityRef& ref);
