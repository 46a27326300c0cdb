#include "EntityRef.h"

#include <type_traits>

std::string describeEntity(const EntityRef& ref) {
    return std::visit([](const auto& r) -> std::string {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, TankRef>) {
            if (r.owner == OwnerType::Player) return "PlayerTank";
            return "EnemyTank#" + std::to_string(r.index);
        } else if constexpr (std::is_same_v<T, BulletRef>) {
            return ownerName(r.owner) + " bullet#" + std::to_string(r.index);
        } else {
            return "Tile(" + std::to_string(r.gridX) + ", " + std::to_string(r.gridY) + ")";
        }
    }, ref);
}
