#pragma once

#include "EntityRef.h"
#include "World.h"

#include <vector>

// ========================
// Collision Detector
// ========================
//
// Pure broad-phase: pairs overlapping rectangles from the groups in a fixed order and
// reports them. Never mutates an entity.
class CollisionDetector {
public:
    // Replace the previous frame's events with the overlaps found in `groups`
    void detect(const CollisionGroups& groups);

    const std::vector<CollisionPair>& getEvents() const { return events_; }
    void clear() { events_.clear(); }

private:
    void check(const Collidable& a, const Collidable& b);
    void checkAll(const std::vector<Collidable>& first, const std::vector<Collidable>& second);

    std::vector<CollisionPair> events_;
};
