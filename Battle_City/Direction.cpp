#include "Direction.h"

#include <array>

std::string directionName(Direction direction) {
    switch (direction) {
        case Direction::Up: return "up";
        case Direction::Down: return "down";
        case Direction::Left: return "left";
        case Direction::Right: return "right";
    }
    return "unknown";
}

std::string ownerName(OwnerType owner) {
    return owner == OwnerType::Player ? "player" : "enemy";
}

sf::Vector2i directionDelta(Direction direction) {
    switch (direction) {
        case Direction::Up: return sf::Vector2i(0, -1);
        case Direction::Down: return sf::Vector2i(0, 1);
        case Direction::Left: return sf::Vector2i(-1, 0);
        case Direction::Right: return sf::Vector2i(1, 0);
    }
    return sf::Vector2i(0, 0);
}

Direction directionFromMovement(int dx, int dy, Direction current) {
    if (dx > 0) return Direction::Right;
    if (dx < 0) return Direction::Left;
    if (dy > 0) return Direction::Down;
    if (dy < 0) return Direction::Up;
    return current;
}

Direction chooseNewDirection(Direction current, std::mt19937& rng) {
    static const std::array<Direction, 4> allDirections = {
        Direction::Up, Direction::Down, Direction::Left, Direction::Right
    };

    // Collect the three candidates that differ from the current facing
    std::array<Direction, 3> candidates{};
    size_t count = 0;
    for (Direction d : allDirections) {
        if (d != current) {
            candidates[count++] = d;
        }
    }

    std::uniform_int_distribution<size_t> pick(0, count - 1);
    return candidates[pick(rng)];
}
