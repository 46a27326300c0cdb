#pragma once

#include <SFML/System/Vector2.hpp>

#include <cstdint>
#include <random>
#include <string>

enum class Direction : uint8_t {
    Up = 0,
    Down = 1,
    Left = 2,
    Right = 3
};

// Which side a tank or bullet belongs to
enum class OwnerType : uint8_t {
    Player = 0,
    Enemy = 1
};

std::string directionName(Direction direction);
std::string ownerName(OwnerType owner);

// Unit grid step for a direction: Up = (0,-1), Down = (0,1), Left = (-1,0), Right = (1,0)
sf::Vector2i directionDelta(Direction direction);

// Facing that results from a movement vector.
// Horizontal input wins over vertical; a zero vector keeps the current facing.
Direction directionFromMovement(int dx, int dy, Direction current);

// Pick a random direction different from the current one.
// The generator is passed in so AI decisions are reproducible under a fixed seed.
Direction chooseNewDirection(Direction current, std::mt19937& rng);
