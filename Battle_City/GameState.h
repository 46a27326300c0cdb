#pragma once

#include <cstdint>
#include <string>

enum class GameState : uint8_t {
    Running = 0,
    GameOver = 1,
    Victory = 2,
    Exit = 3
};

inline std::string gameStateName(GameState state) {
    switch (state) {
        case GameState::Running: return "RUNNING";
        case GameState::GameOver: return "GAME_OVER";
        case GameState::Victory: return "VICTORY";
        case GameState::Exit: return "EXIT";
    }
    return "UNKNOWN";
}
