#pragma once

#include "InputState.h"

#include <SFML/Window/Event.hpp>

// Maps SFML keyboard state into one InputState per frame.
// Arrows are read as held keys; Space, R and Escape are edge-triggered events.
class KeyboardInput {
public:
    // Feed every event from window.pollEvent()
    void handleEvent(const sf::Event& event);

    // Build this frame's input and clear the edge-triggered flags.
    // Held keys are ignored when the window has no focus.
    InputState collect(bool hasFocus);

private:
    bool fire_ = false;
    bool restart_ = false;
    bool quit_ = false;
};
