#pragma once

// Snapshot of the player's controls for one frame.
// dx / dy are -1, 0 or 1; opposite keys cancel each other out.
struct InputState {
    int dx = 0;
    int dy = 0;
    bool fire = false;      // Fire key pressed this frame
    bool restart = false;   // Restart key pressed this frame
    bool quit = false;      // Escape or window closed
};

// Movement vector from the four arrow key states
inline void movementFromKeys(bool up, bool down, bool left, bool right, int& dx, int& dy) {
    dx = 0;
    dy = 0;
    if (up) dy -= 1;
    if (down) dy += 1;
    if (left) dx -= 1;
    if (right) dx += 1;
}
