#pragma once

// ========================
// Window and Grid Constants
// ========================

const char* const WINDOW_TITLE = "Battle City";
const unsigned int WINDOW_WIDTH = 1024;   // Logical surface scaled x2
const unsigned int WINDOW_HEIGHT = 1024;
const unsigned int FPS = 60;
const float FRAME_TIME = 1.0f / FPS;

const int SOURCE_TILE_SIZE = 16;          // Sprite size inside the atlas
const float TILE_SIZE = 32.0f;            // Game logic uses 32x32 tiles
const int GRID_WIDTH = 16;
const int GRID_HEIGHT = 16;
const float LOGICAL_WIDTH = GRID_WIDTH * TILE_SIZE;    // 512
const float LOGICAL_HEIGHT = GRID_HEIGHT * TILE_SIZE;  // 512

// ========================
// Tank Constants
// ========================

const float TANK_WIDTH = TILE_SIZE;
const float TANK_HEIGHT = TILE_SIZE;
const float TANK_MOVE_DELAY = 0.15f;          // Seconds between one-tile moves
const int PLAYER_HEALTH = 1;
const int PLAYER_LIVES = 3;
const float PLAYER_INVINCIBILITY_DURATION = 3.0f;
const float BLINK_INTERVAL = 0.2f;

// ========================
// Bullet Constants
// ========================

const float BULLET_SPEED = 360.0f;        // Pixels per second (6 px per frame at 60 FPS)
const float BULLET_WIDTH = 8.0f;
const float BULLET_HEIGHT = 8.0f;

// ========================
// Tile Constants
// ========================

const float TILE_ANIMATION_INTERVAL = 0.5f;

// ========================
// Asset Paths
// ========================

const char* const TEXTURE_ATLAS_PATH = "assets/sprites/sprites.png";
const char* const FONT_PATH = "arial.ttf";
