// Collision Test Runner for Battle City
// Detector pairings, resolver rules and the enemy spawner

#include "CollisionDetector.h"
#include "CollisionResolver.h"
#include "Constants.h"
#include "LevelConfig.h"
#include "Spawner.h"
#include "World.h"

#include <cmath>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

// ========================
// Test Framework Macros
// ========================

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running test: " << #name << "..."; \
    try { \
        test_##name(); \
        std::cout << " PASSED" << std::endl; \
        passedTests++; \
    } catch (const std::exception& e) { \
        std::cout << " FAILED: " << e.what() << std::endl; \
        failedTests++; \
    } \
    totalTests++; \
} while(0)

#define ASSERT_TRUE(condition) do { \
    if (!(condition)) { \
        std::ostringstream oss; \
        oss << "Assertion failed: " << #condition << " at line " << __LINE__; \
        throw std::runtime_error(oss.str()); \
    } \
} while(0)

#define ASSERT_FALSE(condition) ASSERT_TRUE(!(condition))

#define ASSERT_EQ(expected, actual) do { \
    if ((expected) != (actual)) { \
        std::ostringstream oss; \
        oss << "Assertion failed: expected " << (expected) << " but got " << (actual) << " at line " << __LINE__; \
        throw std::runtime_error(oss.str()); \
    } \
} while(0)

#define ASSERT_NEAR(expected, actual, tolerance) do { \
    if (std::abs((expected) - (actual)) > (tolerance)) { \
        std::ostringstream oss; \
        oss << "Assertion failed: expected " << (expected) << " but got " << (actual) \
            << " (tolerance: " << (tolerance) << ") at line " << __LINE__; \
        throw std::runtime_error(oss.str()); \
    } \
} while(0)

#define ASSERT_GE(value, threshold) do { \
    if (!((value) >= (threshold))) { \
        std::ostringstream oss; \
        oss << "Assertion failed: expected " << (value) << " >= " << (threshold) << " at line " << __LINE__; \
        throw std::runtime_error(oss.str()); \
    } \
} while(0)

// Test counters
int totalTests = 0;
int passedTests = 0;
int failedTests = 0;

// ========================
// Helpers
// ========================

const sf::FloatRect PLAYFIELD(0.0f, 0.0f, LOGICAL_WIDTH, LOGICAL_HEIGHT);

// Open 16x16 field, no enemies, player parked in the bottom-left corner
LevelConfig emptyLevel() {
    LevelConfig config;
    config.useDefaultLayout = false;
    config.initialSpawn = false;
    config.playerStart = sf::Vector2i(0, 15);
    return config;
}

float px(int grid) {
    return grid * TILE_SIZE;
}

EnemyTank& addEnemy(World& world, int gridX, int gridY, EnemyType type = EnemyType::Basic,
                    Direction direction = Direction::Down) {
    world.getEnemies().emplace_back(px(gridX), px(gridY), TILE_SIZE, type, direction);
    return world.getEnemies().back();
}

void setTile(World& world, int gridX, int gridY, TileType type) {
    world.getMap().setType(*world.getMap().tileAt(gridX, gridY), type);
}

// Fire from `tank` and put the bullet's top-left corner at (x, y)
Bullet& placeBullet(Tank& tank, Direction direction, float x, float y) {
    tank.setDirection(direction);
    tank.shoot();
    Bullet& bullet = *tank.getActiveBullet();
    bullet.x = x;
    bullet.y = y;
    return bullet;
}

const BulletRef PLAYER_BULLET{OwnerType::Player, 0};
const TankRef PLAYER_TANK{OwnerType::Player, 0};

BulletRef enemyBullet(std::size_t index) {
    return BulletRef{OwnerType::Enemy, index};
}

TankRef enemyTank(std::size_t index) {
    return TankRef{OwnerType::Enemy, index};
}

int countPair(const std::vector<CollisionPair>& events, const EntityRef& a, const EntityRef& b) {
    int count = 0;
    for (const auto& event : events) {
        if (event.first == a && event.second == b) {
            count++;
        }
    }
    return count;
}

// Detect and resolve one batch the way a game frame does
void runPipeline(World& world, CollisionDetector& detector, CollisionResolver& resolver, std::mt19937& rng) {
    detector.detect(world.collisionGroups());
    resolver.resolve(world, detector.getEvents(), rng);
}

// ========================
// Collision Groups
// ========================

TEST(World_CollisionGroupsSplitTiles) {
    World world(emptyLevel());
    setTile(world, 2, 2, TileType::Brick);
    setTile(world, 3, 2, TileType::Steel);
    setTile(world, 4, 2, TileType::Water);
    setTile(world, 5, 2, TileType::Bush);
    setTile(world, 6, 2, TileType::Base);

    CollisionGroups groups = world.collisionGroups();
    ASSERT_EQ(1u, groups.destructibleTiles.size());
    ASSERT_EQ(4u, groups.impassableTiles.size());
    ASSERT_TRUE(groups.base.has_value());
    ASSERT_TRUE(groups.base->ref == EntityRef(TileRef{6, 2}));
    ASSERT_TRUE(groups.playerTank.has_value());
    ASSERT_EQ(0u, groups.playerBullets.size());
    ASSERT_EQ(0u, groups.enemyTanks.size());
}

TEST(World_SlotLookups) {
    World world(emptyLevel());
    addEnemy(world, 4, 4);

    ASSERT_TRUE(world.findTank(PLAYER_TANK) == &world.getPlayer());
    ASSERT_TRUE(world.findTank(enemyTank(0)) == &world.getEnemies()[0]);
    ASSERT_TRUE(world.findTank(enemyTank(1)) == nullptr);
    ASSERT_TRUE(world.findBullet(enemyBullet(0)) == nullptr);
    ASSERT_TRUE(world.findTile(TileRef{16, 0}) == nullptr);

    world.getEnemies()[0].shoot();
    ASSERT_TRUE(world.findBullet(enemyBullet(0)) != nullptr);
}

// ========================
// Collision Detector
// ========================

TEST(Detector_PlayerBulletHitsEnemyTank) {
    World world(emptyLevel());
    addEnemy(world, 5, 5);
    placeBullet(world.getPlayer(), Direction::Up, px(5) + 12.0f, px(5) + 20.0f);

    CollisionDetector detector;
    detector.detect(world.collisionGroups());

    ASSERT_EQ(1u, detector.getEvents().size());
    ASSERT_EQ(1, countPair(detector.getEvents(), PLAYER_BULLET, enemyTank(0)));
}

TEST(Detector_TouchingEdgesDoNotCollide) {
    World world(emptyLevel());
    world.getPlayer().setPosition(px(4), px(5));
    addEnemy(world, 4, 4);
    setTile(world, 5, 5, TileType::Steel);

    CollisionDetector detector;
    detector.detect(world.collisionGroups());
    ASSERT_EQ(0u, detector.getEvents().size());
}

TEST(Detector_NoFriendlyFirePairs) {
    World world(emptyLevel());
    addEnemy(world, 3, 3);
    EnemyTank& second = addEnemy(world, 8, 8);

    // Enemy 0's bullet sits on top of enemy 1 and of enemy 1's own bullet
    placeBullet(world.getEnemies()[0], Direction::Down, px(8) + 4.0f, px(8) + 4.0f);
    placeBullet(second, Direction::Down, px(8) + 6.0f, px(8) + 6.0f);

    // The player's bullet sits on the player
    world.getPlayer().setPosition(px(1), px(1));
    world.getPlayer().shoot();

    CollisionDetector detector;
    detector.detect(world.collisionGroups());
    ASSERT_EQ(0u, detector.getEvents().size());
}

TEST(Detector_PairingOrderAndBrickReportedTwice) {
    World world(emptyLevel());
    setTile(world, 6, 4, TileType::Brick);
    world.getPlayer().setPosition(px(2), px(2));
    addEnemy(world, 6, 5);
    addEnemy(world, 2, 3);

    // Player bullet straddles enemy 0 and the brick above it
    placeBullet(world.getPlayer(), Direction::Up, px(6) + 12.0f, px(5) - 4.0f);

    // Tanks overlap each other
    world.getEnemies()[1].setPosition(px(2), px(2) + 16.0f);

    CollisionDetector detector;
    detector.detect(world.collisionGroups());
    const std::vector<CollisionPair>& events = detector.getEvents();

    ASSERT_EQ(4u, events.size());
    ASSERT_TRUE(events[0].first == EntityRef(PLAYER_BULLET));
    ASSERT_TRUE(events[0].second == EntityRef(enemyTank(0)));
    ASSERT_TRUE(events[1].second == EntityRef(TileRef{6, 4}));  // destructible pass
    ASSERT_TRUE(events[2].second == EntityRef(TileRef{6, 4}));  // impassable pass
    ASSERT_TRUE(events[3].first == EntityRef(PLAYER_TANK));
    ASSERT_TRUE(events[3].second == EntityRef(enemyTank(1)));
}

TEST(Detector_EnemyBulletPairings) {
    World world(emptyLevel());
    setTile(world, 8, 14, TileType::Base);
    world.getPlayer().setPosition(px(3), px(10));
    addEnemy(world, 8, 2);
    addEnemy(world, 3, 2);

    placeBullet(world.getEnemies()[0], Direction::Down, px(8) + 12.0f, px(14) + 2.0f);
    placeBullet(world.getEnemies()[1], Direction::Down, px(3) + 12.0f, px(10) + 2.0f);

    CollisionDetector detector;
    detector.detect(world.collisionGroups());
    const std::vector<CollisionPair>& events = detector.getEvents();

    // Base pairing, the player pairing, then the base again as an impassable tile
    ASSERT_EQ(3u, events.size());
    ASSERT_TRUE(events[0].first == EntityRef(enemyBullet(0)));
    ASSERT_TRUE(events[0].second == EntityRef(TileRef{8, 14}));
    ASSERT_TRUE(events[1].first == EntityRef(enemyBullet(1)));
    ASSERT_TRUE(events[1].second == EntityRef(PLAYER_TANK));
    ASSERT_TRUE(events[2].second == EntityRef(TileRef{8, 14}));
}

TEST(Detector_ReportReplacedEachFrame) {
    World world(emptyLevel());
    addEnemy(world, 5, 5);
    Bullet& bullet = placeBullet(world.getPlayer(), Direction::Up, px(5) + 12.0f, px(5) + 20.0f);

    CollisionDetector detector;
    detector.detect(world.collisionGroups());
    detector.detect(world.collisionGroups());
    ASSERT_EQ(1u, detector.getEvents().size());

    bullet.y = px(10);
    detector.detect(world.collisionGroups());
    ASSERT_EQ(0u, detector.getEvents().size());
}

// ========================
// Collision Resolver: bullets
// ========================

TEST(Resolver_BulletDestroysBrickOnce) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    setTile(world, 5, 5, TileType::Brick);

    Bullet& bullet = placeBullet(world.getPlayer(), Direction::Up, px(5) + 12.0f, px(6) - 4.0f);
    runPipeline(world, detector, resolver, rng);

    ASSERT_EQ(2u, detector.getEvents().size());
    ASSERT_FALSE(bullet.active);
    ASSERT_TRUE(world.getMap().tileAt(5, 5)->type == TileType::Empty);
    ASSERT_EQ(1u, resolver.getProcessedBullets().size());
}

TEST(Resolver_SteelStopsBullet) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    setTile(world, 5, 5, TileType::Steel);

    Bullet& bullet = placeBullet(world.getPlayer(), Direction::Up, px(5) + 12.0f, px(6) - 4.0f);
    runPipeline(world, detector, resolver, rng);

    ASSERT_FALSE(bullet.active);
    ASSERT_TRUE(world.getMap().tileAt(5, 5)->type == TileType::Steel);
}

TEST(Resolver_BulletsFlyOverWater) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    setTile(world, 5, 5, TileType::Water);

    Bullet& bullet = placeBullet(world.getPlayer(), Direction::Up, px(5) + 12.0f, px(5) + 12.0f);
    runPipeline(world, detector, resolver, rng);

    ASSERT_EQ(1u, detector.getEvents().size());
    ASSERT_TRUE(bullet.active);
    ASSERT_EQ(0u, resolver.getProcessedBullets().size());
    ASSERT_TRUE(world.getMap().tileAt(5, 5)->type == TileType::Water);
}

TEST(Resolver_PlayerBulletKillsEnemy) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    addEnemy(world, 5, 5);

    Bullet& bullet = placeBullet(world.getPlayer(), Direction::Up, px(5) + 12.0f, px(5) + 20.0f);
    runPipeline(world, detector, resolver, rng);

    ASSERT_FALSE(bullet.active);
    ASSERT_EQ(1u, resolver.getEnemiesDestroyed());
    ASSERT_EQ(0u, world.getEnemies().size());
}

TEST(Resolver_ArmorSurvivesOneHit) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    addEnemy(world, 5, 5, EnemyType::Armor);

    placeBullet(world.getPlayer(), Direction::Up, px(5) + 12.0f, px(5) + 20.0f);
    runPipeline(world, detector, resolver, rng);

    ASSERT_EQ(1u, world.getEnemies().size());
    ASSERT_EQ(3, world.getEnemies()[0].getHealth());
    ASSERT_EQ(0u, resolver.getEnemiesDestroyed());
}

TEST(Resolver_BulletConsumedByFirstHitOnly) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    setTile(world, 6, 4, TileType::Brick);
    addEnemy(world, 6, 5, EnemyType::Armor);

    // Overlaps the enemy and the brick: the enemy pairing comes first
    placeBullet(world.getPlayer(), Direction::Up, px(6) + 12.0f, px(5) - 4.0f);
    runPipeline(world, detector, resolver, rng);

    ASSERT_EQ(3u, detector.getEvents().size());
    ASSERT_EQ(3, world.getEnemies()[0].getHealth());
    ASSERT_TRUE(world.getMap().tileAt(6, 4)->type == TileType::Brick);
    ASSERT_EQ(1u, resolver.getProcessedBullets().size());
}

TEST(Resolver_EnemyBulletCostsPlayerALife) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    PlayerTank& player = world.getPlayer();
    addEnemy(world, 2, 2);

    // Player wandered away from its start before being hit
    player.setPosition(px(5), px(10));
    Bullet& bullet = placeBullet(world.getEnemies()[0], Direction::Down, px(5) + 12.0f, px(10) + 4.0f);
    runPipeline(world, detector, resolver, rng);

    ASSERT_FALSE(bullet.active);
    ASSERT_EQ(2, player.getLives());
    ASSERT_TRUE(player.isInvincible());
    ASSERT_NEAR(px(0), player.getPosition().x, 0.001f);
    ASSERT_NEAR(px(15), player.getPosition().y, 0.001f);
    ASSERT_TRUE(world.getState() == GameState::Running);
}

TEST(Resolver_InvinciblePlayerOnlyStopsBullet) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    PlayerTank& player = world.getPlayer();
    player.makeInvincible(PLAYER_INVINCIBILITY_DURATION);
    addEnemy(world, 0, 10);

    Bullet& bullet = placeBullet(world.getEnemies()[0], Direction::Down, px(0) + 12.0f, px(15) + 4.0f);
    runPipeline(world, detector, resolver, rng);

    ASSERT_FALSE(bullet.active);
    ASSERT_EQ(PLAYER_LIVES, player.getLives());
}

TEST(Resolver_LastLifeEndsGame) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    PlayerTank& player = world.getPlayer();
    player.setLives(1);
    addEnemy(world, 0, 10);

    placeBullet(world.getEnemies()[0], Direction::Down, px(0) + 12.0f, px(15) + 4.0f);
    runPipeline(world, detector, resolver, rng);

    ASSERT_EQ(0, player.getLives());
    ASSERT_TRUE(player.isDestroyed());
    ASSERT_TRUE(world.getState() == GameState::GameOver);
}

TEST(Resolver_BaseDestroyedByEitherSide) {
    for (int side = 0; side < 2; side++) {
        World world(emptyLevel());
        std::mt19937 rng(1);
        CollisionDetector detector;
        CollisionResolver resolver;
        setTile(world, 8, 14, TileType::Base);
        addEnemy(world, 8, 2);

        Tank& shooter = (side == 0) ? static_cast<Tank&>(world.getPlayer())
                                    : static_cast<Tank&>(world.getEnemies()[0]);
        Bullet& bullet = placeBullet(shooter, Direction::Down, px(8) + 12.0f, px(14) + 2.0f);
        runPipeline(world, detector, resolver, rng);

        ASSERT_FALSE(bullet.active);
        ASSERT_TRUE(world.getMap().tileAt(8, 14)->type == TileType::BaseDestroyed);
        ASSERT_TRUE(world.getMap().baseTile() == nullptr);
        ASSERT_TRUE(world.getState() == GameState::GameOver);
    }
}

TEST(Resolver_OpposingBulletsCancel) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    addEnemy(world, 7, 2);

    Bullet& mine = placeBullet(world.getPlayer(), Direction::Up, px(7) + 12.0f, px(8));
    Bullet& theirs = placeBullet(world.getEnemies()[0], Direction::Down, px(7) + 14.0f, px(8) + 4.0f);
    runPipeline(world, detector, resolver, rng);

    ASSERT_FALSE(mine.active);
    ASSERT_FALSE(theirs.active);
    ASSERT_EQ(2u, resolver.getProcessedBullets().size());
}

// ========================
// Collision Resolver: tanks
// ========================

TEST(Resolver_TanksBumpingRevert) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    PlayerTank& player = world.getPlayer();
    player.setPosition(px(2), px(4));
    EnemyTank& enemy = addEnemy(world, 4, 4, EnemyType::Basic, Direction::Left);

    // Both step into (3, 4)
    player.update(1.0f, PLAYFIELD);
    enemy.update(1.0f, PLAYFIELD);
    ASSERT_TRUE(player.tryMove(1, 0));
    ASSERT_TRUE(enemy.tryMove(-1, 0));
    runPipeline(world, detector, resolver, rng);

    ASSERT_NEAR(px(2), player.getPosition().x, 0.001f);
    ASSERT_NEAR(px(4), world.getEnemies()[0].getPosition().x, 0.001f);
    ASSERT_EQ(2u, resolver.getRevertedTanks().size());
}

TEST(Resolver_EnemyTurnsAwayFromWall) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    setTile(world, 5, 4, TileType::Steel);
    EnemyTank& enemy = addEnemy(world, 4, 4, EnemyType::Basic, Direction::Right);

    enemy.update(1.0f, PLAYFIELD);
    enemy.think(1.0f, rng);
    ASSERT_NEAR(px(5), enemy.getPosition().x, 0.001f);

    runPipeline(world, detector, resolver, rng);

    const EnemyTank& after = world.getEnemies()[0];
    ASSERT_NEAR(px(4), after.getPosition().x, 0.001f);
    ASSERT_FALSE(after.getDirection() == Direction::Right);
    ASSERT_NEAR(0.0f, after.getDirectionTimer(), 0.001f);
}

TEST(Resolver_PlayerBlockedByWater) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    setTile(world, 0, 14, TileType::Water);
    PlayerTank& player = world.getPlayer();

    player.update(1.0f, PLAYFIELD);
    ASSERT_TRUE(player.tryMove(0, -1));
    runPipeline(world, detector, resolver, rng);

    ASSERT_NEAR(px(15), player.getPosition().y, 0.001f);
    ASSERT_TRUE(player.getDirection() == Direction::Up);
}

TEST(Resolver_BushAndIceDoNotBlock) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    setTile(world, 0, 14, TileType::Bush);
    setTile(world, 1, 15, TileType::Ice);
    PlayerTank& player = world.getPlayer();

    player.update(1.0f, PLAYFIELD);
    ASSERT_TRUE(player.tryMove(0, -1));
    runPipeline(world, detector, resolver, rng);

    ASSERT_NEAR(px(14), player.getPosition().y, 0.001f);
    ASSERT_EQ(0u, detector.getEvents().size());
}

TEST(Resolver_BrickClearedBeforeTankPairIsResolved) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    setTile(world, 5, 4, TileType::Brick);
    addEnemy(world, 1, 1);
    EnemyTank& mover = addEnemy(world, 5, 5, EnemyType::Armor, Direction::Up);

    // One enemy drives into the brick in the same frame another enemy's bullet clears it
    mover.update(1.0f, PLAYFIELD);
    ASSERT_TRUE(mover.tryMove(0, -1));
    placeBullet(world.getEnemies()[0], Direction::Right, px(5) - 4.0f, px(4) + 12.0f);
    runPipeline(world, detector, resolver, rng);

    // Bullet pairings come first, so the tank pairing sees an empty tile
    ASSERT_EQ(3u, detector.getEvents().size());
    ASSERT_TRUE(world.getMap().tileAt(5, 4)->type == TileType::Empty);
    ASSERT_NEAR(px(4), world.getEnemies()[1].getPosition().y, 0.001f);
    ASSERT_EQ(4, world.getEnemies()[1].getHealth());
    ASSERT_EQ(0u, resolver.getRevertedTanks().size());
}

TEST(Resolver_TankStopsAtPlayfieldEdge) {
    World world(emptyLevel());
    std::mt19937 rng(1);
    CollisionDetector detector;
    CollisionResolver resolver;
    EnemyTank& enemy = addEnemy(world, 0, 8, EnemyType::Basic, Direction::Left);
    PlayerTank& player = world.getPlayer();

    // No tile lies beyond the grid, so nothing is reported for either move
    enemy.update(1.0f, PLAYFIELD);
    ASSERT_TRUE(enemy.tryMove(-1, 0));
    player.update(1.0f, PLAYFIELD);
    ASSERT_TRUE(player.tryMove(0, 1));
    runPipeline(world, detector, resolver, rng);

    ASSERT_EQ(0u, detector.getEvents().size());
    const EnemyTank& after = world.getEnemies()[0];
    ASSERT_NEAR(0.0f, after.getPosition().x, 0.001f);
    ASSERT_NEAR(px(8), after.getPosition().y, 0.001f);
    ASSERT_FALSE(after.getDirection() == Direction::Left);
    ASSERT_NEAR(px(15), player.getPosition().y, 0.001f);
    ASSERT_EQ(2u, resolver.getRevertedTanks().size());
}

TEST(Property_BulletResolvedAtMostOncePerFrame) {
    const int NUM_ITERATIONS = 150;
    int successCount = 0;
    std::mt19937 gen(2024);
    std::uniform_int_distribution<int> cell(1, 14);
    std::uniform_real_distribution<float> jitter(0.0f, 28.0f);
    std::uniform_int_distribution<int> tileKind(0, 3);

    std::cout << std::endl;
    std::cout << "  Running property-based test with " << NUM_ITERATIONS << " iterations..." << std::endl;

    for (int i = 0; i < NUM_ITERATIONS; i++) {
        World world(emptyLevel());
        CollisionDetector detector;
        CollisionResolver resolver;

        // A cluttered neighbourhood around a random target cell
        const int cx = cell(gen);
        const int cy = cell(gen);
        const TileType kinds[] = {TileType::Brick, TileType::Steel, TileType::Water, TileType::Empty};
        for (int dx = -1; dx <= 1; dx++) {
            setTile(world, cx + dx, cy - 1, kinds[tileKind(gen)]);
        }
        addEnemy(world, cx, cy, EnemyType::Armor);
        addEnemy(world, cx + (cx < 14 ? 1 : -1), cy, EnemyType::Armor);

        const float bx = px(cx) + jitter(gen);
        const float by = px(cy) - 4.0f;
        placeBullet(world.getPlayer(), Direction::Up, bx, by);
        placeBullet(world.getEnemies()[0], Direction::Down, bx + 2.0f, by + 2.0f);

        int healthBefore = 0;
        for (const auto& enemy : world.getEnemies()) {
            healthBefore += enemy.getHealth();
        }

        runPipeline(world, detector, resolver, gen);

        int healthAfter = 0;
        for (const auto& enemy : world.getEnemies()) {
            healthAfter += enemy.getHealth();
        }

        // One player bullet deals at most one point of damage
        bool holds = healthBefore - healthAfter <= 1 &&
                     resolver.getProcessedBullets().size() <= 2;
        if (!holds) {
            std::ostringstream oss;
            oss << "Property violated: health " << healthBefore << " -> " << healthAfter
                << ", processed " << resolver.getProcessedBullets().size()
                << " at iteration " << i;
            throw std::runtime_error(oss.str());
        }
        successCount++;
    }

    std::cout << "  ✓ Property held for all " << successCount << " iterations" << std::endl;
    ASSERT_EQ(NUM_ITERATIONS, successCount);
}

// ========================
// Spawner
// ========================

TEST(Spawner_RejectsEmptyConfiguration) {
    bool threw = false;
    try {
        Spawner spawner({}, 5, 5.0f, {EnemyType::Basic});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw);

    threw = false;
    try {
        Spawner spawner({sf::Vector2i(3, 1)}, 5, 5.0f, {});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

TEST(Spawner_PlacesEnemyAtSpawnPoint) {
    World world(emptyLevel());
    std::mt19937 rng(3);
    Spawner spawner({sf::Vector2i(3, 1)}, 5, 5.0f, {EnemyType::Fast});

    ASSERT_TRUE(spawner.trySpawn(world, rng));
    ASSERT_EQ(1, spawner.getTotalSpawns());
    ASSERT_EQ(1u, world.getEnemies().size());
    ASSERT_TRUE(world.getEnemies()[0].getType() == EnemyType::Fast);
    ASSERT_NEAR(px(3), world.getEnemies()[0].getPosition().x, 0.001f);
    ASSERT_NEAR(px(1), world.getEnemies()[0].getPosition().y, 0.001f);

    // Same spot is now taken
    ASSERT_FALSE(spawner.trySpawn(world, rng));
    ASSERT_EQ(1, spawner.getTotalSpawns());
    ASSERT_EQ(1u, world.getEnemies().size());
}

TEST(Spawner_BlockedByTileAndPlayer) {
    World world(emptyLevel());
    std::mt19937 rng(3);
    Spawner spawner({sf::Vector2i(3, 1)}, 5, 5.0f, {EnemyType::Basic});

    setTile(world, 3, 1, TileType::Brick);
    ASSERT_FALSE(spawner.trySpawn(world, rng));

    setTile(world, 3, 1, TileType::Bush);
    world.getPlayer().setPosition(px(3), px(1) + 10.0f);
    ASSERT_FALSE(spawner.trySpawn(world, rng));

    world.getPlayer().setPosition(px(3), px(2));
    ASSERT_TRUE(spawner.trySpawn(world, rng));
}

TEST(Spawner_BlockedSpawnRetriesNextFrame) {
    World world(emptyLevel());
    std::mt19937 rng(3);
    Spawner spawner({sf::Vector2i(3, 1)}, 5, 5.0f, {EnemyType::Basic});
    world.getPlayer().setPosition(px(3), px(1));

    for (int frame = 0; frame < 300; frame++) {
        ASSERT_FALSE(spawner.update(FRAME_TIME, world, rng));
    }
    ASSERT_GE(spawner.getSpawnTimer(), 4.9f);

    // Still blocked once the interval has elapsed: timer keeps running
    ASSERT_FALSE(spawner.update(0.2f, world, rng));
    ASSERT_GE(spawner.getSpawnTimer(), 5.0f);

    world.getPlayer().setPosition(px(6), px(6));
    ASSERT_TRUE(spawner.update(FRAME_TIME, world, rng));
    ASSERT_NEAR(0.0f, spawner.getSpawnTimer(), 0.001f);
    ASSERT_EQ(1, spawner.getTotalSpawns());
}

TEST(Property_SpawnCapNeverExceeded) {
    const int NUM_ITERATIONS = 100;
    int successCount = 0;
    std::mt19937 gen(77);
    std::uniform_real_distribution<float> dtDist(0.0f, 3.0f);
    std::uniform_int_distribution<int> capDist(0, 6);

    std::cout << std::endl;
    std::cout << "  Running property-based test with " << NUM_ITERATIONS << " iterations..." << std::endl;

    for (int i = 0; i < NUM_ITERATIONS; i++) {
        LevelConfig config;
        World world(emptyLevel());
        const int cap = capDist(gen);
        Spawner spawner(config.spawnPoints, cap, config.spawnInterval, config.enemyRoster);

        for (int step = 0; step < 200; step++) {
            spawner.update(dtDist(gen), world, gen);
            // Free the spawn points so only the cap can stop the spawner
            if (step % 3 == 0) {
                world.getEnemies().clear();
            }
            if (spawner.getTotalSpawns() > cap) {
                std::ostringstream oss;
                oss << "Property violated: " << spawner.getTotalSpawns() << " spawns with cap " << cap
                    << " at iteration " << i;
                throw std::runtime_error(oss.str());
            }
        }

        ASSERT_EQ(cap, spawner.getTotalSpawns());
        ASSERT_TRUE(spawner.isExhausted());
        ASSERT_FALSE(spawner.trySpawn(world, gen));
        successCount++;
    }

    std::cout << "  ✓ Property held for all " << successCount << " iterations" << std::endl;
    ASSERT_EQ(NUM_ITERATIONS, successCount);
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Battle City Collision Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    RUN_TEST(World_CollisionGroupsSplitTiles);
    RUN_TEST(World_SlotLookups);
    RUN_TEST(Detector_PlayerBulletHitsEnemyTank);
    RUN_TEST(Detector_TouchingEdgesDoNotCollide);
    RUN_TEST(Detector_NoFriendlyFirePairs);
    RUN_TEST(Detector_PairingOrderAndBrickReportedTwice);
    RUN_TEST(Detector_EnemyBulletPairings);
    RUN_TEST(Detector_ReportReplacedEachFrame);
    RUN_TEST(Resolver_BulletDestroysBrickOnce);
    RUN_TEST(Resolver_SteelStopsBullet);
    RUN_TEST(Resolver_BulletsFlyOverWater);
    RUN_TEST(Resolver_PlayerBulletKillsEnemy);
    RUN_TEST(Resolver_ArmorSurvivesOneHit);
    RUN_TEST(Resolver_BulletConsumedByFirstHitOnly);
    RUN_TEST(Resolver_EnemyBulletCostsPlayerALife);
    RUN_TEST(Resolver_InvinciblePlayerOnlyStopsBullet);
    RUN_TEST(Resolver_LastLifeEndsGame);
    RUN_TEST(Resolver_BaseDestroyedByEitherSide);
    RUN_TEST(Resolver_OpposingBulletsCancel);
    RUN_TEST(Resolver_TanksBumpingRevert);
    RUN_TEST(Resolver_EnemyTurnsAwayFromWall);
    RUN_TEST(Resolver_PlayerBlockedByWater);
    RUN_TEST(Resolver_BushAndIceDoNotBlock);
    RUN_TEST(Resolver_BrickClearedBeforeTankPairIsResolved);
    RUN_TEST(Resolver_TankStopsAtPlayfieldEdge);
    RUN_TEST(Property_BulletResolvedAtMostOncePerFrame);
    RUN_TEST(Spawner_RejectsEmptyConfiguration);
    RUN_TEST(Spawner_PlacesEnemyAtSpawnPoint);
    RUN_TEST(Spawner_BlockedByTileAndPlayer);
    RUN_TEST(Spawner_BlockedSpawnRetriesNextFrame);
    RUN_TEST(Property_SpawnCapNeverExceeded);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Test Summary" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Total tests: " << totalTests << std::endl;
    std::cout << "Passed: " << passedTests << std::endl;
    std::cout << "Failed: " << failedTests << std::endl;
    std::cout << "Success rate: " << (totalTests > 0 ? (passedTests * 100 / totalTests) : 0) << "%" << std::endl;
    std::cout << std::endl;

    if (failedTests == 0) {
        std::cout << "✓ All tests passed!" << std::endl;
        return 0;
    } else {
        std::cout << "✗ Some tests failed!" << std::endl;
        return 1;
    }
}
