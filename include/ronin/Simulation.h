#pragma once

#include "ronin/Assets.h"
#include "ronin/Collision.h"
#include "ronin/Config.h"
#include "ronin/Difficulty.h"
#include "ronin/Entities.h"
#include "ronin/Environment.h"
#include "ronin/Particles.h"
#include "ronin/Player.h"
#include "ronin/Spawner.h"
#include "ronin/Types.h"

#include <cstdint>
#include <vector>

namespace ronin {

enum class RunState { Ready, Running, Paused, GameOver };

const char *runStateName(RunState s);

// ------------------------------ Snapshot ----------------------------------
// Read-only copy of what a renderer draws for one frame.

struct PlayerView {
    Rect bounds;
    SpriteRef sprite;
    MotionState state = MotionState::Running;
    bool invincible = false;
    bool defeated = false;
    float powerUpRemaining = 0;
};

struct ObstacleView {
    uint32_t id = 0;
    EntityKind kind = EntityKind::Rock;
    AltitudeBand band = AltitudeBand::Ground;
    Rect bounds;
    SpriteRef sprite;
    float rotation = 0;
};

struct EnvironmentView {
    float phase = 0;
    bool day = true;
    float ambientLight = 1;
    Color3 sky;
    Vec2 sun, moon;
    std::vector<ParallaxLayer> layers;
};

struct FrameSnapshot {
    RunState state = RunState::Ready;
    PlayerView player;
    std::vector<ObstacleView> obstacles;
    std::vector<Particle> particles;
    EnvironmentView environment;
    float groundY = 0;
    float scrollSpeed = 0;
    int score = 0;
    int highScore = 0;
    bool newHighScore = false;
    bool showHitboxes = false;
};

// ------------------------------ Simulation --------------------------------
// Owns every piece of game state for one session. Each step runs the fixed order
// input, player, spawning and entity motion, environment, collisions, particles,
// sounds, then score and difficulty. Paused and GameOver leave state untouched.
class Simulation {
public:
    Simulation(const GameConfig &cfg, const AssetCatalog &assets, int highScore);

    // Fresh run, new seeds, high score carried over as the best seen so far.
    void restart();
    // Queued until the next step. ToggleHitboxDisplay applies at once in any state;
    // JumpPressed in Ready starts the run.
    void handleInput(InputEvent e);
    void step(float dt);
    void setPaused(bool paused);

    RunState state() const { return runState; }
    bool showHitboxes() const { return hitboxes; }
    float elapsed() const { return runTime; }
    DifficultyState difficulty() const { return curve.at(runTime); }
    // Effective scroll speed: difficulty speed times the player's dash bonus.
    float scrollSpeed() const;
    int runCount() const { return runs; }

    FrameSnapshot snapshot() const;
    // Sounds and contacts raised by the last step.
    const std::vector<SoundEvent> &frameSounds() const { return sounds; }
    const std::vector<Contact> &frameContacts() const { return contacts; }

    Player &player() { return hero; }
    const Player &player() const { return hero; }
    ObstacleField &field() { return obstacles; }
    const ObstacleField &field() const { return obstacles; }
    Environment &environment() { return env; }
    const Environment &environment() const { return env; }
    const ParticleSystem &particles() const { return fx; }
    const CollisionEngine &collisions() const { return collider; }
    const ScoreKeeper &score() const { return scorer; }

private:
    void applyInput(InputEvent e, SimContext &ctx);

    GameConfig cfg;
    const AssetCatalog &assets;
    Rng seeds;
    DifficultyCurve curve;
    Player hero;
    ObstacleField obstacles;
    Spawner spawner;
    Environment env;
    ParticleSystem fx;
    CollisionEngine collider;
    ScoreKeeper scorer;

    RunState runState = RunState::Ready;
    bool hitboxes = false;
    float runTime = 0;
    int runs = 0;
    std::vector<InputEvent> pending;
    std::vector<SoundEvent> sounds;
    std::vector<Contact> contacts;
};

} // namespace ronin
