#pragma once

#include "ronin/Assets.h"
#include "ronin/Config.h"
#include "ronin/Particles.h"
#include "ronin/Types.h"

#include <vector>

namespace ronin {

// References handed to component updates. Owned by Simulation.
struct SimContext {
    const GameConfig &config;
    const AssetCatalog &assets;
    ParticleSystem &particles;
    std::vector<SoundEvent> &sounds;
};

enum class MotionState { Running, Jumping, DoubleJumping, Ducking };

const char *motionStateName(MotionState s);

struct ActivePowerUp {
    PowerUpKind kind = PowerUpKind::BlueDash;
    float remaining = 0;            // seconds
};

class Player {
public:
    explicit Player(const PlayerTuning &t, float groundY) : tuning(t), groundY(groundY) { reset(); }

    void reset();
    void handleInput(InputEvent e, SimContext &ctx);
    void update(float dt, SimContext &ctx);
    // Timed kinds become the active effect; instantaneous ones return true and leave
    // the effect untouched.
    bool applyPowerUp(PowerUpKind kind, SimContext &ctx);
    // Returns true when this hit defeated the player.
    bool takeHit(SimContext &ctx);

    MotionState state() const { return motion; }
    bool airborne() const { return motion == MotionState::Jumping || motion == MotionState::DoubleJumping; }
    bool grounded() const { return !airborne(); }
    bool defeated() const { return isDefeated; }
    bool invincible() const { return hasEffect && effect.kind == PowerUpKind::BlueDash && effect.remaining > 0; }
    bool hasPowerUp() const { return hasEffect; }
    const ActivePowerUp &powerUp() const { return effect; }
    // Scroll speed factor granted by the active effect.
    float speedMultiplier() const { return invincible() ? tuning.dashSpeedBonus : 1.0f; }

    float x() const { return tuning.x; }
    float y() const { return height; }
    float velocityY() const { return vy; }
    float currentHeight() const { return motion == MotionState::Ducking ? tuning.duckHeight : tuning.standHeight; }
    Rect bounds() const { return Rect{ tuning.x, groundY + height - currentHeight(), tuning.width, currentHeight() }; }
    Vec2 feet() const { return Vec2{ tuning.x, groundY + height }; }

    SpriteKey spriteKey() const;
    SpriteRef sprite() const { return SpriteRef{ spriteKey(), frameIndex }; }
    const CollisionMask &mask(const AssetCatalog &assets) const { return assets.mask(spriteKey(), frameIndex); }
    size_t animationFrame() const { return frameIndex; }
    float jumpBuffer() const { return bufferedJump; }

private:
    void startJump(float velocity, SimContext &ctx);
    void setMotion(MotionState s);

    PlayerTuning tuning;
    float groundY;
    float height = 0;               // offset from ground, negative is up
    float vy = 0;
    MotionState motion = MotionState::Running;
    bool isDefeated = false;
    bool hasEffect = false;
    ActivePowerUp effect;
    float bufferedJump = 0;
    size_t frameIndex = 0;
    float frameTimer = 0;
    float dustTimer = 0;
    float trailTimer = 0;
};

} // namespace ronin
