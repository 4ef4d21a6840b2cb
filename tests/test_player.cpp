/**
 * @file test_player.cpp
 * @brief Tests for Player: jump kinematics, double jump and input buffer, duck,
 *        power-up stacking and hits.
 */

#include "TestHarness.h"

#include "ronin/Assets.h"
#include "ronin/Config.h"
#include "ronin/Particles.h"
#include "ronin/Player.h"

#include <algorithm>
#include <vector>

using namespace ronin;

namespace
{

struct Fixture
{
    GameConfig cfg;
    AssetCatalog assets;
    ParticleSystem particles;
    std::vector<SoundEvent> sounds;
    SimContext ctx;

    Fixture()
        : assets(makePlaceholderCatalog(cfg))
        , particles(256, 7)
        , ctx{cfg, assets, particles, sounds}
    {
    }

    bool heard(SoundEvent e) const
    {
        return std::find(sounds.begin(), sounds.end(), e) != sounds.end();
    }

    size_t countParticles(ParticleKind k) const
    {
        size_t n = 0;
        for (const auto& p : particles.particles())
            if (p.kind == k) ++n;
        return n;
    }
};

const float kDt = 1.0f / 60.0f;

} // namespace

// =============================================================================
// Jumping
// =============================================================================

void test_jump_kinematics_unit_scenario()
{
    Fixture f;
    PlayerTuning t = f.cfg.player;
    t.gravity = 1.0f;
    t.jumpVelocity = -10.0f;
    Player p(t, f.cfg.screen.groundY);

    TEST_ASSERT(p.state() == MotionState::Running, "starts running");
    TEST_ASSERT(p.y() == 0.0f, "starts on the ground");

    p.handleInput(InputEvent::JumpPressed, f.ctx);
    p.update(1.0f, f.ctx);
    TEST_ASSERT(p.y() == -10.0f, "y is -10 after the first tick");
    TEST_ASSERT(p.state() == MotionState::Jumping, "jumping after the first tick");

    int ticks = 1;
    while (p.airborne() && ticks < 100)
    {
        p.update(1.0f, f.ctx);
        ++ticks;
    }
    TEST_ASSERT(ticks == 21, "symmetric flight lands on tick 21");
    TEST_ASSERT(p.state() == MotionState::Running, "running after landing");
    TEST_ASSERT(p.y() == 0.0f, "back on the ground");
    TEST_ASSERT(p.velocityY() == 0.0f, "vertical velocity cleared on landing");
}

void test_jump_emits_sound_and_dust()
{
    Fixture f;
    Player p(f.cfg.player, f.cfg.screen.groundY);
    p.handleInput(InputEvent::JumpPressed, f.ctx);

    TEST_ASSERT(f.heard(SoundEvent::Jump), "jump sound raised");
    TEST_ASSERT(f.countParticles(ParticleKind::Dust) == 3, "three dust puffs on take-off");
    TEST_ASSERT(p.velocityY() == f.cfg.player.jumpVelocity, "initial velocity applied");
}

void test_double_jump_once_per_flight()
{
    Fixture f;
    Player p(f.cfg.player, f.cfg.screen.groundY);

    p.handleInput(InputEvent::JumpPressed, f.ctx);
    p.update(kDt, f.ctx);
    p.handleInput(InputEvent::JumpPressed, f.ctx);
    TEST_ASSERT(p.state() == MotionState::DoubleJumping, "second press double jumps");
    TEST_ASSERT(p.velocityY() == f.cfg.player.doubleJumpVelocity, "secondary impulse applied");
    TEST_ASSERT(f.heard(SoundEvent::DoubleJump), "double jump sound raised");
    TEST_ASSERT(f.countParticles(ParticleKind::Sparkle) == 5, "five sparkles on double jump");

    p.update(kDt, f.ctx);
    float vy = p.velocityY();
    p.handleInput(InputEvent::JumpPressed, f.ctx);
    TEST_ASSERT(p.state() == MotionState::DoubleJumping, "third press does not re-trigger");
    TEST_ASSERT(p.velocityY() == vy, "third press leaves velocity alone");
    TEST_ASSERT(p.jumpBuffer() > 0.0f, "third press is buffered");

    int guard = 0;
    while (p.airborne() && guard++ < 1000) p.update(kDt, f.ctx);
    TEST_ASSERT(p.state() == MotionState::Running, "buffer expired long before landing");
}

void test_buffered_jump_fires_on_landing()
{
    Fixture f;
    Player p(f.cfg.player, f.cfg.screen.groundY);

    p.handleInput(InputEvent::JumpPressed, f.ctx);
    p.update(kDt, f.ctx);
    p.handleInput(InputEvent::JumpPressed, f.ctx);

    bool pressed = false;
    bool rejumped = false;
    for (int i = 0; i < 600 && !rejumped; ++i)
    {
        if (!pressed && p.velocityY() > 0.0f && p.y() > -20.0f)
        {
            p.handleInput(InputEvent::JumpPressed, f.ctx);
            pressed = true;
            TEST_ASSERT(p.state() == MotionState::DoubleJumping, "still double jumping when pressed");
        }
        p.update(kDt, f.ctx);
        if (pressed && p.state() == MotionState::Jumping) rejumped = true;
    }
    TEST_ASSERT(pressed, "press happened just before landing");
    TEST_ASSERT(rejumped, "buffered press became a jump on landing");
    TEST_ASSERT(p.y() == 0.0f, "jump starts from the ground");
    TEST_ASSERT(p.velocityY() == f.cfg.player.jumpVelocity, "full jump impulse");
}

// =============================================================================
// Ducking
// =============================================================================

void test_duck_shrinks_bounds()
{
    Fixture f;
    Player p(f.cfg.player, f.cfg.screen.groundY);

    p.handleInput(InputEvent::DuckPressed, f.ctx);
    TEST_ASSERT(p.state() == MotionState::Ducking, "duck press ducks");
    Rect b = p.bounds();
    TEST_ASSERT(b.h == f.cfg.player.duckHeight, "duck height");
    TEST_ASSERT(b.bottom() == f.cfg.screen.groundY, "feet stay on the ground");
    TEST_ASSERT(p.mask(f.assets).height() == (int)f.cfg.player.duckHeight, "duck mask in use");

    p.handleInput(InputEvent::DuckReleased, f.ctx);
    TEST_ASSERT(p.state() == MotionState::Running, "release restores running");
    TEST_ASSERT(p.bounds().h == f.cfg.player.standHeight, "standing height again");
}

void test_duck_while_airborne_is_noop()
{
    Fixture f;
    Player p(f.cfg.player, f.cfg.screen.groundY);

    p.handleInput(InputEvent::JumpPressed, f.ctx);
    p.update(kDt, f.ctx);
    p.handleInput(InputEvent::DuckPressed, f.ctx);
    TEST_ASSERT(p.state() == MotionState::Jumping, "duck ignored in the air");
    p.handleInput(InputEvent::DuckReleased, f.ctx);
    TEST_ASSERT(p.state() == MotionState::Jumping, "release ignored in the air");
}

void test_jump_from_duck_stands_up()
{
    Fixture f;
    Player p(f.cfg.player, f.cfg.screen.groundY);

    p.handleInput(InputEvent::DuckPressed, f.ctx);
    p.handleInput(InputEvent::JumpPressed, f.ctx);
    TEST_ASSERT(p.state() == MotionState::Jumping, "jump from a duck");
    TEST_ASSERT(p.bounds().h == f.cfg.player.standHeight, "standing height in the air");
}

// =============================================================================
// Power-ups and hits
// =============================================================================

void test_blue_dash_extends_and_caps()
{
    Fixture f;
    Player p(f.cfg.player, f.cfg.screen.groundY);

    TEST_ASSERT(!p.applyPowerUp(PowerUpKind::BlueDash, f.ctx), "dash is not instantaneous");
    TEST_ASSERT(p.invincible(), "dash grants invincibility");
    TEST_ASSERT(p.speedMultiplier() == f.cfg.player.dashSpeedBonus, "dash grants the speed bonus");
    TEST_ASSERT(p.powerUp().remaining == f.cfg.player.dashDuration, "full duration");
    TEST_ASSERT(f.heard(SoundEvent::PowerUp), "pickup sound raised");

    for (int i = 0; i < 4; ++i) p.update(0.5f, f.ctx);
    TEST_NEAR(p.powerUp().remaining, 3.0f, 1e-4, "two seconds used");

    p.applyPowerUp(PowerUpKind::BlueDash, f.ctx);
    TEST_NEAR(p.powerUp().remaining, 8.0f, 1e-4, "second dash extends by the base duration");

    p.applyPowerUp(PowerUpKind::BlueDash, f.ctx);
    TEST_NEAR(p.powerUp().remaining, f.cfg.player.dashMaxDuration, 1e-4, "extension is capped");

    for (int i = 0; i < 21; ++i) p.update(0.5f, f.ctx);
    TEST_ASSERT(!p.invincible(), "dash expires");
    TEST_ASSERT(!p.hasPowerUp(), "no effect left");
    TEST_ASSERT(p.speedMultiplier() == 1.0f, "speed back to normal");
}

void test_dash_leaves_a_trail()
{
    Fixture f;
    Player p(f.cfg.player, f.cfg.screen.groundY);
    p.applyPowerUp(PowerUpKind::BlueDash, f.ctx);
    for (int i = 0; i < 6; ++i) p.update(kDt, f.ctx);
    TEST_ASSERT(f.countParticles(ParticleKind::DashTrail) > 0, "trail particles while dashing");
}

void test_tornado_is_instantaneous()
{
    Fixture f;
    Player p(f.cfg.player, f.cfg.screen.groundY);

    TEST_ASSERT(p.applyPowerUp(PowerUpKind::YellowTornado, f.ctx), "tornado reports instant use");
    TEST_ASSERT(!p.hasPowerUp(), "tornado never becomes the active effect");

    p.applyPowerUp(PowerUpKind::BlueDash, f.ctx);
    p.update(1.0f, f.ctx);
    p.applyPowerUp(PowerUpKind::YellowTornado, f.ctx);
    TEST_ASSERT(p.invincible(), "tornado does not cancel a running dash");
    TEST_NEAR(p.powerUp().remaining, 4.0f, 1e-4, "dash time untouched by tornado");
}

void test_take_hit_defeats_unless_invincible()
{
    Fixture f;
    Player p(f.cfg.player, f.cfg.screen.groundY);

    p.applyPowerUp(PowerUpKind::BlueDash, f.ctx);
    TEST_ASSERT(!p.takeHit(f.ctx), "hit ignored while invincible");
    TEST_ASSERT(!p.defeated(), "still alive");

    p.reset();
    f.sounds.clear();
    TEST_ASSERT(p.takeHit(f.ctx), "hit lands");
    TEST_ASSERT(p.defeated(), "defeated");
    TEST_ASSERT(f.heard(SoundEvent::Hit), "hit sound raised");
    TEST_ASSERT(!p.takeHit(f.ctx), "second hit is a no-op");

    p.handleInput(InputEvent::JumpPressed, f.ctx);
    TEST_ASSERT(p.grounded(), "input ignored after defeat");
}

void test_running_dust_and_animation()
{
    Fixture f;
    Player p(f.cfg.player, f.cfg.screen.groundY);

    for (int i = 0; i < 30; ++i) p.update(kDt, f.ctx);
    TEST_ASSERT(f.countParticles(ParticleKind::Dust) >= 2, "dust every 0.2 s while running");
    TEST_ASSERT(p.spriteKey() == SpriteKey::PlayerRun, "run sprite");
    TEST_ASSERT(p.animationFrame() < f.assets.animation(SpriteKey::PlayerRun).frameCount(), "frame index in range");

    p.handleInput(InputEvent::JumpPressed, f.ctx);
    TEST_ASSERT(p.spriteKey() == SpriteKey::PlayerJump, "jump sprite");
    TEST_ASSERT(p.animationFrame() == 0, "frame reset on state change");
}

// =============================================================================
// Main
// =============================================================================

int main()
{
    std::printf("=== Player Tests ===\n\n");

    std::printf("jumping:\n");
    RUN_TEST(test_jump_kinematics_unit_scenario);
    RUN_TEST(test_jump_emits_sound_and_dust);
    RUN_TEST(test_double_jump_once_per_flight);
    RUN_TEST(test_buffered_jump_fires_on_landing);

    std::printf("\nducking:\n");
    RUN_TEST(test_duck_shrinks_bounds);
    RUN_TEST(test_duck_while_airborne_is_noop);
    RUN_TEST(test_jump_from_duck_stands_up);

    std::printf("\npower-ups and hits:\n");
    RUN_TEST(test_blue_dash_extends_and_caps);
    RUN_TEST(test_dash_leaves_a_trail);
    RUN_TEST(test_tornado_is_instantaneous);
    RUN_TEST(test_take_hit_defeats_unless_invincible);
    RUN_TEST(test_running_dust_and_animation);

    return TEST_RESULTS();
}
