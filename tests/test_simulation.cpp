/**
 * @file test_simulation.cpp
 * @brief Tests for Simulation: run states, input routing, game over and restart,
 *        scoring, determinism and snapshot consistency.
 */

#include "TestHarness.h"

#include "ronin/Assets.h"
#include "ronin/Config.h"
#include "ronin/Entities.h"
#include "ronin/Simulation.h"

#include <algorithm>
#include <vector>

using namespace ronin;

namespace
{

const float kDt = 1.0f / 60.0f;

bool hasSound(const Simulation& sim, SoundEvent e)
{
    const std::vector<SoundEvent>& s = sim.frameSounds();
    return std::find(s.begin(), s.end(), e) != s.end();
}

bool hasOutcome(const Simulation& sim, ContactOutcome o)
{
    for (const Contact& c : sim.frameContacts())
        if (c.outcome == o) return true;
    return false;
}

void startRun(Simulation& sim)
{
    sim.handleInput(InputEvent::JumpPressed);
    sim.step(kDt);
}

// Steps until the opening jump lands.
void waitForLanding(Simulation& sim)
{
    for (int i = 0; i < 120 && sim.player().airborne(); ++i) sim.step(kDt);
}

} // namespace

// =============================================================================
// Run states
// =============================================================================

void test_ready_waits_for_jump()
{
    GameConfig cfg;
    AssetCatalog assets = makePlaceholderCatalog(cfg);
    Simulation sim(cfg, assets, 0);

    TEST_ASSERT(sim.state() == RunState::Ready, "starts ready");
    TEST_ASSERT(sim.runCount() == 1, "first run");
    sim.handleInput(InputEvent::DuckPressed);
    sim.step(kDt);
    TEST_ASSERT(sim.state() == RunState::Ready, "only jump starts the run");
    TEST_ASSERT(sim.elapsed() == 0.0f, "no time passes while ready");
    TEST_ASSERT(sim.field().empty(), "nothing spawns while ready");

    sim.handleInput(InputEvent::JumpPressed);
    TEST_ASSERT(sim.state() == RunState::Running, "jump starts the run");
    sim.step(kDt);
    TEST_ASSERT(hasSound(sim, SoundEvent::Jump), "the starting jump is a real jump");
    TEST_ASSERT(sim.player().airborne(), "player leaves the ground");
    TEST_NEAR(sim.elapsed(), kDt, 1e-6, "run clock started");

    sim.step(0.0f);
    TEST_NEAR(sim.elapsed(), kDt, 1e-6, "zero dt is a no-op");
    TEST_ASSERT(sim.frameSounds().empty(), "no sounds from an empty step");
}

void test_hitbox_toggle_in_any_state()
{
    GameConfig cfg;
    AssetCatalog assets = makePlaceholderCatalog(cfg);
    Simulation sim(cfg, assets, 0);

    sim.handleInput(InputEvent::ToggleHitboxDisplay);
    TEST_ASSERT(sim.showHitboxes(), "toggled while ready");
    TEST_ASSERT(sim.state() == RunState::Ready, "does not start the run");

    startRun(sim);
    sim.setPaused(true);
    sim.handleInput(InputEvent::ToggleHitboxDisplay);
    TEST_ASSERT(!sim.showHitboxes(), "toggled while paused");
    TEST_ASSERT(!sim.snapshot().showHitboxes, "snapshot follows");
}

void test_pause_freezes_everything()
{
    GameConfig cfg;
    cfg.seed = 3;
    AssetCatalog assets = makePlaceholderCatalog(cfg);
    Simulation sim(cfg, assets, 0);
    startRun(sim);
    for (int i = 0; i < 10; ++i) sim.step(kDt);

    sim.setPaused(true);
    TEST_ASSERT(sim.state() == RunState::Paused, "paused");
    float t = sim.elapsed();
    int score = sim.score().score();
    size_t entities = sim.field().size();
    float phase = sim.environment().phase();
    float y = sim.player().y();

    sim.handleInput(InputEvent::JumpPressed);
    sim.handleInput(InputEvent::ToggleDayNight);
    for (int i = 0; i < 30; ++i) sim.step(kDt);
    TEST_ASSERT(sim.elapsed() == t, "clock frozen");
    TEST_ASSERT(sim.score().score() == score, "score frozen");
    TEST_ASSERT(sim.field().size() == entities, "field frozen");
    TEST_ASSERT(sim.environment().phase() == phase, "environment frozen");
    TEST_ASSERT(sim.player().y() == y, "player frozen");
    TEST_ASSERT(!sim.environment().blending(), "inputs during pause are dropped");

    sim.setPaused(false);
    TEST_ASSERT(sim.state() == RunState::Running, "resumed");
    sim.step(kDt);
    TEST_ASSERT(sim.elapsed() > t, "clock runs again");
}

// =============================================================================
// Game over and restart
// =============================================================================

void test_hit_ends_the_run()
{
    GameConfig cfg;
    cfg.seed = 9;
    AssetCatalog assets = makePlaceholderCatalog(cfg);
    Simulation sim(cfg, assets, 0);
    startRun(sim);
    waitForLanding(sim);
    TEST_ASSERT(sim.player().grounded(), "landed");
    TEST_ASSERT(sim.state() == RunState::Running, "still running");

    const Player& p = sim.player();
    sim.field().add(makeObstacle(EntityKind::Rock, AltitudeBand::Ground, p.x() + 10.0f, cfg));
    sim.step(kDt);

    TEST_ASSERT(sim.state() == RunState::GameOver, "rock ends the run");
    TEST_ASSERT(hasSound(sim, SoundEvent::Hit), "hit sound");
    TEST_ASSERT(hasOutcome(sim, ContactOutcome::Hit), "hit contact reported");
    TEST_ASSERT(sim.snapshot().player.defeated, "snapshot shows defeat");

    float t = sim.elapsed();
    int score = sim.score().score();
    sim.handleInput(InputEvent::JumpPressed);
    for (int i = 0; i < 30; ++i) sim.step(kDt);
    TEST_ASSERT(sim.state() == RunState::GameOver, "stays over");
    TEST_ASSERT(sim.elapsed() == t, "no time after game over");
    TEST_ASSERT(sim.score().score() == score, "score frozen");
    TEST_ASSERT(sim.frameSounds().empty(), "silent after game over");
}

void test_restart_resets_and_keeps_high_score()
{
    GameConfig cfg;
    cfg.seed = 9;
    AssetCatalog assets = makePlaceholderCatalog(cfg);
    Simulation sim(cfg, assets, 0);
    startRun(sim);
    waitForLanding(sim);
    sim.field().add(makeObstacle(EntityKind::Rock, AltitudeBand::Ground, sim.player().x() + 10.0f, cfg));
    sim.step(kDt);
    TEST_ASSERT(sim.state() == RunState::GameOver, "run over");
    int final = sim.score().score();
    TEST_ASSERT(final > 0, "some points scored");
    TEST_ASSERT(sim.score().isNewHighScore(), "beats the stored zero");

    sim.restart();
    TEST_ASSERT(sim.state() == RunState::Ready, "ready again");
    TEST_ASSERT(sim.runCount() == 2, "second run");
    TEST_ASSERT(sim.score().score() == 0, "score cleared");
    TEST_ASSERT(sim.score().highScore() == final, "high score carried");
    TEST_ASSERT(sim.field().empty(), "field cleared");
    TEST_ASSERT(sim.particles().size() == 0, "particles cleared");
    TEST_ASSERT(!sim.player().defeated(), "player revived");
    TEST_ASSERT(sim.elapsed() == 0.0f, "clock reset");
    TEST_ASSERT(sim.collisions().stats().boxTests == 0, "collision counters reset");

    startRun(sim);
    TEST_ASSERT(sim.state() == RunState::Running, "second run starts");
}

// =============================================================================
// Scoring and inputs
// =============================================================================

void test_score_follows_survival_time()
{
    GameConfig cfg;
    AssetCatalog assets = makePlaceholderCatalog(cfg);
    Simulation sim(cfg, assets, 0);
    startRun(sim);
    for (int i = 0; i < 59; ++i) sim.step(kDt);
    TEST_NEAR(sim.elapsed(), 1.0f, 1e-4, "one second survived");
    TEST_ASSERT(sim.score().score() >= 11 && sim.score().score() <= 12, "about twelve points");
    TEST_NEAR(sim.scrollSpeed(), sim.difficulty().speed, 1e-4, "no dash, no bonus speed");
}

void test_milestone_sound()
{
    GameConfig cfg;
    cfg.score.milestoneEvery = 10;
    AssetCatalog assets = makePlaceholderCatalog(cfg);
    Simulation sim(cfg, assets, 0);
    startRun(sim);

    int milestoneFrames = 0;
    for (int i = 0; i < 60; ++i)
    {
        sim.step(kDt);
        if (hasSound(sim, SoundEvent::Milestone)) ++milestoneFrames;
    }
    TEST_ASSERT(milestoneFrames == 1, "one milestone at ten points");
}

void test_world_inputs()
{
    GameConfig cfg;
    AssetCatalog assets = makePlaceholderCatalog(cfg);
    Simulation sim(cfg, assets, 0);
    startRun(sim);

    sim.handleInput(InputEvent::ToggleDayNight);
    sim.handleInput(InputEvent::DebugSpawnDragon);
    sim.step(kDt);
    TEST_ASSERT(sim.environment().blending(), "day/night toggle starts a blend");

    bool dragonAtEdge = false;
    for (const Obstacle& o : sim.field().all())
        if (o.isDragon() && o.x > cfg.screen.width - 20.0f) dragonAtEdge = true;
    TEST_ASSERT(dragonAtEdge, "debug dragon enters at the right edge");
}

void test_tornado_bonus()
{
    GameConfig cfg;
    cfg.seed = 21;
    AssetCatalog assets = makePlaceholderCatalog(cfg);
    Simulation sim(cfg, assets, 0);
    startRun(sim);
    waitForLanding(sim);

    Obstacle ticket = makeObstacle(EntityKind::TicketYellow, AltitudeBand::High, sim.player().x() + 10.0f, cfg);
    ticket.y = ticket.baseY = cfg.screen.groundY - 40.0f;
    sim.field().add(ticket);
    uint32_t rock = sim.field().add(makeObstacle(EntityKind::Rock, AltitudeBand::Ground, 500.0f, cfg)).id;

    int before = sim.score().score();
    sim.step(kDt);
    TEST_ASSERT(sim.state() == RunState::Running, "pickups never end the run");
    TEST_ASSERT(hasOutcome(sim, ContactOutcome::PickedUp), "ticket collected");
    TEST_ASSERT(hasOutcome(sim, ContactOutcome::Slashed), "tornado struck");
    TEST_ASSERT(hasSound(sim, SoundEvent::PowerUp), "pickup sound");
    TEST_ASSERT(hasSound(sim, SoundEvent::Tornado), "tornado sound");
    TEST_ASSERT(sim.field().find(rock) == nullptr, "rock destroyed this step");
    TEST_ASSERT(sim.score().score() >= before + cfg.score.tornadoBonus, "bonus awarded");
    TEST_ASSERT(!sim.player().hasPowerUp(), "tornado leaves no lasting effect");
}

void test_blue_dash_speeds_up_scrolling()
{
    GameConfig cfg;
    cfg.seed = 22;
    AssetCatalog assets = makePlaceholderCatalog(cfg);
    Simulation sim(cfg, assets, 0);
    startRun(sim);
    waitForLanding(sim);

    Obstacle ticket = makeObstacle(EntityKind::TicketBlue, AltitudeBand::High, sim.player().x() + 10.0f, cfg);
    ticket.y = ticket.baseY = cfg.screen.groundY - 40.0f;
    sim.field().add(ticket);
    sim.step(kDt);

    TEST_ASSERT(sim.player().invincible(), "dash active");
    TEST_NEAR(sim.scrollSpeed(), sim.difficulty().speed * cfg.player.dashSpeedBonus, 1e-3, "world scrolls faster");
    FrameSnapshot s = sim.snapshot();
    TEST_ASSERT(s.player.invincible, "snapshot shows the dash");
    TEST_NEAR(s.player.powerUpRemaining, cfg.player.dashDuration, 0.05, "full dash remaining");

    sim.field().add(makeObstacle(EntityKind::Barrel, AltitudeBand::Ground, sim.player().x(), cfg));
    sim.step(kDt);
    TEST_ASSERT(sim.state() == RunState::Running, "dash passes through hazards");
    TEST_ASSERT(hasOutcome(sim, ContactOutcome::PassedThrough), "pass-through reported");
}

// =============================================================================
// Determinism and snapshot
// =============================================================================

void test_same_seed_same_run()
{
    GameConfig cfg;
    cfg.seed = 77;
    AssetCatalog assets = makePlaceholderCatalog(cfg);
    Simulation a(cfg, assets, 0);
    Simulation b(cfg, assets, 0);
    startRun(a);
    startRun(b);
    for (int i = 0; i < 90; ++i)
    {
        a.step(kDt);
        b.step(kDt);
    }

    FrameSnapshot sa = a.snapshot(), sb = b.snapshot();
    TEST_ASSERT(sa.obstacles.size() == sb.obstacles.size(), "same entities");
    for (size_t i = 0; i < sa.obstacles.size(); ++i)
    {
        TEST_ASSERT(sa.obstacles[i].kind == sb.obstacles[i].kind, "same kinds");
        TEST_ASSERT(sa.obstacles[i].bounds.x == sb.obstacles[i].bounds.x, "same positions");
    }
    TEST_ASSERT(sa.particles.size() == sb.particles.size(), "same particles");
    TEST_ASSERT(sa.environment.phase == sb.environment.phase, "same sky");
    TEST_ASSERT(sa.score == sb.score, "same score");
}

void test_snapshot_matches_state()
{
    GameConfig cfg;
    cfg.seed = 5;
    AssetCatalog assets = makePlaceholderCatalog(cfg);
    Simulation sim(cfg, assets, 250);
    startRun(sim);
    for (int i = 0; i < 45; ++i) sim.step(kDt);

    FrameSnapshot s = sim.snapshot();
    TEST_ASSERT(s.state == RunState::Running, "state");
    TEST_ASSERT(s.obstacles.size() == sim.field().size(), "every field entry is alive after a step");
    TEST_ASSERT(!s.obstacles.empty(), "something spawned");
    TEST_ASSERT(s.score == sim.score().score(), "score");
    TEST_ASSERT(s.highScore == 250, "stored high score");
    TEST_ASSERT(!s.newHighScore, "not beaten yet");
    TEST_ASSERT(s.groundY == cfg.screen.groundY, "ground");
    TEST_NEAR(s.scrollSpeed, sim.scrollSpeed(), 1e-6, "scroll speed");
    TEST_NEAR(s.player.bounds.y, sim.player().bounds().y, 1e-6, "player bounds");
    TEST_ASSERT(s.player.sprite.key == sim.player().spriteKey(), "player sprite");
    TEST_ASSERT(s.particles.size() == sim.particles().size(), "particles");
    TEST_NEAR(s.environment.phase, sim.environment().phase(), 1e-6, "phase");
    TEST_ASSERT(s.environment.layers.size() == 3, "parallax layers");
}

// =============================================================================
// Main
// =============================================================================

int main()
{
    std::printf("=== Simulation Tests ===\n\n");

    std::printf("run states:\n");
    RUN_TEST(test_ready_waits_for_jump);
    RUN_TEST(test_hitbox_toggle_in_any_state);
    RUN_TEST(test_pause_freezes_everything);

    std::printf("\ngame over:\n");
    RUN_TEST(test_hit_ends_the_run);
    RUN_TEST(test_restart_resets_and_keeps_high_score);

    std::printf("\nscoring and inputs:\n");
    RUN_TEST(test_score_follows_survival_time);
    RUN_TEST(test_milestone_sound);
    RUN_TEST(test_world_inputs);
    RUN_TEST(test_tornado_bonus);
    RUN_TEST(test_blue_dash_speeds_up_scrolling);

    std::printf("\ndeterminism:\n");
    RUN_TEST(test_same_seed_same_run);
    RUN_TEST(test_snapshot_matches_state);

    return TEST_RESULTS();
}
