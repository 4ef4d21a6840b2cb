#include "ronin/Simulation.h"
#include "ronin/Log.h"

using namespace std;

namespace ronin {

const char *runStateName(RunState s) {
    switch(s) {
    case RunState::Ready: return "ready";
    case RunState::Running: return "running";
    case RunState::Paused: return "paused";
    case RunState::GameOver: return "game_over";
    }
    return "?";
}

Simulation::Simulation(const GameConfig &config, const AssetCatalog &assets, int highScore)
    : cfg(config), assets(assets), seeds(config.seed), curve(config.difficulty),
      hero(config.player, config.screen.groundY), spawner(config, config.seed),
      env(config, config.seed), fx((size_t)config.particles.capacity, config.seed),
      scorer(config.score, highScore) {
    restart();
}

void Simulation::restart() {
    uint32_t spawnSeed = seeds.next();
    uint32_t envSeed = seeds.next();
    uint32_t fxSeed = seeds.next();

    hero.reset();
    obstacles.clear();
    spawner.reset(spawnSeed);
    env.reset(envSeed);
    fx.clear();
    fx.reseed(fxSeed);
    collider.resetStats();
    scorer.reset(scorer.bestScore());

    runState = RunState::Ready;
    runTime = 0;
    pending.clear();
    sounds.clear();
    contacts.clear();
    ++runs;
    LOGI("run %d ready, high score %d", runs, scorer.highScore());
}

void Simulation::handleInput(InputEvent e) {
    if(e == InputEvent::ToggleHitboxDisplay) { hitboxes = !hitboxes; return; }
    switch(runState) {
    case RunState::Ready:
        if(e != InputEvent::JumpPressed) return;
        runState = RunState::Running;
        pending.push_back(e);
        break;
    case RunState::Running:
        pending.push_back(e);
        break;
    case RunState::Paused:
    case RunState::GameOver:
        break;
    }
}

void Simulation::setPaused(bool paused) {
    if(paused && runState == RunState::Running) {
        runState = RunState::Paused;
        LOGI("paused at %.1fs", runTime);
    } else if(!paused && runState == RunState::Paused) {
        runState = RunState::Running;
    }
}

float Simulation::scrollSpeed() const {
    return curve.at(runTime).speed * hero.speedMultiplier();
}

void Simulation::applyInput(InputEvent e, SimContext &ctx) {
    switch(e) {
    case InputEvent::ToggleDayNight:
        env.toggleMode();
        break;
    case InputEvent::DebugSpawnDragon:
        obstacles.add(spawner.spawnDragon((float)cfg.screen.width));
        break;
    default:
        hero.handleInput(e, ctx);
        break;
    }
}

void Simulation::step(float dt) {
    sounds.clear();
    contacts.clear();
    if(runState != RunState::Running || dt <= 0) return;

    SimContext ctx{ cfg, assets, fx, sounds };

    for(InputEvent e : pending) applyInput(e, ctx);
    pending.clear();

    DifficultyState d = curve.at(runTime);
    hero.update(dt, ctx);
    float scroll = d.speed * hero.speedMultiplier();

    obstacles.advance(dt, scroll, assets, cfg);
    for(const Obstacle &o : spawner.update(dt, d, scroll, obstacles, assets)) obstacles.add(o);

    env.update(dt, scroll, fx);

    contacts = collider.test(hero, obstacles, ctx);
    obstacles.removeDead(cfg.spawn.cullMargin);

    fx.update(dt);

    if(hero.defeated()) {
        runState = RunState::GameOver;
        LOGI("game over after %.1fs, score %d%s", runTime, scorer.score(), scorer.isNewHighScore() ? " (new high score)" : "");
        return;
    }

    int milestones = scorer.advance(dt);
    for(const Contact &c : contacts) {
        if(c.outcome == ContactOutcome::Slashed) milestones += scorer.addBonus(cfg.score.tornadoBonus);
    }
    if(milestones > 0) sounds.push_back(SoundEvent::Milestone);
    runTime += dt;
}

FrameSnapshot Simulation::snapshot() const {
    FrameSnapshot s;
    s.state = runState;

    s.player.bounds = hero.bounds();
    s.player.sprite = hero.sprite();
    s.player.state = hero.state();
    s.player.invincible = hero.invincible();
    s.player.defeated = hero.defeated();
    s.player.powerUpRemaining = hero.hasPowerUp() ? hero.powerUp().remaining : 0.0f;

    s.obstacles.reserve(obstacles.size());
    for(const Obstacle &o : obstacles.all()) {
        if(!o.alive) continue;
        ObstacleView v;
        v.id = o.id;
        v.kind = o.kind;
        v.band = o.band;
        v.bounds = o.bounds();
        v.sprite = o.sprite();
        v.rotation = o.rotation;
        s.obstacles.push_back(v);
    }
    s.particles = fx.particles();

    s.environment.phase = env.phase();
    s.environment.day = env.isDay();
    s.environment.ambientLight = env.ambientLight();
    s.environment.sky = env.skyColor();
    s.environment.sun = env.sunPosition();
    s.environment.moon = env.moonPosition();
    s.environment.layers = env.layers();

    s.groundY = cfg.screen.groundY;
    s.scrollSpeed = scrollSpeed();
    s.score = scorer.score();
    s.highScore = scorer.highScore();
    s.newHighScore = scorer.isNewHighScore();
    s.showHitboxes = hitboxes;
    return s;
}

} // namespace ronin
