#include "ronin/Spawner.h"
#include "ronin/Log.h"

#include <algorithm>

using namespace std;

namespace ronin {

static const float kRetryWhenStopped = 0.1f;

Spawner::Spawner(const GameConfig &cfg, uint32_t seed) : config(cfg), rng(seed) {
    reset(seed);
}

void Spawner::reset(uint32_t seed) {
    rng.reseed(seed);
    timer = 0;
    runTime = 0;
    firstDragonDone = false;
    lastKind = EntityKind::Rock;
    anySpawned = false;
    lastBambooTime = -1e9f;
    pendingValid = false;
}

float Spawner::minReactionGap(float scrollSpeed) const {
    return config.spawn.minGapPx + max(0.0f, scrollSpeed) * config.spawn.reactionSeconds;
}

float Spawner::requiredGap(const Obstacle &leader, EntityKind kind, float scrollSpeed) const {
    float gap = minReactionGap(scrollSpeed);
    float lead = leader.info().speedMultiplier;
    float follow = kindInfo(kind).speedMultiplier;
    float travel = leader.bounds().right();
    if(follow > lead && travel > 0) gap += (follow - lead) / lead * travel;
    return gap;
}

float Spawner::rollInterval(const DifficultyState &d) {
    return rng.uniform(config.spawn.minInterval, config.spawn.maxInterval) * d.spawnIntervalMultiplier;
}

AltitudeBand Spawner::rollBand() {
    static const AltitudeBand bands[3] = { AltitudeBand::Low, AltitudeBand::Mid, AltitudeBand::High };
    return bands[rng.range(0, 2)];
}

EntityKind Spawner::rollDragonColor() {
    static const vector<float> weights = { 5, 4, 1 };
    static const EntityKind colors[3] = { EntityKind::DragonRed, EntityKind::DragonGreen, EntityKind::DragonBlack };
    int i = rng.weighted(weights);
    return colors[i < 0 ? 0 : i];
}

bool Spawner::bambooAllowed(const ObstacleField &field, float spawnX) const {
    if(anySpawned && lastKind == EntityKind::Bamboo) return false;
    if(runTime - lastBambooTime <= config.spawn.bambooCooldown) return false;
    for(const auto &o : field.all()) {
        if(o.alive && o.kind == EntityKind::Bamboo && spawnX - o.bounds().right() <= config.spawn.bambooGapPx) return false;
    }
    return true;
}

EntityKind Spawner::rollKind(const DifficultyState &d, const AssetCatalog &assets, const ObstacleField &field, float spawnX) {
    if(!firstDragonDone && runTime >= config.spawn.firstDragonAfter) return rollDragonColor();

    const SpawnTuning &s = config.spawn;
    vector<float> weights = { s.weightRock, s.weightBarrel, s.weightBamboo, s.weightDragon * d.dragonFrequencyMultiplier, s.weightBoulder };
    switch(rng.weighted(weights)) {
    case 1: return EntityKind::Barrel;
    case 2: return bambooAllowed(field, spawnX) ? EntityKind::Bamboo : EntityKind::Rock;
    case 3: return rollDragonColor();
    case 4: return assets.has(SpriteKey::Boulder) ? EntityKind::Boulder : EntityKind::Rock;
    default: return EntityKind::Rock;
    }
}

vector<Obstacle> Spawner::update(float dt, const DifficultyState &d, float scrollSpeed,
                                 const ObstacleField &field, const AssetCatalog &assets) {
    vector<Obstacle> out;
    runTime += dt;
    float spawnX = (float)config.screen.width;

    if(rng.poisson(config.spawn.powerUpRate, dt)) {
        EntityKind k = rng.chance(0.5f) ? EntityKind::TicketBlue : EntityKind::TicketYellow;
        out.push_back(makeObstacle(k, AltitudeBand::High, spawnX, config));
    }

    timer -= dt;
    if(timer > 0) return out;

    if(!pendingValid) {
        EntityKind k = rollKind(d, assets, field, spawnX);
        pending = makeObstacle(k, kindInfo(k).category == EntityCategory::Dragon ? rollBand() : AltitudeBand::Ground, spawnX, config);
        pendingValid = true;
    }
    pending.x = spawnX;

    if(scrollSpeed <= 0) { timer = kRetryWhenStopped; return out; }

    // Hold the spawn back until both gaps are open; the leader opens them at its own speed.
    float wait = 0;
    const Obstacle *leader = pending.isGround() ? field.lastGround() : nullptr;
    if(leader) {
        float room = spawnX - leader->bounds().right();
        float need = requiredGap(*leader, pending.kind, scrollSpeed);
        if(room < need) wait = max(wait, (need - room) / (scrollSpeed * leader->info().speedMultiplier));
    }
    const Obstacle *prev = field.last();
    if(prev) {
        float room = spawnX - prev->bounds().right();
        if(room < config.spawn.minGapPx) wait = max(wait, (config.spawn.minGapPx - room) / (scrollSpeed * prev->info().speedMultiplier));
    }
    if(wait > 0) { timer = wait; return out; }

    out.push_back(pending);
    pendingValid = false;
    anySpawned = true;
    lastKind = pending.kind;
    if(pending.isDragon()) firstDragonDone = true;
    if(pending.kind == EntityKind::Bamboo) lastBambooTime = runTime;
    timer = rollInterval(d);
    return out;
}

Obstacle Spawner::spawnDragon(float x) {
    Obstacle o = makeObstacle(rollDragonColor(), rollBand(), x, config);
    firstDragonDone = true;
    LOGI("debug dragon '%s' at x=%.0f band=%s", o.info().name, x, altitudeBandName(o.band));
    return o;
}

} // namespace ronin
