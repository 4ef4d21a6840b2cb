#pragma once

#include "ronin/Assets.h"
#include "ronin/Config.h"
#include "ronin/Difficulty.h"
#include "ronin/Entities.h"
#include "ronin/Types.h"

#include <cstdint>
#include <vector>

namespace ronin {

// Procedural source of obstacles, dragons and pickups.
//
// Ground obstacles keep a reaction gap behind the previous ground obstacle: the
// distance the world scrolls in `reactionSeconds`, plus `minGapPx`, plus whatever a
// faster follower would close before the leader leaves the screen. A spawn that does
// not fit yet is held back until it does, so entities always enter at the right edge.
class Spawner {
public:
    Spawner(const GameConfig &cfg, uint32_t seed);

    void reset(uint32_t seed);
    // Entities created this frame, not yet in `field`. Ids are assigned by the field.
    std::vector<Obstacle> update(float dt, const DifficultyState &d, float scrollSpeed,
                                 const ObstacleField &field, const AssetCatalog &assets);
    // Dragon with a random color and band at x, bypassing timers.
    Obstacle spawnDragon(float x);

    float minReactionGap(float scrollSpeed) const;
    // Gap needed between `leader` (already on screen) and a new entity of `kind`.
    float requiredGap(const Obstacle &leader, EntityKind kind, float scrollSpeed) const;
    bool hasPending() const { return pendingValid; }

private:
    EntityKind rollKind(const DifficultyState &d, const AssetCatalog &assets, const ObstacleField &field, float spawnX);
    bool bambooAllowed(const ObstacleField &field, float spawnX) const;
    EntityKind rollDragonColor();
    AltitudeBand rollBand();
    float rollInterval(const DifficultyState &d);

    GameConfig config;
    Rng rng;
    float timer = 0;
    float runTime = 0;
    bool firstDragonDone = false;
    EntityKind lastKind = EntityKind::Rock;
    bool anySpawned = false;
    float lastBambooTime = -1e9f;
    bool pendingValid = false;
    Obstacle pending;
};

} // namespace ronin
