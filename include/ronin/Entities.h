#pragma once

#include "ronin/Assets.h"
#include "ronin/Types.h"

#include <cstdint>
#include <vector>

namespace ronin {

struct GameConfig;

enum class EntityKind { Rock, Barrel, Bamboo, Boulder, DragonRed, DragonGreen, DragonBlack, TicketBlue, TicketYellow, Count };

enum class EntityCategory { GroundObstacle, Dragon, PowerUp };

// Vertical lane. Ground obstacles sit on the floor, dragons fly in Low (jump),
// Mid (duck) or High (stay grounded).
enum class AltitudeBand { Ground, Low, Mid, High };

struct KindInfo {
    const char *name;
    EntityCategory category;
    SpriteKey sprite;
    float width, height;
    float speedMultiplier;          // relative to scroll speed
    float spinPerSecond;            // degrees, render only
    PowerUpKind powerUp;            // meaningful for the PowerUp category only
};

const KindInfo &kindInfo(EntityKind kind);
const char *altitudeBandName(AltitudeBand band);

struct Obstacle {
    uint32_t id = 0;
    EntityKind kind = EntityKind::Rock;
    AltitudeBand band = AltitudeBand::Ground;
    float x = 0, y = 0;             // top-left, screen space
    float baseY = 0;                // pickups bob around this
    float animTime = 0;
    size_t frame = 0;
    float rotation = 0;
    bool alive = true;

    const KindInfo &info() const { return kindInfo(kind); }
    bool isPickup() const { return info().category == EntityCategory::PowerUp; }
    bool isGround() const { return info().category == EntityCategory::GroundObstacle; }
    bool isDragon() const { return info().category == EntityCategory::Dragon; }
    Rect bounds() const { return Rect{x, y, info().width, info().height}; }
    SpriteRef sprite() const { return SpriteRef{info().sprite, frame}; }
};

// Builds an entity of `kind` whose left edge is at x, placed vertically by its band.
Obstacle makeObstacle(EntityKind kind, AltitudeBand band, float x, const GameConfig &cfg);

// Live entities in spawn order. Ids are unique for the lifetime of the field.
class ObstacleField {
public:
    Obstacle &add(Obstacle o);
    void advance(float dt, float scrollSpeed, const AssetCatalog &assets, const GameConfig &cfg);
    // Drops dead entities and those that scrolled past the left bound, keeping order.
    size_t removeDead(float cullMargin);
    void clear() { items.clear(); nextId = 1; }

    Obstacle *find(uint32_t id);
    // First hazard (not a pickup) whose left edge is beyond x.
    Obstacle *nearestAhead(float x);
    const Obstacle *last() const;
    const Obstacle *lastGround() const;

    std::vector<Obstacle> &all() { return items; }
    const std::vector<Obstacle> &all() const { return items; }
    size_t size() const { return items.size(); }
    bool empty() const { return items.empty(); }

private:
    std::vector<Obstacle> items;
    uint32_t nextId = 1;
};

} // namespace ronin
