#include "ronin/Entities.h"
#include "ronin/Config.h"

#include <algorithm>
#include <cmath>

using namespace std;

namespace ronin {

static const KindInfo kKinds[(size_t)EntityKind::Count] = {
    // name            category                        sprite                 w     h     speed  spin    powerUp
    { "rock",          EntityCategory::GroundObstacle, SpriteKey::Rock,       36,   36,   1.0f,  0,      PowerUpKind::BlueDash },
    { "barrel",        EntityCategory::GroundObstacle, SpriteKey::Barrel,     56,   56,   1.0f,  0,      PowerUpKind::BlueDash },
    { "bamboo",        EntityCategory::GroundObstacle, SpriteKey::Bamboo,     26,   110,  1.0f,  0,      PowerUpKind::BlueDash },
    { "boulder",       EntityCategory::GroundObstacle, SpriteKey::Boulder,    90,   90,   1.3f,  -600,   PowerUpKind::BlueDash },
    { "dragon_red",    EntityCategory::Dragon,         SpriteKey::DragonRed,  80,   50,   1.0f,  0,      PowerUpKind::BlueDash },
    { "dragon_green",  EntityCategory::Dragon,         SpriteKey::DragonGreen,80,   50,   0.95f, 0,      PowerUpKind::BlueDash },
    { "dragon_black",  EntityCategory::Dragon,         SpriteKey::DragonBlack,80,   50,   1.0f,  0,      PowerUpKind::BlueDash },
    { "ticket_blue",   EntityCategory::PowerUp,        SpriteKey::TicketBlue, 40,   40,   1.0f,  0,      PowerUpKind::BlueDash },
    { "ticket_yellow", EntityCategory::PowerUp,        SpriteKey::TicketYellow,40,  40,   1.0f,  0,      PowerUpKind::YellowTornado },
};

const KindInfo &kindInfo(EntityKind kind) { return kKinds[(size_t)kind]; }

const char *altitudeBandName(AltitudeBand band) {
    switch(band) {
    case AltitudeBand::Ground: return "ground";
    case AltitudeBand::Low: return "low";
    case AltitudeBand::Mid: return "mid";
    case AltitudeBand::High: return "high";
    }
    return "?";
}

Obstacle makeObstacle(EntityKind kind, AltitudeBand band, float x, const GameConfig &cfg) {
    Obstacle o;
    o.kind = kind;
    o.x = x;
    const KindInfo &k = kindInfo(kind);
    float ground = cfg.screen.groundY;
    switch(k.category) {
    case EntityCategory::GroundObstacle:
        o.band = AltitudeBand::Ground;
        o.y = ground - k.height;
        break;
    case EntityCategory::Dragon:
        o.band = band == AltitudeBand::Ground ? AltitudeBand::Low : band;
        // top edges 50 / 120 / 190 px above the floor
        if(o.band == AltitudeBand::Low) o.y = ground - 50;
        else if(o.band == AltitudeBand::Mid) o.y = ground - 120;
        else o.y = ground - 190;
        break;
    case EntityCategory::PowerUp:
        o.band = AltitudeBand::High;
        o.y = ground - cfg.spawn.powerUpAltitude;
        break;
    }
    o.baseY = o.y;
    return o;
}

// ------------------------------ ObstacleField -----------------------------

Obstacle &ObstacleField::add(Obstacle o) {
    o.id = nextId++;
    o.alive = true;
    items.push_back(o);
    return items.back();
}

void ObstacleField::advance(float dt, float scrollSpeed, const AssetCatalog &assets, const GameConfig &cfg) {
    for(auto &o : items) {
        if(!o.alive) continue;
        const KindInfo &k = o.info();
        o.x -= scrollSpeed * k.speedMultiplier * dt;
        o.rotation = fmod(o.rotation + k.spinPerSecond * dt, 360.0f);
        o.animTime += dt;
        if(o.isPickup()) {
            o.y = o.baseY + sinf(o.animTime * cfg.spawn.powerUpBobSpeed) * cfg.spawn.powerUpBobAmplitude;
        }
        const AnimationSet &anim = assets.animation(k.sprite);
        if(anim.frameCount() > 1) {
            float cycle = anim.cycleDuration();
            float t = fmod(o.animTime, cycle);
            size_t i = 0;
            while(i + 1 < anim.frameCount() && t >= anim.frame(i).duration) { t -= anim.frame(i).duration; ++i; }
            o.frame = i;
        }
    }
}

size_t ObstacleField::removeDead(float cullMargin) {
    size_t before = items.size();
    items.erase(remove_if(items.begin(), items.end(), [cullMargin](const Obstacle &o) {
        return !o.alive || o.bounds().right() < -cullMargin;
    }), items.end());
    return before - items.size();
}

Obstacle *ObstacleField::find(uint32_t id) {
    for(auto &o : items) if(o.id == id) return &o;
    return nullptr;
}

Obstacle *ObstacleField::nearestAhead(float x) {
    Obstacle *best = nullptr;
    for(auto &o : items) {
        if(!o.alive || o.isPickup() || o.x <= x) continue;
        if(!best || o.x < best->x) best = &o;
    }
    return best;
}

const Obstacle *ObstacleField::last() const {
    for(auto it = items.rbegin(); it != items.rend(); ++it) if(it->alive && !it->isPickup()) return &*it;
    return nullptr;
}

const Obstacle *ObstacleField::lastGround() const {
    for(auto it = items.rbegin(); it != items.rend(); ++it) if(it->alive && it->isGround()) return &*it;
    return nullptr;
}

} // namespace ronin
