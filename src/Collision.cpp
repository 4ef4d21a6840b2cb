#include "ronin/Collision.h"

#include <cmath>

using namespace std;

namespace ronin {

static const int kDebrisPerObstacle = 8;
static const float kTornadoReach = 20.0f;

const char *contactOutcomeName(ContactOutcome o) {
    switch(o) {
    case ContactOutcome::PickedUp: return "picked_up";
    case ContactOutcome::PassedThrough: return "passed_through";
    case ContactOutcome::Hit: return "hit";
    case ContactOutcome::Slashed: return "slashed";
    }
    return "?";
}

bool CollisionEngine::overlaps(const Rect &a, const CollisionMask &ma, const Rect &b, const CollisionMask &mb) {
    counters.boxTests++;
    if(!aabbIntersect(a, b)) return false;
    counters.maskTests++;
    int dx = (int)lroundf(b.x - a.x);
    int dy = (int)lroundf(b.y - a.y);
    return ma.overlaps(mb, dx, dy);
}

void CollisionEngine::shatter(Obstacle &o, SimContext &ctx) {
    o.alive = false;
    ctx.particles.emit(ParticleKind::Debris, Vec2{ o.x, o.y }, kDebrisPerObstacle);
}

vector<Contact> CollisionEngine::test(Player &player, ObstacleField &field, SimContext &ctx) {
    vector<Contact> out;
    Rect pb = player.bounds();
    const CollisionMask &pm = player.mask(ctx.assets);

    vector<size_t> touching;
    auto &items = field.all();
    for(size_t i=0;i<items.size();++i) {
        const Obstacle &o = items[i];
        if(!o.alive) continue;
        if(overlaps(pb, pm, o.bounds(), ctx.assets.mask(o.info().sprite, o.frame))) touching.push_back(i);
    }
    counters.contacts += touching.size();

    for(size_t i : touching) {
        Obstacle &o = items[i];
        if(!o.isPickup()) continue;
        o.alive = false;
        out.push_back(Contact{ o.id, o.kind, ContactOutcome::PickedUp });
        if(player.applyPowerUp(o.info().powerUp, ctx)) {
            Obstacle *target = field.nearestAhead(player.x() + kTornadoReach);
            if(target) {
                shatter(*target, ctx);
                ctx.sounds.push_back(SoundEvent::Tornado);
                out.push_back(Contact{ target->id, target->kind, ContactOutcome::Slashed });
            }
        }
    }

    for(size_t i : touching) {
        Obstacle &o = items[i];
        if(o.isPickup() || !o.alive) continue;
        if(player.invincible()) {
            shatter(o, ctx);
            out.push_back(Contact{ o.id, o.kind, ContactOutcome::PassedThrough });
        } else {
            player.takeHit(ctx);
            out.push_back(Contact{ o.id, o.kind, ContactOutcome::Hit });
        }
    }
    return out;
}

} // namespace ronin
