#include "ronin/Particles.h"

#include <algorithm>

using namespace std;

namespace ronin {

static const float kDebrisGravity = 1440.0f;
static const float kMaxLifetime = 6.0f;

Particle ParticleSystem::spawn(ParticleKind kind, Vec2 pos) {
    Particle p;
    p.kind = kind;
    p.x = pos.x; p.y = pos.y;
    p.decay = rng.uniform(1.2f, 3.0f);
    switch(kind) {
    case ParticleKind::Petal:
        p.vx = rng.uniform(-60, 60); p.vy = rng.uniform(30, 90);
        p.decay = rng.uniform(0.25f, 0.5f);
        p.size = (float)rng.range(3, 5);
        break;
    case ParticleKind::Debris:
        p.vx = rng.uniform(-300, 300); p.vy = rng.uniform(-360, -120);
        p.size = (float)rng.range(4, 7);
        break;
    case ParticleKind::Sparkle:
        p.vx = rng.uniform(-60, 60); p.vy = rng.uniform(-120, -30);
        p.decay = rng.uniform(0.5f, 1.5f);
        p.size = (float)rng.range(2, 4);
        break;
    case ParticleKind::Dust:
        p.vx = rng.uniform(-120, -30); p.vy = rng.uniform(-30, 0);
        p.size = (float)rng.range(3, 6);
        break;
    case ParticleKind::DashTrail:
        p.vx = rng.uniform(-240, -120); p.vy = rng.uniform(-20, 20);
        p.decay = rng.uniform(3.0f, 5.0f);
        p.size = (float)rng.range(4, 8);
        break;
    }
    p.lifetime = min(kMaxLifetime, 1.0f / p.decay);
    return p;
}

void ParticleSystem::emit(ParticleKind kind, Vec2 pos, int count) {
    if(count <= 0) return;
    size_t n = (size_t)count;
    // Only the newest `cap` of an oversized burst could survive anyway.
    if(n > cap) { evictedTotal += n - cap; n = cap; }
    size_t overflow = pool.size() + n > cap ? pool.size() + n - cap : 0;
    if(overflow) {
        pool.erase(pool.begin(), pool.begin() + overflow);
        evictedTotal += overflow;
    }
    for(size_t i=0;i<n;++i) pool.push_back(spawn(kind, pos));
}

void ParticleSystem::update(float dt) {
    for(auto &p : pool) {
        p.x += p.vx * dt;
        p.y += p.vy * dt;
        if(p.kind == ParticleKind::Debris) p.vy += kDebrisGravity * dt;
        p.alpha -= p.decay * dt;
        p.age += dt;
    }
    pool.erase(remove_if(pool.begin(), pool.end(), [](const Particle &p) {
        return p.alpha <= 0 || p.age >= p.lifetime;
    }), pool.end());
}

} // namespace ronin
