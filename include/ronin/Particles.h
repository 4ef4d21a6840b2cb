#pragma once

#include "ronin/Types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ronin {

enum class ParticleKind { Dust, Petal, Sparkle, Debris, DashTrail };

struct Particle {
    float x=0, y=0, vx=0, vy=0;
    float alpha=1;                  // 1 at birth, only ever decreases
    float decay=1;                  // alpha lost per second
    float age=0, lifetime=0;
    float size=1;
    ParticleKind kind=ParticleKind::Dust;
};

// Bounded pool, oldest first. Emitting into a full pool evicts from the front.
class ParticleSystem {
public:
    ParticleSystem(size_t capacity, uint32_t seed) : cap(capacity ? capacity : 1), rng(seed) { pool.reserve(cap); }

    void emit(ParticleKind kind, Vec2 pos, int count);
    void update(float dt);
    void clear() { pool.clear(); }
    void reseed(uint32_t seed) { rng.reseed(seed); }

    size_t size() const { return pool.size(); }
    size_t capacity() const { return cap; }
    size_t evicted() const { return evictedTotal; }
    const std::vector<Particle> &particles() const { return pool; }

private:
    Particle spawn(ParticleKind kind, Vec2 pos);

    size_t cap;
    Rng rng;
    std::vector<Particle> pool;
    size_t evictedTotal = 0;
};

} // namespace ronin
