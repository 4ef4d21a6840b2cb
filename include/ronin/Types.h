#pragma once

#include <cmath>
#include <cstdint>
#include <random>
#include <vector>

namespace ronin {

struct Vec2 { float x = 0, y = 0; };

struct Rect {
    float x = 0, y = 0, w = 0, h = 0;
    float right() const { return x + w; }
    float bottom() const { return y + h; }
};

// Touching edges do not count as overlap.
inline bool aabbIntersect(const Rect &a, const Rect &b) {
    return a.x < b.x + b.w && b.x < a.x + a.w && a.y < b.y + b.h && b.y < a.y + a.h;
}

// Logical input events; key mapping lives in the host.
enum class InputEvent { JumpPressed, DuckPressed, DuckReleased, ToggleDayNight, DebugSpawnDragon, ToggleHitboxDisplay };

enum class SoundEvent { Jump, DoubleJump, PowerUp, Tornado, Milestone, Hit, Count };

enum class PowerUpKind { BlueDash, YellowTornado };

const char *soundEventName(SoundEvent e);

inline float wrap01(float v) {
    v = std::fmod(v, 1.0f);
    if(v < 0) v += 1.0f;
    if(v >= 1.0f) v = 0.0f;
    return v;
}

inline float clampf(float v, float lo, float hi) { return v < lo ? lo : (v > hi ? hi : v); }
inline float lerpf(float a, float b, float t) { return a + (b - a) * t; }

// ------------------------------ Rng ---------------------------------------
class Rng {
public:
    explicit Rng(uint32_t seed=1) : engine(seed) {}
    void reseed(uint32_t seed) { engine.seed(seed); }
    uint32_t next() { return (uint32_t)engine(); }
    float uniform(float lo, float hi) { return std::uniform_real_distribution<float>(lo, hi)(engine); }
    int range(int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(engine); }
    bool chance(float p) { return uniform(0.0f, 1.0f) < p; }
    // Probability that a Poisson process with `rate` fires at least once in dt.
    bool poisson(float rate, float dt) { return rate > 0 && chance(1.0f - std::exp(-rate * dt)); }
    // Index drawn proportionally to weights; -1 when every weight is zero.
    int weighted(const std::vector<float> &weights) {
        float total = 0;
        for(float w : weights) total += w > 0 ? w : 0;
        if(total <= 0) return -1;
        float r = uniform(0.0f, total);
        for(size_t i=0;i<weights.size();++i) {
            float w = weights[i] > 0 ? weights[i] : 0;
            if(r < w) return (int)i;
            r -= w;
        }
        for(size_t i=weights.size(); i-- > 0;) if(weights[i] > 0) return (int)i;
        return -1;
    }
private:
    std::mt19937 engine;
};

} // namespace ronin
