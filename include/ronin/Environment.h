#pragma once

#include "ronin/Config.h"
#include "ronin/Particles.h"
#include "ronin/Types.h"

#include <cstdint>
#include <vector>

namespace ronin {

struct Color3 { float r=0, g=0, b=0; };

enum class ParallaxKind { Pagoda, Cloud, Lantern };

struct ParallaxItem {
    float x=0, y=0;
    float scale=1;
    float speedFactor=0;            // fraction of scroll speed
};

struct ParallaxLayer {
    ParallaxKind kind = ParallaxKind::Pagoda;
    float wrapAt = 0;               // items left of this x re-enter on the right
    std::vector<ParallaxItem> items;
};

// Day/night phase, sky, celestial bodies and background layers.
// Phase 0.25 is noon and 0.75 midnight; the first half of the cycle is day.
class Environment {
public:
    Environment(const GameConfig &cfg, uint32_t seed);

    void reset(uint32_t seed);
    void update(float dt, float scrollSpeed, ParticleSystem &particles);
    // Moves half a cycle ahead, eased over the configured blend window.
    void toggleMode();
    void setPhase(float p);

    float phase() const;
    bool isDay() const { return phase() < 0.5f; }
    bool blending() const { return blendActive; }
    float ambientLight() const { return ambientLightAt(phase()); }
    Color3 skyColor() const { return skyColorAt(phase()); }
    Vec2 sunPosition() const { return celestialPosition(phase(), false); }
    Vec2 moonPosition() const { return celestialPosition(phase(), true); }
    const std::vector<ParallaxLayer> &layers() const { return parallax; }

    static float ambientLightAt(float phase);
    static Color3 skyColorAt(float phase);
    // Arc from the left to the right screen edge while the body is up; parked below the
    // horizon otherwise.
    Vec2 celestialPosition(float phase, bool moon) const;
    float petalRateAt(float phase) const;
    float sparkleRateAt(float phase) const;

private:
    float blendOffset() const;
    void buildLayers();

    ScreenTuning screen;
    EnvironmentTuning tuning;
    Rng rng;
    float basePhase = 0.25f;
    float blendFrom = 0, blendTo = 0, blendElapsed = 0;
    bool blendActive = false;
    std::vector<ParallaxLayer> parallax;
};

} // namespace ronin
