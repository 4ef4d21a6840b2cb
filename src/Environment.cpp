#include "ronin/Environment.h"

#include <cmath>

using namespace std;

namespace ronin {

static const float kPi = 3.14159265359f;
static const float kStartPhase = 0.1f;
static const Color3 kDaySky = { 135/255.0f, 206/255.0f, 235/255.0f };
static const Color3 kNightSky = { 25/255.0f, 25/255.0f, 60/255.0f };

Environment::Environment(const GameConfig &cfg, uint32_t seed) : screen(cfg.screen), tuning(cfg.environment), rng(seed) {
    reset(seed);
}

void Environment::reset(uint32_t seed) {
    rng.reseed(seed);
    basePhase = kStartPhase;
    blendFrom = blendTo = blendElapsed = 0;
    blendActive = false;
    buildLayers();
}

void Environment::buildLayers() {
    parallax.clear();
    float w = (float)screen.width;

    ParallaxLayer pagodas;
    pagodas.kind = ParallaxKind::Pagoda;
    pagodas.wrapAt = -200;
    for(int i=0;i<3;i++) pagodas.items.push_back(ParallaxItem{ i * 400.0f + 100.0f, screen.groundY - 140.0f, 1.0f, 0.2f });
    parallax.push_back(pagodas);

    ParallaxLayer clouds;
    clouds.kind = ParallaxKind::Cloud;
    clouds.wrapAt = -120;
    for(int i=0;i<4;i++) clouds.items.push_back(ParallaxItem{ rng.uniform(0, w), rng.uniform(20, 160), rng.uniform(0.8f, 1.4f), 0.1f + rng.uniform(0, 0.15f) });
    parallax.push_back(clouds);

    ParallaxLayer lanterns;
    lanterns.kind = ParallaxKind::Lantern;
    lanterns.wrapAt = -50;
    for(int i=0;i<3;i++) lanterns.items.push_back(ParallaxItem{ rng.uniform(0, w), rng.uniform(120, 220), 1.0f, 0.12f });
    parallax.push_back(lanterns);
}

float Environment::blendOffset() const {
    if(!blendActive) return blendTo;
    float t = clampf(blendElapsed / tuning.toggleBlendSeconds, 0.0f, 1.0f);
    float s = t * t * (3.0f - 2.0f * t);
    return lerpf(blendFrom, blendTo, s);
}

float Environment::phase() const { return wrap01(basePhase + blendOffset()); }

void Environment::setPhase(float p) {
    basePhase = wrap01(p);
    blendFrom = blendTo = blendElapsed = 0;
    blendActive = false;
}

void Environment::toggleMode() {
    float current = blendOffset();
    float target = (blendActive ? blendTo : current) + 0.5f;
    blendFrom = current;
    blendTo = target;
    blendElapsed = 0;
    blendActive = true;
}

void Environment::update(float dt, float scrollSpeed, ParticleSystem &particles) {
    if(tuning.cycleSeconds > 0) basePhase = wrap01(basePhase + dt / tuning.cycleSeconds);
    if(blendActive) {
        blendElapsed += dt;
        if(blendElapsed >= tuning.toggleBlendSeconds) {
            // fold the finished shift into the base phase so offsets never grow
            basePhase = wrap01(basePhase + blendTo);
            blendFrom = blendTo = blendElapsed = 0;
            blendActive = false;
        }
    }

    float w = (float)screen.width;
    for(auto &layer : parallax) {
        for(auto &it : layer.items) {
            it.x -= scrollSpeed * it.speedFactor * dt;
            if(it.x >= layer.wrapAt) continue;
            switch(layer.kind) {
            case ParallaxKind::Pagoda: it.x = w + rng.uniform(50, 300); break;
            case ParallaxKind::Cloud:
                it.x = w + rng.uniform(0, 200);
                it.y = rng.uniform(30, 160);
                it.scale = rng.uniform(0.8f, 1.4f);
                break;
            case ParallaxKind::Lantern: it.x = w + rng.uniform(50, 300); break;
            }
        }
    }

    float p = phase();
    if(rng.poisson(petalRateAt(p), dt)) particles.emit(ParticleKind::Petal, Vec2{ rng.uniform(0, w), -10.0f }, 1);
    if(rng.poisson(sparkleRateAt(p), dt)) particles.emit(ParticleKind::Sparkle, Vec2{ rng.uniform(0, w), (float)screen.height }, 1);
}

float Environment::ambientLightAt(float phase) {
    return 0.5f + 0.5f * sinf(2.0f * kPi * wrap01(phase));
}

Color3 Environment::skyColorAt(float phase) {
    float l = ambientLightAt(phase);
    return Color3{ lerpf(kNightSky.r, kDaySky.r, l), lerpf(kNightSky.g, kDaySky.g, l), lerpf(kNightSky.b, kDaySky.b, l) };
}

Vec2 Environment::celestialPosition(float phase, bool moon) const {
    float p = wrap01(phase);
    float local = moon ? p - 0.5f : p;
    if(local < 0 || local >= 0.5f) return Vec2{ -100.0f, screen.groundY + 100.0f };
    float t = local / 0.5f;
    float arc = screen.groundY - 60.0f;
    return Vec2{ lerpf(-40.0f, screen.width + 40.0f, t), screen.groundY - arc * sinf(kPi * t) };
}

float Environment::petalRateAt(float phase) const {
    float p = wrap01(phase);
    return p < 0.5f ? tuning.petalRate * (0.5f + 0.5f * ambientLightAt(p)) : 0.0f;
}

float Environment::sparkleRateAt(float phase) const {
    float p = wrap01(phase);
    return p >= 0.5f ? tuning.sparkleRate * (1.0f - 0.5f * ambientLightAt(p)) : 0.0f;
}

} // namespace ronin
