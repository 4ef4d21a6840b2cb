#pragma once

#include "ronin/CollisionMask.h"

#include <array>
#include <cstddef>
#include <string>

namespace ronin {

struct GameConfig;

enum class SpriteKey {
    PlayerRun, PlayerJump, PlayerDuck,
    Rock, Barrel, Bamboo, Boulder,
    DragonRed, DragonGreen, DragonBlack,
    TicketBlue, TicketYellow,
    Count
};

const char *spriteKeyName(SpriteKey key);

// What the renderer needs to pick a texture: which animation and which of its frames.
struct SpriteRef {
    SpriteKey key = SpriteKey::PlayerRun;
    size_t frame = 0;
};

struct AnimationFrame {
    int width = 0, height = 0;
    float duration = 0;             // seconds this frame stays on screen
    CollisionMask mask;             // gameplay sized, width x height
};

// Fixed capacity ordered frame list for one sprite. Checked once when it enters the catalog.
class AnimationSet {
public:
    static const size_t kMaxFrames = 16;

    bool addFrame(const AnimationFrame &f);
    size_t frameCount() const { return count; }
    const AnimationFrame &frame(size_t i) const { return frames[count ? i % count : 0]; }
    float cycleDuration() const;
    bool validate(std::string &why) const;

private:
    std::array<AnimationFrame, kMaxFrames> frames;
    size_t count = 0;
};

// Decoded frames and masks for every sprite the simulation may reference. Filled by
// the asset loader before the first spawn; the core only reads it.
class AssetCatalog {
public:
    AssetCatalog();

    bool add(SpriteKey key, const AnimationSet &set);
    bool has(SpriteKey key) const { return present[(size_t)key]; }
    // Aborts when the sprite was never loaded: spawning it would be an upstream bug.
    const AnimationSet &animation(SpriteKey key) const;
    const CollisionMask &mask(SpriteKey key, size_t frame) const { return animation(key).frame(frame).mask; }

    static float defaultFrameDuration(SpriteKey key);

private:
    std::array<AnimationSet, (size_t)SpriteKey::Count> sets;
    std::array<bool, (size_t)SpriteKey::Count> present;
};

// Procedural silhouettes for every sprite, at gameplay sizes. The loader starts from
// this and replaces entries for which image files exist.
AssetCatalog makePlaceholderCatalog(const GameConfig &cfg);

} // namespace ronin
