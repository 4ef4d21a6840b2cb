#include "ronin/Assets.h"
#include "ronin/Config.h"
#include "ronin/Entities.h"
#include "ronin/Log.h"

#include <cmath>
#include <vector>

using namespace std;

namespace ronin {

const size_t AnimationSet::kMaxFrames;

const char *spriteKeyName(SpriteKey key) {
    switch(key) {
    case SpriteKey::PlayerRun: return "player_run";
    case SpriteKey::PlayerJump: return "player_jump";
    case SpriteKey::PlayerDuck: return "player_duck";
    case SpriteKey::Rock: return "rock";
    case SpriteKey::Barrel: return "barrel";
    case SpriteKey::Bamboo: return "bamboo";
    case SpriteKey::Boulder: return "boulder";
    case SpriteKey::DragonRed: return "dragon_red";
    case SpriteKey::DragonGreen: return "dragon_green";
    case SpriteKey::DragonBlack: return "dragon_black";
    case SpriteKey::TicketBlue: return "ticket_blue";
    case SpriteKey::TicketYellow: return "ticket_yellow";
    case SpriteKey::Count: break;
    }
    return "?";
}

// ------------------------------ AnimationSet ------------------------------

bool AnimationSet::addFrame(const AnimationFrame &f) {
    if(count >= kMaxFrames) return false;
    frames[count++] = f;
    return true;
}

float AnimationSet::cycleDuration() const {
    float total = 0;
    for(size_t i=0;i<count;++i) total += frames[i].duration;
    return total;
}

bool AnimationSet::validate(string &why) const {
    if(count == 0) { why = "no frames"; return false; }
    for(size_t i=0;i<count;++i) {
        const AnimationFrame &f = frames[i];
        if(f.width <= 0 || f.height <= 0) { why = "frame " + to_string(i) + " has no size"; return false; }
        if(!(f.duration > 0)) { why = "frame " + to_string(i) + " has a non-positive duration"; return false; }
        if(f.mask.width() != f.width || f.mask.height() != f.height) {
            why = "frame " + to_string(i) + " mask is " + to_string(f.mask.width()) + "x" + to_string(f.mask.height()) +
                  ", frame is " + to_string(f.width) + "x" + to_string(f.height);
            return false;
        }
    }
    return true;
}

// ------------------------------ AssetCatalog ------------------------------

AssetCatalog::AssetCatalog() { present.fill(false); }

bool AssetCatalog::add(SpriteKey key, const AnimationSet &set) {
    string why;
    if(!set.validate(why)) { LOGE("animation '%s' rejected: %s", spriteKeyName(key), why.c_str()); return false; }
    sets[(size_t)key] = set;
    present[(size_t)key] = true;
    return true;
}

const AnimationSet &AssetCatalog::animation(SpriteKey key) const {
    RONIN_REQUIRE(has(key), "no decoded frames for sprite '%s'", spriteKeyName(key));
    return sets[(size_t)key];
}

float AssetCatalog::defaultFrameDuration(SpriteKey key) {
    switch(key) {
    case SpriteKey::PlayerRun: return 5.0f / 60.0f;
    case SpriteKey::DragonRed:
    case SpriteKey::DragonGreen:
    case SpriteKey::DragonBlack: return 1.0f / 9.0f;
    default: return 0.25f;
    }
}

// ------------------------------ Placeholders ------------------------------

static AnimationFrame frameFrom(const CollisionMask &mask, SpriteKey key) {
    AnimationFrame f;
    f.width = mask.width();
    f.height = mask.height();
    f.duration = AssetCatalog::defaultFrameDuration(key);
    f.mask = mask;
    return f;
}

static AnimationSet single(const CollisionMask &mask, SpriteKey key) {
    AnimationSet s;
    s.addFrame(frameFrom(mask, key));
    return s;
}

// Rounded body: solid rect with the corners knocked off.
static CollisionMask bodyMask(int w, int h) {
    int c = max(1, min(w, h) / 6);
    vector<float> xy = { (float)c, 0.0f, (float)(w - c), 0.0f, (float)w, (float)c, (float)w, (float)(h - c),
                         (float)(w - c), (float)h, (float)c, (float)h, 0.0f, (float)(h - c), 0.0f, (float)c };
    return CollisionMask::polygon(w, h, xy);
}

// Wing-up and wing-down dragon silhouettes, from a 110x90 design scaled to w x h.
static CollisionMask dragonMask(int w, int h, bool wingsUp) {
    float sx = w / 110.0f, sy = h / 90.0f;
    vector<float> up = { 10, 70, 60, 20, 100, 50, 60, 60 };
    vector<float> down = { 10, 50, 60, 10, 100, 40, 60, 70 };
    vector<float> &src = wingsUp ? up : down;
    for(size_t i=0;i<src.size();i+=2) { src[i] *= sx; src[i+1] *= sy; }
    return CollisionMask::polygon(w, h, src);
}

AssetCatalog makePlaceholderCatalog(const GameConfig &cfg) {
    AssetCatalog cat;
    int pw = (int)lroundf(cfg.player.width);
    int ph = (int)lroundf(cfg.player.standHeight);
    int dh = (int)lroundf(cfg.player.duckHeight);

    AnimationSet run;
    run.addFrame(frameFrom(bodyMask(pw, ph), SpriteKey::PlayerRun));
    run.addFrame(frameFrom(bodyMask(pw, ph), SpriteKey::PlayerRun));
    cat.add(SpriteKey::PlayerRun, run);
    cat.add(SpriteKey::PlayerJump, single(bodyMask(pw, ph), SpriteKey::PlayerJump));
    cat.add(SpriteKey::PlayerDuck, single(bodyMask(pw, dh), SpriteKey::PlayerDuck));

    for(size_t i=0;i<(size_t)EntityKind::Count;++i) {
        const KindInfo &k = kindInfo((EntityKind)i);
        int w = (int)k.width, h = (int)k.height;
        switch((EntityKind)i) {
        case EntityKind::Rock:
        case EntityKind::Boulder:
            cat.add(k.sprite, single(CollisionMask::ellipse(w, h), k.sprite));
            break;
        case EntityKind::DragonRed:
        case EntityKind::DragonGreen:
        case EntityKind::DragonBlack: {
            AnimationSet s;
            s.addFrame(frameFrom(dragonMask(w, h, true), k.sprite));
            s.addFrame(frameFrom(dragonMask(w, h, false), k.sprite));
            cat.add(k.sprite, s);
            break;
        }
        default:
            cat.add(k.sprite, single(bodyMask(w, h), k.sprite));
            break;
        }
    }
    return cat;
}

} // namespace ronin
