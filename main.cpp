#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>
#include <SDL2/SDL_mixer.h>

#include "ronin/Assets.h"
#include "ronin/AudioSynth.h"
#include "ronin/Config.h"
#include "ronin/Log.h"
#include "ronin/Simulation.h"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <chrono>
#include <cmath>
#include <fstream>
#include <algorithm>
#include <stdexcept>

using namespace std;
using namespace ronin;

// ------------------------------ Utilities ----------------------------------
using TimePoint = chrono::steady_clock::time_point;
using ms = chrono::duration<double, milli>;

static double nowMillis() {
    return chrono::duration_cast<ms>(chrono::steady_clock::now().time_since_epoch()).count();
}

static const char *kHighScoreFile = "highscore.txt";
static const char *kImagesDir = "images/";

static int loadHighScore(const string &path) {
    string txt = readFileAll(path);
    if(txt.empty()) return 0;
    try { return max(0, stoi(txt)); }
    catch(const exception &) { LOGW("ignoring unreadable high score in %s", path.c_str()); return 0; }
}

static bool saveHighScore(const string &path, int score) {
    ofstream ofs(path, ios::out | ios::trunc);
    if(!ofs) { LOGW("cannot write %s", path.c_str()); return false; }
    ofs << score << "\n";
    return true;
}

// ------------------------------ Timing / Profiler --------------------------
struct Counter {
    int samples = 0;
    double sum = 0;
    void add(double v) { sum += v; samples++; }
    double avg() const { return samples? (sum/samples) : 0.0; }
    void reset() { samples = 0; sum = 0; }
};

// ------------------------------ Resources ---------------------------------
struct Texture {
    SDL_Texture* tex = nullptr;
    int w=0,h=0;
    Texture(SDL_Texture* t=nullptr,int ww=0,int hh=0):tex(t),w(ww),h(hh){}
    ~Texture(){ if(tex) SDL_DestroyTexture(tex); }
};

// Chunk over a buffer owned by the SoundBank, which outlives it.
struct Sound {
    Mix_Chunk* chunk = nullptr;
    ~Sound(){ if(chunk) Mix_FreeChunk(chunk); }
};

// Opaque where alpha is above half.
static CollisionMask maskFromSurface(SDL_Surface* s) {
    CollisionMask m(s->w, s->h);
    if(SDL_LockSurface(s) != 0) { LOGW("SDL_LockSurface failed: %s", SDL_GetError()); return m; }
    for(int y=0;y<s->h;++y){
        const Uint32* row = (const Uint32*)((const Uint8*)s->pixels + y * s->pitch);
        for(int x=0;x<s->w;++x){ Uint8 r,g,b,a; SDL_GetRGBA(row[x], s->format, &r,&g,&b,&a); if(a > 127) m.set(x,y); }
    }
    SDL_UnlockSurface(s);
    return m;
}

struct SpriteFiles { SpriteKey key; vector<string> files; };

static const vector<SpriteFiles> &spriteFiles() {
    static const vector<SpriteFiles> files = {
        { SpriteKey::PlayerRun,   { "Running_leftLeg.png", "Right_leg.png" } },
        { SpriteKey::PlayerJump,  { "Jump_samrai.png" } },
        { SpriteKey::PlayerDuck,  { "Down_samrai.png" } },
        { SpriteKey::Rock,        { "rock.png" } },
        { SpriteKey::Barrel,      { "drum.png" } },
        { SpriteKey::Bamboo,      { "bamboo.png" } },
        { SpriteKey::Boulder,     { "boulder.png" } },
        { SpriteKey::DragonRed,   { "dragon_red_0.png", "dragon_red_1.png" } },
        { SpriteKey::DragonGreen, { "dragon_green_0.png", "dragon_green_1.png" } },
        { SpriteKey::DragonBlack, { "dragon_black_0.png", "dragon_black_1.png" } },
        { SpriteKey::TicketBlue,  { "ticket_blue.png" } },
        { SpriteKey::TicketYellow,{ "ticket_yellow.png" } },
    };
    return files;
}

class ResourceManager {
public:
    ResourceManager(SDL_Renderer* r):renderer(r){}
    ~ResourceManager(){ textures.clear(); sounds.clear(); }

    // Loads one frame scaled to w x h: a texture for drawing and its mask for the catalog.
    shared_ptr<Texture> loadFrame(const string &id, const string &path, int w, int h, AnimationFrame &out) {
        SDL_Surface* surf = IMG_Load(path.c_str());
        if (!surf) { LOGW("Failed to load texture %s: %s", path.c_str(), IMG_GetError()); return nullptr; }
        SDL_Surface* scaled = SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_RGBA32);
        SDL_Surface* rgba = scaled ? SDL_ConvertSurfaceFormat(surf, SDL_PIXELFORMAT_RGBA32, 0) : nullptr;
        if (!scaled || !rgba) {
            LOGE("surface conversion failed for %s: %s", path.c_str(), SDL_GetError());
            if(rgba) SDL_FreeSurface(rgba);
            if(scaled) SDL_FreeSurface(scaled);
            SDL_FreeSurface(surf);
            return nullptr;
        }
        SDL_SetSurfaceBlendMode(rgba, SDL_BLENDMODE_NONE);
        SDL_BlitScaled(rgba, nullptr, scaled, nullptr);
        SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer, scaled);
        if (!tex) { LOGE("SDL_CreateTextureFromSurface failed: %s", SDL_GetError()); }
        shared_ptr<Texture> t;
        if (tex) {
            out.width = w; out.height = h;
            out.mask = maskFromSurface(scaled);
            t = make_shared<Texture>(tex, w, h);
            textures[id]=t;
            LOGI("Loaded texture '%s' (%s) %dx%d -> %dx%d, %zu solid px", id.c_str(), path.c_str(), surf->w, surf->h, w, h, out.mask.count());
        }
        SDL_FreeSurface(rgba);
        SDL_FreeSurface(scaled);
        SDL_FreeSurface(surf);
        return t;
    }

    // Replaces placeholder animations in `catalog` for every sprite whose files all load.
    int loadSprites(const string &dir, const GameConfig &cfg, AssetCatalog &catalog) {
        int loaded = 0;
        for(const auto &sf : spriteFiles()){
            int w, h;
            spriteSize(sf.key, cfg, w, h);
            AnimationSet set;
            bool ok = true;
            for(size_t i=0;i<sf.files.size() && ok;++i){
                AnimationFrame f;
                f.duration = AssetCatalog::defaultFrameDuration(sf.key);
                ok = loadFrame(frameId(sf.key, i), dir + sf.files[i], w, h, f) != nullptr && set.addFrame(f);
            }
            if(ok && catalog.add(sf.key, set)) loaded++;
            else for(size_t i=0;i<sf.files.size();++i) textures.erase(frameId(sf.key, i));
        }
        LOGI("%d of %zu sprites loaded from %s, placeholders for the rest", loaded, spriteFiles().size(), dir.c_str());
        return loaded;
    }

    shared_ptr<Sound> loadSound(SoundEvent e, const Waveform &w) {
        if (!audioEnabled || w.samples.empty()) return nullptr;
        auto s = make_shared<Sound>();
        s->chunk = Mix_QuickLoad_RAW((Uint8*)w.samples.data(), (Uint32)(w.samples.size() * sizeof(int16_t)));
        if (!s->chunk) { LOGW("Failed to load sound %s: %s", soundEventName(e), Mix_GetError()); return nullptr; }
        sounds[(int)e] = s;
        return s;
    }

    shared_ptr<Texture> getTexture(const SpriteRef &r) { auto it = textures.find(frameId(r.key, r.frame)); return it==textures.end()? nullptr : it->second; }
    shared_ptr<Sound> getSound(SoundEvent e) { auto it = sounds.find((int)e); return it==sounds.end()? nullptr : it->second; }
    void setAudioEnabled(bool v) { audioEnabled = v; }

    static void spriteSize(SpriteKey key, const GameConfig &cfg, int &w, int &h) {
        w = (int)lroundf(cfg.player.width);
        switch(key){
        case SpriteKey::PlayerRun: case SpriteKey::PlayerJump: h = (int)lroundf(cfg.player.standHeight); return;
        case SpriteKey::PlayerDuck: h = (int)lroundf(cfg.player.duckHeight); return;
        default: break;
        }
        for(size_t i=0;i<(size_t)EntityKind::Count;++i){
            const KindInfo &k = kindInfo((EntityKind)i);
            if(k.sprite == key){ w = (int)k.width; h = (int)k.height; return; }
        }
        h = w;
    }

private:
    static string frameId(SpriteKey key, size_t frame) { return string(spriteKeyName(key)) + "#" + to_string(frame); }

    SDL_Renderer* renderer = nullptr;
    unordered_map<string, shared_ptr<Texture>> textures;
    unordered_map<int, shared_ptr<Sound>> sounds;
    bool audioEnabled = true;
};

// ------------------------------ Input -------------------------------------
struct KeyEdge { SDL_Scancode key; bool down; };

struct InputState {
    vector<KeyEdge> edges;
    bool quit=false;
    void update() {
        edges.clear();
        SDL_Event e;
        while(SDL_PollEvent(&e)){
            if(e.type==SDL_QUIT) quit=true;
            else if(e.type==SDL_KEYDOWN && !e.key.repeat) edges.push_back(KeyEdge{ e.key.keysym.scancode, true });
            else if(e.type==SDL_KEYUP) edges.push_back(KeyEdge{ e.key.keysym.scancode, false });
        }
    }
};

// Physical keys to named actions.
class InputMap {
public:
    void bind(SDL_Scancode key, const string &action) { map[key]=action; }
    const string *action(SDL_Scancode key) const { auto it = map.find(key); return it==map.end()? nullptr : &it->second; }
private:
    unordered_map<int,string> map;
};

// ------------------------------ Audio Manager -----------------------------
class AudioManager {
public:
    AudioManager() { Mix_AllocateChannels(16); }
    void playSound(shared_ptr<Sound> s){ if(!s||!s->chunk) return; Mix_PlayChannel(-1, s->chunk, 0); }
};

// ------------------------------ Renderer Utilities ------------------------
static void drawRect(SDL_Renderer* r, int x,int y,int w,int h){ SDL_Rect rr={x,y,w,h}; SDL_RenderFillRect(r,&rr); }
static void drawRect(SDL_Renderer* r, const Rect &b){ drawRect(r, (int)lroundf(b.x), (int)lroundf(b.y), (int)lroundf(b.w), (int)lroundf(b.h)); }
static void drawOutline(SDL_Renderer* r, const Rect &b){ SDL_Rect rr={(int)lroundf(b.x), (int)lroundf(b.y), (int)lroundf(b.w), (int)lroundf(b.h)}; SDL_RenderDrawRect(r,&rr); }
static void drawDisc(SDL_Renderer* r, int cx,int cy,int rad){ for(int dy=-rad;dy<=rad;++dy){ int dx=(int)sqrtf((float)(rad*rad-dy*dy)); SDL_RenderDrawLine(r, cx-dx, cy+dy, cx+dx, cy+dy); } }

static void kindColor(EntityKind k, Uint8 &r, Uint8 &g, Uint8 &b){
    switch(k){
    case EntityKind::Rock: r=110; g=110; b=110; break;
    case EntityKind::Barrel: r=139; g=69; b=19; break;
    case EntityKind::Bamboo: r=60; g=160; b=60; break;
    case EntityKind::Boulder: r=90; g=80; b=70; break;
    case EntityKind::DragonRed: r=200; g=40; b=40; break;
    case EntityKind::DragonGreen: r=40; g=170; b=70; break;
    case EntityKind::DragonBlack: r=30; g=30; b=30; break;
    case EntityKind::TicketBlue: r=40; g=120; b=255; break;
    case EntityKind::TicketYellow: r=255; g=215; b=0; break;
    default: r=g=b=255; break;
    }
}

static void particleColor(ParticleKind k, Uint8 &r, Uint8 &g, Uint8 &b){
    switch(k){
    case ParticleKind::Dust: r=200; g=180; b=150; break;
    case ParticleKind::Petal: r=255; g=183; b=197; break;
    case ParticleKind::Sparkle: r=255; g=255; b=200; break;
    case ParticleKind::Debris: r=120; g=100; b=80; break;
    case ParticleKind::DashTrail: r=80; g=160; b=255; break;
    }
}

// ------------------------------ Engine ------------------------------------
class Engine {
public:
    Engine(const GameConfig &c, const string &title="Ronin Runner") : cfg(c), screenW(c.screen.width), screenH(c.screen.height), windowTitle(title) {}
    bool init(){
        if(SDL_Init(SDL_INIT_VIDEO|SDL_INIT_AUDIO|SDL_INIT_TIMER) < 0){ LOGE("SDL_Init failed: %s", SDL_GetError()); return false; }
        int imgFlags = IMG_INIT_PNG; if(!(IMG_Init(imgFlags) & imgFlags)) LOGW("IMG_Init warning: %s", IMG_GetError());
        audioAvailable = cfg.audio.enabled;
        if(audioAvailable && Mix_OpenAudio(cfg.audio.sampleRate, AUDIO_S16SYS, cfg.audio.channels, 512) < 0){ LOGW("Mix_OpenAudio failed: %s", Mix_GetError()); audioAvailable=false; }
        window = SDL_CreateWindow(windowTitle.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, screenW, screenH, SDL_WINDOW_SHOWN);
        if(!window){ LOGE("CreateWindow failed: %s", SDL_GetError()); return false; }
        renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if(!renderer){ LOGE("CreateRenderer failed: %s", SDL_GetError()); return false; }
        SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
        resources = make_unique<ResourceManager>(renderer);
        resources->setAudioEnabled(audioAvailable);
        if(audioAvailable) audio = make_unique<AudioManager>();
        inputMap.bind(SDL_SCANCODE_SPACE, "jump"); inputMap.bind(SDL_SCANCODE_UP, "jump");
        inputMap.bind(SDL_SCANCODE_DOWN, "duck");
        inputMap.bind(SDL_SCANCODE_T, "daynight");
        inputMap.bind(SDL_SCANCODE_G, "dragon");
        inputMap.bind(SDL_SCANCODE_H, "hitboxes");
        inputMap.bind(SDL_SCANCODE_P, "pause");
        inputMap.bind(SDL_SCANCODE_ESCAPE, "quit");
        lastTime = chrono::steady_clock::now();
        LOGI("Engine initialized");
        return true;
    }

    void loadAssets(){
        catalog = makePlaceholderCatalog(cfg);
        resources->loadSprites(kImagesDir, cfg, catalog);
        if(audioAvailable){
            // synthesize at whatever format the device actually opened with
            int freq = cfg.audio.sampleRate, channels = cfg.audio.channels; Uint16 format = 0;
            if(Mix_QuerySpec(&freq, &format, &channels) == 0) LOGW("Mix_QuerySpec failed: %s", Mix_GetError());
            bank = make_unique<SoundBank>(AudioSynth(freq, channels, cfg.audio.volume));
            bank->precompute();
            for(size_t i=0;i<(size_t)SoundEvent::Count;++i) resources->loadSound((SoundEvent)i, bank->get((SoundEvent)i));
            LOGI("Synthesized %zu sounds at %d Hz, %d channels", bank->synthesizedCount(), freq, channels);
        }
    }

    void startSession(){
        highScore = loadHighScore(kHighScoreFile);
        sim = make_unique<Simulation>(cfg, catalog, highScore);
        LOGI("Press SPACE to run. T day/night, H hitboxes, G dragon, P pause, ESC quit");
    }

    void run(){ running=true; const double fixedDt = 1.0/60.0; const double maxAccum = 0.25; double accumulator=0.0;
        while(running){
            TimePoint frameStart = chrono::steady_clock::now();
            input.update(); if(input.quit) running=false;
            dispatchInput();
            chrono::duration<double> frameTime = chrono::steady_clock::now() - lastTime; lastTime = chrono::steady_clock::now();
            accumulator += frameTime.count(); if(accumulator > maxAccum) accumulator = maxAccum;
            while(accumulator >= fixedDt){ fixedUpdate(fixedDt); accumulator -= fixedDt; }
            double t0 = nowMillis(); render(); renderTime.add(nowMillis() - t0);
            // frame cap if not vsync
            if(!vsync){ TimePoint frameEnd = chrono::steady_clock::now(); chrono::duration<double,milli> elapsed = frameEnd - frameStart; double targetMs = 1000.0/60.0; if(elapsed.count() < targetMs) SDL_Delay((Uint32)(targetMs - elapsed.count())); }
        }
        cleanup(); }

private:
    void dispatchInput(){
        for(const KeyEdge &k : input.edges){
            const string *a = inputMap.action(k.key); if(!a) continue;
            const string &act = *a;
            if(act=="duck"){ sim->handleInput(k.down ? InputEvent::DuckPressed : InputEvent::DuckReleased); continue; }
            if(!k.down) continue;
            if(act=="quit") running=false;
            else if(act=="pause") sim->setPaused(sim->state() != RunState::Paused);
            else if(act=="hitboxes") sim->handleInput(InputEvent::ToggleHitboxDisplay);
            else if(act=="daynight") sim->handleInput(InputEvent::ToggleDayNight);
            else if(act=="dragon") sim->handleInput(InputEvent::DebugSpawnDragon);
            else if(act=="jump"){
                if(sim->state() == RunState::GameOver) sim->restart();
                else sim->handleInput(InputEvent::JumpPressed);
            }
        }
    }

    void fixedUpdate(double dt){
        RunState before = sim->state();
        double t0 = nowMillis();
        sim->step((float)dt);
        stepTime.add(nowMillis() - t0);
        if(audio) for(SoundEvent e : sim->frameSounds()) audio->playSound(resources->getSound(e));
        if(sim->showHitboxes()) for(const Contact &c : sim->frameContacts()) LOGI("contact #%u %s: %s", c.obstacleId, kindInfo(c.kind).name, contactOutcomeName(c.outcome));
        if(before == RunState::Running && sim->state() == RunState::GameOver){
            const ScoreKeeper &s = sim->score();
            if(s.isNewHighScore()){ highScore = s.score(); saveHighScore(kHighScoreFile, highScore); LOGI("New high score %d", highScore); }
            LOGI("Honor lost. Final score %d. Press SPACE to retry", s.score());
        }
    }

    void render(){
        FrameSnapshot s = sim->snapshot();
        SDL_SetRenderDrawColor(renderer, (Uint8)(s.environment.sky.r*255), (Uint8)(s.environment.sky.g*255), (Uint8)(s.environment.sky.b*255), 255); SDL_RenderClear(renderer);
        renderSky(s);
        renderParallax(s);
        SDL_SetRenderDrawColor(renderer, 101, 67, 33, 255); drawRect(renderer, 0, (int)s.groundY, screenW, screenH - (int)s.groundY);
        for(const auto &o : s.obstacles) renderSprite(o.sprite, o.bounds, o.rotation, o.kind);
        for(const auto &p : s.particles){
            Uint8 r=255,g=255,b=255; particleColor(p.kind, r,g,b);
            SDL_SetRenderDrawColor(renderer, r,g,b, (Uint8)(clampf(p.alpha,0,1)*255));
            int sz = max(1, (int)p.size); drawRect(renderer, (int)p.x - sz/2, (int)p.y - sz/2, sz, sz);
        }
        renderPlayer(s.player);
        // night tint
        SDL_SetRenderDrawColor(renderer, 0, 0, 30, (Uint8)((1.0f - s.environment.ambientLight) * 110)); drawRect(renderer, 0, 0, screenW, screenH);
        if(s.showHitboxes) renderHitboxes(s);
        renderOverlay(s);
        SDL_RenderPresent(renderer);
    }

    void renderSky(const FrameSnapshot &s){
        const Vec2 &sun = s.environment.sun, &moon = s.environment.moon;
        SDL_SetRenderDrawColor(renderer, 255, 223, 0, 255); drawDisc(renderer, (int)sun.x, (int)sun.y, 40);
        SDL_SetRenderDrawColor(renderer, 240, 240, 255, 255); drawDisc(renderer, (int)moon.x, (int)moon.y, 30);
    }

    void renderParallax(const FrameSnapshot &s){
        for(const auto &layer : s.environment.layers){
            for(const auto &it : layer.items){
                int x = (int)it.x, y = (int)it.y;
                switch(layer.kind){
                case ParallaxKind::Pagoda: SDL_SetRenderDrawColor(renderer, 60, 40, 50, 255); drawRect(renderer, x, y, 80, (int)s.groundY - y); drawRect(renderer, x - 15, y, 110, 12); drawRect(renderer, x - 10, y + 50, 100, 10); break;
                case ParallaxKind::Cloud: SDL_SetRenderDrawColor(renderer, 255, 255, 255, 180); drawRect(renderer, x, y, (int)(100 * it.scale), (int)(30 * it.scale)); break;
                case ParallaxKind::Lantern: SDL_SetRenderDrawColor(renderer, 230, 60, 40, 220); drawRect(renderer, x, y, 14, 20); break;
                }
            }
        }
    }

    void renderSprite(const SpriteRef &ref, const Rect &b, float rotation, EntityKind kind){
        auto tex = resources->getTexture(ref);
        if(tex){ SDL_Rect dst{ (int)lroundf(b.x), (int)lroundf(b.y), (int)lroundf(b.w), (int)lroundf(b.h) }; SDL_RenderCopyEx(renderer, tex->tex, nullptr, &dst, rotation, nullptr, SDL_FLIP_NONE); return; }
        Uint8 r,g,bl; kindColor(kind, r,g,bl); SDL_SetRenderDrawColor(renderer, r,g,bl, 255); drawRect(renderer, b);
    }

    void renderPlayer(const PlayerView &p){
        auto tex = resources->getTexture(p.sprite);
        SDL_Rect dst{ (int)lroundf(p.bounds.x), (int)lroundf(p.bounds.y), (int)lroundf(p.bounds.w), (int)lroundf(p.bounds.h) };
        if(tex){ if(p.invincible) SDL_SetTextureColorMod(tex->tex, 120, 180, 255); else SDL_SetTextureColorMod(tex->tex, 255, 255, 255); SDL_RenderCopy(renderer, tex->tex, nullptr, &dst); }
        else { if(p.invincible) SDL_SetRenderDrawColor(renderer, 80, 160, 255, 255); else SDL_SetRenderDrawColor(renderer, 180, 20, 20, 255); SDL_RenderFillRect(renderer, &dst); }
    }

    void renderHitboxes(const FrameSnapshot &s){
        SDL_SetRenderDrawColor(renderer, 0, 255, 0, 255); drawOutline(renderer, s.player.bounds);
        SDL_SetRenderDrawColor(renderer, 255, 0, 0, 255); for(const auto &o : s.obstacles) drawOutline(renderer, o.bounds);
    }

    void renderOverlay(const FrameSnapshot &s){ // score bar & stats
        int best = max(s.score, s.highScore);
        if(best > 0){ SDL_SetRenderDrawColor(renderer, 0,0,0,160); drawRect(renderer, 8, 8, 204, 14); SDL_SetRenderDrawColor(renderer, 255, 215, 0, 255); drawRect(renderer, 10, 10, 200 * s.score / best, 10); }
        if(s.state == RunState::Ready || s.state == RunState::Paused){ SDL_SetRenderDrawColor(renderer, 0,0,0,120); drawRect(renderer, 0,0,screenW,screenH); }
        if(s.state == RunState::GameOver){ SDL_SetRenderDrawColor(renderer, 50,0,0,150); drawRect(renderer, 0,0,screenW,screenH); }
        if(s.score != shownScore){ shownScore = s.score; char title[128]; snprintf(title, sizeof(title), "%s | score %d | best %d", windowTitle.c_str(), s.score, best); SDL_SetWindowTitle(window, title); }
        double t = nowMillis(); if(t - lastStatsTime >= 5000.0){
            LOGI("%s/%s | step %.3f ms | render %.3f ms | entities %zu | particles %zu | box tests %zu | mask tests %zu", runStateName(s.state), motionStateName(s.player.state), stepTime.avg(), renderTime.avg(), s.obstacles.size(), s.particles.size(), sim->collisions().stats().boxTests, sim->collisions().stats().maskTests);
            stepTime.reset(); renderTime.reset(); lastStatsTime = t; }
    }

    void cleanup(){ sim.reset(); resources.reset(); audio.reset(); bank.reset(); if(renderer){ SDL_DestroyRenderer(renderer); renderer=nullptr; } if(window){ SDL_DestroyWindow(window); window=nullptr; } if(audioAvailable) Mix_CloseAudio(); IMG_Quit(); SDL_Quit(); }

    GameConfig cfg;
    int screenW, screenH; string windowTitle; SDL_Window* window=nullptr; SDL_Renderer* renderer=nullptr; unique_ptr<ResourceManager> resources; unique_ptr<AudioManager> audio; unique_ptr<SoundBank> bank;
    AssetCatalog catalog; unique_ptr<Simulation> sim; int highScore=0;
    InputState input; InputMap inputMap;
    bool running=false; bool vsync=true; bool audioAvailable=true; TimePoint lastTime;
    // debug
    Counter stepTime, renderTime; double lastStatsTime=nowMillis(); int shownScore=-1;
};

// ------------------------------ Main --------------------------------------
int main(int argc, char** argv){
    string cfgPath = argc > 1 ? argv[1] : "config/ronin.cfg";
    Config c;
    if(!c.load(cfgPath)) LOGW("no config at %s, using defaults", cfgPath.c_str());
    GameConfig cfg = GameConfig::fromConfig(c);
    if(!cfg.validate()) return EXIT_FAILURE;
    if(cfg.seed == 0) cfg.seed = (uint32_t)time(nullptr);
    LOGI("seed %u", cfg.seed);
    Engine e(cfg); if(!e.init()) return EXIT_FAILURE; e.loadAssets(); e.startSession(); e.run(); return EXIT_SUCCESS; }
