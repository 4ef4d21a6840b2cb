#include "ronin/Config.h"
#include "ronin/Log.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace ronin {

string readFileAll(const string &path) {
    ifstream ifs(path, ios::in | ios::binary);
    if(!ifs) return string();
    stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

static string trim(const string &s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a==string::npos) return string();
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a,b-a+1);
}

bool Config::load(const string &path) {
    string txt = readFileAll(path);
    if (txt.empty()) return false;
    return parse(txt);
}

bool Config::parse(const string &text) {
    istringstream iss(text);
    string line;
    int lineNo = 0;
    while (getline(iss, line)) {
        lineNo++;
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        size_t eq = line.find('=');
        if (eq==string::npos) { LOGW("config line %d has no '=': %s", lineNo, line.c_str()); continue; }
        string k = trim(line.substr(0,eq));
        string v = trim(line.substr(eq+1));
        if (k.empty()) { LOGW("config line %d has an empty key", lineNo); continue; }
        data[k]=v;
    }
    return !data.empty();
}

string Config::get(const string &k, const string &def) const {
    auto it=data.find(k);
    return it==data.end()?def:it->second;
}

int Config::getInt(const string &k, int def) const {
    auto s=get(k);
    if(s.empty()) return def;
    try {
        size_t used = 0;
        int v = stoi(s, &used);
        if(used == s.size()) return v;
    }
    catch(const exception &) {}
    LOGW("config '%s': '%s' is not an integer, using %d", k.c_str(), s.c_str(), def);
    return def;
}

float Config::getFloat(const string &k, float def) const {
    auto s=get(k);
    if(s.empty()) return def;
    try {
        size_t used = 0;
        float v = stof(s, &used);
        if(used == s.size()) return v;
    }
    catch(const exception &) {}
    LOGW("config '%s': '%s' is not a number, using %g", k.c_str(), s.c_str(), def);
    return def;
}

bool Config::getBool(const string &k, bool def) const {
    auto s=get(k);
    if(s.empty()) return def;
    if(s=="1" || s=="true" || s=="yes" || s=="on") return true;
    if(s=="0" || s=="false" || s=="no" || s=="off") return false;
    LOGW("config '%s': '%s' is not a boolean, using %s", k.c_str(), s.c_str(), def?"true":"false");
    return def;
}

// ------------------------------ GameConfig --------------------------------

GameConfig GameConfig::fromConfig(const Config &c) {
    GameConfig g;
    g.screen.width = c.getInt("screen.width", g.screen.width);
    g.screen.height = c.getInt("screen.height", g.screen.height);
    g.screen.groundY = c.getFloat("screen.ground_y", g.screen.groundY);

    PlayerTuning &p = g.player;
    p.x = c.getFloat("player.x", p.x);
    p.width = c.getFloat("player.width", p.width);
    p.standHeight = c.getFloat("player.stand_height", p.standHeight);
    p.duckHeight = c.getFloat("player.duck_height", p.duckHeight);
    p.gravity = c.getFloat("player.gravity", p.gravity);
    p.jumpVelocity = c.getFloat("player.jump_velocity", p.jumpVelocity);
    p.doubleJumpVelocity = c.getFloat("player.double_jump_velocity", p.doubleJumpVelocity);
    p.jumpBufferSeconds = c.getFloat("player.jump_buffer", p.jumpBufferSeconds);
    p.dustInterval = c.getFloat("player.dust_interval", p.dustInterval);
    p.dashDuration = c.getFloat("player.dash_duration", p.dashDuration);
    p.dashMaxDuration = c.getFloat("player.dash_max_duration", p.dashMaxDuration);
    p.dashSpeedBonus = c.getFloat("player.dash_speed_bonus", p.dashSpeedBonus);
    p.dashTrailInterval = c.getFloat("player.dash_trail_interval", p.dashTrailInterval);

    DifficultyTuning &d = g.difficulty;
    d.startSpeed = c.getFloat("difficulty.start_speed", d.startSpeed);
    d.maxSpeed = c.getFloat("difficulty.max_speed", d.maxSpeed);
    d.speedPerSecond = c.getFloat("difficulty.speed_per_second", d.speedPerSecond);
    d.rampSeconds = c.getFloat("difficulty.ramp_seconds", d.rampSeconds);
    d.minIntervalMultiplier = c.getFloat("difficulty.min_interval_multiplier", d.minIntervalMultiplier);
    d.maxDragonMultiplier = c.getFloat("difficulty.max_dragon_multiplier", d.maxDragonMultiplier);

    SpawnTuning &s = g.spawn;
    s.minInterval = c.getFloat("spawn.min_interval", s.minInterval);
    s.maxInterval = c.getFloat("spawn.max_interval", s.maxInterval);
    s.minGapPx = c.getFloat("spawn.min_gap", s.minGapPx);
    s.reactionSeconds = c.getFloat("spawn.reaction_seconds", s.reactionSeconds);
    s.bambooCooldown = c.getFloat("spawn.bamboo_cooldown", s.bambooCooldown);
    s.bambooGapPx = c.getFloat("spawn.bamboo_gap", s.bambooGapPx);
    s.firstDragonAfter = c.getFloat("spawn.first_dragon_after", s.firstDragonAfter);
    s.powerUpRate = c.getFloat("spawn.powerup_rate", s.powerUpRate);
    s.powerUpAltitude = c.getFloat("spawn.powerup_altitude", s.powerUpAltitude);
    s.powerUpBobAmplitude = c.getFloat("spawn.powerup_bob_amplitude", s.powerUpBobAmplitude);
    s.powerUpBobSpeed = c.getFloat("spawn.powerup_bob_speed", s.powerUpBobSpeed);
    s.cullMargin = c.getFloat("spawn.cull_margin", s.cullMargin);
    s.weightRock = c.getFloat("spawn.weight.rock", s.weightRock);
    s.weightBarrel = c.getFloat("spawn.weight.barrel", s.weightBarrel);
    s.weightBamboo = c.getFloat("spawn.weight.bamboo", s.weightBamboo);
    s.weightDragon = c.getFloat("spawn.weight.dragon", s.weightDragon);
    s.weightBoulder = c.getFloat("spawn.weight.boulder", s.weightBoulder);

    g.particles.capacity = c.getInt("particles.capacity", g.particles.capacity);

    EnvironmentTuning &e = g.environment;
    e.cycleSeconds = c.getFloat("environment.cycle_seconds", e.cycleSeconds);
    e.toggleBlendSeconds = c.getFloat("environment.toggle_blend", e.toggleBlendSeconds);
    e.petalRate = c.getFloat("environment.petal_rate", e.petalRate);
    e.sparkleRate = c.getFloat("environment.sparkle_rate", e.sparkleRate);

    g.score.pointsPerSecond = c.getFloat("score.points_per_second", g.score.pointsPerSecond);
    g.score.milestoneEvery = c.getInt("score.milestone_every", g.score.milestoneEvery);
    g.score.tornadoBonus = c.getInt("score.tornado_bonus", g.score.tornadoBonus);

    g.audio.enabled = c.getBool("audio.enabled", g.audio.enabled);
    g.audio.sampleRate = c.getInt("audio.sample_rate", g.audio.sampleRate);
    g.audio.channels = c.getInt("audio.channels", g.audio.channels);
    g.audio.volume = c.getFloat("audio.volume", g.audio.volume);

    g.seed = static_cast<uint32_t>(c.getInt("seed", 0));
    return g;
}

bool GameConfig::validate() const {
    if(screen.width <= 0 || screen.height <= 0) { LOGE("screen size must be positive"); return false; }
    if(screen.groundY <= 0 || screen.groundY > screen.height) { LOGE("screen.ground_y must lie on screen"); return false; }
    if(player.gravity <= 0) { LOGE("player.gravity must be positive"); return false; }
    if(player.jumpVelocity >= 0 || player.doubleJumpVelocity >= 0) { LOGE("jump velocities must point up (negative)"); return false; }
    if(player.duckHeight <= 0 || player.duckHeight > player.standHeight) { LOGE("player.duck_height must be in (0, stand_height]"); return false; }
    if(player.dustInterval <= 0 || player.dashTrailInterval <= 0) { LOGE("player dust and dash trail intervals must be positive"); return false; }
    if(player.dashMaxDuration < player.dashDuration) { LOGE("player.dash_max_duration below dash_duration"); return false; }
    if(difficulty.maxSpeed < difficulty.startSpeed) { LOGE("difficulty.max_speed below start_speed"); return false; }
    if(difficulty.speedPerSecond < 0 || difficulty.rampSeconds <= 0) { LOGE("difficulty ramp must be non-negative"); return false; }
    if(difficulty.minIntervalMultiplier <= 0 || difficulty.minIntervalMultiplier > 1) { LOGE("difficulty.min_interval_multiplier must be in (0,1]"); return false; }
    if(difficulty.maxDragonMultiplier < 1) { LOGE("difficulty.max_dragon_multiplier must be >= 1"); return false; }
    if(spawn.minInterval <= 0 || spawn.maxInterval < spawn.minInterval) { LOGE("spawn interval range is invalid"); return false; }
    if(spawn.minGapPx < 0 || spawn.reactionSeconds < 0) { LOGE("spawn gaps must be non-negative"); return false; }
    if(particles.capacity <= 0) { LOGE("particles.capacity must be positive"); return false; }
    if(environment.toggleBlendSeconds <= 0) { LOGE("environment.toggle_blend must be positive"); return false; }
    if(score.milestoneEvery <= 0) { LOGE("score.milestone_every must be positive"); return false; }
    if(audio.sampleRate <= 0 || audio.channels < 1 || audio.channels > 2) { LOGE("audio format is invalid"); return false; }
    return true;
}

} // namespace ronin
