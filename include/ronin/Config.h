#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace ronin {

std::string readFileAll(const std::string &path);

// ------------------------------ Config ------------------------------------
// Flat key=value store. '#' starts a comment line, keys and values are trimmed.
class Config {
public:
    bool load(const std::string &path);
    bool parse(const std::string &text);
    void set(const std::string &k, const std::string &v) { data[k] = v; }
    bool has(const std::string &k) const { return data.count(k) != 0; }
    std::string get(const std::string &k, const std::string &def="") const;
    int getInt(const std::string &k, int def=0) const;
    float getFloat(const std::string &k, float def=0.0f) const;
    bool getBool(const std::string &k, bool def=false) const;
    size_t size() const { return data.size(); }
private:
    std::unordered_map<std::string,std::string> data;
};

// ------------------------------ Tunables ----------------------------------
// All durations are seconds, distances pixels, speeds pixels per second.

struct ScreenTuning {
    int width = 960;
    int height = 540;
    float groundY = 420.0f;
};

struct PlayerTuning {
    float x = 100.0f;
    float width = 48.0f;
    float standHeight = 72.0f;
    float duckHeight = 44.0f;
    float gravity = 2340.0f;
    float jumpVelocity = -750.0f;
    float doubleJumpVelocity = -600.0f;
    float jumpBufferSeconds = 0.12f;
    float dustInterval = 0.2f;
    float dashDuration = 5.0f;
    float dashMaxDuration = 10.0f;
    float dashSpeedBonus = 1.25f;
    float dashTrailInterval = 0.03f;
};

struct DifficultyTuning {
    float startSpeed = 360.0f;
    float maxSpeed = 960.0f;
    float speedPerSecond = 5.4f;
    float rampSeconds = 111.0f;
    float minIntervalMultiplier = 0.5f;
    float maxDragonMultiplier = 2.0f;
};

struct SpawnTuning {
    float minInterval = 0.9f;
    float maxInterval = 1.8f;
    float minGapPx = 140.0f;
    float reactionSeconds = 0.75f;
    float bambooCooldown = 4.0f;
    float bambooGapPx = 300.0f;
    float firstDragonAfter = 1.0f;
    float powerUpRate = 0.18f;
    float powerUpAltitude = 160.0f;
    float powerUpBobAmplitude = 15.0f;
    float powerUpBobSpeed = 6.0f;
    float cullMargin = 200.0f;
    float weightRock = 25.0f;
    float weightBarrel = 20.0f;
    float weightBamboo = 20.0f;
    float weightDragon = 25.0f;
    float weightBoulder = 10.0f;
};

struct ParticleTuning {
    int capacity = 512;
};

struct EnvironmentTuning {
    float cycleSeconds = 40.0f;     // <= 0 freezes the cycle
    float toggleBlendSeconds = 0.5f;
    float petalRate = 6.0f;
    float sparkleRate = 3.0f;
};

struct ScoreTuning {
    float pointsPerSecond = 12.0f;
    int milestoneEvery = 100;
    int tornadoBonus = 50;
};

struct AudioTuning {
    bool enabled = true;
    int sampleRate = 22050;
    int channels = 2;
    float volume = 0.5f;
};

struct GameConfig {
    ScreenTuning screen;
    PlayerTuning player;
    DifficultyTuning difficulty;
    SpawnTuning spawn;
    ParticleTuning particles;
    EnvironmentTuning environment;
    ScoreTuning score;
    AudioTuning audio;
    uint32_t seed = 0;              // 0 picks a time based seed in the host

    static GameConfig fromConfig(const Config &cfg);
    // Rejects values the simulation cannot run with. Logs the first offending key.
    bool validate() const;
};

} // namespace ronin
