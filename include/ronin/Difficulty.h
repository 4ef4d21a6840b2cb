#pragma once

#include "ronin/Config.h"

namespace ronin {

struct DifficultyState {
    float elapsed = 0;
    float speed = 0;                        // scroll speed, px/s
    float spawnIntervalMultiplier = 1;      // non-increasing
    float dragonFrequencyMultiplier = 1;    // non-decreasing
};

// Difficulty as a pure function of elapsed run time.
class DifficultyCurve {
public:
    explicit DifficultyCurve(const DifficultyTuning &t) : tuning(t) {}
    DifficultyState at(float elapsed) const;
private:
    DifficultyTuning tuning;
};

// Survival score, bonuses and milestone detection for one run.
class ScoreKeeper {
public:
    ScoreKeeper(const ScoreTuning &t, int highScore) : tuning(t), high(highScore) {}
    void reset(int highScore) { exact = 0; high = highScore; lastMilestone = 0; }
    // Both return how many milestones the added points crossed.
    int advance(float dt) { return addPoints(tuning.pointsPerSecond * dt); }
    int addBonus(int points) { return addPoints((float)points); }

    int score() const { return (int)exact; }
    int highScore() const { return high; }
    bool isNewHighScore() const { return score() > high; }
    int bestScore() const { return score() > high ? score() : high; }

private:
    int addPoints(float points);

    ScoreTuning tuning;
    float exact = 0;
    int high = 0;
    int lastMilestone = 0;
};

} // namespace ronin
