#include "ronin/Difficulty.h"
#include "ronin/Types.h"

namespace ronin {

DifficultyState DifficultyCurve::at(float elapsed) const {
    DifficultyState d;
    d.elapsed = elapsed < 0 ? 0 : elapsed;
    d.speed = clampf(tuning.startSpeed + tuning.speedPerSecond * d.elapsed, tuning.startSpeed, tuning.maxSpeed);
    float p = clampf(d.elapsed / tuning.rampSeconds, 0.0f, 1.0f);
    d.spawnIntervalMultiplier = lerpf(1.0f, tuning.minIntervalMultiplier, p);
    d.dragonFrequencyMultiplier = lerpf(1.0f, tuning.maxDragonMultiplier, p);
    return d;
}

int ScoreKeeper::addPoints(float points) {
    if(points <= 0) return 0;
    exact += points;
    int reached = score() / tuning.milestoneEvery;
    int crossed = reached - lastMilestone;
    lastMilestone = reached;
    return crossed > 0 ? crossed : 0;
}

} // namespace ronin
