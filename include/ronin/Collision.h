#pragma once

#include "ronin/CollisionMask.h"
#include "ronin/Entities.h"
#include "ronin/Player.h"
#include "ronin/Types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ronin {

enum class ContactOutcome {
    PickedUp,       // pickup collected, removed
    PassedThrough,  // hazard shattered by an invincible player
    Hit,            // hazard reached a vulnerable player
    Slashed         // destroyed by a tornado, not necessarily touching
};

const char *contactOutcomeName(ContactOutcome o);

struct Contact {
    uint32_t obstacleId = 0;
    EntityKind kind = EntityKind::Rock;
    ContactOutcome outcome = ContactOutcome::Hit;
};

struct CollisionStats {
    size_t boxTests = 0;
    size_t maskTests = 0;
    size_t contacts = 0;
};

class CollisionEngine {
public:
    // Tests the player against every live entity and applies the outcomes. Pickups are
    // settled before hazards, so the result does not depend on field order.
    std::vector<Contact> test(Player &player, ObstacleField &field, SimContext &ctx);

    // Box pre-check, then mask overlap at the integer offset between the two boxes.
    bool overlaps(const Rect &a, const CollisionMask &ma, const Rect &b, const CollisionMask &mb);

    const CollisionStats &stats() const { return counters; }
    void resetStats() { counters = CollisionStats(); }

private:
    void shatter(Obstacle &o, SimContext &ctx);

    CollisionStats counters;
};

} // namespace ronin
