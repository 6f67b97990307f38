// SPDX-License-Identifier: Apache-2.0
// combat_resolver.hpp - projectile advance, swept hits, damage, kills and respawn timers.
#pragma once
#include "server/config.hpp"
#include "server/game/events.hpp"
#include "server/game/world_state.hpp"

namespace strafe::game {

// One combat step. Order: respawn timers, then projectiles in id order (move, sweep, damage, lifetime).
void resolve_combat(WorldState &world, const RoomConfig &cfg, float dt, EventList &events);

// Applies damage to a living target. Emits hit and, when health reaches zero, kill; schedules respawn.
// Returns true when the target died.
bool apply_damage(
    WorldState &world,
    const RoomConfig &cfg,
    Player &target,
    uint32_t attacker_id,
    float amount,
    uint32_t projectile_id,
    EventList &events);

} // namespace strafe::game
