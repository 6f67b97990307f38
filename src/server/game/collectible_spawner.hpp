// SPDX-License-Identifier: Apache-2.0
// collectible_spawner.hpp - respawn timers and pickups for static collectible slots.
#pragma once
#include "server/config.hpp"
#include "server/game/events.hpp"
#include "server/game/world_state.hpp"

namespace strafe::game {

// Timers advance in every phase; pickups only happen while playing.
void update_collectibles(WorldState &world, const RoomConfig &cfg, float dt, EventList &events);

} // namespace strafe::game
