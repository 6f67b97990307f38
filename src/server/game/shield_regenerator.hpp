// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "server/config.hpp"
#include "server/game/world_state.hpp"

namespace strafe::game {

// Living players untouched for regen_delay seconds recover regen_rate health per second, capped at max.
void regenerate_shields(WorldState &world, const RoomConfig &cfg, float dt);

} // namespace strafe::game
