// SPDX-License-Identifier: Apache-2.0
// phase_controller.hpp - Lobby -> Countdown -> Playing -> Results -> Lobby.
#pragma once
#include "server/config.hpp"
#include "server/game/events.hpp"
#include "server/game/world_state.hpp"

#include <string>

namespace strafe::game {

// Advances phase timers and performs at most one transition per call.
void update_phase(WorldState &world, const RoomConfig &cfg, float dt, EventList &events);

// Accepted only in results with a matching non-empty admin token; the transition happens on the next update.
Rejection request_restart(WorldState &world, const RoomConfig &cfg, const std::string &token);

// Most kills wins; ties go to the lowest id. 0 when the room is empty.
uint32_t compute_winner(const WorldState &world);

} // namespace strafe::game
