// SPDX-License-Identifier: Apache-2.0
#include "server/game/shield_regenerator.hpp"

#include <algorithm>

namespace strafe::game {

void regenerate_shields(WorldState &world, const RoomConfig &cfg, float dt)
{
    for (auto &[id, p] : world.players) {
        if (!p.alive || p.health >= p.max_health)
            continue;
        if (world.sim_time - p.last_damage_time < static_cast<double>(cfg.regen_delay))
            continue;
        p.health = std::min(p.max_health, p.health + cfg.regen_rate * dt);
    }
}

} // namespace strafe::game
