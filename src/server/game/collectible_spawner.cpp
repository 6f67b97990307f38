// SPDX-License-Identifier: Apache-2.0
#include "server/game/collectible_spawner.hpp"

#include "common/logger.hpp"
#include "server/game/physics.hpp"

#include <algorithm>

namespace strafe::game {

namespace {

void apply_effect(Player &p, CollectibleType type, const RoomConfig &cfg)
{
    switch (type) {
        case CollectibleType::missile_refill:
            p.missiles = std::min(p.max_missiles, p.missiles + cfg.missile_refill_amount);
            break;
        case CollectibleType::laser_upgrade:
            p.laser_upgrade = true;
            break;
    }
}

} // namespace

void update_collectibles(WorldState &world, const RoomConfig &cfg, float dt, EventList &events)
{
    for (auto &[id, c] : world.collectibles) {
        if (c.active)
            continue;
        c.respawn_remaining -= dt;
        if (c.respawn_remaining <= 0.f) {
            c.active = true;
            c.respawn_remaining = 0.f;
        }
    }
    if (world.phase != Phase::playing)
        return;

    for (auto &[pid, p] : world.players) {
        if (!p.alive)
            continue;
        for (auto &[cid, c] : world.collectibles) {
            if (!c.active)
                continue;
            if (!strafe::phys::spheres_overlap({p.position, cfg.ship_radius}, {c.position, cfg.collectible_radius}))
                continue;
            c.active = false;
            c.respawn_remaining = cfg.respawn_seconds(c.type);
            apply_effect(p, c.type, cfg);
            events.push_back({world.tick, PickupEvent{p.id, c.id, c.type}});
            strafe::log::debug("[pickup] player={} collectible={} tick={}", p.id, c.id, world.tick);
        }
    }
}

} // namespace strafe::game
