// SPDX-License-Identifier: Apache-2.0
#include "server/game/collectible_spawner.hpp"
#include "test_room_fixture.hpp"

#include <cassert>
#include <iostream>

using namespace strafe::game;

int main()
{
    auto cfg = strafe::test::make_room_config();
    cfg.missile_refill_amount = 3;
    cfg.missile_refill_respawn_seconds = 1.f;
    WorldState world;
    init_world(world, cfg);
    assert(world.collectibles.size() == 2);
    auto &a = strafe::test::place_player(world, cfg, 1, {50.f, 0.f, 2.f}); // on the missile refill
    a.missiles = 1;
    EventList events;

    // No pickups outside a match
    update_collectibles(world, cfg, cfg.tick_dt(), events);
    assert(events.empty() && world.collectibles.at(1).active);

    strafe::test::force_playing(world, cfg);
    update_collectibles(world, cfg, cfg.tick_dt(), events);
    assert(events.size() == 1);
    const auto &pick = std::get<PickupEvent>(events[0].payload);
    assert(pick.player_id == 1 && pick.collectible_id == 1 && pick.type == strafe::CollectibleType::missile_refill);
    assert(a.missiles == 4);
    assert(!world.collectibles.at(1).active);
    assert(world.collectibles.at(1).respawn_remaining == 1.f);

    // Inactive slot is not picked again; it reactivates after its timer
    events.clear();
    update_collectibles(world, cfg, 0.5f, events);
    assert(events.empty());
    update_collectibles(world, cfg, 0.5f, events);
    assert(world.collectibles.at(1).active);
    // Active again and the player is still there: picked up, capped at max
    assert(events.size() == 1);
    assert(a.missiles == a.max_missiles);

    // Dead players do not collect; the laser upgrade sets the flag
    auto &b = strafe::test::place_player(world, cfg, 2, {-50.f, 1.f, 0.f});
    b.alive = false;
    events.clear();
    update_collectibles(world, cfg, cfg.tick_dt(), events);
    assert(events.empty() && world.collectibles.at(2).active);
    b.alive = true;
    update_collectibles(world, cfg, cfg.tick_dt(), events);
    assert(events.size() == 1 && b.laser_upgrade);
    assert(world.collectibles.at(2).respawn_remaining == cfg.laser_upgrade_respawn_seconds);

    // Timers keep running in other phases
    world.phase = strafe::Phase::results;
    world.collectibles.at(2).respawn_remaining = 0.01f;
    update_collectibles(world, cfg, cfg.tick_dt(), events);
    assert(world.collectibles.at(2).active);

    std::cout << "unit_collectible_spawner OK" << std::endl;
    return 0;
}
