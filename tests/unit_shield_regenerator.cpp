// SPDX-License-Identifier: Apache-2.0
#include "server/game/combat_resolver.hpp"
#include "server/game/shield_regenerator.hpp"
#include "test_room_fixture.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace strafe::game;

int main()
{
    auto cfg = strafe::test::make_room_config();
    cfg.regen_delay = 5.f;
    cfg.regen_rate = 15.f;
    WorldState world;
    auto &a = strafe::test::place_player(world, cfg, 1, {0.f, 0.f, 0.f});
    EventList events;
    world.sim_time = 10.0;
    apply_damage(world, cfg, a, 2, 40.f, 0, events);
    assert(a.health == 60.f);
    assert(a.last_damage_time == 10.0);

    // Inside the delay: nothing
    world.sim_time = 14.9;
    regenerate_shields(world, cfg, 1.f);
    assert(a.health == 60.f);

    // After the delay: regen_rate per second
    world.sim_time = 15.0;
    regenerate_shields(world, cfg, 1.f);
    assert(std::fabs(a.health - 75.f) < 1e-4f);

    // Fresh damage restarts the delay
    world.sim_time = 16.0;
    apply_damage(world, cfg, a, 2, 5.f, 0, events);
    world.sim_time = 20.0;
    float h = a.health;
    regenerate_shields(world, cfg, 1.f);
    assert(a.health == h);

    // Capped at max
    world.sim_time = 100.0;
    for (int i = 0; i < 10; ++i)
        regenerate_shields(world, cfg, 1.f);
    assert(a.health == a.max_health);

    // The dead do not regenerate
    auto &b = strafe::test::place_player(world, cfg, 2, {10.f, 0.f, 0.f});
    b.alive = false;
    b.health = 0.f;
    b.last_damage_time = 0.0;
    regenerate_shields(world, cfg, 1.f);
    assert(b.health == 0.f);

    std::cout << "unit_shield_regenerator OK" << std::endl;
    return 0;
}
