// SPDX-License-Identifier: Apache-2.0
#include "server/game/input_ingestor.hpp"
#include "test_room_fixture.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace strafe::game;

static MoveIntent move(uint32_t seq, glm::vec3 pos, glm::vec3 vel = glm::vec3(0.f))
{
    MoveIntent m;
    m.seq = seq;
    m.position = pos;
    m.velocity = vel;
    return m;
}

int main()
{
    auto cfg = strafe::test::make_room_config();
    WorldState world;
    init_world(world, cfg);
    auto &a = strafe::test::place_player(world, cfg, 1, {0.f, 0.f, 0.f});
    strafe::test::place_player(world, cfg, 2, {100.f, 0.f, 0.f});
    InputIngestor ing(cfg);
    EventList events;

    // ---- movement
    assert(ing.submit(world, 1, move(1, {5.f, 0.f, 0.f}, {100.f, 0.f, 0.f})) == Rejection::none);
    assert(ing.submit(world, 1, move(1, {6.f, 0.f, 0.f})) == Rejection::stale_sequence);
    assert(ing.submit(world, 1, move(0, {6.f, 0.f, 0.f})) == Rejection::stale_sequence);
    // fighter cap 135 with 10% tolerance
    assert(ing.submit(world, 1, move(2, {6.f, 0.f, 0.f}, {160.f, 0.f, 0.f})) == Rejection::speed_cap);
    assert(ing.submit(world, 1, move(2, {700.f, 0.f, 0.f})) == Rejection::out_of_bounds);
    float nan = std::numeric_limits<float>::quiet_NaN();
    assert(ing.submit(world, 1, move(2, {nan, 0.f, 0.f})) == Rejection::malformed);
    MoveIntent zero_rot = move(2, {6.f, 0.f, 0.f});
    zero_rot.rotation = glm::quat(0.f, 0.f, 0.f, 0.f);
    assert(ing.submit(world, 1, zero_rot) == Rejection::malformed);
    assert(ing.submit(world, 99, move(1, {0.f, 0.f, 0.f})) == Rejection::unknown_player);
    // rejected seqs do not advance the watermark
    assert(ing.last_accepted_seq(1) == 1);
    assert(ing.submit(world, 1, move(3, {7.f, 0.f, 0.f}, {140.f, 0.f, 0.f})) == Rejection::none);
    assert(ing.pending() == 2);

    ing.apply_pending(world, events);
    assert(events.empty());
    assert(a.position == glm::vec3(7.f, 0.f, 0.f));
    assert(a.last_acked_input_seq == 3);
    assert(ing.pending() == 0);

    // claimed positions must be reachable from the server position in the elapsed time
    assert(ing.submit(world, 1, move(4, {590.f, 0.f, 590.f})) == Rejection::speed_cap);
    assert(ing.submit(world, 1, move(4, {20.f, 0.f, 0.f})) == Rejection::speed_cap);
    world.sim_time += 1.0;
    assert(ing.submit(world, 1, move(4, {140.f, 0.f, 0.f}, {130.f, 0.f, 0.f})) == Rejection::none);
    ing.apply_pending(world, events);
    assert(a.position == glm::vec3(140.f, 0.f, 0.f));

    // a move queued before a server reset is dropped; later ones start from the spawn
    assert(ing.submit(world, 1, move(5, {143.f, 0.f, 0.f})) == Rejection::none);
    respawn_player(a, cfg);
    const glm::vec3 spawn = a.position;
    ing.apply_pending(world, events);
    assert(a.position == spawn);
    world.sim_time += 1.0;
    assert(ing.submit(world, 1, move(6, {146.f, 0.f, 0.f})) == Rejection::speed_cap);
    assert(ing.submit(world, 1, move(6, spawn + glm::vec3(3.f, 0.f, 0.f))) == Rejection::none);
    ing.apply_pending(world, events);
    assert(a.position == spawn + glm::vec3(3.f, 0.f, 0.f));

    // ---- fire
    FireIntent laser{strafe::Weapon::laser, a.position, {0.f, 0.f, 2.f}};
    assert(ing.submit(world, 1, laser) == Rejection::wrong_phase);
    strafe::test::force_playing(world, cfg);
    FireIntent far = laser;
    far.origin = a.position + glm::vec3(0.f, 50.f, 0.f);
    assert(ing.submit(world, 1, far) == Rejection::origin_mismatch);
    FireIntent nodir = laser;
    nodir.direction = glm::vec3(0.f);
    assert(ing.submit(world, 1, nodir) == Rejection::malformed);
    assert(ing.submit(world, 1, laser) == Rejection::none);
    ing.apply_pending(world, events);
    // one shot per fire_interval per weapon
    assert(ing.submit(world, 1, laser) == Rejection::cooldown);
    world.sim_time += cfg.laser.fire_interval / 2.f;
    assert(ing.submit(world, 1, laser) == Rejection::cooldown);
    world.sim_time += cfg.laser.fire_interval / 2.f;
    a.laser_upgrade = true;
    assert(ing.submit(world, 1, laser) == Rejection::none);
    FireIntent missile{strafe::Weapon::missile, a.position, {1.f, 0.f, 0.f}};
    assert(ing.submit(world, 1, missile) == Rejection::none);
    ing.apply_pending(world, events);
    assert(ing.submit(world, 1, missile) == Rejection::cooldown);
    assert(world.projectiles.size() == 3);
    const auto &p1 = world.projectiles.at(1);
    assert(p1.authoritative && p1.damage == cfg.laser.damage && p1.owner_id == 1);
    assert(std::fabs(glm::length(p1.direction) - 1.f) < 1e-5f);
    assert(world.projectiles.at(2).damage == cfg.laser.damage * cfg.laser_upgrade_multiplier);
    const auto &m3 = world.projectiles.at(3);
    assert(!m3.authoritative && m3.weapon == strafe::Weapon::missile);
    assert(a.missiles == cfg.ship(strafe::ShipClass::fighter).max_missiles - 1);

    a.missiles = 0;
    assert(ing.submit(world, 1, missile) == Rejection::no_ammo);

    // ---- missile guidance is owner-only
    MissileUpdateIntent guide{3, a.position + glm::vec3(3.f, 0.f, 0.f), {1.f, 0.f, 0.f}};
    assert(ing.submit(world, 2, guide) == Rejection::not_owner);
    MissileUpdateIntent on_laser{1, a.position, {1.f, 0.f, 0.f}};
    assert(ing.submit(world, 1, on_laser) == Rejection::not_owner);
    MissileUpdateIntent outside{3, {0.f, 900.f, 0.f}, {1.f, 0.f, 0.f}};
    assert(ing.submit(world, 1, outside) == Rejection::out_of_bounds);
    assert(ing.submit(world, 1, guide) == Rejection::none);
    ing.apply_pending(world, events);
    assert(world.projectiles.at(3).has_reported_position);
    assert(world.projectiles.at(3).reported_position == guide.position);

    // ---- chat
    assert(ing.submit(world, 2, ChatIntent{"   "}) == Rejection::malformed);
    assert(ing.submit(world, 2, ChatIntent{"bad\x01text"}) == Rejection::malformed);
    assert(ing.submit(world, 2, ChatIntent{std::string(cfg.chat_max_length + 1, 'x')}) == Rejection::malformed);
    assert(ing.submit(world, 2, ChatIntent{"  gg  "}) == Rejection::none);
    ing.apply_pending(world, events);
    assert(events.size() == 1);
    const auto &chat = std::get<ChatEvent>(events[0].payload);
    assert(chat.player_id == 2 && chat.text == "gg" && chat.name == "p2");

    // ---- session-level intents are not ingested
    assert(ing.submit(world, 1, AckIntent{1}) == Rejection::malformed);

    // ---- dead players: fire refused, movement accepted but not applied
    a.alive = false;
    a.missiles = 3;
    assert(ing.submit(world, 1, laser) == Rejection::dead);
    glm::vec3 before = a.position;
    assert(ing.submit(world, 1, move(7, before + glm::vec3(4.f, 0.f, 0.f))) == Rejection::none);
    ing.apply_pending(world, events);
    assert(a.position == before);

    // ---- forget drops queued work and sequence tracking
    assert(ing.submit(world, 2, move(1, {101.f, 0.f, 0.f})) == Rejection::none);
    ing.forget(2);
    assert(ing.pending() == 0 && ing.last_accepted_seq(2) == 0);

    std::cout << "unit_input_ingestor OK" << std::endl;
    return 0;
}
