// SPDX-License-Identifier: Apache-2.0
// Server-side resets (match start, respawn) stick even while a client keeps sending moves
// predicted from before the reset.
#include "server/game/room.hpp"
#include "server/game/world_state.hpp"
#include "test_room_fixture.hpp"

#include <cassert>
#include <iostream>

using namespace strafe::game;

static MoveIntent move(uint32_t seq, glm::vec3 pos)
{
    MoveIntent m;
    m.seq = seq;
    m.position = pos;
    m.velocity = glm::vec3(60.f, 0.f, 0.f);
    return m;
}

int main()
{
    auto cfg = strafe::test::make_room_config();
    auto room = std::make_shared<Room>("reset", cfg, DeliverFn{});
    room->post_join(1, "one", strafe::ShipClass::fighter);
    room->post_join(2, "two", strafe::ShipClass::fighter);
    room->step();
    assert(room->world().phase == strafe::Phase::countdown);

    const Player &p = room->world().players.at(1);
    const glm::vec3 spawn = spawn_point(cfg, p.spawn_slot);

    // Fly 3 units per tick through the countdown; the match start puts the ship back on its spawn.
    uint32_t seq = 0;
    while (room->world().phase != strafe::Phase::playing) {
        ++seq;
        room->post_intent(1, move(seq, spawn + glm::vec3(3.f * float(seq), 0.f, 0.f)));
        room->step();
        assert(seq < 100);
    }
    assert(seq > 5);
    assert(p.position == spawn);
    const uint32_t acked = p.last_acked_input_seq;

    // Moves still predicted from the old path are refused.
    for (int i = 0; i < 3; ++i) {
        ++seq;
        room->post_intent(1, move(seq, spawn + glm::vec3(3.f * float(seq), 0.f, 0.f)));
        room->step();
        assert(p.position == spawn);
        assert(p.last_acked_input_seq == acked);
    }

    // Once the client continues from the spawn its moves are accepted again.
    glm::vec3 pos = spawn;
    for (int i = 0; i < 4; ++i) {
        ++seq;
        pos += glm::vec3(3.f, 0.f, 0.f);
        room->post_intent(1, move(seq, pos));
        room->step();
        assert(p.position == pos);
        assert(p.last_acked_input_seq == seq);
    }

    // Same after a respawn in the middle of the match.
    respawn_player(room->world().players.at(1), cfg);
    ++seq;
    room->post_intent(1, move(seq, pos + glm::vec3(3.f, 0.f, 0.f)));
    room->step();
    assert(p.position == spawn);
    ++seq;
    room->post_intent(1, move(seq, spawn + glm::vec3(2.f, 0.f, 0.f)));
    room->step();
    assert(p.position == spawn + glm::vec3(2.f, 0.f, 0.f));

    std::cout << "unit_room_reset OK" << std::endl;
    return 0;
}
