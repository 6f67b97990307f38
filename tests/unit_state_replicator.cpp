// SPDX-License-Identifier: Apache-2.0
#include "server/game/state_replicator.hpp"

#include <cassert>
#include <iostream>

static strafe::snap::SnapshotState at(uint32_t tick)
{
    strafe::snap::SnapshotState s;
    s.tick = tick;
    strafe::snap::PlayerView p;
    p.id = 1;
    p.name = "a";
    p.position = glm::vec3(float(tick), 0.f, 0.f);
    s.players.emplace(1, p);
    return s;
}

int main()
{
    strafe::game::StateReplicator rep(4);
    strafe::wire::ServerMessage msg;
    assert(!rep.build_message(1, msg)); // nothing captured, unknown connection

    rep.add_connection(1);
    assert(!rep.build_message(1, msg));
    rep.capture(at(1));
    assert(rep.build_message(1, msg) && msg.has_snapshot());
    assert(msg.snapshot().server_tick() == 1);

    rep.capture(at(2));
    rep.acknowledge(1, 1);
    assert(rep.baseline(1) == 1u);
    msg.Clear();
    assert(rep.build_message(1, msg) && msg.has_delta_snapshot());
    assert(msg.delta_snapshot().base_tick() == 1 && msg.delta_snapshot().server_tick() == 2);

    // Future and regressing acks are ignored
    rep.acknowledge(1, 9);
    assert(rep.baseline(1) == 1u);
    rep.capture(at(3));
    rep.acknowledge(1, 3);
    rep.acknowledge(1, 2);
    assert(rep.baseline(1) == 3u);

    // Baseline equal to latest -> full (nothing to diff against a newer state)
    msg.Clear();
    assert(rep.build_message(1, msg) && msg.has_snapshot());

    // Baseline evicted from history -> full
    for (uint32_t t = 4; t <= 8; ++t)
        rep.capture(at(t));
    assert(rep.find(3) == nullptr);
    assert(rep.latest()->tick == 8);
    msg.Clear();
    assert(rep.build_message(1, msg) && msg.has_snapshot());
    // Ack for an evicted tick is ignored
    rep.acknowledge(1, 4);
    assert(rep.baseline(1) == 3u);

    rep.acknowledge(1, 7);
    msg.Clear();
    assert(rep.build_message(1, msg) && msg.has_delta_snapshot());
    rep.reset_baseline(1);
    assert(!rep.baseline(1));
    msg.Clear();
    assert(rep.build_message(1, msg) && msg.has_snapshot());

    rep.add_connection(2);
    assert(rep.connection_count() == 2);
    rep.remove_connection(1);
    assert(rep.connection_count() == 1);
    assert(!rep.build_message(1, msg));
    rep.acknowledge(1, 8); // unknown connection: no effect
    assert(!rep.baseline(1));

    std::cout << "unit_state_replicator OK" << std::endl;
    return 0;
}
