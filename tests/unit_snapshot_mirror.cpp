// SPDX-License-Identifier: Apache-2.0
#include "client/snapshot_mirror.hpp"

#include <cassert>
#include <iostream>

using strafe::client::MirrorResult;

static strafe::snap::SnapshotState state_at(uint32_t tick, float health)
{
    strafe::snap::SnapshotState s;
    s.tick = tick;
    s.phase = strafe::Phase::playing;
    strafe::snap::PlayerView p;
    p.id = 1;
    p.name = "me";
    p.health = health;
    p.max_health = 100.f;
    s.players.emplace(1, p);
    return s;
}

static strafe::wire::ServerMessage full_msg(const strafe::snap::SnapshotState &s)
{
    strafe::wire::ServerMessage sm;
    strafe::snap::encode_full(s, *sm.mutable_snapshot());
    return sm;
}

static strafe::wire::ServerMessage delta_msg(const strafe::snap::SnapshotState &base, const strafe::snap::SnapshotState &cur)
{
    strafe::wire::ServerMessage sm;
    strafe::snap::encode_delta(base, cur, *sm.mutable_delta_snapshot());
    return sm;
}

int main()
{
    strafe::client::SnapshotMirror mirror(4);
    assert(!mirror.current());
    assert(mirror.last_tick() == 0);

    auto s5 = state_at(5, 100.f);
    auto s6 = state_at(6, 90.f);
    auto s7 = state_at(7, 80.f);
    auto s8 = state_at(8, 70.f);

    // Delta before any base -> resync
    assert(mirror.apply(delta_msg(s5, s6)) == MirrorResult::needs_resync);

    assert(mirror.apply(full_msg(s5)) == MirrorResult::applied);
    assert(mirror.last_tick() == 5 && *mirror.current() == s5);

    // Duplicate / older ticks are dropped
    assert(mirror.apply(full_msg(s5)) == MirrorResult::stale);
    assert(mirror.apply(full_msg(state_at(4, 1.f))) == MirrorResult::stale);

    assert(mirror.apply(delta_msg(s5, s6)) == MirrorResult::applied);
    assert(*mirror.current() == s6);
    // Delta against an older base still held in history
    assert(mirror.apply(delta_msg(s5, s7)) == MirrorResult::applied);
    assert(mirror.current()->players.at(1).health == 80.f);
    // Late delta for a tick already passed
    assert(mirror.apply(delta_msg(s5, s6)) == MirrorResult::stale);

    // Base the mirror never had
    auto s3 = state_at(3, 50.f);
    assert(mirror.apply(delta_msg(s3, s8)) == MirrorResult::needs_resync);
    assert(mirror.last_tick() == 7);

    // Malformed full snapshot
    auto bad = full_msg(s8);
    bad.mutable_snapshot()->mutable_players(0)->set_ship_class(static_cast<strafe::wire::ShipClass>(42));
    assert(mirror.apply(bad) == MirrorResult::needs_resync);

    // Recovery by a fresh full snapshot
    assert(mirror.apply(full_msg(s8)) == MirrorResult::applied);
    assert(mirror.find(5) != nullptr);

    // History is bounded
    for (uint32_t t = 9; t < 20; ++t)
        assert(mirror.apply(full_msg(state_at(t, 100.f))) == MirrorResult::applied);
    assert(mirror.find(5) == nullptr);
    assert(mirror.find(19) != nullptr);

    strafe::wire::ServerMessage unrelated;
    unrelated.mutable_chat()->set_text("hi");
    assert(mirror.apply(unrelated) == MirrorResult::stale);

    std::cout << "unit_snapshot_mirror OK" << std::endl;
    return 0;
}
