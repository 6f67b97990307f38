// SPDX-License-Identifier: Apache-2.0
// Unit test: a delta encoded against a base reconstructs the current view exactly, carries only
// changed fields, and is refused when applied to the wrong base.
#include "common/snapshot_state.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>

using strafe::snap::SnapshotState;

static SnapshotState make_base()
{
    SnapshotState s;
    s.tick = 10;
    s.phase = strafe::Phase::playing;
    s.phase_timer = 42.f;
    for (uint32_t id : {1u, 2u, 3u}) {
        strafe::snap::PlayerView p;
        p.id = id;
        p.name = "p" + std::to_string(id);
        p.position = glm::vec3(float(id) * 10.f, 0.f, 0.f);
        p.health = 100.f;
        p.max_health = 100.f;
        p.missiles = 6;
        p.max_missiles = 6;
        s.players.emplace(id, p);
    }
    strafe::snap::ProjectileView pr;
    pr.id = 5;
    pr.owner_id = 1;
    pr.position = glm::vec3(1.f, 2.f, 3.f);
    pr.speed = 200.f;
    pr.remaining_lifetime = 2.5f;
    s.projectiles.emplace(pr.id, pr);
    strafe::snap::CollectibleView c;
    c.id = 1;
    c.position = glm::vec3(50.f, 0.f, 0.f);
    s.collectibles.emplace(c.id, c);
    return s;
}

int main()
{
    SnapshotState base = make_base();
    SnapshotState cur = base;
    cur.tick = 13;
    cur.phase_timer = 41.85f;
    cur.players[2].health = 75.f; // changed
    cur.players.erase(3); // removed
    strafe::snap::PlayerView joiner;
    joiner.id = 4;
    joiner.name = "late";
    joiner.ship_class = strafe::ShipClass::rogue;
    joiner.health = 80.f;
    joiner.max_health = 80.f;
    cur.players.emplace(4, joiner); // new
    cur.projectiles.erase(5);
    strafe::snap::ProjectileView missile;
    missile.id = 6;
    missile.owner_id = 2;
    missile.weapon = strafe::Weapon::missile;
    missile.authoritative = false;
    missile.remaining_lifetime = 6.f;
    cur.projectiles.emplace(6, missile);
    cur.collectibles[1].active = false;
    cur.collectibles[1].respawn_remaining = 15.f;

    strafe::wire::DeltaSnapshot delta;
    strafe::snap::encode_delta(base, cur, delta);
    assert(delta.server_tick() == 13 && delta.base_tick() == 10);
    assert(!delta.has_phase());
    assert(delta.has_phase_timer());
    // player 1 unchanged -> absent; player 2 only health; player 4 complete
    assert(delta.players_size() == 2);
    for (const auto &pd : delta.players()) {
        assert(pd.id() != 1);
        if (pd.id() == 2) {
            assert(pd.has_health() && pd.health() == 75.f);
            assert(!pd.has_name() && !pd.has_position() && !pd.has_kills() && !pd.has_alive());
        } else {
            assert(pd.id() == 4 && pd.has_name() && pd.has_ship_class() && pd.has_position());
        }
    }
    assert(delta.removed_players_size() == 1 && delta.removed_players(0) == 3);
    assert(delta.removed_projectiles_size() == 1 && delta.removed_projectiles(0) == 5);
    assert(delta.collectibles_size() == 1 && !delta.collectibles(0).has_type());

    SnapshotState rebuilt;
    assert(strafe::snap::apply_delta(base, delta, rebuilt));
    assert(rebuilt == cur);

    // Wire round-trip of the delta itself
    std::string bytes;
    assert(delta.SerializeToString(&bytes));
    strafe::wire::DeltaSnapshot parsed;
    assert(parsed.ParseFromString(bytes));
    SnapshotState rebuilt2;
    assert(strafe::snap::apply_delta(base, parsed, rebuilt2) && rebuilt2 == cur);

    // Identical states produce an empty delta
    strafe::wire::DeltaSnapshot empty;
    SnapshotState same = base;
    same.tick = 11;
    strafe::snap::encode_delta(base, same, empty);
    assert(empty.players_size() == 0 && empty.projectiles_size() == 0 && empty.collectibles_size() == 0);
    assert(empty.removed_players_size() == 0);

    // Wrong base tick
    SnapshotState other = base;
    other.tick = 9;
    SnapshotState sink;
    assert(!strafe::snap::apply_delta(other, delta, sink));

    // Removal of an unknown entity
    strafe::wire::DeltaSnapshot bad = delta;
    bad.add_removed_players(77);
    assert(!strafe::snap::apply_delta(base, bad, sink));

    // A new entity missing fields
    strafe::wire::DeltaSnapshot partial;
    partial.set_server_tick(11);
    partial.set_base_tick(10);
    auto *pd = partial.add_players();
    pd->set_id(9);
    pd->set_health(50.f);
    assert(!strafe::snap::apply_delta(base, partial, sink));

    // Full snapshot encode / decode
    strafe::wire::StateSnapshot full;
    strafe::snap::encode_full(cur, full);
    SnapshotState decoded;
    assert(strafe::snap::decode_full(full, decoded) && decoded == cur);
    full.add_players()->CopyFrom(full.players(0)); // duplicate id
    assert(!strafe::snap::decode_full(full, decoded));

    std::cout << "unit_snapshot_delta OK" << std::endl;
    return 0;
}
