// SPDX-License-Identifier: Apache-2.0
#include "common/snapshot_state.hpp"

#include "common/wire_convert.hpp"

#include <cmath>

namespace strafe::snap {

using namespace strafe::wire_conv;

namespace {

void write_player(const PlayerView &p, strafe::wire::PlayerState *ps)
{
    ps->set_id(p.id);
    ps->set_name(p.name);
    ps->set_ship_class(to_wire(p.ship_class));
    to_wire(p.position, ps->mutable_position());
    to_wire(p.rotation, ps->mutable_rotation());
    to_wire(p.velocity, ps->mutable_velocity());
    ps->set_health(p.health);
    ps->set_max_health(p.max_health);
    ps->set_kills(p.kills);
    ps->set_deaths(p.deaths);
    ps->set_missiles(p.missiles);
    ps->set_max_missiles(p.max_missiles);
    ps->set_alive(p.alive);
    ps->set_last_acked_input_seq(p.last_acked_input_seq);
    ps->set_laser_upgrade(p.laser_upgrade);
}

void write_projectile(const ProjectileView &p, strafe::wire::ProjectileState *ps)
{
    ps->set_id(p.id);
    ps->set_owner_id(p.owner_id);
    ps->set_weapon(to_wire(p.weapon));
    to_wire(p.position, ps->mutable_position());
    to_wire(p.direction, ps->mutable_direction());
    ps->set_speed(p.speed);
    ps->set_remaining_lifetime(p.remaining_lifetime);
    ps->set_spawn_tick(p.spawn_tick);
    ps->set_authoritative(p.authoritative);
}

void write_collectible(const CollectibleView &c, strafe::wire::CollectibleState *cs)
{
    cs->set_id(c.id);
    cs->set_type(to_wire(c.type));
    to_wire(c.position, cs->mutable_position());
    cs->set_active(c.active);
    cs->set_respawn_remaining(c.respawn_remaining);
}

// Delta writers: `base` is nullptr for entities the receiver has not seen yet.
void write_player_delta(const PlayerView *base, const PlayerView &p, strafe::wire::PlayerDelta *d)
{
    d->set_id(p.id);
    if (!base || base->name != p.name)
        d->set_name(p.name);
    if (!base || base->ship_class != p.ship_class)
        d->set_ship_class(to_wire(p.ship_class));
    if (!base || base->position != p.position)
        to_wire(p.position, d->mutable_position());
    if (!base || base->rotation != p.rotation)
        to_wire(p.rotation, d->mutable_rotation());
    if (!base || base->velocity != p.velocity)
        to_wire(p.velocity, d->mutable_velocity());
    if (!base || base->health != p.health)
        d->set_health(p.health);
    if (!base || base->max_health != p.max_health)
        d->set_max_health(p.max_health);
    if (!base || base->kills != p.kills)
        d->set_kills(p.kills);
    if (!base || base->deaths != p.deaths)
        d->set_deaths(p.deaths);
    if (!base || base->missiles != p.missiles)
        d->set_missiles(p.missiles);
    if (!base || base->max_missiles != p.max_missiles)
        d->set_max_missiles(p.max_missiles);
    if (!base || base->alive != p.alive)
        d->set_alive(p.alive);
    if (!base || base->last_acked_input_seq != p.last_acked_input_seq)
        d->set_last_acked_input_seq(p.last_acked_input_seq);
    if (!base || base->laser_upgrade != p.laser_upgrade)
        d->set_laser_upgrade(p.laser_upgrade);
}

void write_projectile_delta(const ProjectileView *base, const ProjectileView &p, strafe::wire::ProjectileDelta *d)
{
    d->set_id(p.id);
    if (!base || base->owner_id != p.owner_id)
        d->set_owner_id(p.owner_id);
    if (!base || base->weapon != p.weapon)
        d->set_weapon(to_wire(p.weapon));
    if (!base || base->position != p.position)
        to_wire(p.position, d->mutable_position());
    if (!base || base->direction != p.direction)
        to_wire(p.direction, d->mutable_direction());
    if (!base || base->speed != p.speed)
        d->set_speed(p.speed);
    if (!base || base->remaining_lifetime != p.remaining_lifetime)
        d->set_remaining_lifetime(p.remaining_lifetime);
    if (!base || base->spawn_tick != p.spawn_tick)
        d->set_spawn_tick(p.spawn_tick);
    if (!base || base->authoritative != p.authoritative)
        d->set_authoritative(p.authoritative);
}

void write_collectible_delta(const CollectibleView *base, const CollectibleView &c, strafe::wire::CollectibleDelta *d)
{
    d->set_id(c.id);
    if (!base || base->type != c.type)
        d->set_type(to_wire(c.type));
    if (!base || base->position != c.position)
        to_wire(c.position, d->mutable_position());
    if (!base || base->active != c.active)
        d->set_active(c.active);
    if (!base || base->respawn_remaining != c.respawn_remaining)
        d->set_respawn_remaining(c.respawn_remaining);
}

bool finite_vec(const strafe::wire::Vec3 &v)
{
    return std::isfinite(v.x()) && std::isfinite(v.y()) && std::isfinite(v.z());
}

bool finite_quat(const strafe::wire::Quat &q)
{
    return std::isfinite(q.x()) && std::isfinite(q.y()) && std::isfinite(q.z()) && std::isfinite(q.w());
}

bool read_player(const strafe::wire::PlayerState &ps, PlayerView &p)
{
    if (!strafe::wire::ShipClass_IsValid(ps.ship_class()))
        return false;
    if (!finite_vec(ps.position()) || !finite_quat(ps.rotation()) || !finite_vec(ps.velocity()))
        return false;
    if (!std::isfinite(ps.health()) || !std::isfinite(ps.max_health()))
        return false;
    p.id = ps.id();
    p.name = ps.name();
    p.ship_class = from_wire(ps.ship_class());
    p.position = from_wire(ps.position());
    p.rotation = from_wire(ps.rotation());
    p.velocity = from_wire(ps.velocity());
    p.health = ps.health();
    p.max_health = ps.max_health();
    p.kills = ps.kills();
    p.deaths = ps.deaths();
    p.missiles = ps.missiles();
    p.max_missiles = ps.max_missiles();
    p.alive = ps.alive();
    p.last_acked_input_seq = ps.last_acked_input_seq();
    p.laser_upgrade = ps.laser_upgrade();
    return true;
}

bool read_projectile(const strafe::wire::ProjectileState &ps, ProjectileView &p)
{
    if (!strafe::wire::Weapon_IsValid(ps.weapon()))
        return false;
    if (!finite_vec(ps.position()) || !finite_vec(ps.direction()) || !std::isfinite(ps.speed())
        || !std::isfinite(ps.remaining_lifetime()))
        return false;
    p.id = ps.id();
    p.owner_id = ps.owner_id();
    p.weapon = from_wire(ps.weapon());
    p.position = from_wire(ps.position());
    p.direction = from_wire(ps.direction());
    p.speed = ps.speed();
    p.remaining_lifetime = ps.remaining_lifetime();
    p.spawn_tick = ps.spawn_tick();
    p.authoritative = ps.authoritative();
    return true;
}

bool read_collectible(const strafe::wire::CollectibleState &cs, CollectibleView &c)
{
    if (!strafe::wire::CollectibleType_IsValid(cs.type()))
        return false;
    if (!finite_vec(cs.position()) || !std::isfinite(cs.respawn_remaining()))
        return false;
    c.id = cs.id();
    c.type = from_wire(cs.type());
    c.position = from_wire(cs.position());
    c.active = cs.active();
    c.respawn_remaining = cs.respawn_remaining();
    return true;
}

bool has_all_fields(const strafe::wire::PlayerDelta &d)
{
    return d.has_name() && d.has_ship_class() && d.has_position() && d.has_rotation() && d.has_velocity()
        && d.has_health() && d.has_max_health() && d.has_kills() && d.has_deaths() && d.has_missiles()
        && d.has_max_missiles() && d.has_alive() && d.has_last_acked_input_seq() && d.has_laser_upgrade();
}

bool has_all_fields(const strafe::wire::ProjectileDelta &d)
{
    return d.has_owner_id() && d.has_weapon() && d.has_position() && d.has_direction() && d.has_speed()
        && d.has_remaining_lifetime() && d.has_spawn_tick() && d.has_authoritative();
}

bool has_all_fields(const strafe::wire::CollectibleDelta &d)
{
    return d.has_type() && d.has_position() && d.has_active() && d.has_respawn_remaining();
}

bool merge_player(const strafe::wire::PlayerDelta &d, PlayerView &p)
{
    if (d.has_ship_class() && !strafe::wire::ShipClass_IsValid(d.ship_class()))
        return false;
    if ((d.has_position() && !finite_vec(d.position())) || (d.has_rotation() && !finite_quat(d.rotation()))
        || (d.has_velocity() && !finite_vec(d.velocity())))
        return false;
    p.id = d.id();
    if (d.has_name())
        p.name = d.name();
    if (d.has_ship_class())
        p.ship_class = from_wire(d.ship_class());
    if (d.has_position())
        p.position = from_wire(d.position());
    if (d.has_rotation())
        p.rotation = from_wire(d.rotation());
    if (d.has_velocity())
        p.velocity = from_wire(d.velocity());
    if (d.has_health())
        p.health = d.health();
    if (d.has_max_health())
        p.max_health = d.max_health();
    if (d.has_kills())
        p.kills = d.kills();
    if (d.has_deaths())
        p.deaths = d.deaths();
    if (d.has_missiles())
        p.missiles = d.missiles();
    if (d.has_max_missiles())
        p.max_missiles = d.max_missiles();
    if (d.has_alive())
        p.alive = d.alive();
    if (d.has_last_acked_input_seq())
        p.last_acked_input_seq = d.last_acked_input_seq();
    if (d.has_laser_upgrade())
        p.laser_upgrade = d.laser_upgrade();
    return true;
}

bool merge_projectile(const strafe::wire::ProjectileDelta &d, ProjectileView &p)
{
    if (d.has_weapon() && !strafe::wire::Weapon_IsValid(d.weapon()))
        return false;
    if ((d.has_position() && !finite_vec(d.position())) || (d.has_direction() && !finite_vec(d.direction())))
        return false;
    p.id = d.id();
    if (d.has_owner_id())
        p.owner_id = d.owner_id();
    if (d.has_weapon())
        p.weapon = from_wire(d.weapon());
    if (d.has_position())
        p.position = from_wire(d.position());
    if (d.has_direction())
        p.direction = from_wire(d.direction());
    if (d.has_speed())
        p.speed = d.speed();
    if (d.has_remaining_lifetime())
        p.remaining_lifetime = d.remaining_lifetime();
    if (d.has_spawn_tick())
        p.spawn_tick = d.spawn_tick();
    if (d.has_authoritative())
        p.authoritative = d.authoritative();
    return true;
}

bool merge_collectible(const strafe::wire::CollectibleDelta &d, CollectibleView &c)
{
    if (d.has_type() && !strafe::wire::CollectibleType_IsValid(d.type()))
        return false;
    if (d.has_position() && !finite_vec(d.position()))
        return false;
    c.id = d.id();
    if (d.has_type())
        c.type = from_wire(d.type());
    if (d.has_position())
        c.position = from_wire(d.position());
    if (d.has_active())
        c.active = d.active();
    if (d.has_respawn_remaining())
        c.respawn_remaining = d.respawn_remaining();
    return true;
}

// Shared merge loop for the three entity kinds.
template <typename Map, typename Entries, typename Removed, typename Merge>
bool apply_entities(Map &out, const Entries &entries, const Removed &removed, Merge merge)
{
    for (uint32_t id : removed) {
        if (out.erase(id) == 0)
            return false;
    }
    for (const auto &d : entries) {
        auto it = out.find(d.id());
        if (it == out.end()) {
            if (!has_all_fields(d))
                return false;
            typename Map::mapped_type fresh;
            if (!merge(d, fresh))
                return false;
            out.emplace(d.id(), std::move(fresh));
        } else if (!merge(d, it->second)) {
            return false;
        }
    }
    return true;
}

} // namespace

void encode_full(const SnapshotState &state, strafe::wire::StateSnapshot &out)
{
    out.Clear();
    out.set_server_tick(state.tick);
    out.set_phase(to_wire(state.phase));
    out.set_phase_timer(state.phase_timer);
    for (const auto &[id, p] : state.players)
        write_player(p, out.add_players());
    for (const auto &[id, p] : state.projectiles)
        write_projectile(p, out.add_projectiles());
    for (const auto &[id, c] : state.collectibles)
        write_collectible(c, out.add_collectibles());
}

void encode_delta(const SnapshotState &base, const SnapshotState &current, strafe::wire::DeltaSnapshot &out)
{
    out.Clear();
    out.set_server_tick(current.tick);
    out.set_base_tick(base.tick);
    if (base.phase != current.phase)
        out.set_phase(to_wire(current.phase));
    if (base.phase_timer != current.phase_timer)
        out.set_phase_timer(current.phase_timer);

    for (const auto &[id, p] : current.players) {
        auto it = base.players.find(id);
        if (it == base.players.end())
            write_player_delta(nullptr, p, out.add_players());
        else if (!(it->second == p))
            write_player_delta(&it->second, p, out.add_players());
    }
    for (const auto &[id, p] : base.players) {
        if (!current.players.contains(id))
            out.add_removed_players(id);
    }

    for (const auto &[id, p] : current.projectiles) {
        auto it = base.projectiles.find(id);
        if (it == base.projectiles.end())
            write_projectile_delta(nullptr, p, out.add_projectiles());
        else if (!(it->second == p))
            write_projectile_delta(&it->second, p, out.add_projectiles());
    }
    for (const auto &[id, p] : base.projectiles) {
        if (!current.projectiles.contains(id))
            out.add_removed_projectiles(id);
    }

    for (const auto &[id, c] : current.collectibles) {
        auto it = base.collectibles.find(id);
        if (it == base.collectibles.end())
            write_collectible_delta(nullptr, c, out.add_collectibles());
        else if (!(it->second == c))
            write_collectible_delta(&it->second, c, out.add_collectibles());
    }
    for (const auto &[id, c] : base.collectibles) {
        if (!current.collectibles.contains(id))
            out.add_removed_collectibles(id);
    }
}

bool decode_full(const strafe::wire::StateSnapshot &in, SnapshotState &out)
{
    if (!strafe::wire::Phase_IsValid(in.phase()) || !std::isfinite(in.phase_timer()))
        return false;
    SnapshotState s;
    s.tick = in.server_tick();
    s.phase = from_wire(in.phase());
    s.phase_timer = in.phase_timer();
    for (const auto &ps : in.players()) {
        PlayerView p;
        if (!read_player(ps, p) || !s.players.emplace(p.id, p).second)
            return false;
    }
    for (const auto &ps : in.projectiles()) {
        ProjectileView p;
        if (!read_projectile(ps, p) || !s.projectiles.emplace(p.id, p).second)
            return false;
    }
    for (const auto &cs : in.collectibles()) {
        CollectibleView c;
        if (!read_collectible(cs, c) || !s.collectibles.emplace(c.id, c).second)
            return false;
    }
    out = std::move(s);
    return true;
}

bool apply_delta(const SnapshotState &base, const strafe::wire::DeltaSnapshot &delta, SnapshotState &out)
{
    if (delta.base_tick() != base.tick || delta.server_tick() <= base.tick)
        return false;
    if (delta.has_phase() && !strafe::wire::Phase_IsValid(delta.phase()))
        return false;
    if (delta.has_phase_timer() && !std::isfinite(delta.phase_timer()))
        return false;
    SnapshotState s = base;
    s.tick = delta.server_tick();
    if (delta.has_phase())
        s.phase = from_wire(delta.phase());
    if (delta.has_phase_timer())
        s.phase_timer = delta.phase_timer();
    if (!apply_entities(s.players, delta.players(), delta.removed_players(), merge_player))
        return false;
    if (!apply_entities(s.projectiles, delta.projectiles(), delta.removed_projectiles(), merge_projectile))
        return false;
    if (!apply_entities(s.collectibles, delta.collectibles(), delta.removed_collectibles(), merge_collectible))
        return false;
    out = std::move(s);
    return true;
}

} // namespace strafe::snap
