// SPDX-License-Identifier: Apache-2.0
#include "server/game/combat_resolver.hpp"

#include "common/logger.hpp"
#include "server/game/physics.hpp"

#include <algorithm>
#include <optional>
#include <vector>

namespace strafe::game {

namespace {

void advance_respawns(WorldState &world, const RoomConfig &cfg, float dt, EventList &events)
{
    for (auto &[id, p] : world.players) {
        if (p.alive)
            continue;
        p.respawn_remaining -= dt;
        if (p.respawn_remaining <= 0.f) {
            respawn_player(p, cfg);
            events.push_back({world.tick, RespawnEvent{p.id, p.position}});
            strafe::log::debug("[combat] respawn player={} tick={}", p.id, world.tick);
        }
    }
}

void move_projectile(Projectile &pr, float dt)
{
    pr.prev_position = pr.position;
    if (!pr.authoritative && pr.has_reported_position) {
        pr.position = pr.reported_position;
        pr.has_reported_position = false;
    } else {
        pr.position += pr.direction * pr.speed * dt;
    }
}

// Earliest living non-owner player crossed by the projectile segment this tick.
Player *first_hit(WorldState &world, const RoomConfig &cfg, const Projectile &pr)
{
    Player *hit = nullptr;
    float best = 2.f;
    for (auto &[id, p] : world.players) {
        if (!p.alive || id == pr.owner_id)
            continue;
        auto toi = strafe::phys::sweep_sphere(
            pr.prev_position, pr.position, pr.radius, strafe::phys::Sphere{p.position, cfg.ship_radius});
        if (toi && *toi < best) {
            best = *toi;
            hit = &p;
        }
    }
    return hit;
}

} // namespace

bool apply_damage(
    WorldState &world,
    const RoomConfig &cfg,
    Player &target,
    uint32_t attacker_id,
    float amount,
    uint32_t projectile_id,
    EventList &events)
{
    if (!target.alive)
        return false;
    target.health = std::max(0.f, target.health - amount);
    target.last_damage_time = world.sim_time;
    events.push_back({world.tick, HitEvent{target.id, attacker_id, amount, target.health, projectile_id}});
    if (target.health > 0.f)
        return false;

    target.alive = false;
    target.velocity = glm::vec3(0.f);
    target.respawn_remaining = cfg.respawn_delay;
    ++target.deaths;
    if (attacker_id != target.id) {
        if (Player *killer = world.find_player(attacker_id))
            ++killer->kills;
    }
    events.push_back({world.tick, KillEvent{attacker_id, target.id}});
    strafe::log::info("[combat] kill killer={} victim={} tick={}", attacker_id, target.id, world.tick);
    return true;
}

void resolve_combat(WorldState &world, const RoomConfig &cfg, float dt, EventList &events)
{
    advance_respawns(world, cfg, dt, events);

    std::vector<uint32_t> removed;
    for (auto &[id, pr] : world.projectiles) {
        move_projectile(pr, dt);
        if (Player *target = first_hit(world, cfg, pr)) {
            apply_damage(world, cfg, *target, pr.owner_id, pr.damage, pr.id, events);
            removed.push_back(id);
            continue;
        }
        pr.remaining_lifetime -= dt;
        if (pr.remaining_lifetime <= 1e-6f)
            removed.push_back(id);
    }
    for (uint32_t id : removed)
        world.projectiles.erase(id);
}

} // namespace strafe::game
