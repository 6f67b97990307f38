// SPDX-License-Identifier: Apache-2.0
#include "server/game/world_state.hpp"

namespace strafe::game {

Player *WorldState::find_player(uint32_t id)
{
    auto it = players.find(id);
    return it == players.end() ? nullptr : &it->second;
}

const Player *WorldState::find_player(uint32_t id) const
{
    auto it = players.find(id);
    return it == players.end() ? nullptr : &it->second;
}

void init_world(WorldState &world, const RoomConfig &cfg)
{
    world.collectibles.clear();
    for (const auto &slot : cfg.level.collectibles) {
        Collectible c;
        c.id = slot.id;
        c.type = slot.type;
        c.position = slot.position;
        world.collectibles.emplace(c.id, c);
    }
}

glm::vec3 spawn_point(const RoomConfig &cfg, uint32_t slot)
{
    if (cfg.level.spawn_points.empty())
        return glm::vec3(0.f);
    return cfg.level.spawn_points[slot % cfg.level.spawn_points.size()];
}

Player *add_player(WorldState &world, const RoomConfig &cfg, uint32_t id, std::string name, ShipClass ship_class)
{
    if (world.players.contains(id))
        return nullptr;
    Player p;
    p.id = id;
    p.name = std::move(name);
    p.ship_class = ship_class;
    p.spawn_slot = world.next_spawn_slot++;
    reset_player_for_match(p, cfg);
    auto [it, inserted] = world.players.emplace(id, std::move(p));
    return &it->second;
}

bool remove_player(WorldState &world, uint32_t id)
{
    return world.players.erase(id) > 0;
}

void respawn_player(Player &p, const RoomConfig &cfg)
{
    const auto &ship = cfg.ship(p.ship_class);
    p.position = spawn_point(cfg, p.spawn_slot);
    p.rotation = glm::quat(1.f, 0.f, 0.f, 0.f);
    p.velocity = glm::vec3(0.f);
    p.max_health = ship.max_health;
    p.health = ship.max_health;
    p.alive = true;
    p.respawn_remaining = 0.f;
    ++p.reset_epoch;
}

void reset_player_for_match(Player &p, const RoomConfig &cfg)
{
    respawn_player(p, cfg);
    const auto &ship = cfg.ship(p.ship_class);
    p.max_missiles = ship.max_missiles;
    p.missiles = ship.max_missiles;
    p.kills = 0;
    p.deaths = 0;
    p.laser_upgrade = false;
    p.last_damage_time = -1e9;
}

void reset_collectibles(WorldState &world)
{
    for (auto &[id, c] : world.collectibles) {
        c.active = true;
        c.respawn_remaining = 0.f;
    }
}

snap::SnapshotState capture(const WorldState &world)
{
    snap::SnapshotState s;
    s.tick = world.tick;
    s.phase = world.phase;
    s.phase_timer = world.phase_timer;
    for (const auto &[id, p] : world.players) {
        snap::PlayerView v;
        v.id = p.id;
        v.name = p.name;
        v.ship_class = p.ship_class;
        v.position = p.position;
        v.rotation = p.rotation;
        v.velocity = p.velocity;
        v.health = p.health;
        v.max_health = p.max_health;
        v.kills = p.kills;
        v.deaths = p.deaths;
        v.missiles = p.missiles;
        v.max_missiles = p.max_missiles;
        v.alive = p.alive;
        v.last_acked_input_seq = p.last_acked_input_seq;
        v.laser_upgrade = p.laser_upgrade;
        s.players.emplace(id, std::move(v));
    }
    for (const auto &[id, pr] : world.projectiles) {
        snap::ProjectileView v;
        v.id = pr.id;
        v.owner_id = pr.owner_id;
        v.weapon = pr.weapon;
        v.position = pr.position;
        v.direction = pr.direction;
        v.speed = pr.speed;
        v.remaining_lifetime = pr.remaining_lifetime;
        v.spawn_tick = pr.spawn_tick;
        v.authoritative = pr.authoritative;
        s.projectiles.emplace(id, v);
    }
    for (const auto &[id, c] : world.collectibles) {
        snap::CollectibleView v;
        v.id = c.id;
        v.type = c.type;
        v.position = c.position;
        v.active = c.active;
        v.respawn_remaining = c.respawn_remaining;
        s.collectibles.emplace(id, v);
    }
    return s;
}

} // namespace strafe::game
