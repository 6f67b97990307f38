// SPDX-License-Identifier: Apache-2.0
#include "server/game/input_ingestor.hpp"

#include "common/flight_model.hpp"
#include "common/log_rate_limit.hpp"
#include "common/metrics.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace strafe::game {

namespace {

bool normalize_direction(glm::vec3 &dir)
{
    if (!strafe::flight::is_finite(dir))
        return false;
    float len2 = glm::dot(dir, dir);
    if (len2 < 1e-8f)
        return false;
    dir /= std::sqrt(len2);
    return true;
}

std::string trim(const std::string &s)
{
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

} // namespace

InputIngestor::InputIngestor(const RoomConfig &cfg) : m_cfg(cfg) {}

uint32_t InputIngestor::last_accepted_seq(uint32_t player_id) const
{
    auto it = m_tracks.find(player_id);
    return it == m_tracks.end() ? 0 : it->second.last_seq;
}

Rejection InputIngestor::submit(const WorldState &world, uint32_t player_id, const Intent &intent)
{
    const Player *player = world.find_player(player_id);
    Rejection r = Rejection::none;
    if (!player) {
        r = Rejection::unknown_player;
    } else if (auto *m = std::get_if<MoveIntent>(&intent)) {
        r = check_move(world, *player, *m);
        if (r == Rejection::none) {
            Track &t = m_tracks[player_id];
            t.last_seq = m->seq;
            t.reset_epoch = player->reset_epoch;
            t.moved = true;
            t.last_move_time = world.sim_time;
            MoveIntent copy = *m;
            copy.rotation = glm::normalize(copy.rotation);
            m_queue.push_back({player_id, player->reset_epoch, copy});
        }
    } else if (auto *f = std::get_if<FireIntent>(&intent)) {
        FireIntent copy = *f;
        r = check_fire(world, *player, copy);
        if (r == Rejection::none) {
            m_tracks[player_id].last_fire_time[static_cast<size_t>(copy.weapon)] = world.sim_time;
            m_queue.push_back({player_id, player->reset_epoch, copy});
        }
    } else if (auto *u = std::get_if<MissileUpdateIntent>(&intent)) {
        MissileUpdateIntent copy = *u;
        r = check_missile_update(world, player_id, copy);
        if (r == Rejection::none)
            m_queue.push_back({player_id, player->reset_epoch, copy});
    } else if (auto *c = std::get_if<ChatIntent>(&intent)) {
        ChatIntent copy = *c;
        r = check_chat(copy);
        if (r == Rejection::none)
            m_queue.push_back({player_id, player->reset_epoch, std::move(copy)});
    } else {
        r = Rejection::malformed;
    }
    if (r != Rejection::none) {
        strafe::metrics::runtime().rejected_messages.fetch_add(1, std::memory_order_relaxed);
        STRAFE_LOG_EVERY_N(warn, 50, "[ingest] rejected player={} reason={}", player_id, rejection_name(r));
    }
    return r;
}

Rejection InputIngestor::check_move(const WorldState &world, const Player &p, const MoveIntent &m) const
{
    if (!strafe::flight::is_finite(m.position) || !strafe::flight::is_finite(m.velocity)
        || !strafe::flight::is_finite(m.rotation))
        return Rejection::malformed;
    if (glm::dot(m.rotation, m.rotation) < 1e-8f)
        return Rejection::malformed;
    if (m.seq <= last_accepted_seq(p.id))
        return Rejection::stale_sequence;
    const float max_speed = m_cfg.ship(p.ship_class).max_speed;
    if (!strafe::flight::within_speed_cap(m.velocity, max_speed, m_cfg.speed_tolerance))
        return Rejection::speed_cap;
    if (!strafe::flight::within_bounds(m.position, m_cfg.map_half_extents))
        return Rejection::out_of_bounds;
    // The claimed position must be reachable from the authoritative one. After a server reset the
    // clock restarts so moves predicted from the old position cannot drag the ship back.
    double elapsed = 0.0;
    auto it = m_tracks.find(p.id);
    if (it != m_tracks.end() && it->second.moved && it->second.reset_epoch == p.reset_epoch)
        elapsed = world.sim_time - it->second.last_move_time;
    elapsed = std::max(elapsed, static_cast<double>(m_cfg.tick_dt()));
    const double reach = static_cast<double>(max_speed) * (1.0 + m_cfg.speed_tolerance) * elapsed + m_cfg.move_slack;
    if (static_cast<double>(glm::length(m.position - p.position)) > reach)
        return Rejection::speed_cap;
    return Rejection::none;
}

Rejection InputIngestor::check_fire(const WorldState &world, const Player &p, FireIntent &f) const
{
    if (!strafe::flight::is_finite(f.origin) || !normalize_direction(f.direction))
        return Rejection::malformed;
    if (world.phase != Phase::playing)
        return Rejection::wrong_phase;
    if (!p.alive)
        return Rejection::dead;
    if (glm::length(f.origin - p.position) > m_cfg.fire_origin_tolerance)
        return Rejection::origin_mismatch;
    if (f.weapon == Weapon::missile && p.missiles == 0)
        return Rejection::no_ammo;
    auto it = m_tracks.find(p.id);
    if (it != m_tracks.end()) {
        const auto &weapon = f.weapon == Weapon::laser ? m_cfg.laser : m_cfg.missile;
        double since = world.sim_time - it->second.last_fire_time[static_cast<size_t>(f.weapon)];
        if (since + 1e-6 < static_cast<double>(weapon.fire_interval))
            return Rejection::cooldown;
    }
    return Rejection::none;
}

Rejection InputIngestor::check_missile_update(const WorldState &world, uint32_t player_id, MissileUpdateIntent &u) const
{
    if (!strafe::flight::is_finite(u.position) || !normalize_direction(u.direction))
        return Rejection::malformed;
    auto it = world.projectiles.find(u.projectile_id);
    if (it == world.projectiles.end() || it->second.authoritative)
        return Rejection::not_owner;
    if (it->second.owner_id != player_id)
        return Rejection::not_owner;
    if (!strafe::flight::within_bounds(u.position, m_cfg.map_half_extents))
        return Rejection::out_of_bounds;
    return Rejection::none;
}

Rejection InputIngestor::check_chat(ChatIntent &c) const
{
    c.text = trim(c.text);
    if (c.text.empty() || c.text.size() > m_cfg.chat_max_length)
        return Rejection::malformed;
    for (unsigned char ch : c.text) {
        if (ch < 0x20 || ch == 0x7f)
            return Rejection::malformed;
    }
    return Rejection::none;
}

void InputIngestor::apply_pending(WorldState &world, EventList &events)
{
    std::vector<Pending> batch;
    batch.swap(m_queue);
    for (auto &pending : batch) {
        const Player *owner = world.find_player(pending.player_id);
        bool reset_since = owner && owner->reset_epoch != pending.reset_epoch;
        if (reset_since && !std::holds_alternative<ChatIntent>(pending.intent))
            continue;
        if (auto *m = std::get_if<MoveIntent>(&pending.intent)) {
            apply_move(world, pending.player_id, *m);
        } else if (auto *f = std::get_if<FireIntent>(&pending.intent)) {
            apply_fire(world, pending.player_id, *f);
        } else if (auto *u = std::get_if<MissileUpdateIntent>(&pending.intent)) {
            apply_missile_update(world, pending.player_id, *u);
        } else if (auto *c = std::get_if<ChatIntent>(&pending.intent)) {
            const Player *p = world.find_player(pending.player_id);
            if (p)
                events.push_back({world.tick, ChatEvent{p->id, p->name, std::move(c->text)}});
        }
    }
}

void InputIngestor::apply_move(WorldState &world, uint32_t player_id, const MoveIntent &m)
{
    Player *p = world.find_player(player_id);
    if (!p || !p->alive)
        return;
    p->position = m.position;
    p->rotation = m.rotation;
    p->velocity = m.velocity;
    p->last_acked_input_seq = m.seq;
}

void InputIngestor::apply_fire(WorldState &world, uint32_t player_id, const FireIntent &f)
{
    Player *p = world.find_player(player_id);
    // State can change between submit and apply when several intents land in one tick.
    if (!p || !p->alive || world.phase != Phase::playing)
        return;
    Projectile pr;
    pr.id = world.next_projectile_id++;
    pr.owner_id = player_id;
    pr.weapon = f.weapon;
    pr.position = f.origin;
    pr.prev_position = f.origin;
    pr.direction = f.direction;
    pr.spawn_tick = world.tick;
    if (f.weapon == Weapon::laser) {
        pr.speed = m_cfg.laser.speed;
        pr.damage = m_cfg.laser.damage * (p->laser_upgrade ? m_cfg.laser_upgrade_multiplier : 1.f);
        pr.radius = m_cfg.laser.radius;
        pr.remaining_lifetime = m_cfg.laser.lifetime;
        pr.authoritative = true;
    } else {
        if (p->missiles == 0)
            return;
        --p->missiles;
        pr.speed = m_cfg.missile.speed;
        pr.damage = m_cfg.missile.damage;
        pr.radius = m_cfg.missile.radius;
        pr.remaining_lifetime = m_cfg.missile.lifetime;
        pr.authoritative = false;
    }
    strafe::log::debug(
        "[ingest] fire player={} projectile={} weapon={} tick={}",
        player_id,
        pr.id,
        f.weapon == Weapon::laser ? "laser" : "missile",
        world.tick);
    world.projectiles.emplace(pr.id, pr);
}

void InputIngestor::apply_missile_update(WorldState &world, uint32_t player_id, const MissileUpdateIntent &u)
{
    auto it = world.projectiles.find(u.projectile_id);
    if (it == world.projectiles.end() || it->second.owner_id != player_id || it->second.authoritative)
        return;
    it->second.reported_position = u.position;
    it->second.has_reported_position = true;
    it->second.direction = u.direction;
}

void InputIngestor::forget(uint32_t player_id)
{
    m_tracks.erase(player_id);
    std::erase_if(m_queue, [player_id](const Pending &p) { return p.player_id == player_id; });
}

} // namespace strafe::game
