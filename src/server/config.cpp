// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <stdexcept>

namespace strafe {

namespace {

template <typename T>
void read_key(const YAML::Node &node, const char *key, T &dst)
{
    if (node[key])
        dst = node[key].as<T>();
}

glm::vec3 read_vec3(const YAML::Node &node)
{
    if (!node.IsSequence() || node.size() != 3)
        throw std::runtime_error("expected [x, y, z] sequence");
    return {node[0].as<float>(), node[1].as<float>(), node[2].as<float>()};
}

CollectibleType parse_collectible_type(const std::string &s)
{
    if (s == "missile_refill")
        return CollectibleType::missile_refill;
    if (s == "laser_upgrade")
        return CollectibleType::laser_upgrade;
    throw std::runtime_error("unknown collectible type '" + s + "'");
}

void read_weapon(const YAML::Node &node, WeaponParams &w)
{
    if (!node)
        return;
    read_key(node, "speed", w.speed);
    read_key(node, "damage", w.damage);
    read_key(node, "lifetime", w.lifetime);
    read_key(node, "radius", w.radius);
    read_key(node, "fire_interval", w.fire_interval);
}

void read_ship(const YAML::Node &node, ShipClassParams &s)
{
    if (!node)
        return;
    read_key(node, "max_health", s.max_health);
    read_key(node, "max_missiles", s.max_missiles);
    read_key(node, "max_speed", s.max_speed);
    read_key(node, "acceleration", s.acceleration);
}

void validate(const RoomConfig &rc)
{
    if (rc.tick_rate == 0 || rc.tick_rate > 240)
        throw std::runtime_error("room.tick_rate must be in 1..240");
    if (rc.snapshot_history == 0)
        throw std::runtime_error("room.snapshot_history must be > 0");
    if (rc.min_players == 0)
        throw std::runtime_error("room.min_players must be > 0");
    for (const auto &s : rc.ships) {
        if (s.max_health <= 0.f || s.max_speed <= 0.f)
            throw std::runtime_error("ship max_health and max_speed must be positive");
    }
    if (rc.map_half_extents.x <= 0.f || rc.map_half_extents.y <= 0.f || rc.map_half_extents.z <= 0.f)
        throw std::runtime_error("room.map_half_extents must be positive");
    if (rc.laser.fire_interval < 0.f || rc.missile.fire_interval < 0.f)
        throw std::runtime_error("weapon fire_interval must not be negative");
    if (rc.speed_tolerance < 0.f || rc.move_slack < 0.f)
        throw std::runtime_error("room.speed_tolerance and room.move_slack must not be negative");
}

} // namespace

RoomConfig parse_room_config(const YAML::Node &node, RoomConfig base)
{
    RoomConfig rc = std::move(base);
    if (!node)
        return rc;
    read_key(node, "tick_rate", rc.tick_rate);
    read_key(node, "max_catch_up_steps", rc.max_catch_up_steps);
    read_key(node, "max_players", rc.max_players);
    read_key(node, "min_players", rc.min_players);
    read_key(node, "countdown_seconds", rc.countdown_seconds);
    read_key(node, "match_seconds", rc.match_seconds);
    read_key(node, "score_limit", rc.score_limit);
    read_key(node, "results_seconds", rc.results_seconds);
    read_key(node, "admin_token", rc.admin_token);
    read_key(node, "respawn_delay", rc.respawn_delay);
    read_key(node, "regen_delay", rc.regen_delay);
    read_key(node, "regen_rate", rc.regen_rate);
    read_key(node, "ship_radius", rc.ship_radius);
    read_weapon(node["laser"], rc.laser);
    read_weapon(node["missile"], rc.missile);
    read_key(node, "laser_upgrade_multiplier", rc.laser_upgrade_multiplier);
    read_key(node, "fire_origin_tolerance", rc.fire_origin_tolerance);
    read_key(node, "speed_tolerance", rc.speed_tolerance);
    read_key(node, "move_slack", rc.move_slack);
    if (node["map_half_extents"])
        rc.map_half_extents = read_vec3(node["map_half_extents"]);
    read_key(node, "collectible_radius", rc.collectible_radius);
    read_key(node, "missile_refill_amount", rc.missile_refill_amount);
    read_key(node, "missile_refill_respawn_seconds", rc.missile_refill_respawn_seconds);
    read_key(node, "laser_upgrade_respawn_seconds", rc.laser_upgrade_respawn_seconds);
    if (auto ships = node["ships"]) {
        read_ship(ships["fighter"], rc.ships[static_cast<size_t>(ShipClass::fighter)]);
        read_ship(ships["tank"], rc.ships[static_cast<size_t>(ShipClass::tank)]);
        read_ship(ships["rogue"], rc.ships[static_cast<size_t>(ShipClass::rogue)]);
    }
    read_key(node, "snapshot_history", rc.snapshot_history);
    read_key(node, "max_outgoing_backlog", rc.max_outgoing_backlog);
    read_key(node, "chat_max_length", rc.chat_max_length);
    validate(rc);
    return rc;
}

LevelData parse_level(const YAML::Node &node)
{
    LevelData level;
    if (auto spawns = node["spawn_points"]) {
        for (const auto &sp : spawns)
            level.spawn_points.push_back(read_vec3(sp));
    }
    if (auto items = node["collectibles"]) {
        uint32_t next_id = 1;
        for (const auto &it : items) {
            CollectibleSlot slot;
            slot.id = it["id"] ? it["id"].as<uint32_t>() : next_id;
            next_id = slot.id + 1;
            slot.type = parse_collectible_type(it["type"].as<std::string>());
            slot.position = read_vec3(it["position"]);
            level.collectibles.push_back(slot);
        }
    }
    if (level.spawn_points.empty())
        level.spawn_points.push_back(glm::vec3(0.f));
    return level;
}

LevelData load_level(const std::string &path)
{
    return parse_level(YAML::LoadFile(path));
}

ServerConfig load_server_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    ServerConfig cfg;
    read_key(root, "listen_port", cfg.listen_port);
    read_key(root, "heartbeat_timeout_seconds", cfg.heartbeat_timeout_seconds);
    read_key(root, "max_rooms", cfg.max_rooms);
    read_key(root, "default_room", cfg.default_room);
    read_key(root, "log_level", cfg.log_level);
    read_key(root, "log_json", cfg.log_json);
    read_key(root, "auth_mode", cfg.auth_mode);
    read_key(root, "auth_stub_prefix", cfg.auth_stub_prefix);
    read_key(root, "level", cfg.level_path);
    read_key(root, "metrics_log_interval_seconds", cfg.metrics_log_interval_seconds);
    if (cfg.max_rooms == 0)
        throw std::runtime_error("max_rooms must be > 0");
    cfg.room = parse_room_config(root["room"]);

    std::filesystem::path level_path(cfg.level_path);
    if (level_path.is_relative())
        level_path = std::filesystem::path(path).parent_path() / level_path;
    cfg.level_path = level_path.string();
    cfg.room.level = load_level(cfg.level_path);
    return cfg;
}

} // namespace strafe
