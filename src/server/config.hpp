// SPDX-License-Identifier: Apache-2.0
// config.hpp - server and room configuration loaded from YAML (config/server.yaml, config/level.yaml).
#pragma once
#include "common/game_types.hpp"

#include <glm/glm.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace strafe {

struct ShipClassParams
{
    float max_health{100.f};
    uint32_t max_missiles{6};
    float max_speed{135.f};
    float acceleration{45.f};
};

struct WeaponParams
{
    float speed{200.f};
    float damage{25.f};
    float lifetime{3.f};
    float radius{0.25f};
    float fire_interval{0.2f}; // minimum seconds between shots per player
};

struct CollectibleSlot
{
    uint32_t id{0};
    CollectibleType type{CollectibleType::missile_refill};
    glm::vec3 position{0.f};
};

// Static level layout: spawn points are assigned round-robin by join order.
struct LevelData
{
    std::vector<glm::vec3> spawn_points;
    std::vector<CollectibleSlot> collectibles;
};

struct RoomConfig
{
    uint32_t tick_rate{20};
    uint32_t max_catch_up_steps{5};
    uint32_t max_players{16};
    // Phases
    uint32_t min_players{2};
    float countdown_seconds{5.f};
    float match_seconds{300.f};
    uint32_t score_limit{20};
    float results_seconds{10.f};
    std::string admin_token; // empty disables admin restart
    // Combat
    float respawn_delay{3.f};
    float regen_delay{5.f};
    float regen_rate{15.f};
    float ship_radius{1.5f};
    WeaponParams laser{200.f, 25.f, 3.f, 0.25f, 0.2f};
    WeaponParams missile{60.f, 50.f, 6.f, 0.5f, 1.f};
    float laser_upgrade_multiplier{1.5f};
    float fire_origin_tolerance{10.f};
    // Movement validation
    float speed_tolerance{0.1f};
    float move_slack{1.f}; // extra displacement allowed per move on top of the speed cap
    glm::vec3 map_half_extents{600.f, 300.f, 600.f};
    // Collectibles
    float collectible_radius{3.f};
    uint32_t missile_refill_amount{3};
    float missile_refill_respawn_seconds{15.f};
    float laser_upgrade_respawn_seconds{30.f};
    // Ship classes indexed by ShipClass
    std::array<ShipClassParams, 3> ships{{
        {100.f, 6, 135.f, 45.f}, // fighter
        {150.f, 8, 110.f, 35.f}, // tank
        {80.f, 4, 160.f, 55.f}, // rogue
    }};
    // Replication / chat
    uint32_t snapshot_history{32};
    uint32_t max_outgoing_backlog{64};
    uint32_t chat_max_length{200};
    LevelData level;

    const ShipClassParams &ship(ShipClass c) const { return ships[static_cast<size_t>(c)]; }
    float tick_dt() const { return 1.f / static_cast<float>(tick_rate); }
    float respawn_seconds(CollectibleType t) const
    {
        return t == CollectibleType::laser_upgrade ? laser_upgrade_respawn_seconds : missile_refill_respawn_seconds;
    }
};

struct ServerConfig
{
    uint16_t listen_port{40001};
    uint32_t heartbeat_timeout_seconds{15};
    uint32_t max_rooms{8};
    std::string default_room{"main"};
    std::string log_level{"info"};
    bool log_json{false};
    std::string auth_mode{"disabled"};
    std::string auth_stub_prefix{"user_"};
    std::string level_path{"level.yaml"}; // relative paths resolve against the server config directory
    uint32_t metrics_log_interval_seconds{60};
    RoomConfig room;
};

// Missing keys keep defaults. Throws YAML::Exception on unreadable files or bad conversions and
// std::runtime_error on values that fail range checks.
ServerConfig load_server_config(const std::string &path);
RoomConfig parse_room_config(const YAML::Node &node, RoomConfig base = {});
LevelData load_level(const std::string &path);
LevelData parse_level(const YAML::Node &node);

} // namespace strafe
