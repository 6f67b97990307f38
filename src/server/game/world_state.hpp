// SPDX-License-Identifier: Apache-2.0
// world_state.hpp - authoritative room state. Plain records keyed by id; the owning Room is the only writer.
#pragma once
#include "common/game_types.hpp"
#include "common/snapshot_state.hpp"
#include "server/config.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace strafe::game {

struct Player
{
    uint32_t id{0};
    std::string name;
    ShipClass ship_class{ShipClass::fighter};
    glm::vec3 position{0.f};
    glm::quat rotation{1.f, 0.f, 0.f, 0.f};
    glm::vec3 velocity{0.f};
    float health{100.f};
    float max_health{100.f};
    uint32_t kills{0};
    uint32_t deaths{0};
    uint32_t missiles{6};
    uint32_t max_missiles{6};
    bool laser_upgrade{false};
    double last_damage_time{-1e9};
    uint32_t last_acked_input_seq{0};
    bool alive{true};
    float respawn_remaining{0.f};
    uint32_t spawn_slot{0};
    uint32_t reset_epoch{0}; // bumped whenever the server moves the ship back to a spawn
};

struct Projectile
{
    uint32_t id{0};
    uint32_t owner_id{0};
    Weapon weapon{Weapon::laser};
    glm::vec3 position{0.f};
    glm::vec3 prev_position{0.f};
    glm::vec3 direction{0.f, 0.f, 1.f};
    float speed{0.f};
    float damage{0.f};
    float radius{0.f};
    float remaining_lifetime{0.f};
    uint32_t spawn_tick{0};
    bool authoritative{true};
    // Owner-reported position for this tick (non-authoritative projectiles only)
    bool has_reported_position{false};
    glm::vec3 reported_position{0.f};
};

struct Collectible
{
    uint32_t id{0};
    CollectibleType type{CollectibleType::missile_refill};
    glm::vec3 position{0.f};
    bool active{true};
    float respawn_remaining{0.f};
};

struct WorldState
{
    uint32_t tick{0};
    double sim_time{0.0};
    Phase phase{Phase::lobby};
    float phase_timer{0.f};
    uint32_t winner_id{0};
    bool restart_requested{false};
    std::map<uint32_t, Player> players;
    std::map<uint32_t, Projectile> projectiles;
    std::map<uint32_t, Collectible> collectibles;
    uint32_t next_projectile_id{1};
    uint32_t next_spawn_slot{0};

    Player *find_player(uint32_t id);
    const Player *find_player(uint32_t id) const;
};

// Creates the collectible slots from level data.
void init_world(WorldState &world, const RoomConfig &cfg);

glm::vec3 spawn_point(const RoomConfig &cfg, uint32_t slot);

// Adds a player at its spawn point with class stats; returns nullptr if the id is taken.
Player *add_player(WorldState &world, const RoomConfig &cfg, uint32_t id, std::string name, ShipClass ship_class);
bool remove_player(WorldState &world, uint32_t id);

// Position, rotation, velocity and health back to spawn state; alive again.
void respawn_player(Player &p, const RoomConfig &cfg);

// Full match reset: spawn state plus missiles, score and upgrades.
void reset_player_for_match(Player &p, const RoomConfig &cfg);

void reset_collectibles(WorldState &world);

snap::SnapshotState capture(const WorldState &world);

} // namespace strafe::game
