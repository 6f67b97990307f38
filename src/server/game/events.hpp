// SPDX-License-Identifier: Apache-2.0
// events.hpp - tick-tagged gameplay events produced by the simulation systems and
// intents decoded from client messages at the transport boundary.
#pragma once
#include "common/game_types.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace strafe::game {

struct HitEvent
{
    uint32_t target_id{0};
    uint32_t attacker_id{0};
    float amount{0.f};
    float health{0.f}; // target health after the hit
    uint32_t projectile_id{0};
};

struct KillEvent
{
    uint32_t killer_id{0};
    uint32_t victim_id{0};
};

struct RespawnEvent
{
    uint32_t player_id{0};
    glm::vec3 position{0.f};
};

struct PhaseChangedEvent
{
    Phase from{Phase::lobby};
    Phase to{Phase::lobby};
    float phase_timer{0.f};
    uint32_t winner_id{0}; // set on entering results
};

struct PickupEvent
{
    uint32_t player_id{0};
    uint32_t collectible_id{0};
    CollectibleType type{CollectibleType::missile_refill};
};

struct ChatEvent
{
    uint32_t player_id{0};
    std::string name;
    std::string text;
};

using EventPayload = std::variant<HitEvent, KillEvent, RespawnEvent, PhaseChangedEvent, PickupEvent, ChatEvent>;

struct GameEvent
{
    uint32_t tick{0};
    EventPayload payload;
};

using EventList = std::vector<GameEvent>;

// ---- client intents

struct MoveIntent
{
    uint32_t seq{0};
    glm::vec3 position{0.f};
    glm::quat rotation{1.f, 0.f, 0.f, 0.f};
    glm::vec3 velocity{0.f};
};

struct FireIntent
{
    Weapon weapon{Weapon::laser};
    glm::vec3 origin{0.f};
    glm::vec3 direction{0.f, 0.f, 1.f};
};

struct MissileUpdateIntent
{
    uint32_t projectile_id{0};
    glm::vec3 position{0.f};
    glm::vec3 direction{0.f, 0.f, 1.f};
};

struct ChatIntent
{
    std::string text;
};

struct AckIntent
{
    uint32_t server_tick{0};
};

struct ResyncIntent
{
    uint32_t last_applied_tick{0};
};

struct RestartIntent
{
    std::string admin_token;
};

struct LeaveIntent
{};

using Intent = std::variant<
    MoveIntent,
    FireIntent,
    MissileUpdateIntent,
    ChatIntent,
    AckIntent,
    ResyncIntent,
    RestartIntent,
    LeaveIntent>;

// Validation outcome for an intent; anything but `none` drops the message.
enum class Rejection : uint8_t
{
    none,
    malformed,
    stale_sequence,
    speed_cap,
    out_of_bounds,
    unknown_player,
    not_owner,
    dead,
    wrong_phase,
    no_ammo,
    origin_mismatch,
    cooldown,
    bad_token
};

inline const char *rejection_name(Rejection r)
{
    switch (r) {
        case Rejection::none:
            return "none";
        case Rejection::malformed:
            return "malformed";
        case Rejection::stale_sequence:
            return "stale_sequence";
        case Rejection::speed_cap:
            return "speed_cap";
        case Rejection::out_of_bounds:
            return "out_of_bounds";
        case Rejection::unknown_player:
            return "unknown_player";
        case Rejection::not_owner:
            return "not_owner";
        case Rejection::dead:
            return "dead";
        case Rejection::wrong_phase:
            return "wrong_phase";
        case Rejection::no_ammo:
            return "no_ammo";
        case Rejection::origin_mismatch:
            return "origin_mismatch";
        case Rejection::cooldown:
            return "cooldown";
        case Rejection::bad_token:
            return "bad_token";
    }
    return "unknown";
}

} // namespace strafe::game
