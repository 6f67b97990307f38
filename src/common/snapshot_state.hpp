// SPDX-License-Identifier: Apache-2.0
// snapshot_state.hpp - replicated world view shared by the server replicator and the client mirror.
// Full snapshots carry every entity; deltas carry only fields that differ from an acknowledged base.
#pragma once
#include "common/game_types.hpp"
#include "game.pb.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cstdint>
#include <map>
#include <string>

namespace strafe::snap {

struct PlayerView
{
    uint32_t id{0};
    std::string name;
    ShipClass ship_class{ShipClass::fighter};
    glm::vec3 position{0.f};
    glm::quat rotation{1.f, 0.f, 0.f, 0.f};
    glm::vec3 velocity{0.f};
    float health{0.f};
    float max_health{0.f};
    uint32_t kills{0};
    uint32_t deaths{0};
    uint32_t missiles{0};
    uint32_t max_missiles{0};
    bool alive{true};
    uint32_t last_acked_input_seq{0};
    bool laser_upgrade{false};

    bool operator==(const PlayerView &) const = default;
};

struct ProjectileView
{
    uint32_t id{0};
    uint32_t owner_id{0};
    Weapon weapon{Weapon::laser};
    glm::vec3 position{0.f};
    glm::vec3 direction{0.f, 0.f, 1.f};
    float speed{0.f};
    float remaining_lifetime{0.f};
    uint32_t spawn_tick{0};
    bool authoritative{true};

    bool operator==(const ProjectileView &) const = default;
};

struct CollectibleView
{
    uint32_t id{0};
    CollectibleType type{CollectibleType::missile_refill};
    glm::vec3 position{0.f};
    bool active{true};
    float respawn_remaining{0.f};

    bool operator==(const CollectibleView &) const = default;
};

struct SnapshotState
{
    uint32_t tick{0};
    Phase phase{Phase::lobby};
    float phase_timer{0.f};
    std::map<uint32_t, PlayerView> players;
    std::map<uint32_t, ProjectileView> projectiles;
    std::map<uint32_t, CollectibleView> collectibles;

    bool operator==(const SnapshotState &) const = default;
};

void encode_full(const SnapshotState &state, strafe::wire::StateSnapshot &out);

// Fields equal to the base are omitted. Entities absent from base are written in full.
void encode_delta(const SnapshotState &base, const SnapshotState &current, strafe::wire::DeltaSnapshot &out);

// Returns false on malformed input (invalid enum, duplicate id, non-finite vector).
bool decode_full(const strafe::wire::StateSnapshot &in, SnapshotState &out);

// Applies `delta` on top of `base` into `out`. Returns false when the delta does not match the
// base tick, references an unknown entity without carrying every field, or is malformed.
bool apply_delta(const SnapshotState &base, const strafe::wire::DeltaSnapshot &delta, SnapshotState &out);

} // namespace strafe::snap
