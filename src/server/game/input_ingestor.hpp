// SPDX-License-Identifier: Apache-2.0
// input_ingestor.hpp - validates movement / fire / missile / chat intents and queues them for the next tick.
#pragma once
#include "server/config.hpp"
#include "server/game/events.hpp"
#include "server/game/world_state.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <variant>
#include <vector>

namespace strafe::game {

class InputIngestor
{
public:
    explicit InputIngestor(const RoomConfig &cfg);

    // Validates against the current world and queues on success. Only Move, Fire, MissileUpdate and
    // Chat intents are accepted here; anything else is reported as malformed.
    Rejection submit(const WorldState &world, uint32_t player_id, const Intent &intent);

    // Applies everything queued since the last call, in submission order.
    void apply_pending(WorldState &world, EventList &events);

    // Drops queued intents and sequence tracking of a departed player.
    void forget(uint32_t player_id);

    size_t pending() const { return m_queue.size(); }
    uint32_t last_accepted_seq(uint32_t player_id) const;

private:
    using Queued = std::variant<MoveIntent, FireIntent, MissileUpdateIntent, ChatIntent>;

    struct Pending
    {
        uint32_t player_id{0};
        uint32_t reset_epoch{0}; // player's epoch at submit; moves and shots from an older epoch are dropped
        Queued intent;
    };

    // Per-player validation history.
    struct Track
    {
        uint32_t last_seq{0};
        uint32_t reset_epoch{0};
        bool moved{false};
        double last_move_time{0.0};
        std::array<double, 2> last_fire_time{{-1e9, -1e9}}; // indexed by Weapon
    };

    Rejection check_move(const WorldState &world, const Player &p, const MoveIntent &m) const;
    Rejection check_fire(const WorldState &world, const Player &p, FireIntent &f) const;
    Rejection check_missile_update(const WorldState &world, uint32_t player_id, MissileUpdateIntent &u) const;
    Rejection check_chat(ChatIntent &c) const;

    void apply_move(WorldState &world, uint32_t player_id, const MoveIntent &m);
    void apply_fire(WorldState &world, uint32_t player_id, const FireIntent &f);
    void apply_missile_update(WorldState &world, uint32_t player_id, const MissileUpdateIntent &u);

    const RoomConfig &m_cfg;
    std::vector<Pending> m_queue;
    std::map<uint32_t, Track> m_tracks;
};

} // namespace strafe::game
