// SPDX-License-Identifier: Apache-2.0
// room_registry.hpp - named rooms created on demand and retired when empty. A join names its room.
#pragma once
#include "common/game_types.hpp"
#include "server/config.hpp"
#include "server/game/room.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace strafe::rooms {

struct JoinResult
{
    bool ok{false};
    std::string reason;
    std::shared_ptr<game::Room> room;
    uint32_t player_id{0};
};

class RoomRegistry
{
public:
    // Called once for every newly created room (the server spawns its tick coroutine here).
    using LaunchFn = std::function<void(const std::shared_ptr<game::Room> &)>;

    RoomRegistry(
        RoomConfig room_cfg, uint32_t max_rooms, std::string default_room, game::DeliverFn deliver, LaunchFn launch);

    // Empty name selects the default room. Fails on invalid names, a full room or the room limit.
    JoinResult join(const std::string &room_name, std::string display_name, ShipClass ship_class);

    std::shared_ptr<game::Room> find(const std::string &name);
    std::vector<std::shared_ptr<game::Room>> rooms();
    size_t room_count();

    // Closes and forgets rooms with no members, and forgets rooms closed by a fault. Returns how many.
    size_t retire_idle();
    void close_all();

    static bool valid_room_name(const std::string &name);

private:
    RoomConfig m_room_cfg;
    uint32_t m_max_rooms;
    std::string m_default_room;
    game::DeliverFn m_deliver;
    LaunchFn m_launch;
    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<game::Room>> m_rooms;
    std::atomic<uint32_t> m_next_player_id{1};
};

// Global pointer set once at startup (listener access).
void set_registry(RoomRegistry *r) noexcept;
RoomRegistry *registry() noexcept;

} // namespace strafe::rooms
