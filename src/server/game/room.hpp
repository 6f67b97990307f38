// SPDX-License-Identifier: Apache-2.0
// room.hpp - one authoritative simulation: world state, systems, replicator and the tick coroutine.
#pragma once
#include "game.pb.h"
#include "server/config.hpp"
#include "server/game/events.hpp"
#include "server/game/input_ingestor.hpp"
#include "server/game/simulation_clock.hpp"
#include "server/game/state_replicator.hpp"
#include "server/game/world_state.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace strafe::game {

// Outbound sink. Returning false means the connection backlog overflowed and its queue was dropped.
using DeliverFn = std::function<bool(uint32_t player_id, const strafe::wire::ServerMessage &msg)>;

class Room : public std::enable_shared_from_this<Room>
{
public:
    Room(std::string name, RoomConfig cfg, DeliverFn deliver);

    const std::string &name() const { return m_name; }
    const RoomConfig &config() const { return m_cfg; }

    // Thread-safe: called from connection coroutines, consumed at the start of the next step.
    void post_join(uint32_t player_id, std::string display_name, ShipClass ship_class);
    void post_intent(uint32_t player_id, Intent intent);
    void post_leave(uint32_t player_id);

    // One fixed simulation step followed by replication. Runs on the room coroutine only.
    void step();

    size_t member_count() const { return m_members.load(std::memory_order_relaxed); }
    bool closed() const { return m_closed.load(std::memory_order_acquire); }
    void close() { m_closed.store(true, std::memory_order_release); }

    // Loop-thread accessors (tests and the room coroutine).
    const WorldState &world() const { return m_world; }
    WorldState &world() { return m_world; }
    SimulationClock &clock() { return m_clock; }
    const StateReplicator &replicator() const { return m_replicator; }

private:
    struct JoinCommand
    {
        std::string name;
        ShipClass ship_class{ShipClass::fighter};
    };

    struct Mail
    {
        uint32_t player_id{0};
        std::variant<JoinCommand, Intent> body;
    };

    void handle_mail(Mail &mail);
    void handle_intent(uint32_t player_id, const Intent &intent);
    void replicate(const EventList &events);

    std::string m_name;
    RoomConfig m_cfg;
    DeliverFn m_deliver;
    WorldState m_world;
    InputIngestor m_ingestor;
    StateReplicator m_replicator;
    SimulationClock m_clock;

    std::mutex m_mail_mutex;
    std::vector<Mail> m_mailbox;
    std::atomic<size_t> m_members{0};
    std::atomic<bool> m_closed{false};
};

// Tick loop: accumulates real time into the room clock and steps until the room is closed.
// A std::exception escaping a step closes this room only.
coro::task<void> run_room(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<Room> room);

} // namespace strafe::game
