// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "game.pb.h"

#include <coro/net/tcp/client.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace strafe::game {
class Room;
}

namespace strafe::rooms {

struct Session : public std::enable_shared_from_this<Session>
{
    std::string connection_id;
    std::string user_id; // set after a successful join
    std::string display_name;
    uint32_t player_id{0}; // 0 while not in a room
    // Room membership. Weak reference so a retired room is not kept alive by its sessions.
    std::weak_ptr<game::Room> room;
    std::chrono::steady_clock::time_point last_heartbeat{};
    std::atomic<bool> closing{false}; // set on disconnect; the connection loop exits on its next pass

    std::unique_ptr<coro::net::tcp::client> client; // nullptr for in-process sessions
    std::vector<strafe::wire::ServerMessage> outgoing; // pending outbound messages

    Session(std::string cid, coro::net::tcp::client c)
        : connection_id(std::move(cid)), client(std::make_unique<coro::net::tcp::client>(std::move(c)))
    {}

    explicit Session(std::string cid) : connection_id(std::move(cid)) {}
};

class SessionManager
{
public:
    std::shared_ptr<Session> add_connection(coro::net::tcp::client client);
    // Session without a socket; used by in-process clients and tests.
    std::shared_ptr<Session> add_detached();

    void bind_player(
        const std::shared_ptr<Session> &s,
        std::string user_id,
        std::string display_name,
        uint32_t player_id,
        const std::shared_ptr<game::Room> &room);
    // Leaves the current room (posting the leave to it). No-op when not in a room.
    void leave_room(const std::shared_ptr<Session> &s);
    std::shared_ptr<game::Room> room_of(const std::shared_ptr<Session> &s);
    uint32_t player_of(const std::shared_ptr<Session> &s);

    // Returns false when the backlog limit was exceeded; the queue is dropped in that case.
    bool push_message(const std::shared_ptr<Session> &s, const strafe::wire::ServerMessage &msg);
    // Routes a room message to the session bound to player_id; unknown players are ignored.
    bool push_to_player(uint32_t player_id, const strafe::wire::ServerMessage &msg);
    std::vector<strafe::wire::ServerMessage> drain_messages(const std::shared_ptr<Session> &s);
    size_t pending_messages(const std::shared_ptr<Session> &s);

    void update_heartbeat(const std::shared_ptr<Session> &s);
    std::vector<std::shared_ptr<Session>> snapshot_all_sessions();
    // Sessions whose last heartbeat is older than timeout at `now`.
    std::vector<std::shared_ptr<Session>> expired_sessions(
        std::chrono::steady_clock::time_point now, std::chrono::seconds timeout);
    // Leaves the room, forgets the session and flags it closing.
    void disconnect_session(const std::shared_ptr<Session> &s);

    void set_max_backlog(size_t n);
    size_t session_count();

private:
    std::mutex m_mutex;
    uint64_t m_connection_counter{0};
    size_t m_max_backlog{64};
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_connection;
    std::unordered_map<uint32_t, std::shared_ptr<Session>> m_by_player; // joined sessions
};

// Global accessor
SessionManager &instance();

} // namespace strafe::rooms
