// SPDX-License-Identifier: Apache-2.0
#include "server/rooms/session_manager.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/room.hpp"

namespace strafe::rooms {

SessionManager &instance()
{
    static SessionManager inst;
    return inst;
}

std::shared_ptr<Session> SessionManager::add_connection(coro::net::tcp::client client)
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "conn_" + std::to_string(++m_connection_counter);
    auto s = std::make_shared<Session>(cid, std::move(client));
    s->last_heartbeat = std::chrono::steady_clock::now();
    m_by_connection.emplace(cid, s);
    return s;
}

std::shared_ptr<Session> SessionManager::add_detached()
{
    std::scoped_lock lk{m_mutex};
    std::string cid = "local_" + std::to_string(++m_connection_counter);
    auto s = std::make_shared<Session>(cid);
    s->last_heartbeat = std::chrono::steady_clock::now();
    m_by_connection.emplace(cid, s);
    return s;
}

void SessionManager::bind_player(
    const std::shared_ptr<Session> &s,
    std::string user_id,
    std::string display_name,
    uint32_t player_id,
    const std::shared_ptr<game::Room> &room)
{
    std::scoped_lock lk{m_mutex};
    s->user_id = std::move(user_id);
    s->display_name = std::move(display_name);
    s->player_id = player_id;
    s->room = room;
    s->last_heartbeat = std::chrono::steady_clock::now();
    m_by_player[player_id] = s;
    strafe::metrics::runtime().connected_players.fetch_add(1, std::memory_order_relaxed);
}

void SessionManager::leave_room(const std::shared_ptr<Session> &s)
{
    std::shared_ptr<game::Room> room;
    uint32_t player_id = 0;
    {
        std::scoped_lock lk{m_mutex};
        if (s->player_id == 0)
            return;
        player_id = s->player_id;
        room = s->room.lock();
        m_by_player.erase(player_id);
        s->player_id = 0;
        s->room.reset();
        s->outgoing.clear();
        auto &cp = strafe::metrics::runtime().connected_players;
        if (cp.load(std::memory_order_relaxed) > 0)
            cp.fetch_sub(1, std::memory_order_relaxed);
    }
    if (room)
        room->post_leave(player_id);
}

std::shared_ptr<game::Room> SessionManager::room_of(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    return s->room.lock();
}

uint32_t SessionManager::player_of(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    return s->player_id;
}

bool SessionManager::push_message(const std::shared_ptr<Session> &s, const strafe::wire::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    if (s->outgoing.size() >= m_max_backlog) {
        s->outgoing.clear();
        return false;
    }
    s->outgoing.push_back(msg);
    return true;
}

bool SessionManager::push_to_player(uint32_t player_id, const strafe::wire::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_player.find(player_id);
    if (it == m_by_player.end())
        return true; // already gone; the room learns through its mailbox
    auto &s = it->second;
    if (s->outgoing.size() >= m_max_backlog) {
        s->outgoing.clear();
        return false;
    }
    s->outgoing.push_back(msg);
    return true;
}

std::vector<strafe::wire::ServerMessage> SessionManager::drain_messages(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    std::vector<strafe::wire::ServerMessage> out;
    out.swap(s->outgoing);
    return out;
}

size_t SessionManager::pending_messages(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    return s->outgoing.size();
}

void SessionManager::update_heartbeat(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    s->last_heartbeat = std::chrono::steady_clock::now();
}

std::vector<std::shared_ptr<Session>> SessionManager::snapshot_all_sessions()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> res;
    res.reserve(m_by_connection.size());
    for (auto &kv : m_by_connection)
        res.push_back(kv.second);
    return res;
}

std::vector<std::shared_ptr<Session>> SessionManager::expired_sessions(
    std::chrono::steady_clock::time_point now, std::chrono::seconds timeout)
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> res;
    for (auto &kv : m_by_connection) {
        if (now - kv.second->last_heartbeat > timeout)
            res.push_back(kv.second);
    }
    return res;
}

void SessionManager::disconnect_session(const std::shared_ptr<Session> &s)
{
    leave_room(s);
    std::scoped_lock lk{m_mutex};
    m_by_connection.erase(s->connection_id);
    s->closing.store(true, std::memory_order_release);
}

void SessionManager::set_max_backlog(size_t n)
{
    std::scoped_lock lk{m_mutex};
    m_max_backlog = n == 0 ? 1 : n;
}

size_t SessionManager::session_count()
{
    std::scoped_lock lk{m_mutex};
    return m_by_connection.size();
}

} // namespace strafe::rooms
