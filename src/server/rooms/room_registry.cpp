// SPDX-License-Identifier: Apache-2.0
#include "server/rooms/room_registry.hpp"

#include "common/logger.hpp"

#include <cctype>

namespace strafe::rooms {

namespace {
std::atomic<RoomRegistry *> g_registry{nullptr};
}

RoomRegistry::RoomRegistry(
    RoomConfig room_cfg, uint32_t max_rooms, std::string default_room, game::DeliverFn deliver, LaunchFn launch)
    : m_room_cfg(std::move(room_cfg)), m_max_rooms(max_rooms), m_default_room(std::move(default_room)),
      m_deliver(std::move(deliver)), m_launch(std::move(launch))
{}

bool RoomRegistry::valid_room_name(const std::string &name)
{
    if (name.empty() || name.size() > 32)
        return false;
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '_' && c != '-')
            return false;
    }
    return true;
}

JoinResult RoomRegistry::join(const std::string &room_name, std::string display_name, ShipClass ship_class)
{
    JoinResult res;
    const std::string name = room_name.empty() ? m_default_room : room_name;
    if (!valid_room_name(name)) {
        res.reason = "invalid_room_name";
        return res;
    }
    std::shared_ptr<game::Room> room;
    bool created = false;
    {
        std::scoped_lock lk{m_mutex};
        auto it = m_rooms.find(name);
        if (it != m_rooms.end() && it->second->closed()) {
            m_rooms.erase(it);
            it = m_rooms.end();
        }
        if (it == m_rooms.end()) {
            if (m_rooms.size() >= m_max_rooms) {
                res.reason = "room_limit";
                return res;
            }
            room = std::make_shared<game::Room>(name, m_room_cfg, m_deliver);
            m_rooms.emplace(name, room);
            created = true;
        } else {
            room = it->second;
        }
        if (room->member_count() >= m_room_cfg.max_players) {
            res.reason = "room_full";
            return res;
        }
        res.player_id = m_next_player_id.fetch_add(1, std::memory_order_relaxed);
        room->post_join(res.player_id, std::move(display_name), ship_class);
    }
    if (created) {
        strafe::log::info("[registry] created room {}", name);
        if (m_launch)
            m_launch(room);
    }
    res.ok = true;
    res.room = std::move(room);
    return res;
}

std::shared_ptr<game::Room> RoomRegistry::find(const std::string &name)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_rooms.find(name);
    return it == m_rooms.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<game::Room>> RoomRegistry::rooms()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<game::Room>> out;
    out.reserve(m_rooms.size());
    for (auto &kv : m_rooms)
        out.push_back(kv.second);
    return out;
}

size_t RoomRegistry::room_count()
{
    std::scoped_lock lk{m_mutex};
    return m_rooms.size();
}

size_t RoomRegistry::retire_idle()
{
    std::scoped_lock lk{m_mutex};
    size_t retired = 0;
    for (auto it = m_rooms.begin(); it != m_rooms.end();) {
        auto &room = it->second;
        if (room->closed() || room->member_count() == 0) {
            room->close();
            strafe::log::info("[registry] retired room {}", it->first);
            it = m_rooms.erase(it);
            ++retired;
        } else {
            ++it;
        }
    }
    return retired;
}

void RoomRegistry::close_all()
{
    std::scoped_lock lk{m_mutex};
    for (auto &kv : m_rooms)
        kv.second->close();
    m_rooms.clear();
}

void set_registry(RoomRegistry *r) noexcept
{
    g_registry.store(r, std::memory_order_release);
}

RoomRegistry *registry() noexcept
{
    return g_registry.load(std::memory_order_acquire);
}

} // namespace strafe::rooms
