// SPDX-License-Identifier: Apache-2.0
// In-process sessions driven through the message handler: match start, hits, kill, respawn,
// chat broadcast, match end by score limit and admin restart. The room is stepped by hand.
#include "common/snapshot_state.hpp"
#include "common/wire_convert.hpp"
#include "server/auth/identity_provider.hpp"
#include "server/game/room.hpp"
#include "server/net/listener.hpp"
#include "server/rooms/room_registry.hpp"
#include "server/rooms/session_manager.hpp"
#include "test_room_fixture.hpp"

#include <cassert>
#include <iostream>

using strafe::wire::ClientMessage;
using strafe::wire::ServerMessage;

struct Inbox
{
    std::vector<ServerMessage> all;

    void pull(const std::shared_ptr<strafe::rooms::Session> &s)
    {
        for (auto &m : strafe::rooms::instance().drain_messages(s))
            all.push_back(std::move(m));
    }

    template <typename Pred>
    size_t count(Pred pred) const
    {
        size_t n = 0;
        for (const auto &m : all)
            n += pred(m) ? 1 : 0;
        return n;
    }
};

static uint32_t join(const std::shared_ptr<strafe::rooms::Session> &s, const std::string &name)
{
    ClientMessage m;
    m.mutable_join()->set_display_name(name);
    m.mutable_join()->set_room("duel");
    strafe::net::handle_client_message(s, m);
    auto msgs = strafe::rooms::instance().drain_messages(s);
    assert(msgs.size() == 1 && msgs[0].join_response().success());
    return msgs[0].join_response().player_id();
}

static void fire_laser(const std::shared_ptr<strafe::rooms::Session> &s, glm::vec3 from, glm::vec3 dir)
{
    ClientMessage m;
    m.mutable_fire()->set_weapon(strafe::wire::WEAPON_LASER);
    strafe::wire_conv::to_wire(from, m.mutable_fire()->mutable_position());
    strafe::wire_conv::to_wire(dir, m.mutable_fire()->mutable_direction());
    strafe::net::handle_client_message(s, m);
}

int main()
{
    auto cfg = strafe::test::make_room_config();
    cfg.score_limit = 1;
    cfg.results_seconds = 60.f;
    cfg.admin_token = "admin";
    auto idp = strafe::auth::make_provider("disabled", "");
    strafe::auth::set_provider(idp.get());
    strafe::rooms::RoomRegistry reg(
        cfg,
        2,
        "main",
        [](uint32_t pid, const ServerMessage &sm) { return strafe::rooms::instance().push_to_player(pid, sm); },
        strafe::rooms::RoomRegistry::LaunchFn{});
    strafe::rooms::set_registry(&reg);
    auto &mgr = strafe::rooms::instance();

    auto sa = mgr.add_detached();
    auto sb = mgr.add_detached();
    uint32_t a = join(sa, "ace");
    uint32_t b = join(sb, "bandit");
    auto room = reg.find("duel");
    assert(room && room->member_count() == 2);

    Inbox ia, ib;
    // lobby -> countdown -> playing
    for (int i = 0; i < 30 && room->world().phase != strafe::Phase::playing; ++i) {
        room->step();
        ia.pull(sa);
        ib.pull(sb);
    }
    assert(room->world().phase == strafe::Phase::playing);
    assert(ib.count([](const ServerMessage &m) { return m.has_phase_changed() && m.phase_changed().to() == strafe::wire::PHASE_PLAYING; }) == 1);
    assert(ib.all.front().has_snapshot());

    // Firing from a spawn at the other ship: four laser hits kill a 100 hp fighter
    glm::vec3 pa = room->world().players.at(a).position;
    glm::vec3 pb = room->world().players.at(b).position;
    glm::vec3 dir = glm::normalize(pb - pa);
    for (int shot = 0; shot < 4; ++shot) {
        fire_laser(sa, pa + dir * 2.f, dir);
        for (int i = 0; i < 12; ++i) {
            room->step();
            ia.pull(sa);
            ib.pull(sb);
        }
    }
    auto hits = ib.count([&](const ServerMessage &m) { return m.has_hit() && m.hit().target_id() == b; });
    assert(hits == 4);
    assert(ia.count([&](const ServerMessage &m) { return m.has_kill() && m.kill().killer_id() == a && m.kill().victim_id() == b; }) == 1);
    // Score limit 1 ends the match with a as winner
    assert(room->world().phase == strafe::Phase::results);
    assert(room->world().winner_id == a);
    assert(ib.count([&](const ServerMessage &m) { return m.has_phase_changed() && m.phase_changed().winner_id() == a; }) == 1);

    // Fire in results is refused and creates nothing
    fire_laser(sa, pa + dir * 2.f, dir);
    room->step();
    assert(room->world().projectiles.empty());

    // The victim respawns after the delay
    for (int i = 0; i < 70; ++i) {
        room->step();
        ia.pull(sa);
        ib.pull(sb);
    }
    assert(ib.count([&](const ServerMessage &m) { return m.has_respawn() && m.respawn().player_id() == b; }) == 1);
    assert(room->world().players.at(b).alive);

    // Chat is broadcast to everyone in the room
    ClientMessage chat;
    chat.mutable_chat()->set_text(" good fight ");
    strafe::net::handle_client_message(sb, chat);
    room->step();
    ia.pull(sa);
    assert(ia.count([](const ServerMessage &m) { return m.has_chat() && m.chat().text() == "good fight" && m.chat().name() == "bandit"; }) == 1);

    // Admin restart: a wrong token is ignored, the right one returns to lobby on the next step
    ClientMessage restart;
    restart.mutable_admin_restart()->set_admin_token("guess");
    strafe::net::handle_client_message(sa, restart);
    room->step();
    assert(room->world().phase == strafe::Phase::results);
    restart.mutable_admin_restart()->set_admin_token("admin");
    strafe::net::handle_client_message(sa, restart);
    room->step();
    assert(room->world().phase != strafe::Phase::results);

    // Mirror the stream client-side: it must reconstruct the server view
    strafe::snap::SnapshotState mirror;
    bool have = false;
    for (const auto &m : ib.all) {
        if (m.has_snapshot()) {
            have = strafe::snap::decode_full(m.snapshot(), mirror);
            assert(have);
        }
    }
    assert(have && mirror.players.size() == 2);

    // Leaving empties the room; the registry retires it
    ClientMessage leave;
    leave.mutable_leave();
    strafe::net::handle_client_message(sa, leave);
    mgr.disconnect_session(sb);
    room->step();
    assert(room->world().players.empty());
    assert(reg.retire_idle() == 1);

    strafe::rooms::set_registry(nullptr);
    strafe::auth::set_provider(nullptr);
    std::cout << "e2e_combat_events OK" << std::endl;
    return 0;
}
