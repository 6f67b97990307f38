// SPDX-License-Identifier: Apache-2.0
// headless_client.cpp - scripted client: joins a room, flies with local prediction, fires,
// acknowledges snapshots and reports reconciliation statistics.
#include "client/client_predictor.hpp"
#include "client/reconciler.hpp"
#include "client/snapshot_mirror.hpp"
#include "common/framing.hpp"
#include "common/logger.hpp"
#include "common/wire_convert.hpp"
#include "game.pb.h"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <glm/gtc/quaternion.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <span>
#include <string>

using namespace std::chrono_literals;

namespace {

struct ClientOptions
{
    uint16_t port{40001};
    uint32_t active_secs{20};
    std::string room;
    std::string name{"pilot"};
    std::string token;
    strafe::wire::ShipClass ship_class{strafe::wire::SHIP_FIGHTER};
};

coro::task<bool> send_frame(coro::net::tcp::client &client, const strafe::wire::ClientMessage &msg)
{
    std::string payload;
    if (!msg.SerializeToString(&payload))
        co_return false;
    std::string frame = strafe::netutil::build_frame(payload);
    std::span<const char> rest(frame.data(), frame.size());
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, remaining] = client.send(rest);
        if (st == coro::net::send_status::ok || st == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

// Reads whatever is available within `timeout` into the parse state. Returns false when the connection is gone.
coro::task<bool> pump_socket(
    coro::net::tcp::client &client, strafe::netutil::FrameParseState &state, std::chrono::milliseconds timeout)
{
    auto pstat = co_await client.poll(coro::poll_op::read, timeout);
    if (pstat == coro::poll_status::timeout)
        co_return true;
    if (pstat != coro::poll_status::event)
        co_return false;
    std::string tmp(4096, '\0');
    auto [st, span] = client.recv(tmp);
    if (st == coro::net::recv_status::closed)
        co_return false;
    if (st == coro::net::recv_status::ok)
        state.buffer.insert(state.buffer.end(), span.begin(), span.end());
    else if (st != coro::net::recv_status::would_block)
        co_return false;
    co_return !state.corrupt;
}

class Pilot
{
public:
    Pilot(coro::net::tcp::client &cli, uint32_t player_id, uint32_t tick_rate)
        : m_cli(cli), m_player_id(player_id), m_dt(1.f / static_cast<float>(std::max<uint32_t>(tick_rate, 1))),
          m_reconciler(m_predictor)
    {}

    coro::task<bool> handle(const strafe::wire::ServerMessage &sm)
    {
        if (sm.has_snapshot() || sm.has_delta_snapshot()) {
            auto result = m_mirror.apply(sm);
            if (result == strafe::client::MirrorResult::needs_resync) {
                ++m_resyncs;
                strafe::wire::ClientMessage rs;
                rs.mutable_resync()->set_last_applied_tick(m_mirror.last_tick());
                co_return co_await send_frame(m_cli, rs);
            }
            if (result != strafe::client::MirrorResult::applied)
                co_return true;
            const auto *state = m_mirror.current();
            strafe::wire::ClientMessage ack;
            ack.mutable_snapshot_ack()->set_server_tick(state->tick);
            if (!co_await send_frame(m_cli, ack))
                co_return false;
            auto it = state->players.find(m_player_id);
            if (it != state->players.end()) {
                if (!m_seeded) {
                    strafe::flight::ShipKinematics k{it->second.position, it->second.rotation, it->second.velocity};
                    m_predictor.reset(k);
                    m_seeded = true;
                } else {
                    m_reconciler.on_snapshot(state->tick, it->second.last_acked_input_seq, it->second.position);
                }
                m_alive = it->second.alive;
            }
            m_phase = state->phase;
        } else if (sm.has_hit()) {
            if (sm.hit().target_id() == m_player_id)
                strafe::log::info("[client] hit by {} health={}", sm.hit().attacker_id(), sm.hit().health());
        } else if (sm.has_kill()) {
            strafe::log::info("[client] kill {} -> {}", sm.kill().killer_id(), sm.kill().victim_id());
        } else if (sm.has_respawn()) {
            if (sm.respawn().player_id() == m_player_id)
                strafe::log::info("[client] respawned");
        } else if (sm.has_phase_changed()) {
            strafe::log::info("[client] phase {} -> {} winner={}", strafe::wire::Phase_Name(sm.phase_changed().from()),
                strafe::wire::Phase_Name(sm.phase_changed().to()), sm.phase_changed().winner_id());
        } else if (sm.has_chat()) {
            strafe::log::info("[chat] {}: {}", sm.chat().name(), sm.chat().text());
        } else if (sm.has_heartbeat_resp()) {
            strafe::log::debug("[client] heartbeat server_time={}", sm.heartbeat_resp().server_time_ms());
        }
        co_return true;
    }

    // One fixed step of scripted flight: circle around the spawn and fire every few seconds.
    coro::task<bool> fly()
    {
        if (!m_seeded || !m_alive)
            co_return true;
        m_heading += 0.6f * m_dt;
        glm::quat rot = glm::angleAxis(m_heading, glm::vec3(0.f, 1.f, 0.f));
        glm::vec3 forward = rot * glm::vec3(0.f, 0.f, -1.f);
        strafe::wire::ClientMessage in;
        *in.mutable_input() = m_predictor.apply_input(forward, rot, m_dt);
        if (!co_await send_frame(m_cli, in))
            co_return false;
        m_reconciler.advance(m_dt);
        if (m_phase == strafe::Phase::playing && (++m_steps % 40) == 0) {
            strafe::wire::ClientMessage fire;
            auto *fc = fire.mutable_fire();
            fc->set_weapon(strafe::wire::WEAPON_LASER);
            strafe::wire_conv::to_wire(m_predictor.current().position, fc->mutable_position());
            strafe::wire_conv::to_wire(forward, fc->mutable_direction());
            if (!co_await send_frame(m_cli, fire))
                co_return false;
        }
        co_return true;
    }

    void report() const
    {
        const auto &st = m_reconciler.stats();
        strafe::log::info(
            "[client] snapshots={} stale={} corrections={} snaps={} max_error={} resyncs={} last_seq={}", st.snapshots,
            st.stale, st.corrections, st.snaps, st.max_error, m_resyncs, m_predictor.last_seq());
    }

    float dt() const { return m_dt; }

private:
    coro::net::tcp::client &m_cli;
    uint32_t m_player_id;
    float m_dt;
    strafe::client::ClientPredictor m_predictor;
    strafe::client::Reconciler m_reconciler;
    strafe::client::SnapshotMirror m_mirror;
    strafe::Phase m_phase{strafe::Phase::lobby};
    bool m_seeded{false};
    bool m_alive{true};
    float m_heading{0.f};
    uint64_t m_steps{0};
    uint64_t m_resyncs{0};
};

coro::task<void> client_flow(std::shared_ptr<coro::io_scheduler> scheduler, ClientOptions opts)
{
    co_await scheduler->schedule();
    coro::net::tcp::client cli{
        scheduler, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = opts.port}};
    auto cstatus = co_await cli.connect(5s);
    if (cstatus != coro::net::connect_status::connected) {
        strafe::log::error("client connect failed");
        co_return;
    }
    strafe::log::info("client connected port={}", opts.port);

    strafe::wire::ClientMessage join;
    auto *jr = join.mutable_join();
    jr->set_token(opts.token);
    jr->set_room(opts.room);
    jr->set_display_name(opts.name);
    jr->set_ship_class(opts.ship_class);
    jr->set_client_version(STRAFE_VERSION);
    if (!co_await send_frame(cli, join))
        co_return;

    strafe::netutil::FrameParseState frames;
    uint32_t player_id = 0;
    uint32_t tick_rate = 20;
    auto wait_start = std::chrono::steady_clock::now();
    while (player_id == 0 && std::chrono::steady_clock::now() - wait_start < 10s) {
        if (!co_await pump_socket(cli, frames, 100ms))
            break;
        std::string payload;
        while (player_id == 0 && strafe::netutil::try_extract(frames, payload)) {
            strafe::wire::ServerMessage sm;
            if (!sm.ParseFromArray(payload.data(), static_cast<int>(payload.size())) || !sm.has_join_response())
                continue;
            const auto &resp = sm.join_response();
            if (!resp.success()) {
                strafe::log::error("join rejected reason={}", resp.reason());
                co_return;
            }
            player_id = resp.player_id();
            tick_rate = resp.tick_rate();
            strafe::log::info("joined room={} player_id={} name={}", resp.room(), player_id, resp.display_name());
        }
    }
    if (player_id == 0) {
        strafe::log::warn("Timeout waiting for join response");
        co_return;
    }

    Pilot pilot(cli, player_id, tick_rate);
    const auto step = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<float>(pilot.dt()));
    auto active_start = std::chrono::steady_clock::now();
    auto next_step = active_start;
    auto next_hb = active_start;
    bool connected = true;
    while (connected && std::chrono::steady_clock::now() - active_start < std::chrono::seconds(opts.active_secs)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= next_step) {
            connected = co_await pilot.fly();
            next_step += step;
        }
        if (connected && now >= next_hb) {
            strafe::wire::ClientMessage hb;
            hb.mutable_heartbeat()->set_time_ms(static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(now - active_start).count()));
            connected = co_await send_frame(cli, hb);
            next_hb = now + 2s;
        }
        if (!connected)
            break;
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_step - std::chrono::steady_clock::now());
        if (!co_await pump_socket(cli, frames, std::max(wait, std::chrono::milliseconds(1)))) {
            strafe::log::warn("server closed connection");
            break;
        }
        std::string payload;
        while (connected && strafe::netutil::try_extract(frames, payload)) {
            strafe::wire::ServerMessage sm;
            if (!sm.ParseFromArray(payload.data(), static_cast<int>(payload.size())))
                continue;
            connected = co_await pilot.handle(sm);
        }
    }
    pilot.report();
    if (connected) {
        strafe::wire::ClientMessage leave;
        leave.mutable_leave();
        co_await send_frame(cli, leave);
    }
    strafe::log::info("Active phase complete (secs={})", opts.active_secs);
}

} // namespace

int main(int argc, char **argv)
{
    strafe::log::init();
    ClientOptions opts;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--active-seconds" && i + 1 < argc) {
                opts.active_secs = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (a == "--room" && i + 1 < argc) {
                opts.room = argv[++i];
            } else if (a == "--name" && i + 1 < argc) {
                opts.name = argv[++i];
            } else if (a == "--token" && i + 1 < argc) {
                opts.token = argv[++i];
            } else if (a == "--ship" && i + 1 < argc) {
                std::string s = argv[++i];
                if (s == "tank")
                    opts.ship_class = strafe::wire::SHIP_TANK;
                else if (s == "rogue")
                    opts.ship_class = strafe::wire::SHIP_ROGUE;
                else
                    opts.ship_class = strafe::wire::SHIP_FIGHTER;
            } else if (!a.empty() && a[0] != '-') {
                opts.port = static_cast<uint16_t>(std::stoi(a));
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "invalid argument: " << e.what() << "\n";
        return 2;
    }
    if (const char *env_active = std::getenv("STRAFE_ACTIVE_SECS")) {
        try {
            opts.active_secs = static_cast<uint32_t>(std::stoul(env_active));
        } catch (const std::exception &) {
            strafe::log::warn("Invalid STRAFE_ACTIVE_SECS env value");
        }
    }
    auto scheduler = coro::default_executor::io_executor();
    coro::sync_wait(client_flow(scheduler, opts));
    return 0;
}
