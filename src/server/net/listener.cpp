// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/framing.hpp"
#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "common/wire_convert.hpp"
#include "server/auth/identity_provider.hpp"
#include "server/game/room.hpp"
#include "server/net/intent_codec.hpp"
#include "server/rooms/room_registry.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <algorithm>
#include <chrono>
#include <span>
#include <string>
#include <vector>

namespace strafe::net {

using strafe::rooms::Session;

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<Session> session, uint32_t tick_rate);

coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, uint32_t tick_rate, const std::atomic_bool &stop)
{
    co_await scheduler->schedule();
    strafe::log::info("[listener] starting TCP listener on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (!stop.load()) {
        auto status = co_await server.poll(std::chrono::milliseconds(250));
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                auto session = strafe::rooms::instance().add_connection(std::move(client));
                strafe::log::debug("[listener] accepted {}", session->connection_id);
                scheduler->spawn(connection_loop(scheduler, session, tick_rate));
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            strafe::log::error("[listener] poll error/closed, exiting listener loop");
            co_return;
        }
    }
    strafe::log::info("[listener] stopped");
}

// Send all bytes of buffer; false on a socket error.
static coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

static void reply_join_failure(const std::shared_ptr<Session> &session, const std::string &reason)
{
    strafe::wire::ServerMessage sm;
    auto *resp = sm.mutable_join_response();
    resp->set_success(false);
    resp->set_reason(reason);
    strafe::rooms::instance().push_message(session, sm);
}

static void handle_join(const std::shared_ptr<Session> &session, const strafe::wire::JoinRequest &jr)
{
    auto &mgr = strafe::rooms::instance();
    if (mgr.player_of(session) != 0) {
        reply_join_failure(session, "already_joined");
        return;
    }
    auto *idp = strafe::auth::provider();
    auto *reg = strafe::rooms::registry();
    if (!idp || !reg) {
        reply_join_failure(session, "server_not_ready");
        return;
    }
    auto identity = idp->resolve(jr.token(), jr.display_name());
    if (!identity.ok) {
        strafe::metrics::runtime().auth_failures.fetch_add(1, std::memory_order_relaxed);
        strafe::log::warn("[conn] {} join rejected reason={}", session->connection_id, identity.reason);
        reply_join_failure(session, identity.reason);
        return;
    }
    if (!strafe::wire::ShipClass_IsValid(jr.ship_class())) {
        reply_join_failure(session, "invalid_ship_class");
        return;
    }
    auto ship = strafe::wire_conv::from_wire(jr.ship_class());
    auto result = reg->join(jr.room(), identity.display_name, ship);
    if (!result.ok) {
        strafe::log::warn("[conn] {} join room='{}' failed reason={}", session->connection_id, jr.room(), result.reason);
        reply_join_failure(session, result.reason);
        return;
    }
    // Queue the response before binding so it precedes the first snapshot routed to this player.
    strafe::wire::ServerMessage sm;
    auto *resp = sm.mutable_join_response();
    resp->set_success(true);
    resp->set_player_id(result.player_id);
    resp->set_room(result.room->name());
    resp->set_tick_rate(result.room->config().tick_rate);
    resp->set_display_name(identity.display_name);
    mgr.push_message(session, sm);
    mgr.bind_player(session, identity.user_id, identity.display_name, result.player_id, result.room);
    strafe::log::info(
        "[conn] {} joined room={} player={} user={} version={}",
        session->connection_id,
        result.room->name(),
        result.player_id,
        identity.user_id,
        jr.client_version());
}

void handle_client_message(const std::shared_ptr<Session> &session, const strafe::wire::ClientMessage &msg)
{
    auto &mgr = strafe::rooms::instance();
    if (msg.has_join()) {
        handle_join(session, msg.join());
        return;
    }
    if (msg.has_heartbeat()) {
        mgr.update_heartbeat(session);
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now().time_since_epoch())
                          .count();
        strafe::wire::ServerMessage hb;
        auto *hbr = hb.mutable_heartbeat_resp();
        hbr->set_client_time_ms(msg.heartbeat().time_ms());
        hbr->set_server_time_ms(static_cast<uint64_t>(now_ms));
        mgr.push_message(session, hb);
        return;
    }
    strafe::game::Intent intent;
    std::string reason;
    if (!decode_intent(msg, intent, reason)) {
        strafe::metrics::runtime().rejected_messages.fetch_add(1, std::memory_order_relaxed);
        STRAFE_LOG_EVERY_N(warn, 50, "[conn] {} undecodable message: {}", session->connection_id, reason);
        return;
    }
    if (std::holds_alternative<strafe::game::LeaveIntent>(intent)) {
        mgr.leave_room(session);
        return;
    }
    auto room = mgr.room_of(session);
    uint32_t player_id = mgr.player_of(session);
    if (!room || player_id == 0)
        return; // not in a room
    if (room->closed()) {
        strafe::log::warn("[conn] {} room {} closed, detaching", session->connection_id, room->name());
        mgr.leave_room(session);
        return;
    }
    room->post_intent(player_id, std::move(intent));
}

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<Session> session, uint32_t tick_rate)
{
    co_await scheduler->schedule();
    auto &mgr = strafe::rooms::instance();
    const auto poll_timeout = std::chrono::milliseconds(std::max<uint32_t>(5, 1000 / std::max<uint32_t>(tick_rate, 1) / 2));
    strafe::netutil::FrameParseState fps;
    std::string tmp(4096, '\0');
    while (!session->closing.load(std::memory_order_acquire)) {
        // Flush pending outbound first
        auto pending = mgr.drain_messages(session);
        if (!pending.empty()) {
            std::string batch;
            batch.reserve(pending.size() * 64);
            for (auto &msg : pending) {
                std::string out;
                if (!msg.SerializeToString(&out))
                    continue;
                strafe::netutil::append_frame(batch, out);
            }
            if (!co_await send_all(*session->client, std::span<const char>(batch.data(), batch.size()))) {
                strafe::log::warn("[conn] {} send failed", session->connection_id);
                break;
            }
        }
        auto pstat = co_await session->client->poll(coro::poll_op::read, poll_timeout);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat == coro::poll_status::error || pstat == coro::poll_status::closed)
            break;
        auto [rstatus, span] = session->client->recv(tmp);
        if (rstatus == coro::net::recv_status::closed) {
            strafe::log::info("[conn] {} closed by peer", session->connection_id);
            break;
        }
        if (rstatus != coro::net::recv_status::ok && rstatus != coro::net::recv_status::would_block) {
            strafe::log::warn("[conn] {} recv error", session->connection_id);
            break;
        }
        if (rstatus == coro::net::recv_status::ok)
            fps.buffer.insert(fps.buffer.end(), span.begin(), span.end());
        std::string payload;
        while (strafe::netutil::try_extract(fps, payload)) {
            strafe::wire::ClientMessage cmsg;
            if (!cmsg.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                strafe::metrics::runtime().rejected_messages.fetch_add(1, std::memory_order_relaxed);
                STRAFE_LOG_EVERY_N(warn, 50, "[conn] {} unparsable frame ({} bytes) dropped", session->connection_id, payload.size());
                continue;
            }
            handle_client_message(session, cmsg);
        }
        if (fps.corrupt) {
            strafe::log::warn("[conn] {} invalid frame length, closing", session->connection_id);
            break;
        }
    }
    mgr.disconnect_session(session);
    session->client.reset();
    strafe::log::debug("[conn] {} loop exit", session->connection_id);
    co_return;
}

} // namespace strafe::net
