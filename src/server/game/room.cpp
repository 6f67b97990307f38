// SPDX-License-Identifier: Apache-2.0
#include "server/game/room.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/collectible_spawner.hpp"
#include "server/game/combat_resolver.hpp"
#include "server/game/phase_controller.hpp"
#include "server/game/shield_regenerator.hpp"
#include "server/net/intent_codec.hpp"

#include <chrono>

namespace strafe::game {

Room::Room(std::string name, RoomConfig cfg, DeliverFn deliver)
    : m_name(std::move(name)), m_cfg(std::move(cfg)), m_deliver(std::move(deliver)), m_ingestor(m_cfg),
      m_replicator(m_cfg.snapshot_history), m_clock(m_cfg.tick_rate, m_cfg.max_catch_up_steps)
{
    init_world(m_world, m_cfg);
}

void Room::post_join(uint32_t player_id, std::string display_name, ShipClass ship_class)
{
    std::scoped_lock lk{m_mail_mutex};
    m_mailbox.push_back({player_id, JoinCommand{std::move(display_name), ship_class}});
    m_members.fetch_add(1, std::memory_order_relaxed);
}

void Room::post_intent(uint32_t player_id, Intent intent)
{
    std::scoped_lock lk{m_mail_mutex};
    m_mailbox.push_back({player_id, std::move(intent)});
}

void Room::post_leave(uint32_t player_id)
{
    std::scoped_lock lk{m_mail_mutex};
    m_mailbox.push_back({player_id, Intent{LeaveIntent{}}});
    if (m_members.load(std::memory_order_relaxed) > 0)
        m_members.fetch_sub(1, std::memory_order_relaxed);
}

void Room::handle_mail(Mail &mail)
{
    if (auto *join = std::get_if<JoinCommand>(&mail.body)) {
        Player *p = add_player(m_world, m_cfg, mail.player_id, std::move(join->name), join->ship_class);
        if (!p) {
            strafe::log::warn("[room] {} duplicate join player={}", m_name, mail.player_id);
            return;
        }
        m_replicator.add_connection(mail.player_id);
        strafe::log::info(
            "[room] {} join player={} name={} class={} players={}",
            m_name,
            p->id,
            p->name,
            ship_class_name(p->ship_class),
            m_world.players.size());
        return;
    }
    handle_intent(mail.player_id, std::get<Intent>(mail.body));
}

void Room::handle_intent(uint32_t player_id, const Intent &intent)
{
    if (std::holds_alternative<LeaveIntent>(intent)) {
        if (remove_player(m_world, player_id)) {
            m_ingestor.forget(player_id);
            m_replicator.remove_connection(player_id);
            strafe::log::info("[room] {} leave player={} players={}", m_name, player_id, m_world.players.size());
        }
        return;
    }
    if (auto *ack = std::get_if<AckIntent>(&intent)) {
        m_replicator.acknowledge(player_id, ack->server_tick);
        return;
    }
    if (auto *resync = std::get_if<ResyncIntent>(&intent)) {
        strafe::log::debug(
            "[room] {} resync player={} last_applied={}", m_name, player_id, resync->last_applied_tick);
        m_replicator.reset_baseline(player_id);
        return;
    }
    if (auto *restart = std::get_if<RestartIntent>(&intent)) {
        auto r = request_restart(m_world, m_cfg, restart->admin_token);
        if (r != Rejection::none) {
            strafe::metrics::runtime().rejected_messages.fetch_add(1, std::memory_order_relaxed);
            strafe::log::warn("[room] {} admin restart rejected player={} reason={}", m_name, player_id, rejection_name(r));
        } else {
            strafe::log::info("[room] {} admin restart accepted player={}", m_name, player_id);
        }
        return;
    }
    // Rejections are counted and logged by the ingestor.
    (void)m_ingestor.submit(m_world, player_id, intent);
}

void Room::step()
{
    const float dt = m_clock.step_seconds();
    ++m_world.tick;
    m_world.sim_time += static_cast<double>(dt);

    std::vector<Mail> mail;
    {
        std::scoped_lock lk{m_mail_mutex};
        mail.swap(m_mailbox);
    }
    for (auto &m : mail)
        handle_mail(m);

    EventList events;
    m_ingestor.apply_pending(m_world, events);
    resolve_combat(m_world, m_cfg, dt, events);
    regenerate_shields(m_world, m_cfg, dt);
    update_collectibles(m_world, m_cfg, dt, events);
    update_phase(m_world, m_cfg, dt, events);

    m_replicator.capture(capture(m_world));
    replicate(events);
}

void Room::replicate(const EventList &events)
{
    if (!m_deliver)
        return;
    std::vector<strafe::wire::ServerMessage> event_msgs;
    event_msgs.reserve(events.size());
    for (const auto &ev : events) {
        strafe::wire::ServerMessage sm;
        strafe::net::encode_event(ev, sm);
        event_msgs.push_back(std::move(sm));
    }
    for (const auto &[player_id, p] : m_world.players) {
        strafe::wire::ServerMessage sm;
        if (!m_replicator.build_message(player_id, sm))
            continue;
        size_t bytes = sm.ByteSizeLong();
        if (sm.has_delta_snapshot())
            strafe::metrics::add_delta(bytes);
        else
            strafe::metrics::add_full(bytes);
        bool ok = m_deliver(player_id, sm);
        for (const auto &em : event_msgs)
            ok = m_deliver(player_id, em) && ok;
        if (!ok) {
            strafe::metrics::snapshot().backlog_drops.fetch_add(1, std::memory_order_relaxed);
            STRAFE_LOG_EVERY_N(warn, 20, "[room] {} backlog overflow player={}, forcing full snapshot", m_name, player_id);
            m_replicator.reset_baseline(player_id);
        }
    }
}

coro::task<void> run_room(std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<Room> room)
{
    co_await scheduler->schedule();
    using clock = std::chrono::steady_clock;
    strafe::metrics::runtime().active_rooms.fetch_add(1, std::memory_order_relaxed);
    strafe::log::info("[room] {} start tick_rate={}", room->name(), room->config().tick_rate);
    auto last = clock::now();
    while (!room->closed()) {
        auto now = clock::now();
        uint32_t due = room->clock().advance(std::chrono::duration_cast<SimulationClock::duration>(now - last));
        last = now;
        for (uint32_t i = 0; i < due && !room->closed(); ++i) {
            auto tick_start = clock::now();
            try {
                room->step();
            } catch (const std::exception &ex) {
                strafe::metrics::runtime().room_faults.fetch_add(1, std::memory_order_relaxed);
                strafe::log::error("[room] {} fault at tick={}: {}; closing room", room->name(), room->world().tick, ex.what());
                room->close();
                break;
            }
            auto tick_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - tick_start).count();
            strafe::metrics::add_tick_duration(static_cast<uint64_t>(tick_ns));
            strafe::metrics::runtime().projectiles_active.store(
                room->world().projectiles.size(), std::memory_order_relaxed);
        }
        if (room->closed())
            break;
        co_await scheduler->yield_for(room->clock().until_next_step());
    }
    strafe::metrics::runtime().active_rooms.fetch_sub(1, std::memory_order_relaxed);
    strafe::log::info("[room] {} stopped at tick={}", room->name(), room->world().tick);
    co_return;
}

} // namespace strafe::game
