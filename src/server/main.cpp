// SPDX-License-Identifier: Apache-2.0
// Entry point for the authoritative room server.
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/auth/identity_provider.hpp"
#include "server/config.hpp"
#include "server/game/room.hpp"
#include "server/net/listener.hpp"
#include "server/rooms/room_registry.hpp"
#include "server/rooms/session_manager.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <thread>

namespace strafe {
std::atomic_bool g_shutdown{false};
}

static coro::task<void> heartbeat_monitor(std::shared_ptr<coro::io_scheduler> sched, uint32_t timeout_sec)
{
    co_await sched->schedule();
    using clock = std::chrono::steady_clock;
    while (!strafe::g_shutdown.load()) {
        auto expired = strafe::rooms::instance().expired_sessions(clock::now(), std::chrono::seconds(timeout_sec));
        for (auto &s : expired) {
            strafe::log::warn("[hb] disconnect timeout session={} player={}", s->connection_id, s->player_id);
            strafe::rooms::instance().disconnect_session(s);
        }
        co_await sched->yield_for(std::chrono::seconds(1));
    }
    co_return;
}

static std::string runtime_metrics_json(const char *name)
{
    auto &rt = strafe::metrics::runtime();
    auto &snap = strafe::metrics::snapshot();
    uint64_t samples = rt.tick_samples.load();
    uint64_t avg_ns = samples ? rt.tick_duration_ns_accum.load() / samples : 0;
    std::ostringstream j;
    j << "{\"metric\":\"" << name << "\"";
    j << ",\"avg_tick_ns\":" << avg_ns;
    j << ",\"p99_tick_ns\":" << strafe::metrics::approx_tick_p99();
    j << ",\"tick_samples\":" << samples;
    j << ",\"dropped_steps\":" << rt.dropped_steps.load();
    j << ",\"active_rooms\":" << rt.active_rooms.load();
    j << ",\"connected_players\":" << rt.connected_players.load();
    j << ",\"projectiles_active\":" << rt.projectiles_active.load();
    j << ",\"rejected_messages\":" << rt.rejected_messages.load();
    j << ",\"auth_failures\":" << rt.auth_failures.load();
    j << ",\"room_faults\":" << rt.room_faults.load();
    j << ",\"full_bytes\":" << snap.full_bytes.load();
    j << ",\"delta_bytes\":" << snap.delta_bytes.load();
    j << ",\"full_count\":" << snap.full_count.load();
    j << ",\"delta_count\":" << snap.delta_count.load();
    j << ",\"backlog_drops\":" << snap.backlog_drops.load();
    j << "}";
    return j.str();
}

static void handle_signal(int)
{
    strafe::g_shutdown.store(true);
}

int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } catch (const std::exception &) {
                strafe::log::warn("Invalid --port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                strafe::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }

    strafe::ServerConfig cfg;
    try {
        cfg = strafe::load_server_config(config_path);
    } catch (const std::exception &ex) {
        strafe::log::error("Failed to load config '{}': {}", config_path, ex.what());
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Config supplies logging defaults; an explicit STRAFE_LOG_LEVEL in the environment wins.
    strafe::log::init();
    if (!cfg.log_level.empty() && std::getenv("STRAFE_LOG_LEVEL") == nullptr)
        strafe::log::set_level(cfg.log_level);
    if (cfg.log_json)
        strafe::log::set_json(true);
    strafe::log::info("strafe server starting (version: {})", STRAFE_VERSION);
    if (cli_port_override) {
        cfg.listen_port = port_override;
        strafe::log::info("CLI override: listen_port set to {}", cfg.listen_port);
    }
    if (duration_override_sec > 0)
        strafe::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);
    strafe::log::info("Tick rate: {} Hz", cfg.room.tick_rate);
    strafe::log::info("Listening on port: {}", cfg.listen_port);
    strafe::log::info("Auth mode: {}", cfg.auth_mode);
    strafe::log::info(
        "Level: {} ({} spawn points, {} collectibles)",
        cfg.level_path,
        cfg.room.level.spawn_points.size(),
        cfg.room.level.collectibles.size());

    std::unique_ptr<strafe::auth::IIdentityProvider> identity;
    try {
        identity = strafe::auth::make_provider(cfg.auth_mode, cfg.auth_stub_prefix);
    } catch (const std::exception &ex) {
        strafe::log::error("Invalid identity configuration: {}", ex.what());
        return 1;
    }
    strafe::auth::set_provider(identity.get());
    strafe::rooms::instance().set_max_backlog(cfg.room.max_outgoing_backlog);

    auto scheduler = coro::default_executor::io_executor();
    strafe::rooms::RoomRegistry registry(
        cfg.room,
        cfg.max_rooms,
        cfg.default_room,
        [](uint32_t player_id, const strafe::wire::ServerMessage &msg)
        { return strafe::rooms::instance().push_to_player(player_id, msg); },
        [scheduler](const std::shared_ptr<strafe::game::Room> &room)
        { scheduler->spawn(strafe::game::run_room(scheduler, room)); });
    strafe::rooms::set_registry(&registry);

    scheduler->spawn(strafe::net::run_listener(scheduler, cfg.listen_port, cfg.room.tick_rate, strafe::g_shutdown));
    scheduler->spawn(heartbeat_monitor(scheduler, cfg.heartbeat_timeout_seconds));

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!strafe::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto now = std::chrono::steady_clock::now();
        registry.retire_idle();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                strafe::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                strafe::g_shutdown.store(true);
            }
        }
        if (cfg.metrics_log_interval_seconds > 0
            && now - last_metrics >= std::chrono::seconds(cfg.metrics_log_interval_seconds)) {
            last_metrics = now;
            strafe::log::info("{}", runtime_metrics_json("runtime"));
        }
    }
    strafe::log::info("Signal or duration reached, shutting down...");
    registry.close_all();
    for (auto &s : strafe::rooms::instance().snapshot_all_sessions())
        strafe::rooms::instance().disconnect_session(s);
    // Give room and connection coroutines one pass to observe the close flags.
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    strafe::rooms::set_registry(nullptr);
    strafe::log::info("{}", runtime_metrics_json("runtime_final"));
    strafe::log::info("Shutdown complete.");
    return 0;
}
