// SPDX-License-Identifier: Apache-2.0
#include "server/game/phase_controller.hpp"

#include "common/logger.hpp"

namespace strafe::game {

namespace {

void enter(WorldState &world, Phase to, float timer, EventList &events)
{
    Phase from = world.phase;
    world.phase = to;
    world.phase_timer = timer;
    events.push_back({world.tick, PhaseChangedEvent{from, to, timer, world.winner_id}});
    strafe::log::info(
        "[phase] {} -> {} tick={} timer={} winner={}",
        phase_name(from),
        phase_name(to),
        world.tick,
        timer,
        world.winner_id);
}

void reset_for_match(WorldState &world, const RoomConfig &cfg)
{
    for (auto &[id, p] : world.players)
        reset_player_for_match(p, cfg);
    world.projectiles.clear();
    reset_collectibles(world);
    world.winner_id = 0;
}

} // namespace

uint32_t compute_winner(const WorldState &world)
{
    uint32_t winner = 0;
    uint32_t best = 0;
    bool any = false;
    for (const auto &[id, p] : world.players) {
        // map order is ascending id, so strict > keeps the lowest id on ties
        if (!any || p.kills > best) {
            winner = id;
            best = p.kills;
            any = true;
        }
    }
    return winner;
}

Rejection request_restart(WorldState &world, const RoomConfig &cfg, const std::string &token)
{
    if (cfg.admin_token.empty() || token != cfg.admin_token)
        return Rejection::bad_token;
    if (world.phase != Phase::results)
        return Rejection::wrong_phase;
    world.restart_requested = true;
    return Rejection::none;
}

void update_phase(WorldState &world, const RoomConfig &cfg, float dt, EventList &events)
{
    const size_t players = world.players.size();
    switch (world.phase) {
        case Phase::lobby:
            world.phase_timer = 0.f;
            if (players >= cfg.min_players)
                enter(world, Phase::countdown, cfg.countdown_seconds, events);
            break;
        case Phase::countdown:
            if (players < cfg.min_players) {
                enter(world, Phase::lobby, 0.f, events);
                break;
            }
            world.phase_timer -= dt;
            if (world.phase_timer <= 0.f) {
                reset_for_match(world, cfg);
                enter(world, Phase::playing, cfg.match_seconds, events);
            }
            break;
        case Phase::playing: {
            world.phase_timer -= dt;
            bool score_reached = false;
            if (cfg.score_limit > 0) {
                for (const auto &[id, p] : world.players) {
                    if (p.kills >= cfg.score_limit) {
                        score_reached = true;
                        break;
                    }
                }
            }
            if (score_reached || world.phase_timer <= 0.f) {
                world.winner_id = compute_winner(world);
                world.projectiles.clear();
                enter(world, Phase::results, cfg.results_seconds, events);
            }
            break;
        }
        case Phase::results:
            world.phase_timer -= dt;
            if (world.restart_requested || world.phase_timer <= 0.f) {
                world.restart_requested = false;
                world.winner_id = 0;
                enter(world, Phase::lobby, 0.f, events);
            }
            break;
    }
    if (world.phase_timer < 0.f)
        world.phase_timer = 0.f;
}

} // namespace strafe::game
