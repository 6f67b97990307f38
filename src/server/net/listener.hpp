// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "game.pb.h"
#include "server/rooms/session_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

namespace strafe::net {

// Starts the TCP accept loop on the given port; returns when `stop` is set.
// The read poll timeout inside each connection loop is derived from tick_rate to
// keep outbound flush latency bounded relative to simulation ticks.
coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, uint32_t tick_rate, const std::atomic_bool &stop);

// Handles one decoded client message for a session: join, heartbeat, leave or a room intent.
// Replies are queued on the session. Exposed for in-process tests.
void handle_client_message(const std::shared_ptr<strafe::rooms::Session> &session, const strafe::wire::ClientMessage &msg);

} // namespace strafe::net
