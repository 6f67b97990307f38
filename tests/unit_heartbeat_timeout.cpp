// SPDX-License-Identifier: Apache-2.0
#include "server/rooms/session_manager.hpp"

#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <cassert>
#include <iostream>

int main()
{
    auto sched = coro::io_scheduler::make_shared();
    // Dummy tcp client (never connected); only session bookkeeping is exercised.
    coro::net::tcp::client dummy{sched};
    auto &mgr = strafe::rooms::instance();
    auto s = mgr.add_connection(std::move(dummy));
    auto fresh = mgr.add_detached();
    const auto now = std::chrono::steady_clock::now();
    s->last_heartbeat = now - std::chrono::seconds(20);
    fresh->last_heartbeat = now - std::chrono::seconds(5);

    auto expired = mgr.expired_sessions(now, std::chrono::seconds(15));
    assert(expired.size() == 1 && expired.front() == s);

    mgr.update_heartbeat(s);
    assert(mgr.expired_sessions(std::chrono::steady_clock::now(), std::chrono::seconds(15)).empty());

    // Invoke disconnect_session as the monitor would
    s->last_heartbeat = now - std::chrono::hours(1);
    for (auto &x : mgr.expired_sessions(now, std::chrono::seconds(15)))
        mgr.disconnect_session(x);
    assert(s->closing.load());
    assert(!fresh->closing.load());
    for (auto &x : mgr.snapshot_all_sessions())
        assert(x != s);
    std::cout << "unit_heartbeat_timeout OK" << std::endl;
    return 0;
}
