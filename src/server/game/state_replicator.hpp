// SPDX-License-Identifier: Apache-2.0
// state_replicator.hpp - per-tick snapshot history and per-connection full / delta selection.
#pragma once
#include "common/snapshot_state.hpp"
#include "game.pb.h"

#include <cstdint>
#include <deque>
#include <map>
#include <optional>

namespace strafe::game {

class StateReplicator
{
public:
    explicit StateReplicator(uint32_t history_len);

    // Stores the view for this tick; the oldest view is evicted beyond history_len.
    void capture(snap::SnapshotState state);

    void add_connection(uint32_t player_id);
    void remove_connection(uint32_t player_id);

    // Acks are monotonic; acks for ticks never captured or older than the current baseline are ignored.
    void acknowledge(uint32_t player_id, uint32_t tick);

    // Drops the baseline so the next message for this connection is a full snapshot.
    void reset_baseline(uint32_t player_id);

    // Full snapshot when the connection has no baseline in history, delta otherwise.
    // Returns false when nothing has been captured yet or the connection is unknown.
    bool build_message(uint32_t player_id, strafe::wire::ServerMessage &out) const;

    std::optional<uint32_t> baseline(uint32_t player_id) const;
    const snap::SnapshotState *latest() const;
    const snap::SnapshotState *find(uint32_t tick) const;
    size_t connection_count() const { return m_acked.size(); }

private:
    uint32_t m_history_len;
    std::deque<snap::SnapshotState> m_history; // ascending tick
    std::map<uint32_t, std::optional<uint32_t>> m_acked;
};

} // namespace strafe::game
