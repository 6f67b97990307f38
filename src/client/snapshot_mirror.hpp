// SPDX-License-Identifier: Apache-2.0
// snapshot_mirror.hpp - client-side reconstruction of the replicated world from full and delta snapshots.
#pragma once
#include "common/snapshot_state.hpp"
#include "game.pb.h"

#include <cstdint>
#include <deque>

namespace strafe::client {

enum class MirrorResult : uint8_t
{
    applied,
    stale, // tick not newer than the last applied one; dropped
    needs_resync // base missing or payload malformed; request a full snapshot
};

class SnapshotMirror
{
public:
    explicit SnapshotMirror(size_t history_len = 32);

    // Accepts snapshot / delta_snapshot messages; any other payload is reported as stale.
    MirrorResult apply(const strafe::wire::ServerMessage &msg);
    MirrorResult apply_full(const strafe::wire::StateSnapshot &snapshot);
    MirrorResult apply_delta(const strafe::wire::DeltaSnapshot &delta);

    const snap::SnapshotState *current() const;
    const snap::SnapshotState *find(uint32_t tick) const;
    uint32_t last_tick() const;

private:
    bool is_stale(uint32_t tick) const;
    void push(snap::SnapshotState state);

    size_t m_history_len;
    std::deque<snap::SnapshotState> m_history; // ascending tick
};

} // namespace strafe::client
