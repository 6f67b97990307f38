// SPDX-License-Identifier: Apache-2.0
#include "client/snapshot_mirror.hpp"

#include "common/logger.hpp"

#include <algorithm>

namespace strafe::client {

SnapshotMirror::SnapshotMirror(size_t history_len) : m_history_len(std::max<size_t>(history_len, 1)) {}

const snap::SnapshotState *SnapshotMirror::current() const
{
    return m_history.empty() ? nullptr : &m_history.back();
}

const snap::SnapshotState *SnapshotMirror::find(uint32_t tick) const
{
    for (const auto &s : m_history) {
        if (s.tick == tick)
            return &s;
    }
    return nullptr;
}

uint32_t SnapshotMirror::last_tick() const
{
    return m_history.empty() ? 0 : m_history.back().tick;
}

bool SnapshotMirror::is_stale(uint32_t tick) const
{
    return !m_history.empty() && tick <= m_history.back().tick;
}

void SnapshotMirror::push(snap::SnapshotState state)
{
    m_history.push_back(std::move(state));
    while (m_history.size() > m_history_len)
        m_history.pop_front();
}

MirrorResult SnapshotMirror::apply(const strafe::wire::ServerMessage &msg)
{
    if (msg.has_snapshot())
        return apply_full(msg.snapshot());
    if (msg.has_delta_snapshot())
        return apply_delta(msg.delta_snapshot());
    return MirrorResult::stale;
}

MirrorResult SnapshotMirror::apply_full(const strafe::wire::StateSnapshot &snapshot)
{
    if (is_stale(snapshot.server_tick()))
        return MirrorResult::stale;
    snap::SnapshotState state;
    if (!snap::decode_full(snapshot, state)) {
        strafe::log::warn("[mirror] malformed full snapshot tick={}", snapshot.server_tick());
        return MirrorResult::needs_resync;
    }
    push(std::move(state));
    return MirrorResult::applied;
}

MirrorResult SnapshotMirror::apply_delta(const strafe::wire::DeltaSnapshot &delta)
{
    if (is_stale(delta.server_tick()))
        return MirrorResult::stale;
    const snap::SnapshotState *base = find(delta.base_tick());
    if (!base) {
        strafe::log::debug("[mirror] delta tick={} base={} missing", delta.server_tick(), delta.base_tick());
        return MirrorResult::needs_resync;
    }
    snap::SnapshotState next;
    if (!snap::apply_delta(*base, delta, next)) {
        strafe::log::warn("[mirror] malformed delta tick={} base={}", delta.server_tick(), delta.base_tick());
        return MirrorResult::needs_resync;
    }
    push(std::move(next));
    return MirrorResult::applied;
}

} // namespace strafe::client
