// SPDX-License-Identifier: Apache-2.0
#include "server/game/state_replicator.hpp"

#include <algorithm>

namespace strafe::game {

StateReplicator::StateReplicator(uint32_t history_len) : m_history_len(std::max<uint32_t>(history_len, 1)) {}

void StateReplicator::capture(snap::SnapshotState state)
{
    m_history.push_back(std::move(state));
    while (m_history.size() > m_history_len)
        m_history.pop_front();
}

void StateReplicator::add_connection(uint32_t player_id)
{
    m_acked[player_id] = std::nullopt;
}

void StateReplicator::remove_connection(uint32_t player_id)
{
    m_acked.erase(player_id);
}

const snap::SnapshotState *StateReplicator::latest() const
{
    return m_history.empty() ? nullptr : &m_history.back();
}

const snap::SnapshotState *StateReplicator::find(uint32_t tick) const
{
    auto it = std::lower_bound(
        m_history.begin(), m_history.end(), tick, [](const snap::SnapshotState &s, uint32_t t) { return s.tick < t; });
    if (it == m_history.end() || it->tick != tick)
        return nullptr;
    return &*it;
}

void StateReplicator::acknowledge(uint32_t player_id, uint32_t tick)
{
    auto it = m_acked.find(player_id);
    if (it == m_acked.end())
        return;
    const auto *newest = latest();
    if (!newest || tick > newest->tick)
        return;
    if (it->second && tick <= *it->second)
        return;
    if (!find(tick))
        return;
    it->second = tick;
}

void StateReplicator::reset_baseline(uint32_t player_id)
{
    auto it = m_acked.find(player_id);
    if (it != m_acked.end())
        it->second = std::nullopt;
}

std::optional<uint32_t> StateReplicator::baseline(uint32_t player_id) const
{
    auto it = m_acked.find(player_id);
    if (it == m_acked.end())
        return std::nullopt;
    return it->second;
}

bool StateReplicator::build_message(uint32_t player_id, strafe::wire::ServerMessage &out) const
{
    const auto *current = latest();
    auto it = m_acked.find(player_id);
    if (!current || it == m_acked.end())
        return false;
    const snap::SnapshotState *base = it->second ? find(*it->second) : nullptr;
    if (base && base->tick < current->tick) {
        snap::encode_delta(*base, *current, *out.mutable_delta_snapshot());
    } else {
        snap::encode_full(*current, *out.mutable_snapshot());
    }
    return true;
}

} // namespace strafe::game
