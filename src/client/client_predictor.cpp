// SPDX-License-Identifier: Apache-2.0
#include "client/client_predictor.hpp"

#include "common/wire_convert.hpp"

#include <algorithm>

namespace strafe::client {

namespace {

glm::vec3 clamp_to_box(const glm::vec3 &p, const glm::vec3 &half)
{
    return glm::clamp(p, -half, half);
}

} // namespace

ClientPredictor::ClientPredictor(strafe::flight::FlightParams params, size_t history_len)
    : m_params(params), m_history_len(std::max<size_t>(history_len, 1))
{}

void ClientPredictor::reset(const strafe::flight::ShipKinematics &state)
{
    m_state = state;
    m_history.clear();
}

strafe::wire::InputCommand ClientPredictor::apply_input(const glm::vec3 &thrust, const glm::quat &rotation, float dt)
{
    m_state.rotation = rotation;
    strafe::flight::integrate(m_state, thrust, m_params, dt);
    PredictedInput entry{m_next_seq++, m_state};
    m_history.push_back(entry);
    while (m_history.size() > m_history_len)
        m_history.pop_front();

    strafe::wire::InputCommand cmd;
    cmd.set_seq(entry.seq);
    strafe::wire_conv::to_wire(m_state.position, cmd.mutable_position());
    strafe::wire_conv::to_wire(m_state.rotation, cmd.mutable_rotation());
    strafe::wire_conv::to_wire(m_state.velocity, cmd.mutable_velocity());
    return cmd;
}

std::optional<strafe::flight::ShipKinematics> ClientPredictor::predicted_at(uint32_t seq) const
{
    auto it = std::lower_bound(
        m_history.begin(), m_history.end(), seq, [](const PredictedInput &p, uint32_t s) { return p.seq < s; });
    if (it == m_history.end() || it->seq != seq)
        return std::nullopt;
    return it->state;
}

void ClientPredictor::rebase(const glm::vec3 &offset, uint32_t from_seq)
{
    while (!m_history.empty() && m_history.front().seq < from_seq)
        m_history.pop_front();
    for (auto &entry : m_history)
        entry.state.position = clamp_to_box(entry.state.position + offset, m_params.half_extents);
    m_state.position = clamp_to_box(m_state.position + offset, m_params.half_extents);
}

} // namespace strafe::client
