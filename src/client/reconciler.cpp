// SPDX-License-Identifier: Apache-2.0
#include "client/reconciler.hpp"

#include "common/logger.hpp"

#include <algorithm>

namespace strafe::client {

namespace {

float smoothstep01(float t)
{
    t = std::clamp(t, 0.f, 1.f);
    return t * t * (3.f - 2.f * t);
}

} // namespace

Reconciler::Reconciler(ClientPredictor &predictor, ReconcileParams params) : m_predictor(predictor), m_params(params)
{}

glm::vec3 Reconciler::rendered_position() const
{
    glm::vec3 pos = m_predictor.current().position;
    if (m_state != ReconcileState::reconciling || m_params.correction_window <= 0.f)
        return pos;
    float w = 1.f - smoothstep01(m_blend_elapsed / m_params.correction_window);
    return pos + m_blend_offset * w;
}

bool Reconciler::on_snapshot(uint32_t server_tick, uint32_t acked_seq, const glm::vec3 &server_position)
{
    if (m_have_tick && server_tick <= m_last_tick) {
        ++m_stats.stale;
        return false;
    }
    m_have_tick = true;
    m_last_tick = server_tick;
    ++m_stats.snapshots;

    auto predicted = m_predictor.predicted_at(acked_seq);
    if (!predicted)
        return true; // acked input already evicted or nothing acked yet
    glm::vec3 offset = server_position - predicted->position;
    float error = glm::length(offset);
    m_stats.last_error = error;
    m_stats.max_error = std::max(m_stats.max_error, error);

    if (error <= m_params.threshold) {
        if (m_state != ReconcileState::reconciling)
            m_state = ReconcileState::synced;
        return true;
    }
    if (error > m_params.snap_distance) {
        m_predictor.rebase(offset, acked_seq);
        m_blend_offset = glm::vec3(0.f);
        m_blend_elapsed = 0.f;
        m_state = ReconcileState::synced;
        ++m_stats.snaps;
        strafe::log::debug("[reconcile] snap tick={} seq={} error={}", server_tick, acked_seq, error);
        return true;
    }
    glm::vec3 visual_before = rendered_position();
    m_predictor.rebase(offset, acked_seq);
    m_blend_offset = visual_before - m_predictor.current().position;
    m_blend_elapsed = 0.f;
    m_state = ReconcileState::reconciling;
    ++m_stats.corrections;
    strafe::log::debug("[reconcile] correct tick={} seq={} error={}", server_tick, acked_seq, error);
    return true;
}

void Reconciler::advance(float dt)
{
    if (m_state != ReconcileState::reconciling)
        return;
    m_blend_elapsed += dt;
    if (m_blend_elapsed >= m_params.correction_window) {
        m_blend_offset = glm::vec3(0.f);
        m_blend_elapsed = 0.f;
        m_state = ReconcileState::synced;
    }
}

} // namespace strafe::client
