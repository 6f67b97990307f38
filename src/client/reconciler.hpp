// SPDX-License-Identifier: Apache-2.0
// reconciler.hpp - compares authoritative positions with predictions and corrects the local ship.
#pragma once
#include "client/client_predictor.hpp"

#include <glm/glm.hpp>

#include <cstdint>

namespace strafe::client {

enum class ReconcileState : uint8_t
{
    predicted, // no authoritative comparison yet
    reconciling, // visual blend towards the corrected prediction in progress
    synced
};

struct ReconcileParams
{
    float threshold{0.5f}; // errors at or below are ignored
    float correction_window{0.2f}; // seconds of visual blend
    float snap_distance{20.f}; // errors above snap without blending
};

struct ReconcileStats
{
    uint64_t snapshots{0};
    uint64_t stale{0};
    uint64_t corrections{0};
    uint64_t snaps{0};
    float last_error{0.f};
    float max_error{0.f};
};

class Reconciler
{
public:
    explicit Reconciler(ClientPredictor &predictor, ReconcileParams params = {});

    // Feeds the authoritative position of the local ship at `server_tick`, which acknowledged `acked_seq`.
    // Returns false for stale / duplicate ticks.
    bool on_snapshot(uint32_t server_tick, uint32_t acked_seq, const glm::vec3 &server_position);

    // Advances the visual blend.
    void advance(float dt);

    glm::vec3 rendered_position() const;
    ReconcileState state() const { return m_state; }
    const ReconcileStats &stats() const { return m_stats; }
    uint32_t last_tick() const { return m_last_tick; }

private:
    ClientPredictor &m_predictor;
    ReconcileParams m_params;
    ReconcileState m_state{ReconcileState::predicted};
    uint32_t m_last_tick{0};
    bool m_have_tick{false};
    glm::vec3 m_blend_offset{0.f}; // visual minus predicted position when the blend started
    float m_blend_elapsed{0.f};
    ReconcileStats m_stats;
};

} // namespace strafe::client
