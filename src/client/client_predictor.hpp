// SPDX-License-Identifier: Apache-2.0
// client_predictor.hpp - local-ship prediction with an input history keyed by sequence number.
#pragma once
#include "common/flight_model.hpp"
#include "game.pb.h"

#include <cstdint>
#include <deque>
#include <optional>

namespace strafe::client {

struct PredictedInput
{
    uint32_t seq{0};
    strafe::flight::ShipKinematics state; // result after applying this input
};

class ClientPredictor
{
public:
    explicit ClientPredictor(strafe::flight::FlightParams params = {}, size_t history_len = 256);

    void reset(const strafe::flight::ShipKinematics &state);

    // Integrates one input step immediately and returns the command to send to the server.
    strafe::wire::InputCommand apply_input(const glm::vec3 &thrust, const glm::quat &rotation, float dt);

    std::optional<strafe::flight::ShipKinematics> predicted_at(uint32_t seq) const;

    // Shifts the current state and predictions from `from_seq` onwards by `offset`; older entries are dropped.
    void rebase(const glm::vec3 &offset, uint32_t from_seq);

    const strafe::flight::ShipKinematics &current() const { return m_state; }
    uint32_t last_seq() const { return m_next_seq - 1; }
    const strafe::flight::FlightParams &params() const { return m_params; }
    size_t history_size() const { return m_history.size(); }

private:
    strafe::flight::FlightParams m_params;
    size_t m_history_len;
    strafe::flight::ShipKinematics m_state;
    std::deque<PredictedInput> m_history; // ascending seq
    uint32_t m_next_seq{1};
};

} // namespace strafe::client
