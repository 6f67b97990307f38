// SPDX-License-Identifier: Apache-2.0
// simulation_clock.hpp - fixed-step accumulator driving a room's tick loop.
#pragma once
#include <chrono>
#include <cstdint>

namespace strafe::game {

class SimulationClock
{
public:
    using duration = std::chrono::nanoseconds;

    explicit SimulationClock(uint32_t tick_rate, uint32_t max_catch_up_steps = 5);

    // Adds real elapsed time and returns the number of fixed steps due (capped at max_catch_up_steps).
    // Time beyond the cap is discarded and reported through dropped_steps().
    uint32_t advance(duration elapsed);

    // Time left until the next step is due.
    duration until_next_step() const;

    duration step() const { return m_step; }
    float step_seconds() const { return m_step_seconds; }
    uint64_t dropped_steps() const { return m_dropped; }

private:
    duration m_step;
    float m_step_seconds;
    uint32_t m_max_catch_up;
    duration m_accumulator{0};
    uint64_t m_dropped{0};
};

} // namespace strafe::game
