// SPDX-License-Identifier: Apache-2.0
#include "server/game/simulation_clock.hpp"

#include "common/metrics.hpp"

#include <algorithm>

namespace strafe::game {

SimulationClock::SimulationClock(uint32_t tick_rate, uint32_t max_catch_up_steps)
    // Round to the nearest nanosecond so e.g. 30 Hz does not drift by integer truncation.
    : m_step((1'000'000'000ull + tick_rate / 2) / std::max<uint32_t>(tick_rate, 1)),
      m_step_seconds(1.f / static_cast<float>(std::max<uint32_t>(tick_rate, 1))),
      m_max_catch_up(std::max<uint32_t>(max_catch_up_steps, 1))
{}

uint32_t SimulationClock::advance(duration elapsed)
{
    if (elapsed.count() > 0)
        m_accumulator += elapsed;
    uint64_t due = static_cast<uint64_t>(m_accumulator / m_step);
    m_accumulator -= m_step * static_cast<int64_t>(due);
    if (due > m_max_catch_up) {
        uint64_t dropped = due - m_max_catch_up;
        m_dropped += dropped;
        strafe::metrics::runtime().dropped_steps.fetch_add(dropped, std::memory_order_relaxed);
        due = m_max_catch_up;
    }
    return static_cast<uint32_t>(due);
}

SimulationClock::duration SimulationClock::until_next_step() const
{
    return m_step - m_accumulator;
}

} // namespace strafe::game
