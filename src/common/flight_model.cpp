// SPDX-License-Identifier: Apache-2.0
#include "common/flight_model.hpp"

#include <algorithm>
#include <cmath>

namespace strafe::flight {

void integrate(ShipKinematics &ship, const glm::vec3 &thrust, const FlightParams &params, float dt)
{
    float thrust_len2 = glm::dot(thrust, thrust);
    if (thrust_len2 > 1e-8f)
        ship.velocity += (thrust / std::sqrt(thrust_len2)) * params.acceleration * dt;
    float speed2 = glm::dot(ship.velocity, ship.velocity);
    if (speed2 > params.max_speed * params.max_speed)
        ship.velocity *= params.max_speed / std::sqrt(speed2);
    ship.velocity *= std::pow(params.drag, dt * 60.f);
    ship.position += ship.velocity * dt;
    for (int axis = 0; axis < 3; ++axis) {
        float lim = params.half_extents[axis];
        if (ship.position[axis] > lim) {
            ship.position[axis] = lim;
            ship.velocity[axis] = std::min(ship.velocity[axis], 0.f);
        } else if (ship.position[axis] < -lim) {
            ship.position[axis] = -lim;
            ship.velocity[axis] = std::max(ship.velocity[axis], 0.f);
        }
    }
}

bool within_bounds(const glm::vec3 &position, const glm::vec3 &half_extents)
{
    return std::fabs(position.x) <= half_extents.x && std::fabs(position.y) <= half_extents.y
        && std::fabs(position.z) <= half_extents.z;
}

bool within_speed_cap(const glm::vec3 &velocity, float max_speed, float tolerance)
{
    float cap = max_speed * (1.f + tolerance);
    return glm::dot(velocity, velocity) <= cap * cap;
}

bool is_finite(const glm::vec3 &v)
{
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

bool is_finite(const glm::quat &q)
{
    return std::isfinite(q.x) && std::isfinite(q.y) && std::isfinite(q.z) && std::isfinite(q.w);
}

} // namespace strafe::flight
