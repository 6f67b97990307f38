// SPDX-License-Identifier: Apache-2.0
// flight_model.hpp - ship movement integration shared by client prediction and server bound checks.
#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace strafe::flight {

struct FlightParams
{
    float acceleration{45.f}; // units / s^2 while thrusting
    float max_speed{135.f}; // units / s
    float drag{0.97f}; // velocity retention per 1/60 s
    glm::vec3 half_extents{600.f, 300.f, 600.f}; // playable box centered at origin
};

struct ShipKinematics
{
    glm::vec3 position{0.f};
    glm::quat rotation{1.f, 0.f, 0.f, 0.f};
    glm::vec3 velocity{0.f};
};

// Advance one step. `thrust` is a world-space direction (any length, zero = coast).
// Position is clamped to the playable box; velocity components pushing outward are cancelled.
void integrate(ShipKinematics &ship, const glm::vec3 &thrust, const FlightParams &params, float dt);

bool within_bounds(const glm::vec3 &position, const glm::vec3 &half_extents);

// Speed cap with a relative tolerance for float drift between client and server.
bool within_speed_cap(const glm::vec3 &velocity, float max_speed, float tolerance);

bool is_finite(const glm::vec3 &v);
bool is_finite(const glm::quat &q);

} // namespace strafe::flight
