// SPDX-License-Identifier: Apache-2.0
// physics.hpp - swept-sphere query consumed by the combat resolver and sphere overlap for pickups.
#pragma once
#include <glm/glm.hpp>

#include <optional>

namespace strafe::phys {

struct Sphere
{
    glm::vec3 center{0.f};
    float radius{0.f};
};

// Sweeps a sphere of `radius` from `from` to `to` against `target`.
// Returns the time of impact as a fraction of the segment in [0, 1], or nullopt when it misses.
// A sweep that starts overlapping the target reports 0.
std::optional<float> sweep_sphere(const glm::vec3 &from, const glm::vec3 &to, float radius, const Sphere &target);

bool spheres_overlap(const Sphere &a, const Sphere &b);

} // namespace strafe::phys
