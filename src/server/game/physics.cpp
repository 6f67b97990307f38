// SPDX-License-Identifier: Apache-2.0
#include "server/game/physics.hpp"

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/intersect.hpp>

namespace strafe::phys {

std::optional<float> sweep_sphere(const glm::vec3 &from, const glm::vec3 &to, float radius, const Sphere &target)
{
    // Moving sphere vs static sphere reduces to a ray against the target inflated by the mover radius.
    const float combined = radius + target.radius;
    const float combined2 = combined * combined;
    glm::vec3 start_offset = from - target.center;
    if (glm::dot(start_offset, start_offset) <= combined2)
        return 0.f;
    glm::vec3 segment = to - from;
    float length = glm::length(segment);
    if (length <= 1e-6f)
        return std::nullopt;
    glm::vec3 dir = segment / length;
    float distance = 0.f;
    if (!glm::intersectRaySphere(from, dir, target.center, combined2, distance))
        return std::nullopt;
    if (distance < 0.f || distance > length)
        return std::nullopt;
    return distance / length;
}

bool spheres_overlap(const Sphere &a, const Sphere &b)
{
    glm::vec3 d = a.center - b.center;
    float r = a.radius + b.radius;
    return glm::dot(d, d) <= r * r;
}

} // namespace strafe::phys
