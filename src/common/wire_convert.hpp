// SPDX-License-Identifier: Apache-2.0
// wire_convert.hpp - conversions between glm / domain enums and generated protobuf types.
#pragma once
#include "common/game_types.hpp"
#include "game.pb.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace strafe::wire_conv {

inline void to_wire(const glm::vec3 &v, strafe::wire::Vec3 *out)
{
    out->set_x(v.x);
    out->set_y(v.y);
    out->set_z(v.z);
}

inline void to_wire(const glm::quat &q, strafe::wire::Quat *out)
{
    out->set_x(q.x);
    out->set_y(q.y);
    out->set_z(q.z);
    out->set_w(q.w);
}

inline glm::vec3 from_wire(const strafe::wire::Vec3 &v)
{
    return {v.x(), v.y(), v.z()};
}

// glm::quat constructor order is (w, x, y, z)
inline glm::quat from_wire(const strafe::wire::Quat &q)
{
    return {q.w(), q.x(), q.y(), q.z()};
}

inline strafe::wire::ShipClass to_wire(ShipClass c)
{
    return static_cast<strafe::wire::ShipClass>(static_cast<int>(c));
}

inline strafe::wire::Phase to_wire(Phase p)
{
    return static_cast<strafe::wire::Phase>(static_cast<int>(p));
}

inline strafe::wire::Weapon to_wire(Weapon w)
{
    return static_cast<strafe::wire::Weapon>(static_cast<int>(w));
}

inline strafe::wire::CollectibleType to_wire(CollectibleType t)
{
    return static_cast<strafe::wire::CollectibleType>(static_cast<int>(t));
}

// from_wire for enums assumes the value already passed the generated *_IsValid check.
inline ShipClass from_wire(strafe::wire::ShipClass c)
{
    return static_cast<ShipClass>(static_cast<int>(c));
}

inline Phase from_wire(strafe::wire::Phase p)
{
    return static_cast<Phase>(static_cast<int>(p));
}

inline Weapon from_wire(strafe::wire::Weapon w)
{
    return static_cast<Weapon>(static_cast<int>(w));
}

inline CollectibleType from_wire(strafe::wire::CollectibleType t)
{
    return static_cast<CollectibleType>(static_cast<int>(t));
}

} // namespace strafe::wire_conv
