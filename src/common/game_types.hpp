// SPDX-License-Identifier: Apache-2.0
// game_types.hpp - enums shared by the room server and the client library.
#pragma once

#include <cstdint>

namespace strafe {

enum class ShipClass : uint8_t
{
    fighter = 0,
    tank = 1,
    rogue = 2
};

enum class Phase : uint8_t
{
    lobby = 0,
    countdown = 1,
    playing = 2,
    results = 3
};

enum class Weapon : uint8_t
{
    laser = 0,
    missile = 1
};

enum class CollectibleType : uint8_t
{
    missile_refill = 0,
    laser_upgrade = 1
};

inline const char *phase_name(Phase p)
{
    switch (p) {
        case Phase::lobby:
            return "lobby";
        case Phase::countdown:
            return "countdown";
        case Phase::playing:
            return "playing";
        case Phase::results:
            return "results";
    }
    return "lobby";
}

inline const char *ship_class_name(ShipClass c)
{
    switch (c) {
        case ShipClass::fighter:
            return "fighter";
        case ShipClass::tank:
            return "tank";
        case ShipClass::rogue:
            return "rogue";
    }
    return "fighter";
}

} // namespace strafe
