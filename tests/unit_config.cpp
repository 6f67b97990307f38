// SPDX-License-Identifier: Apache-2.0
// Runs from the source directory so the shipped config files are loaded as-is.
#include "server/config.hpp"

#include <yaml-cpp/yaml.h>

#include <cassert>
#include <iostream>
#include <stdexcept>

template <typename Fn>
static bool throws_runtime(Fn fn)
{
    try {
        fn();
    } catch (const std::runtime_error &) {
        return true;
    }
    return false;
}

int main()
{
    // Shipped configuration
    strafe::ServerConfig cfg = strafe::load_server_config("config/server.yaml");
    assert(cfg.listen_port == 40001);
    assert(cfg.default_room == "main");
    assert(cfg.auth_mode == "disabled");
    assert(cfg.room.tick_rate == 20);
    assert(cfg.room.min_players == 2);
    assert(cfg.room.laser.damage == 25.f);
    assert(cfg.room.laser.fire_interval == 0.2f && cfg.room.missile.fire_interval == 1.f);
    assert(cfg.room.move_slack == 1.f);
    assert(cfg.room.ship(strafe::ShipClass::tank).max_health == 150.f);
    assert(cfg.room.ship(strafe::ShipClass::rogue).max_speed == 160.f);
    assert(cfg.room.map_half_extents == glm::vec3(600.f, 300.f, 600.f));
    // level path resolves next to server.yaml
    assert(cfg.level_path.find("config") != std::string::npos);
    assert(cfg.room.level.spawn_points.size() == 8);
    assert(cfg.room.level.collectibles.size() == 5);
    assert(cfg.room.level.collectibles[3].type == strafe::CollectibleType::laser_upgrade);

    // Partial overrides keep the remaining values of the base
    strafe::RoomConfig base;
    base.score_limit = 7;
    auto rc = strafe::parse_room_config(YAML::Load("tick_rate: 30\nlaser: { damage: 40 }\nships: { tank: { max_missiles: 2 } }"), base);
    assert(rc.tick_rate == 30);
    assert(rc.laser.damage == 40.f && rc.laser.speed == base.laser.speed);
    assert(rc.ship(strafe::ShipClass::tank).max_missiles == 2);
    assert(rc.ship(strafe::ShipClass::tank).max_health == 150.f);
    assert(rc.score_limit == 7);

    // Range checks
    assert(throws_runtime([] { strafe::parse_room_config(YAML::Load("tick_rate: 0")); }));
    assert(throws_runtime([] { strafe::parse_room_config(YAML::Load("snapshot_history: 0")); }));
    assert(throws_runtime([] { strafe::parse_room_config(YAML::Load("map_half_extents: [1, 2]")); }));
    assert(throws_runtime([] { strafe::parse_room_config(YAML::Load("ships: { rogue: { max_speed: 0 } }")); }));
    assert(throws_runtime([] { strafe::parse_room_config(YAML::Load("missile: { fire_interval: -1 }")); }));
    assert(throws_runtime([] { strafe::parse_room_config(YAML::Load("move_slack: -0.5")); }));

    // Level parsing
    auto level = strafe::parse_level(YAML::Load(
        "collectibles:\n  - { type: laser_upgrade, position: [1, 2, 3] }\n  - { type: missile_refill, position: [4, 5, 6] }"));
    assert(level.spawn_points.size() == 1 && level.spawn_points[0] == glm::vec3(0.f));
    assert(level.collectibles[0].id == 1 && level.collectibles[1].id == 2);
    assert(level.collectibles[1].position == glm::vec3(4.f, 5.f, 6.f));
    assert(throws_runtime([] { strafe::parse_level(YAML::Load("collectibles:\n  - { type: shield, position: [0, 0, 0] }")); }));

    // Unreadable file
    bool bad_file = false;
    try {
        strafe::load_server_config("config/does_not_exist.yaml");
    } catch (const YAML::Exception &) {
        bad_file = true;
    }
    assert(bad_file);

    std::cout << "unit_config OK" << std::endl;
    return 0;
}
