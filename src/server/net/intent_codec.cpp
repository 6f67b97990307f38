// SPDX-License-Identifier: Apache-2.0
#include "server/net/intent_codec.hpp"

#include "common/wire_convert.hpp"

#include <type_traits>

namespace strafe::net {

using namespace strafe::wire_conv;

bool decode_intent(const strafe::wire::ClientMessage &msg, strafe::game::Intent &out, std::string &reason)
{
    using strafe::wire::ClientMessage;
    switch (msg.payload_case()) {
        case ClientMessage::kInput: {
            const auto &in = msg.input();
            if (!in.has_position() || !in.has_rotation() || !in.has_velocity()) {
                reason = "input missing position/rotation/velocity";
                return false;
            }
            out = strafe::game::MoveIntent{
                in.seq(), from_wire(in.position()), from_wire(in.rotation()), from_wire(in.velocity())};
            return true;
        }
        case ClientMessage::kFire: {
            const auto &f = msg.fire();
            if (!strafe::wire::Weapon_IsValid(f.weapon()) || !f.has_position() || !f.has_direction()) {
                reason = "fire missing weapon/position/direction";
                return false;
            }
            out = strafe::game::FireIntent{from_wire(f.weapon()), from_wire(f.position()), from_wire(f.direction())};
            return true;
        }
        case ClientMessage::kMissileUpdate: {
            const auto &u = msg.missile_update();
            if (!u.has_position() || !u.has_direction()) {
                reason = "missile_update missing position/direction";
                return false;
            }
            out = strafe::game::MissileUpdateIntent{
                u.projectile_id(), from_wire(u.position()), from_wire(u.direction())};
            return true;
        }
        case ClientMessage::kChat:
            out = strafe::game::ChatIntent{msg.chat().text()};
            return true;
        case ClientMessage::kSnapshotAck:
            out = strafe::game::AckIntent{msg.snapshot_ack().server_tick()};
            return true;
        case ClientMessage::kResync:
            out = strafe::game::ResyncIntent{msg.resync().last_applied_tick()};
            return true;
        case ClientMessage::kAdminRestart:
            out = strafe::game::RestartIntent{msg.admin_restart().admin_token()};
            return true;
        case ClientMessage::kLeave:
            out = strafe::game::LeaveIntent{};
            return true;
        case ClientMessage::kJoin:
        case ClientMessage::kHeartbeat:
            reason = "session message";
            return false;
        case ClientMessage::PAYLOAD_NOT_SET:
            break;
    }
    reason = "empty payload";
    return false;
}

void encode_event(const strafe::game::GameEvent &ev, strafe::wire::ServerMessage &out)
{
    std::visit(
        [&](const auto &e)
        {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, strafe::game::HitEvent>) {
                auto *m = out.mutable_hit();
                m->set_server_tick(ev.tick);
                m->set_target_id(e.target_id);
                m->set_attacker_id(e.attacker_id);
                m->set_amount(e.amount);
                m->set_health(e.health);
                m->set_projectile_id(e.projectile_id);
            } else if constexpr (std::is_same_v<T, strafe::game::KillEvent>) {
                auto *m = out.mutable_kill();
                m->set_server_tick(ev.tick);
                m->set_killer_id(e.killer_id);
                m->set_victim_id(e.victim_id);
            } else if constexpr (std::is_same_v<T, strafe::game::RespawnEvent>) {
                auto *m = out.mutable_respawn();
                m->set_server_tick(ev.tick);
                m->set_player_id(e.player_id);
                to_wire(e.position, m->mutable_position());
            } else if constexpr (std::is_same_v<T, strafe::game::PhaseChangedEvent>) {
                auto *m = out.mutable_phase_changed();
                m->set_server_tick(ev.tick);
                m->set_from(to_wire(e.from));
                m->set_to(to_wire(e.to));
                m->set_phase_timer(e.phase_timer);
                m->set_winner_id(e.winner_id);
            } else if constexpr (std::is_same_v<T, strafe::game::PickupEvent>) {
                auto *m = out.mutable_pickup();
                m->set_server_tick(ev.tick);
                m->set_player_id(e.player_id);
                m->set_collectible_id(e.collectible_id);
                m->set_type(to_wire(e.type));
            } else if constexpr (std::is_same_v<T, strafe::game::ChatEvent>) {
                auto *m = out.mutable_chat();
                m->set_player_id(e.player_id);
                m->set_name(e.name);
                m->set_text(e.text);
            }
        },
        ev.payload);
}

} // namespace strafe::net
