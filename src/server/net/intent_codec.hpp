// SPDX-License-Identifier: Apache-2.0
// intent_codec.hpp - boundary translation between protobuf messages and room intents / events.
#pragma once
#include "game.pb.h"
#include "server/game/events.hpp"

#include <string>

namespace strafe::net {

// Decodes a gameplay ClientMessage into an intent. Join and heartbeat are session-level and are
// not intents; for those (and malformed payloads) false is returned with `reason` set.
bool decode_intent(const strafe::wire::ClientMessage &msg, strafe::game::Intent &out, std::string &reason);

void encode_event(const strafe::game::GameEvent &ev, strafe::wire::ServerMessage &out);

} // namespace strafe::net
