#pragma once

#include <huewire/codec.hpp>
#include <huewire/color.hpp>
#include <huewire/config.hpp>
#include <huewire/errors.hpp>
#include <huewire/hex.hpp>
#include <huewire/logger.hpp>
#include <huewire/message.hpp>

// ─── Usage ───────────────────────────────────────────────────────────────────
//
//   huewire::LightUpdateMessage msg;
//   msg.is_on      = true;
//   msg.brightness = 200;
//   auto bytes = huewire::encode_message(msg);          // {0x03, 0x00, 0x01, 0xc8}
//   auto back  = huewire::decode_message(bytes);
//   std::string hex = huewire::bytes_to_hex(bytes);     // "0300" "01c8"
