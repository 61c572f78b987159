#pragma once

#include <cstdint>
#include <huewire/color.hpp>
#include <huewire/message.hpp>
#include <optional>
#include <span>
#include <vector>

namespace huewire
{

// Knobs for the places where the wire format leaves room for policy.
struct CodecOptions
{
    // Decode: flag bits 9..15 carry no field. By default they are ignored so
    // newer senders stay readable; when set, they raise FormatError.
    bool reject_unknown_flags = false;

    // Decode: effect bytes outside the Effect list are stored as-is by
    // default; when set, they raise FormatError.
    bool strict_effects = false;

    // Encode: how gradient scale/offset values off the 1/8 grid are handled.
    GradientParamRounding gradient_param_rounding = GradientParamRounding::Reject;

    bool operator==(const CodecOptions&) const = default;
};

// Exact number of bytes encode_message() produces for `msg`.
size_t encoded_length(const LightUpdateMessage& msg);

// Serialize the present fields.
// Throws RangeError for brightness outside [1, 254], more than 15 gradient
// colors, gradient params outside [0, 31.875] (or off-grid under
// GradientParamRounding::Reject) and non-finite colors.
std::vector<uint8_t> encode_message(const LightUpdateMessage& msg,
                                    const CodecOptions&       options = {});

// Parse a full message. Throws LengthError if the buffer ends early and
// FormatError for an inconsistent gradient block (or, under strict options,
// unknown flags/effects). Never returns a partially filled message.
LightUpdateMessage decode_message(std::span<const uint8_t> data,
                                  const CodecOptions&      options = {});

// Same as decode_message() but reports rejection as std::nullopt and logs
// the reason at warning level.
std::optional<LightUpdateMessage> try_decode_message(std::span<const uint8_t> data,
                                                     const CodecOptions&      options = {});

}  // namespace huewire
