#pragma once

#include <cstddef>
#include <cstdint>
#include <huewire/codec.hpp>
#include <huewire/message.hpp>
#include <span>

#include "wire.hpp"

namespace huewire::detail
{

// One row per optional field, in wire order. Encode, decode and
// encoded_length() all walk this table, so the field order lives here only.
struct FieldSpec
{
    uint16_t    flag;
    const char* name;  // used in decode error messages
    size_t      fixed_size;  // 0 for the variable-length gradient block

    bool (*is_present)(const LightUpdateMessage& msg);
    size_t (*variable_size)(const LightUpdateMessage& msg);  // null unless fixed_size == 0
    void (*encode)(const LightUpdateMessage& msg, wire::ByteWriter& out, const CodecOptions& opts);
    void (*decode)(wire::ByteReader&   in,
                   const char*         name,
                   LightUpdateMessage& msg,
                   const CodecOptions& opts);
};

std::span<const FieldSpec> field_table();

// Bytes `spec` occupies on the wire for `msg` (assumes the field is present).
inline size_t field_size(const FieldSpec& spec, const LightUpdateMessage& msg)
{
    return spec.fixed_size != 0 ? spec.fixed_size : spec.variable_size(msg);
}

}  // namespace huewire::detail
