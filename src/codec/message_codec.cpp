#include <cstdio>
#include <huewire/codec.hpp>
#include <huewire/errors.hpp>
#include <huewire/logger.hpp>
#include <stdexcept>
#include <string>

#include "field_table.hpp"
#include "wire.hpp"

namespace huewire
{

static constexpr size_t FLAGS_SIZE = 2;

static std::string flags_to_string(uint16_t flags)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%04x", static_cast<unsigned>(flags));
    return buf;
}

size_t encoded_length(const LightUpdateMessage& msg)
{
    size_t length = FLAGS_SIZE;
    for (const auto& field : detail::field_table())
    {
        if (field.is_present(msg))
            length += detail::field_size(field, msg);
    }
    return length;
}

std::vector<uint8_t> encode_message(const LightUpdateMessage& msg, const CodecOptions& options)
{
    const size_t         length = encoded_length(msg);
    std::vector<uint8_t> out(length, 0);

    // Flags go in last, once every present field has been written.
    wire::ByteWriter writer(out, FLAGS_SIZE);
    uint16_t         flags = 0;
    for (const auto& field : detail::field_table())
    {
        if (!field.is_present(msg))
            continue;
        field.encode(msg, writer, options);
        flags |= field.flag;
    }

    if (writer.position() != length)
    {
        HUEWIRE_LOG_CRITICAL("codec",
                             "encoder wrote {} bytes, precomputed length was {}",
                             writer.position(),
                             length);
        throw std::logic_error("encoder wrote " + std::to_string(writer.position())
                               + " bytes, precomputed length was " + std::to_string(length));
    }

    wire::store_u16_le(out.data(), flags);

    HUEWIRE_LOG_DEBUG("codec", "encoded {} bytes, flags={}", length, flags_to_string(flags));
    return out;
}

LightUpdateMessage decode_message(std::span<const uint8_t> data, const CodecOptions& options)
{
    wire::ByteReader reader(data);
    const uint16_t   flags = reader.get_u16_le("flags");

    const uint16_t unknown = flags & static_cast<uint16_t>(~FLAG_KNOWN_MASK);
    if (unknown != 0)
    {
        if (options.reject_unknown_flags)
            throw FormatError("unknown flag bits " + flags_to_string(unknown));
        HUEWIRE_LOG_DEBUG("codec", "ignoring unknown flag bits {}", flags_to_string(unknown));
    }

    LightUpdateMessage msg;
    for (const auto& field : detail::field_table())
    {
        if ((flags & field.flag) == 0)
            continue;
        HUEWIRE_LOG_TRACE("codec", "{} at offset {}", field.name, reader.position());
        field.decode(reader, field.name, msg, options);
    }

    if (reader.remaining() != 0)
    {
        HUEWIRE_LOG_DEBUG("codec",
                          "{} trailing byte(s) after last field ignored",
                          reader.remaining());
    }
    HUEWIRE_LOG_DEBUG("codec", "decoded {} bytes, flags={}", data.size(), flags_to_string(flags));
    return msg;
}

std::optional<LightUpdateMessage> try_decode_message(std::span<const uint8_t> data,
                                                     const CodecOptions&      options)
{
    try
    {
        return decode_message(data, options);
    }
    catch (const Error& e)
    {
        HUEWIRE_LOG_WARN("codec", "rejected {}-byte message: {}", data.size(), e.what());
        return std::nullopt;
    }
}

}  // namespace huewire
