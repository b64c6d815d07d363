/**
 * @file encoder.cpp
 * @brief Packet encoding.
 */

#include <bitexpr/encoder.hpp>
#include <bitexpr/hex.hpp>

#include <utility>

namespace bitexpr {

/**
 * @brief Width of the length field for a framing mode.
 */
static std::size_t length_field_bits(LengthMode mode) noexcept {
    return mode == LengthMode::BitCount ? BIT_COUNT_BITS : SUB_COUNT_BITS;
}

static Error encode_header(BitBuffer& output, std::uint8_t version, PacketKind kind) {
    if (version > MAX_VERSION) {
        return Error::InvalidArg;
    }

    auto result = output.append_value(version, VERSION_BITS);
    if (result != Error::Ok)
        return result;

    return output.append_value(kind_code(kind), TYPE_ID_BITS);
}

std::size_t literal_groups(const Value& value) {
    std::size_t bits = significant_bits(value);
    if (bits == 0) {
        return 1;
    }
    return (bits + NIBBLE_BITS - 1) / NIBBLE_BITS;
}

Error encode_literal_body(BitBuffer& output, const Value& value) {
    if (value < 0) {
        return Error::InvalidArg;
    }

    std::size_t groups = literal_groups(value);

    // Most significant nibble first; every group but the last sets 'more'
    for (std::size_t i = groups; i > 0; --i) {
        unsigned shift = static_cast<unsigned>((i - 1) * NIBBLE_BITS);
        Value bits = (value >> shift) & 0x0F;
        std::uint32_t nibble = bits.convert_to<std::uint32_t>();
        std::uint32_t more = (i > 1) ? 1U : 0U;

        auto result = output.append_value((more << NIBBLE_BITS) | nibble, GROUP_BITS);
        if (result != Error::Ok)
            return result;
    }

    return Error::Ok;
}

Error encode_packet(BitBuffer& output, const Packet& packet) {
    auto result = encode_header(output, packet.version(), packet.kind());
    if (result != Error::Ok)
        return result;

    if (packet.is_literal()) {
        return encode_literal_body(output, packet.value());
    }

    const auto& children = packet.children();

    if (packet.length_mode() == LengthMode::SubCount) {
        if (children.size() > MAX_SUB_COUNT) {
            return Error::Overflow;
        }

        result = output.append_value(1U, LENGTH_TYPE_BITS);
        if (result != Error::Ok)
            return result;

        result = output.append_value(static_cast<std::uint32_t>(children.size()), SUB_COUNT_BITS);
        if (result != Error::Ok)
            return result;

        for (const Packet& child : children) {
            result = encode_packet(output, child);
            if (result != Error::Ok)
                return result;
        }
        return Error::Ok;
    }

    // Bit-count mode: the total is only known once the children are written
    BitBuffer body;
    for (const Packet& child : children) {
        result = encode_packet(body, child);
        if (result != Error::Ok)
            return result;
    }

    if (body.size() > MAX_BIT_COUNT) {
        return Error::Overflow;
    }

    result = output.append_value(0U, LENGTH_TYPE_BITS);
    if (result != Error::Ok)
        return result;

    result = output.append_value(static_cast<std::uint32_t>(body.size()), BIT_COUNT_BITS);
    if (result != Error::Ok)
        return result;

    output.append(body);
    return Error::Ok;
}

Error encode_hex(const Packet& packet, std::string& hex) {
    BitBuffer bits;
    auto result = encode_packet(bits, packet);
    if (result != Error::Ok)
        return result;

    hex = bytes_to_hex(bits.to_bytes(), bits.size());
    return Error::Ok;
}

Error literal_packet(std::uint8_t version, Value value, Packet& packet) {
    if (version > MAX_VERSION || value < 0) {
        return Error::InvalidArg;
    }

    std::size_t bit_length = HEADER_BITS + (literal_groups(value) * GROUP_BITS);
    packet = Packet::make_literal(version, std::move(value), bit_length);
    return Error::Ok;
}

Error operator_packet(std::uint8_t version, PacketKind kind, LengthMode mode,
                      std::vector<Packet> children, Packet& packet) {
    if (version > MAX_VERSION || !is_operator(kind)) {
        return Error::InvalidArg;
    }

    std::size_t children_bits = 0;
    for (const Packet& child : children) {
        children_bits += child.bit_length();
    }

    if (mode == LengthMode::BitCount && children_bits > MAX_BIT_COUNT) {
        return Error::Overflow;
    }
    if (mode == LengthMode::SubCount && children.size() > MAX_SUB_COUNT) {
        return Error::Overflow;
    }

    std::size_t bit_length = HEADER_BITS + LENGTH_TYPE_BITS + length_field_bits(mode) + children_bits;
    return Packet::make_operator(version, kind, mode, std::move(children), bit_length, packet);
}

} // namespace bitexpr
