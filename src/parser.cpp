/**
 * @file parser.cpp
 * @brief PacketParser implementation.
 */

#include <bitexpr/parser.hpp>

#include <utility>

namespace bitexpr {

Error PacketParser::parse(Packet& packet) {
    const std::size_t start = cursor_.bits_consumed();

    // ====================================================================
    // Header: BIT_3(version) || BIT_3(type)
    // ====================================================================

    std::uint32_t version = 0;
    auto status = cursor_.read(VERSION_BITS, version);
    if (status != Error::Ok) {
        return status;
    }

    std::uint32_t type_code = 0;
    status = cursor_.read(TYPE_ID_BITS, type_code);
    if (status != Error::Ok) {
        return status;
    }

    PacketKind kind = kind_from_code(type_code);

    // ====================================================================
    // Body
    // ====================================================================

    if (!is_operator(kind)) {
        Value value;
        status = parse_literal_body(value);
        if (status != Error::Ok) {
            return status;
        }

        packet = Packet::make_literal(static_cast<std::uint8_t>(version), std::move(value),
                                      cursor_.bits_consumed() - start);
        return Error::Ok;
    }

    LengthMode mode = LengthMode::BitCount;
    std::vector<Packet> children;
    status = parse_sub_packets(mode, children);
    if (status != Error::Ok) {
        return status;
    }

    return Packet::make_operator(static_cast<std::uint8_t>(version), kind, mode,
                                 std::move(children), cursor_.bits_consumed() - start, packet);
}

Error PacketParser::parse_literal_body(Value& value) {
    // Nibbles are concatenated most significant first
    BitBuffer nibbles;

    std::uint32_t more = 1;
    while (more != 0) {
        auto status = cursor_.read(GROUP_FLAG_BITS, more);
        if (status != Error::Ok) {
            return status;
        }

        std::uint32_t nibble = 0;
        status = cursor_.read(NIBBLE_BITS, nibbles, nibble);
        if (status != Error::Ok) {
            return status;
        }
    }

    value = nibbles.to_value();
    return Error::Ok;
}

Error PacketParser::parse_sub_packets(LengthMode& mode, std::vector<Packet>& children) {
    std::uint32_t length_type = 0;
    auto status = cursor_.read(LENGTH_TYPE_BITS, length_type);
    if (status != Error::Ok) {
        return status;
    }

    if (length_type == 0) {
        // Bit-count mode: children must fill the declared bits exactly
        mode = LengthMode::BitCount;

        std::uint32_t total_bits = 0;
        status = cursor_.read(BIT_COUNT_BITS, total_bits);
        if (status != Error::Ok) {
            return status;
        }

        std::size_t consumed = 0;
        while (consumed < total_bits) {
            const std::size_t before = cursor_.bits_consumed();

            Packet child;
            status = parse(child);
            if (status != Error::Ok) {
                return status;
            }

            consumed += cursor_.bits_consumed() - before;
            if (consumed > total_bits) {
                return Error::FramingMismatch;
            }
            children.push_back(std::move(child));
        }
        return Error::Ok;
    }

    // Sub-count mode: exactly sub_count children, no length check
    mode = LengthMode::SubCount;

    std::uint32_t sub_count = 0;
    status = cursor_.read(SUB_COUNT_BITS, sub_count);
    if (status != Error::Ok) {
        return status;
    }

    children.reserve(sub_count);
    for (std::uint32_t i = 0; i < sub_count; ++i) {
        Packet child;
        status = parse(child);
        if (status != Error::Ok) {
            return status;
        }
        children.push_back(std::move(child));
    }
    return Error::Ok;
}

} // namespace bitexpr
