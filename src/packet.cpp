/**
 * @file packet.cpp
 * @brief Packet accessors and comparison.
 */

#include <bitexpr/packet.hpp>

namespace bitexpr {

const char* kind_name(PacketKind kind) noexcept {
    switch (kind) {
    case PacketKind::Sum:
        return "sum";
    case PacketKind::Product:
        return "product";
    case PacketKind::Minimum:
        return "minimum";
    case PacketKind::Maximum:
        return "maximum";
    case PacketKind::Literal:
        return "literal";
    case PacketKind::GreaterThan:
        return "greater-than";
    case PacketKind::LessThan:
        return "less-than";
    case PacketKind::EqualTo:
        return "equal-to";
    default:
        return "unknown";
    }
}

const std::vector<Packet>& Packet::children() const noexcept {
    static const std::vector<Packet> no_children;

    if (const auto* op = std::get_if<OperatorBody>(&body_)) {
        return op->children;
    }
    return no_children;
}

LengthMode Packet::length_mode() const noexcept {
    if (const auto* op = std::get_if<OperatorBody>(&body_)) {
        return op->mode;
    }
    return LengthMode::BitCount;
}

std::size_t Packet::packet_count() const {
    std::size_t count = 0;
    for_each([&count](const Packet&) { ++count; });
    return count;
}

bool operator==(const Packet& lhs, const Packet& rhs) {
    if (lhs.version_ != rhs.version_ || lhs.kind_ != rhs.kind_ ||
        lhs.bit_length_ != rhs.bit_length_ || lhs.is_literal() != rhs.is_literal()) {
        return false;
    }

    if (lhs.is_literal()) {
        return lhs.value() == rhs.value();
    }

    if (lhs.length_mode() != rhs.length_mode()) {
        return false;
    }

    const auto& left = lhs.children();
    const auto& right = rhs.children();
    if (left.size() != right.size()) {
        return false;
    }
    for (std::size_t i = 0; i < left.size(); ++i) {
        if (left[i] != right[i]) {
            return false;
        }
    }
    return true;
}

} // namespace bitexpr
