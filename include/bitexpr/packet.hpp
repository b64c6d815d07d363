/**
 * @file packet.hpp
 * @brief Decoded packet tree.
 *
 * A packet is either a literal carrying a value or an operator over an
 * ordered list of sub-packets. The two payload shapes are held in a
 * std::variant so a packet can never carry both. Packets own their
 * children by value and are immutable once built.
 */

#ifndef BITEXPR_PACKET_HPP
#define BITEXPR_PACKET_HPP

#include <utility>
#include <variant>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "value.hpp"

namespace bitexpr {

/**
 * @brief Packet kinds, numbered by their 3-bit type code.
 */
enum class PacketKind : std::uint8_t {
    Sum = 0,
    Product = 1,
    Minimum = 2,
    Maximum = 3,
    Literal = 4,
    GreaterThan = 5,
    LessThan = 6,
    EqualTo = 7
};

/**
 * @brief Operator framing, numbered by the length-type flag bit.
 */
enum class LengthMode : std::uint8_t {
    BitCount = 0, ///< 15-bit total of sub-packet bits follows
    SubCount = 1  ///< 11-bit number of sub-packets follows
};

/**
 * @brief Map a 3-bit type code to its kind.
 *
 * Every code 0-7 is assigned, so only the low three bits are used.
 */
inline constexpr PacketKind kind_from_code(std::uint32_t code) noexcept {
    return static_cast<PacketKind>(code & 0x07U);
}

inline constexpr std::uint32_t kind_code(PacketKind kind) noexcept {
    return static_cast<std::uint32_t>(kind);
}

inline constexpr bool is_operator(PacketKind kind) noexcept {
    return kind != PacketKind::Literal;
}

/**
 * @brief True for the kinds that compare exactly two operands.
 */
inline constexpr bool is_comparison(PacketKind kind) noexcept {
    return kind == PacketKind::GreaterThan || kind == PacketKind::LessThan ||
           kind == PacketKind::EqualTo;
}

/**
 * @brief Get the display name of a kind.
 * @param kind Packet kind
 * @return Lower-case name ("sum", "literal", ...)
 */
const char* kind_name(PacketKind kind) noexcept;

class Packet;

/// Payload of a literal packet
struct LiteralBody {
    Value value;
};

/// Payload of an operator packet
struct OperatorBody {
    LengthMode mode;
    std::vector<Packet> children;
};

/**
 * @brief One node of a decoded packet tree.
 *
 * Built bottom-up by the parser (or by the encoder helpers) through the
 * make_literal() / make_operator() factories. bit_length() covers the
 * packet's own header and body plus every descendant.
 */
class Packet {
public:
    /**
     * @brief Default packet: version 0 literal with value 0 and no bits.
     */
    Packet() : version_(0), kind_(PacketKind::Literal), bit_length_(0), body_(LiteralBody{0}) {}

    /**
     * @brief Build a literal packet.
     *
     * @param version Version field (0-7)
     * @param value Literal value
     * @param bit_length Bits the packet occupies on the wire
     */
    static Packet make_literal(std::uint8_t version, Value value, std::size_t bit_length) {
        return Packet(version, PacketKind::Literal, bit_length, LiteralBody{std::move(value)});
    }

    /**
     * @brief Build an operator packet.
     *
     * A literal kind never gets an operator body, so kind() == Literal
     * always means is_literal().
     *
     * @param version Version field (0-7)
     * @param kind Operator kind
     * @param mode Framing the packet uses on the wire
     * @param children Sub-packets in order
     * @param bit_length Bits the packet occupies on the wire, children included
     * @param[out] packet Built packet; untouched on error
     * @return Error::Ok on success, Error::InvalidArg if @p kind is Literal
     */
    static Error make_operator(std::uint8_t version, PacketKind kind, LengthMode mode,
                               std::vector<Packet> children, std::size_t bit_length,
                               Packet& packet) {
        if (!is_operator(kind)) [[unlikely]] {
            return Error::InvalidArg;
        }
        packet = Packet(version, kind, bit_length, OperatorBody{mode, std::move(children)});
        return Error::Ok;
    }

    [[nodiscard]] std::uint8_t version() const noexcept { return version_; }

    [[nodiscard]] PacketKind kind() const noexcept { return kind_; }

    [[nodiscard]] std::size_t bit_length() const noexcept { return bit_length_; }

    [[nodiscard]] bool is_literal() const noexcept {
        return std::holds_alternative<LiteralBody>(body_);
    }

    /**
     * @brief Literal value.
     *
     * @pre is_literal()
     */
    [[nodiscard]] const Value& value() const {
        return std::get<LiteralBody>(body_).value;
    }

    /**
     * @brief Sub-packets (empty for a literal).
     */
    [[nodiscard]] const std::vector<Packet>& children() const noexcept;

    /**
     * @brief Framing of an operator packet (BitCount for a literal).
     */
    [[nodiscard]] LengthMode length_mode() const noexcept;

    /**
     * @brief Visit this packet and every descendant, pre-order.
     *
     * @param visit Callable taking const Packet&
     */
    template <typename Visitor> void for_each(Visitor&& visit) const {
        visit(*this);
        for (const Packet& child : children()) {
            child.for_each(visit);
        }
    }

    /**
     * @brief Number of packets in this tree, this one included.
     */
    [[nodiscard]] std::size_t packet_count() const;

    /**
     * @brief Structural equality: kind, version, value, framing, bit length
     *        and children all match.
     */
    friend bool operator==(const Packet& lhs, const Packet& rhs);

    friend bool operator!=(const Packet& lhs, const Packet& rhs) {
        return !(lhs == rhs);
    }

private:
    using Body = std::variant<LiteralBody, OperatorBody>;

    Packet(std::uint8_t version, PacketKind kind, std::size_t bit_length, Body body)
        : version_(version), kind_(kind), bit_length_(bit_length), body_(std::move(body)) {}

    std::uint8_t version_;
    PacketKind kind_;
    std::size_t bit_length_;
    Body body_;
};

} // namespace bitexpr

#endif // BITEXPR_PACKET_HPP
