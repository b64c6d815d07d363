/**
 * @file encoder.hpp
 * @brief Packet encoding (inverse of the parser).
 *
 * Writes packet trees in the same wire format the parser reads:
 * - Literal values use the fewest 5-bit groups that hold them
 *   (value 0 is the single group '00000')
 * - Operators use the framing recorded in their length_mode()
 *
 * The literal_packet() / operator_packet() builders produce packets whose
 * bit_length() matches what encode_packet() writes, so encoding a built
 * tree and parsing it back gives an equal tree.
 */

#ifndef BITEXPR_ENCODER_HPP
#define BITEXPR_ENCODER_HPP

#include <string>
#include <vector>

#include "bitbuffer.hpp"
#include "config.hpp"
#include "error.hpp"
#include "packet.hpp"
#include "value.hpp"

namespace bitexpr {

/**
 * @brief Number of 5-bit groups the encoder uses for a literal value.
 *
 * @param value Non-negative value
 * @return ceil(significant bits / 4), at least 1
 */
std::size_t literal_groups(const Value& value);

/**
 * @brief Continuation-nibble encoding of a literal value.
 *
 * BIT_1(more) || BIT_4(nibble) per group, most significant nibble first.
 *
 * @param output Bit buffer to append to
 * @param value Non-negative value of any size
 * @return Error::Ok on success, Error::InvalidArg for a negative value
 */
Error encode_literal_body(BitBuffer& output, const Value& value);

/**
 * @brief Encode a packet tree.
 *
 * @param output Bit buffer to append to
 * @param packet Root packet
 * @return Error::Ok on success, Error::InvalidArg for a version above 7,
 *         Error::Overflow if a length field cannot hold its value
 */
Error encode_packet(BitBuffer& output, const Packet& packet);

/**
 * @brief Encode a packet tree as upper-case hex, zero-padded to a digit.
 *
 * @param packet Root packet
 * @param[out] hex Hex text
 * @return Error::Ok on success, see encode_packet()
 */
Error encode_hex(const Packet& packet, std::string& hex);

/**
 * @brief Build a literal packet with its encoded bit length.
 *
 * @param version Version field (0-7)
 * @param value Non-negative value
 * @param[out] packet Built packet
 * @return Error::Ok on success, Error::InvalidArg for a bad version or a
 *         negative value
 */
Error literal_packet(std::uint8_t version, Value value, Packet& packet);

/**
 * @brief Build an operator packet with its encoded bit length.
 *
 * @param version Version field (0-7)
 * @param kind Operator kind (not Literal)
 * @param mode Framing to use on the wire
 * @param children Sub-packets in order
 * @param[out] packet Built packet
 * @return Error::Ok on success, Error::InvalidArg for a bad version or kind,
 *         Error::Overflow if the children do not fit the length field
 */
Error operator_packet(std::uint8_t version, PacketKind kind, LengthMode mode,
                      std::vector<Packet> children, Packet& packet);

} // namespace bitexpr

#endif // BITEXPR_ENCODER_HPP
