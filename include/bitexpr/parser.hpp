/**
 * @file parser.hpp
 * @brief Recursive-descent packet parser.
 *
 * Reads exactly one packet (and, recursively, all of its sub-packets) from
 * the front of a BitCursor:
 * - Header: BIT_3(version) || BIT_3(type)
 * - Literal: groups of BIT_1(more) || BIT_4(nibble) until more = 0
 * - Operator, I = 0: BIT_15(total sub-packet bits) || sub-packets
 * - Operator, I = 1: BIT_11(sub-packet count) || sub-packets
 *
 * Bits after the packet are left in the cursor. Any framing error aborts
 * the whole parse and no packet is produced.
 */

#ifndef BITEXPR_PARSER_HPP
#define BITEXPR_PARSER_HPP

#include <vector>

#include "bitcursor.hpp"
#include "config.hpp"
#include "error.hpp"
#include "packet.hpp"

namespace bitexpr {

/**
 * @brief Packet parser bound to one cursor.
 *
 * Holds no state of its own beyond the cursor reference, so nested
 * packets are parsed by calling parse() again on the same instance.
 */
class PacketParser {
public:
    /**
     * @brief Bind the parser to a cursor.
     *
     * @param cursor Cursor positioned at the first bit of a packet
     */
    explicit PacketParser(BitCursor& cursor) noexcept : cursor_(cursor) {}

    /**
     * @brief Parse one packet tree.
     *
     * @param[out] packet Parsed packet; untouched unless Error::Ok is returned
     * @return Error::Ok on success, Error::UnexpectedEndOfStream if the input
     *         ends inside the packet, Error::FramingMismatch if sub-packets
     *         overrun a declared bit count
     */
    Error parse(Packet& packet);

private:
    /**
     * @brief Parse continuation-nibble groups into a value.
     */
    Error parse_literal_body(Value& value);

    /**
     * @brief Parse the length-type flag, length field and sub-packets.
     */
    Error parse_sub_packets(LengthMode& mode, std::vector<Packet>& children);

    BitCursor& cursor_;
};

/**
 * @brief Parse one packet tree from a cursor.
 *
 * @param cursor Cursor positioned at the first bit of a packet
 * @param[out] packet Parsed packet
 * @return Error::Ok on success, see PacketParser::parse()
 */
inline Error parse_packet(BitCursor& cursor, Packet& packet) {
    PacketParser parser(cursor);
    return parser.parse(packet);
}

} // namespace bitexpr

#endif // BITEXPR_PARSER_HPP
