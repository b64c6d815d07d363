/**
 * @file test_parser.cpp
 * @brief Unit tests for PacketParser.
 */

#include <catch2/catch.hpp>
#include <bitexpr/bitcursor.hpp>
#include <bitexpr/parser.hpp>

using namespace bitexpr;

/**
 * @brief Parse hex text, requiring the cursor to build.
 */
static Error parse_hex(const char* hex, Packet& packet, BitCursor& cursor) {
    REQUIRE(BitCursor::from_hex(hex, cursor) == Error::Ok);
    return parse_packet(cursor, packet);
}

TEST_CASE("Parse literal packet", "[parser]") {
    // 110 100 10111 11110 00101 000
    BitCursor cursor;
    Packet packet;
    REQUIRE(parse_hex("D2FE28", packet, cursor) == Error::Ok);

    REQUIRE(packet.is_literal());
    REQUIRE(packet.version() == 6);
    REQUIRE(packet.kind() == PacketKind::Literal);
    REQUIRE(packet.value() == 2021);
    REQUIRE(packet.bit_length() == 21);

    // Padding is left in the cursor
    REQUIRE(cursor.bits_consumed() == 21);
    REQUIRE(cursor.remaining() == 3);
}

TEST_CASE("Parse literal zero", "[parser]") {
    // 000 100 00000 + padding
    BitCursor cursor;
    Packet packet;
    REQUIRE(parse_hex("100", packet, cursor) == Error::Ok);

    REQUIRE(packet.value() == 0);
    REQUIRE(packet.bit_length() == 11);
}

TEST_CASE("Parse literal with leading zero groups", "[parser]") {
    // 000 100 10000 10000 00111: three groups, value 7
    BitCursor cursor;
    Packet packet;
    REQUIRE(parse_hex("121038", packet, cursor) == Error::Ok);

    REQUIRE(packet.value() == 7);
    REQUIRE(packet.bit_length() == 21);
}

TEST_CASE("Parse operator in bit-count mode", "[parser]") {
    BitCursor cursor;
    Packet packet;
    REQUIRE(parse_hex("38006F45291200", packet, cursor) == Error::Ok);

    REQUIRE_FALSE(packet.is_literal());
    REQUIRE(packet.version() == 1);
    REQUIRE(packet.kind() == PacketKind::LessThan);
    REQUIRE(packet.length_mode() == LengthMode::BitCount);
    REQUIRE(packet.children().size() == 2);

    const Packet& first = packet.children()[0];
    const Packet& second = packet.children()[1];
    REQUIRE(first.is_literal());
    REQUIRE(first.value() == 10);
    REQUIRE(first.bit_length() == 11);
    REQUIRE(second.is_literal());
    REQUIRE(second.value() == 20);
    REQUIRE(second.bit_length() == 16);

    // Header + flag + 15-bit count + children
    REQUIRE(packet.bit_length() == HEADER_BITS + 1 + 15 + first.bit_length() + second.bit_length());
    REQUIRE(packet.bit_length() == 49);
    REQUIRE(cursor.bits_consumed() == 49);
}

TEST_CASE("Parse operator in sub-count mode", "[parser]") {
    BitCursor cursor;
    Packet packet;
    REQUIRE(parse_hex("EE00D40C823060", packet, cursor) == Error::Ok);

    REQUIRE(packet.version() == 7);
    REQUIRE(packet.kind() == PacketKind::Maximum);
    REQUIRE(packet.length_mode() == LengthMode::SubCount);
    REQUIRE(packet.children().size() == 3);
    REQUIRE(packet.children()[0].value() == 1);
    REQUIRE(packet.children()[1].value() == 2);
    REQUIRE(packet.children()[2].value() == 3);
    REQUIRE(packet.children()[0].version() == 2);
    REQUIRE(packet.children()[1].version() == 4);
    REQUIRE(packet.children()[2].version() == 1);

    // Header + flag + 11-bit count + 3 x 11-bit literals
    REQUIRE(packet.bit_length() == 51);
    REQUIRE(cursor.bits_consumed() == 51);
}

TEST_CASE("Parse nested operators", "[parser]") {
    // greater-than(product(6, 7), 41), outer in bit-count mode
    BitCursor cursor;
    Packet packet;
    REQUIRE(parse_hex("7400E0980210C21D4924", packet, cursor) == Error::Ok);

    REQUIRE(packet.kind() == PacketKind::GreaterThan);
    REQUIRE(packet.version() == 3);
    REQUIRE(packet.children().size() == 2);

    const Packet& product = packet.children()[0];
    REQUIRE(product.kind() == PacketKind::Product);
    REQUIRE(product.length_mode() == LengthMode::SubCount);
    REQUIRE(product.children().size() == 2);
    REQUIRE(product.children()[0].value() == 6);
    REQUIRE(product.children()[1].value() == 7);
    REQUIRE(packet.children()[1].value() == 41);

    REQUIRE(packet.bit_length() == 78);
    REQUIRE(packet.packet_count() == 5);
}

TEST_CASE("Parsed bit_length matches cursor offsets", "[parser]") {
    const char* inputs[] = {"8A004A801A8002F478", "620080001611562C8802118E34",
                            "C0015000016115A2E0802F182340", "A0016C880162017C3686B18A3D4780",
                            "9C0141080250320F1802104A08"};

    for (const char* hex : inputs) {
        BitCursor cursor;
        REQUIRE(BitCursor::from_hex(hex, cursor) == Error::Ok);

        std::size_t before = cursor.bits_consumed();
        Packet packet;
        REQUIRE(parse_packet(cursor, packet) == Error::Ok);
        REQUIRE(packet.bit_length() == cursor.bits_consumed() - before);

        // Every operator's length is its own fields plus its children
        packet.for_each([](const Packet& p) {
            if (p.is_literal()) {
                return;
            }
            std::size_t children_bits = 0;
            for (const Packet& child : p.children()) {
                children_bits += child.bit_length();
            }
            std::size_t field = p.length_mode() == LengthMode::BitCount ? 15 : 11;
            REQUIRE(p.bit_length() == HEADER_BITS + 1 + field + children_bits);
        });
    }
}

TEST_CASE("Parse empty operators", "[parser]") {
    BitCursor cursor;
    Packet packet;

    SECTION("sub-count of zero") {
        REQUIRE(parse_hex("02000", packet, cursor) == Error::Ok);
        REQUIRE(packet.kind() == PacketKind::Sum);
        REQUIRE(packet.children().empty());
        REQUIRE(packet.bit_length() == 18);
    }

    SECTION("bit count of zero") {
        REQUIRE(parse_hex("000000", packet, cursor) == Error::Ok);
        REQUIRE(packet.kind() == PacketKind::Sum);
        REQUIRE(packet.children().empty());
        REQUIRE(packet.bit_length() == 22);
    }
}

TEST_CASE("Parse errors", "[parser]") {
    BitCursor cursor;
    Packet packet = Packet::make_literal(5, Value(99), 1);

    SECTION("declared bit count with no sub-packets") {
        // sum, I=0, 11 bits declared, then only padding
        REQUIRE(parse_hex("00002C", packet, cursor) == Error::UnexpectedEndOfStream);
    }

    SECTION("literal runs off the end") {
        REQUIRE(parse_hex("D2FE", packet, cursor) == Error::UnexpectedEndOfStream);
    }

    SECTION("header runs off the end") {
        REQUIRE(parse_hex("D", packet, cursor) == Error::UnexpectedEndOfStream);
    }

    SECTION("length field runs off the end") {
        // 000 000 0 + 9 of 15 count bits
        REQUIRE(parse_hex("0000", packet, cursor) == Error::UnexpectedEndOfStream);
    }

    SECTION("missing sub-packet in sub-count mode") {
        REQUIRE(parse_hex("02008408", packet, cursor) == Error::UnexpectedEndOfStream);
    }

    SECTION("single sub-packet overruns declared bits") {
        // declares 10 bits, child literal takes 11
        REQUIRE(parse_hex("000028408", packet, cursor) == Error::FramingMismatch);
    }

    SECTION("second sub-packet overruns declared bits") {
        // declares 15 bits, two 11-bit literals
        REQUIRE(parse_hex("00003C40882", packet, cursor) == Error::FramingMismatch);
    }

    // No partial tree is ever handed back
    REQUIRE(packet.version() == 5);
    REQUIRE(packet.value() == 99);
}

TEST_CASE("Parser reads consecutive packets", "[parser]") {
    // Two literals back to back: 110 100 00001 + 010 100 00010 + 00 padding
    BitCursor cursor;
    REQUIRE(BitCursor::from_hex("D02A08", cursor) == Error::Ok);

    PacketParser parser(cursor);
    Packet first;
    Packet second;
    REQUIRE(parser.parse(first) == Error::Ok);
    REQUIRE(parser.parse(second) == Error::Ok);

    REQUIRE(first.version() == 6);
    REQUIRE(first.value() == 1);
    REQUIRE(second.version() == 2);
    REQUIRE(second.value() == 2);
    REQUIRE(cursor.bits_consumed() == 22);
}
