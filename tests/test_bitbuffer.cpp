/**
 * @file test_bitbuffer.cpp
 * @brief Unit tests for BitBuffer class.
 */

#include <catch2/catch.hpp>
#include <bitexpr/bitbuffer.hpp>

using namespace bitexpr;

TEST_CASE("BitBuffer construction", "[bitbuffer]") {
    SECTION("default construction") {
        BitBuffer bb;
        REQUIRE(bb.size() == 0);
        REQUIRE(bb.empty());
        REQUIRE(bb.to_bytes().empty());
        REQUIRE(bb.to_value() == 0);
    }
}

TEST_CASE("BitBuffer append_bit", "[bitbuffer]") {
    BitBuffer bb;

    SECTION("append single bits") {
        bb.append_bit(1);
        REQUIRE(bb.size() == 1);

        bb.append_bit(0);
        bb.append_bit(1);
        bb.append_bit(1);
        REQUIRE(bb.size() == 4);
    }

    SECTION("append 8 bits and convert to bytes") {
        // 1010 0101 = 0xA5
        bb.append_bit(1);
        bb.append_bit(0);
        bb.append_bit(1);
        bb.append_bit(0);
        bb.append_bit(0);
        bb.append_bit(1);
        bb.append_bit(0);
        bb.append_bit(1);

        auto output = bb.to_bytes();
        REQUIRE(output.size() == 1);
        REQUIRE(output[0] == 0xA5);
    }
}

TEST_CASE("BitBuffer append_value", "[bitbuffer]") {
    BitBuffer bb;

    SECTION("append 4-bit values") {
        REQUIRE(bb.append_value(0xA, 4) == Error::Ok);
        REQUIRE(bb.append_value(0xB, 4) == Error::Ok);

        auto output = bb.to_bytes();
        REQUIRE(output.size() == 1);
        REQUIRE(output[0] == 0xAB);
    }

    SECTION("append unaligned values") {
        // 110 + 10111 + 1 = 1101 0111 1
        REQUIRE(bb.append_value(0b110, 3) == Error::Ok);
        REQUIRE(bb.append_value(0b10111, 5) == Error::Ok);
        REQUIRE(bb.append_value(1, 1) == Error::Ok);
        REQUIRE(bb.size() == 9);

        auto output = bb.to_bytes();
        REQUIRE(output.size() == 2);
        REQUIRE(output[0] == 0xD7);
        REQUIRE(output[1] == 0x80); // padded
    }

    SECTION("append 32-bit value") {
        REQUIRE(bb.append_value(0xDEADBEEF, 32) == Error::Ok);
        auto output = bb.to_bytes();
        REQUIRE(output.size() == 4);
        REQUIRE(output[0] == 0xDE);
        REQUIRE(output[3] == 0xEF);
    }

    SECTION("only low bits are kept") {
        REQUIRE(bb.append_value(0xFF, 3) == Error::Ok);
        REQUIRE(bb.size() == 3);
        REQUIRE(bb.to_value() == 7);
    }

    SECTION("invalid widths") {
        REQUIRE(bb.append_value(0, 0) == Error::InvalidArg);
        REQUIRE(bb.append_value(0, 33) == Error::InvalidArg);
        REQUIRE(bb.size() == 0);
    }
}

TEST_CASE("BitBuffer get_bit", "[bitbuffer]") {
    BitBuffer bb;
    REQUIRE(bb.append_value(0xA5, 8) == Error::Ok); // flushed byte
    REQUIRE(bb.append_value(0b101, 3) == Error::Ok); // pending bits

    REQUIRE(bb.get_bit(0) == 1);
    REQUIRE(bb.get_bit(1) == 0);
    REQUIRE(bb.get_bit(7) == 1);
    REQUIRE(bb.get_bit(8) == 1);
    REQUIRE(bb.get_bit(9) == 0);
    REQUIRE(bb.get_bit(10) == 1);
    REQUIRE(bb.get_bit(11) == -1);
}

TEST_CASE("BitBuffer append buffer", "[bitbuffer]") {
    BitBuffer head;
    BitBuffer tail;

    REQUIRE(head.append_value(0b101, 3) == Error::Ok);
    REQUIRE(tail.append_value(0xCD, 8) == Error::Ok);
    REQUIRE(tail.append_value(0b11, 2) == Error::Ok);

    head.append(tail);
    REQUIRE(head.size() == 13);

    // 101 1100 1101 11 -> 1011 1001 1011 1(000)
    auto output = head.to_bytes();
    REQUIRE(output.size() == 2);
    REQUIRE(output[0] == 0xB9);
    REQUIRE(output[1] == 0xB8);
}

TEST_CASE("BitBuffer to_value", "[bitbuffer]") {
    BitBuffer bb;

    SECTION("nibble chain 0111 1110 0101") {
        REQUIRE(bb.append_value(0b0111, 4) == Error::Ok);
        REQUIRE(bb.append_value(0b1110, 4) == Error::Ok);
        REQUIRE(bb.append_value(0b0101, 4) == Error::Ok);
        REQUIRE(bb.to_value() == 2021);
    }

    SECTION("wider than 64 bits") {
        // 0x1 followed by 20 zero nibbles = 2^80
        REQUIRE(bb.append_value(1, 4) == Error::Ok);
        for (int i = 0; i < 20; ++i) {
            REQUIRE(bb.append_value(0, 4) == Error::Ok);
        }

        Value expected = 1;
        expected <<= 80;
        REQUIRE(bb.to_value() == expected);
    }

    SECTION("leading zeros do not change the value") {
        REQUIRE(bb.append_value(0, 4) == Error::Ok);
        REQUIRE(bb.append_value(0, 4) == Error::Ok);
        REQUIRE(bb.append_value(0x9, 4) == Error::Ok);
        REQUIRE(bb.to_value() == 9);
    }
}

TEST_CASE("BitBuffer clear", "[bitbuffer]") {
    BitBuffer bb;
    REQUIRE(bb.append_value(0xFFFF, 16) == Error::Ok);
    bb.append_bit(1);
    REQUIRE(bb.size() == 17);

    bb.clear();
    REQUIRE(bb.size() == 0);
    REQUIRE(bb.to_bytes().empty());

    REQUIRE(bb.append_value(0x3, 2) == Error::Ok);
    REQUIRE(bb.to_value() == 3);
}
