/**
 * @file bitcursor.hpp
 * @brief Sequential bit reading over a decoded input stream.
 *
 * The bit cursor owns the complete input bit sequence and a read offset.
 * It is the only mutable state while a packet tree is being parsed, reading
 * MSB-first within each byte. The offset only moves forward; a failed read
 * leaves it where it was.
 */

#ifndef BITEXPR_BITCURSOR_HPP
#define BITEXPR_BITCURSOR_HPP

#include <string_view>
#include <utility>
#include <vector>

#include "bitbuffer.hpp"
#include "config.hpp"
#include "error.hpp"

namespace bitexpr {

/**
 * @brief Sequential bit reader owning its input.
 *
 * Single consumer, no rewind. Sub-parse lengths are measured as the
 * difference between bits_consumed() before and after.
 */
class BitCursor {
public:
    /**
     * @brief Construct an empty cursor (no bits to read).
     */
    BitCursor() noexcept : num_bits_(0), bit_pos_(0) {}

    /**
     * @brief Construct a cursor over packed bytes.
     *
     * @param data Packed MSB-first bits
     * @param num_bits Number of valid bits, clamped to data.size() * 8
     */
    BitCursor(std::vector<std::uint8_t> data, std::size_t num_bits) noexcept
        : data_(std::move(data)), num_bits_(num_bits), bit_pos_(0) {
        if (num_bits_ > data_.size() * 8) {
            num_bits_ = data_.size() * 8;
        }
    }

    /**
     * @brief Construct a cursor over the contents of a bit buffer.
     *
     * @param bits Source bits
     */
    explicit BitCursor(const BitBuffer& bits) : data_(bits.to_bytes()), num_bits_(bits.size()), bit_pos_(0) {}

    BitCursor(const BitCursor&) = delete;
    BitCursor& operator=(const BitCursor&) = delete;
    BitCursor(BitCursor&&) noexcept = default;
    BitCursor& operator=(BitCursor&&) noexcept = default;

    /**
     * @brief Build a cursor from hex text.
     *
     * @param hex Hex digits, trailing whitespace allowed
     * @param[out] cursor Cursor positioned at bit 0
     * @return Error::Ok on success, Error::InvalidArg for bad text
     */
    static Error from_hex(std::string_view hex, BitCursor& cursor);

    /**
     * @brief Read a single bit.
     *
     * @return Bit value (0 or 1), or -1 if no bits remaining
     */
    inline int read_bit() noexcept {
        if (bit_pos_ >= num_bits_) [[unlikely]] {
            return -1;
        }

        std::size_t byte_idx = bit_pos_ >> 3; // bit_pos_ / 8
        std::size_t bit_idx = bit_pos_ & 7;   // bit_pos_ % 8

        // MSB-first: bit 0 of byte is at position 7
        int bit = (data_[byte_idx] >> (7 - bit_idx)) & 1;
        ++bit_pos_;

        return bit;
    }

    /**
     * @brief Read multiple bits as an unsigned value.
     *
     * Reads MSB-first and interprets the bits big-endian.
     *
     * @param num_bits Number of bits to read (1-32)
     * @param[out] value Unsigned value of the bits read
     * @return Error::Ok on success, Error::UnexpectedEndOfStream if fewer
     *         than @p num_bits remain, Error::InvalidArg for a bad width
     */
    Error read(std::size_t num_bits, std::uint32_t& value) noexcept {
        if (num_bits == 0 || num_bits > MAX_READ_BITS) [[unlikely]] {
            return Error::InvalidArg;
        }

        if (num_bits > remaining()) [[unlikely]] {
            return Error::UnexpectedEndOfStream;
        }

        std::uint32_t result = 0;
        std::size_t left = num_bits;

        while (left > 0) {
            std::size_t byte_idx = bit_pos_ >> 3;
            std::size_t bit_idx = bit_pos_ & 7;

            // Bits available in current byte
            std::size_t bits_in_byte = 8 - bit_idx;
            std::size_t bits_to_read = (left < bits_in_byte) ? left : bits_in_byte;

            // Extract bits from current byte (MSB-first)
            std::uint8_t byte_val = data_[byte_idx];
            std::uint32_t shift = static_cast<std::uint32_t>(8 - bit_idx - bits_to_read);
            std::uint32_t mask = (1U << bits_to_read) - 1U;
            std::uint32_t extracted = (static_cast<std::uint32_t>(byte_val) >> shift) & mask;

            result = (result << bits_to_read) | extracted;
            bit_pos_ += bits_to_read;
            left -= bits_to_read;
        }

        value = result;
        return Error::Ok;
    }

    /**
     * @brief Read multiple bits as both a bit sequence and a value.
     *
     * @param num_bits Number of bits to read (1-32)
     * @param[in,out] bits Buffer the bits are appended to
     * @param[out] value Unsigned value of the bits read
     * @return Error::Ok on success, see read(std::size_t, std::uint32_t&)
     */
    Error read(std::size_t num_bits, BitBuffer& bits, std::uint32_t& value) {
        auto status = read(num_bits, value);
        if (status != Error::Ok) {
            return status;
        }
        return bits.append_value(value, num_bits);
    }

    /**
     * @brief Get current bit position.
     *
     * @return Number of bits already read
     */
    [[nodiscard]] std::size_t bits_consumed() const noexcept {
        return bit_pos_;
    }

    /**
     * @brief Get remaining bits.
     *
     * @return Number of bits remaining to read
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (bit_pos_ < num_bits_) ? (num_bits_ - bit_pos_) : 0;
    }

    /**
     * @brief Get total length of the stream.
     *
     * @return Number of valid bits
     */
    [[nodiscard]] std::size_t size() const noexcept {
        return num_bits_;
    }

private:
    std::vector<std::uint8_t> data_;
    std::size_t num_bits_;
    std::size_t bit_pos_;
};

} // namespace bitexpr

#endif // BITEXPR_BITCURSOR_HPP
