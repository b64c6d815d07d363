/**
 * @file bitbuffer.hpp
 * @brief Growable bit buffer for building bit sequences.
 *
 * Bits are appended sequentially using MSB-first ordering. The buffer is
 * used in two places: the parser accumulates literal nibbles in one before
 * turning them into a Value, and the encoder writes whole packets into one.
 *
 * @par Bit Ordering
 * Bits are appended MSB-first within each byte:
 * - First bit appended goes to bit position 7
 * - Second bit goes to position 6, etc.
 */

#ifndef BITEXPR_BITBUFFER_HPP
#define BITEXPR_BITBUFFER_HPP

#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "value.hpp"

namespace bitexpr {

/**
 * @brief Variable-length bit buffer with heap storage.
 *
 * Complete bytes live in a byte vector; up to seven trailing bits wait in
 * an accumulator until the next byte boundary.
 */
class BitBuffer {
public:
    /**
     * @brief Default constructor - initializes to empty state.
     */
    BitBuffer() noexcept : num_bits_(0), acc_(0), acc_len_(0) {}

    /**
     * @brief Clear buffer to empty state.
     */
    void clear() noexcept {
        data_.clear();
        num_bits_ = 0;
        acc_ = 0;
        acc_len_ = 0;
    }

    /**
     * @brief Get number of bits in buffer.
     * @return Number of bits currently stored
     */
    [[nodiscard]] std::size_t size() const noexcept { return num_bits_; }

    [[nodiscard]] bool empty() const noexcept { return num_bits_ == 0; }

    /**
     * @brief Append a single bit.
     *
     * @param bit Bit value (0 or 1)
     */
    void append_bit(int bit) {
        acc_ = (acc_ << 1) | (static_cast<std::uint64_t>(bit) & 1U);
        ++acc_len_;
        ++num_bits_;

        if (acc_len_ >= 8) {
            flush_acc();
        }
    }

    /**
     * @brief Append multiple bits from a value.
     *
     * @param value Value containing bits (right-justified)
     * @param num_bits Number of bits to append (1-32)
     * @return Error::Ok on success, Error::InvalidArg for a bad width
     */
    Error append_value(std::uint32_t value, std::size_t num_bits) {
        if (num_bits == 0 || num_bits > MAX_READ_BITS) [[unlikely]] {
            return Error::InvalidArg;
        }

        push(value, num_bits);
        return Error::Ok;
    }

    /**
     * @brief Append every bit of another buffer.
     *
     * @param other Source buffer
     */
    void append(const BitBuffer& other) {
        for (std::uint8_t byte : other.data_) {
            push(byte, 8);
        }
        if (other.acc_len_ > 0) {
            push(static_cast<std::uint32_t>(other.acc_), other.acc_len_);
        }
    }

    /**
     * @brief Read back a stored bit.
     *
     * @param index Bit position (0 = first appended)
     * @return Bit value (0 or 1), or -1 if out of range
     */
    [[nodiscard]] int get_bit(std::size_t index) const noexcept {
        if (index >= num_bits_) {
            return -1;
        }

        std::size_t flushed_bits = data_.size() * 8;
        if (index < flushed_bits) {
            return (data_[index >> 3] >> (7 - (index & 7))) & 1;
        }

        std::size_t offset = index - flushed_bits;
        return static_cast<int>((acc_ >> (acc_len_ - 1 - offset)) & 1U);
    }

    /**
     * @brief Convert bit buffer to bytes.
     *
     * Pads final byte with zeros if not byte-aligned.
     *
     * @return (size() + 7) / 8 bytes
     */
    [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

    /**
     * @brief Interpret the whole buffer as a big-endian unsigned integer.
     *
     * @return Value of the bit sequence, 0 for an empty buffer
     */
    [[nodiscard]] Value to_value() const;

private:
    std::vector<std::uint8_t> data_;
    std::size_t num_bits_;
    std::uint64_t acc_;
    std::size_t acc_len_;

    /**
     * @brief Append 1-32 bits without validating the width.
     */
    void push(std::uint32_t value, std::size_t num_bits) {
        std::uint64_t mask = (std::uint64_t{1} << num_bits) - 1U;
        acc_ = (acc_ << num_bits) | (static_cast<std::uint64_t>(value) & mask);
        acc_len_ += num_bits;
        num_bits_ += num_bits;

        flush_acc();
    }

    /**
     * @brief Move complete bytes from the accumulator to the data vector.
     */
    void flush_acc() {
        while (acc_len_ >= 8) {
            acc_len_ -= 8;
            data_.push_back(static_cast<std::uint8_t>(acc_ >> acc_len_));
            acc_ &= (std::uint64_t{1} << acc_len_) - 1U;
        }
    }
};

} // namespace bitexpr

#endif // BITEXPR_BITBUFFER_HPP
