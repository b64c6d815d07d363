/**
 * @file bitbuffer.cpp
 * @brief BitBuffer conversions.
 *
 * Appending stays inline in bitbuffer.hpp; the conversions below allocate
 * and are only called once per literal or per encoded packet.
 */

#include <bitexpr/bitbuffer.hpp>

namespace bitexpr {

std::vector<std::uint8_t> BitBuffer::to_bytes() const {
    std::vector<std::uint8_t> bytes(data_);
    if (acc_len_ > 0) {
        // Shift accumulator bits to MSB position
        bytes.push_back(static_cast<std::uint8_t>(acc_ << (8 - acc_len_)));
    }
    return bytes;
}

Value BitBuffer::to_value() const {
    Value value = 0;
    for (std::uint8_t byte : data_) {
        value <<= 8;
        value |= byte;
    }
    if (acc_len_ > 0) {
        value <<= static_cast<unsigned>(acc_len_);
        value |= static_cast<std::uint32_t>(acc_);
    }
    return value;
}

} // namespace bitexpr
