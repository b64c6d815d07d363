/**
 * @file hex.hpp
 * @brief Hexadecimal text to bits and back.
 *
 * Each hex digit expands to exactly four bits, most significant first, so
 * "D2FE28" is the 24-bit sequence 1101 0010 1111 1110 0010 1000.
 */

#ifndef BITEXPR_HEX_HPP
#define BITEXPR_HEX_HPP

#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "error.hpp"

namespace bitexpr {

/**
 * @brief Drop trailing spaces, tabs, carriage returns and newlines.
 *
 * @param text Input text
 * @return View of @p text without trailing whitespace
 */
std::string_view strip_trailing_whitespace(std::string_view text) noexcept;

/**
 * @brief Value of a single hex digit.
 *
 * @param c Character '0'-'9', 'a'-'f' or 'A'-'F'
 * @return Digit value 0-15, or -1 if @p c is not a hex digit
 */
inline int hex_digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}

/**
 * @brief Expand hex text into packed MSB-first bytes.
 *
 * Trailing whitespace is ignored. An odd number of digits leaves the low
 * nibble of the last byte zero.
 *
 * @param hex Hex digits without separators
 * @param[out] bytes Packed bits
 * @param[out] num_bits Number of valid bits (4 per digit)
 * @return Error::Ok on success, Error::InvalidArg for empty text or a
 *         non-hex character
 */
Error hex_to_bytes(std::string_view hex, std::vector<std::uint8_t>& bytes, std::size_t& num_bits);

/**
 * @brief Render packed bits as upper-case hex.
 *
 * @param bytes Packed MSB-first bits
 * @param num_bits Number of valid bits; the last digit is zero-padded
 * @return (num_bits + 3) / 4 hex digits
 */
std::string bytes_to_hex(const std::vector<std::uint8_t>& bytes, std::size_t num_bits);

/**
 * @brief Load hex text from a file.
 *
 * A readable file holding only whitespace succeeds with empty text; the
 * caller decides whether that is an error.
 *
 * @param path File path
 * @param[out] hex File contents with trailing whitespace removed
 * @return Error::Ok on success, Error::InvalidArg if the file cannot be
 *         opened or read
 */
Error read_hex_file(const std::string& path, std::string& hex);

} // namespace bitexpr

#endif // BITEXPR_HEX_HPP
