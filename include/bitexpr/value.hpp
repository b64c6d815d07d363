/**
 * @file value.hpp
 * @brief Arbitrary-precision integer type for literal and evaluated values.
 *
 * Literal nibble chains have no length bound and products of literals grow
 * quickly, so packet values use boost::multiprecision::cpp_int rather than a
 * fixed-width integer.
 */

#ifndef BITEXPR_VALUE_HPP
#define BITEXPR_VALUE_HPP

#include <boost/multiprecision/cpp_int.hpp>

#include "config.hpp"

namespace bitexpr {

/// Unbounded integer used for literal values and evaluation results
using Value = boost::multiprecision::cpp_int;

/**
 * @brief Number of significant bits in a non-negative value.
 *
 * @param value Non-negative value
 * @return Position of the highest set bit plus one, 0 for zero
 */
inline std::size_t significant_bits(const Value& value) {
    if (value <= 0) {
        return 0;
    }
    return static_cast<std::size_t>(boost::multiprecision::msb(value)) + 1U;
}

} // namespace bitexpr

#endif // BITEXPR_VALUE_HPP
