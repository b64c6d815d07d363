/**
 * @file config.hpp
 * @brief bitexpr compile-time configuration.
 *
 * Field widths of the packet wire format and build-time switches.
 *
 * @par Packet Layout (MSB first)
 * - Header: VVV TTT (version, type code)
 * - Literal body: groups of 1 continuation bit + 4 value bits
 * - Operator body: I, then 15-bit bit count (I=0) or 11-bit sub-count (I=1),
 *   followed by the sub-packets
 */

#ifndef BITEXPR_CONFIG_HPP
#define BITEXPR_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace bitexpr {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Wire Format Constants
 * @{
 */

/// Packet version field
inline constexpr std::size_t VERSION_BITS = 3U;

/// Packet type code field
inline constexpr std::size_t TYPE_ID_BITS = 3U;

/// Header width shared by every packet kind
inline constexpr std::size_t HEADER_BITS = VERSION_BITS + TYPE_ID_BITS;

/// Literal continuation flag
inline constexpr std::size_t GROUP_FLAG_BITS = 1U;

/// Literal value nibble
inline constexpr std::size_t NIBBLE_BITS = 4U;

/// One literal group: flag + nibble
inline constexpr std::size_t GROUP_BITS = GROUP_FLAG_BITS + NIBBLE_BITS;

/// Operator length-type flag
inline constexpr std::size_t LENGTH_TYPE_BITS = 1U;

/// Total sub-packet bits field (length type 0)
inline constexpr std::size_t BIT_COUNT_BITS = 15U;

/// Number of sub-packets field (length type 1)
inline constexpr std::size_t SUB_COUNT_BITS = 11U;

inline constexpr std::uint32_t MAX_VERSION = (1U << VERSION_BITS) - 1U;
inline constexpr std::uint32_t MAX_BIT_COUNT = (1U << BIT_COUNT_BITS) - 1U;
inline constexpr std::uint32_t MAX_SUB_COUNT = (1U << SUB_COUNT_BITS) - 1U;

/// Widest single integer read supported by BitCursor
inline constexpr std::size_t MAX_READ_BITS = 32U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define BITEXPR_NO_EXCEPTIONS=1 to drop the throwing API and the
 * exception types. The status-code API is always available.
 * @{
 */
#ifndef BITEXPR_NO_EXCEPTIONS
#define BITEXPR_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace bitexpr

#endif // BITEXPR_CONFIG_HPP
