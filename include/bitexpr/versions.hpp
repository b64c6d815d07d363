/**
 * @file versions.hpp
 * @brief Version-field accumulation over a packet tree.
 */

#ifndef BITEXPR_VERSIONS_HPP
#define BITEXPR_VERSIONS_HPP

#include "config.hpp"
#include "packet.hpp"

namespace bitexpr {

/**
 * @brief Sum of the version fields of a packet and all its descendants.
 *
 * Read-only; safe to run concurrently with evaluate() on the same tree.
 *
 * @param packet Root packet
 * @return version(packet) + total_version(child) for every child
 */
std::uint64_t total_version(const Packet& packet) noexcept;

} // namespace bitexpr

#endif // BITEXPR_VERSIONS_HPP
