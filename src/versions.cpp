/**
 * @file versions.cpp
 * @brief Version-field accumulation.
 */

#include <bitexpr/versions.hpp>

namespace bitexpr {

std::uint64_t total_version(const Packet& packet) noexcept {
    std::uint64_t total = packet.version();
    for (const Packet& child : packet.children()) {
        total += total_version(child);
    }
    return total;
}

} // namespace bitexpr
