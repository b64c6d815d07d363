/**
 * @file bitcursor.cpp
 * @brief BitCursor construction from hex text.
 *
 * Bit reads are inline in bitcursor.hpp.
 */

#include <bitexpr/bitcursor.hpp>
#include <bitexpr/hex.hpp>

namespace bitexpr {

Error BitCursor::from_hex(std::string_view hex, BitCursor& cursor) {
    std::vector<std::uint8_t> bytes;
    std::size_t num_bits = 0;

    auto status = hex_to_bytes(hex, bytes, num_bits);
    if (status != Error::Ok) {
        return status;
    }

    cursor = BitCursor(std::move(bytes), num_bits);
    return Error::Ok;
}

} // namespace bitexpr
