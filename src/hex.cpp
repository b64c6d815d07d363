/**
 * @file hex.cpp
 * @brief Hex conversion and file loading.
 */

#include <bitexpr/hex.hpp>

#include <fstream>
#include <iterator>
#include <utility>

namespace bitexpr {

static constexpr const char* HEX_DIGITS = "0123456789ABCDEF";

std::string_view strip_trailing_whitespace(std::string_view text) noexcept {
    std::size_t end = text.size();
    while (end > 0) {
        char c = text[end - 1];
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            break;
        }
        --end;
    }
    return text.substr(0, end);
}

Error hex_to_bytes(std::string_view hex, std::vector<std::uint8_t>& bytes, std::size_t& num_bits) {
    std::string_view digits = strip_trailing_whitespace(hex);
    if (digits.empty()) {
        return Error::InvalidArg;
    }

    std::vector<std::uint8_t> packed((digits.size() + 1) / 2, 0U);
    for (std::size_t i = 0; i < digits.size(); ++i) {
        int nibble = hex_digit_value(digits[i]);
        if (nibble < 0) {
            return Error::InvalidArg;
        }
        // Even digits fill the high nibble
        int shift = (i & 1U) == 0 ? 4 : 0;
        packed[i >> 1] = static_cast<std::uint8_t>(packed[i >> 1] | (nibble << shift));
    }

    bytes = std::move(packed);
    num_bits = digits.size() * 4;
    return Error::Ok;
}

std::string bytes_to_hex(const std::vector<std::uint8_t>& bytes, std::size_t num_bits) {
    std::size_t num_digits = (num_bits + 3) / 4;
    if (num_digits > bytes.size() * 2) {
        num_digits = bytes.size() * 2;
    }

    std::string hex;
    hex.reserve(num_digits);
    for (std::size_t i = 0; i < num_digits; ++i) {
        std::uint8_t byte = bytes[i >> 1];
        int nibble = (i & 1U) == 0 ? (byte >> 4) : (byte & 0x0F);
        hex.push_back(HEX_DIGITS[nibble]);
    }
    return hex;
}

Error read_hex_file(const std::string& path, std::string& hex) {
    std::ifstream file(path);
    if (!file) {
        return Error::InvalidArg;
    }

    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Error::InvalidArg;
    }

    std::string_view stripped = strip_trailing_whitespace(contents);
    hex.assign(stripped.data(), stripped.size());
    return Error::Ok;
}

} // namespace bitexpr
