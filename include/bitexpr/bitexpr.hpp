/**
 * @file bitexpr.hpp
 * @brief High-level bitexpr API.
 *
 * Provides decode() and run() for going straight from hex text to a packet
 * tree or to its two results (version sum and expression value), plus
 * throwing variants when exceptions are enabled.
 */

#ifndef BITEXPR_HPP
#define BITEXPR_HPP

#include <string_view>
#include <utility>

#include "bitbuffer.hpp"
#include "bitcursor.hpp"
#include "config.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "evaluator.hpp"
#include "hex.hpp"
#include "packet.hpp"
#include "parser.hpp"
#include "value.hpp"
#include "versions.hpp"

namespace bitexpr {

/**
 * @brief Decode hex text into a packet tree.
 *
 * Bits following the root packet (hex padding) are ignored.
 *
 * @param hex Hex digits, trailing whitespace allowed
 * @param[out] root Root packet; untouched on error
 * @return Error::Ok on success, Error::InvalidArg for bad text, or any
 *         parse error
 */
inline Error decode(std::string_view hex, Packet& root) {
    BitCursor cursor;
    auto status = BitCursor::from_hex(hex, cursor);
    if (status != Error::Ok) {
        return status;
    }
    return parse_packet(cursor, root);
}

/**
 * @brief Decode hex text and compute both results.
 *
 * The version sum only needs a well-formed tree, so it is written as soon
 * as decoding succeeds, even when evaluation then fails.
 *
 * @param hex Hex digits, trailing whitespace allowed
 * @param[out] version_sum Sum of all version fields, written once decoding succeeds
 * @param[out] value Value of the root expression, written only on success
 * @return Error::Ok on success, otherwise the decode or evaluation error
 */
inline Error run(std::string_view hex, std::uint64_t& version_sum, Value& value) {
    Packet root;
    auto status = decode(hex, root);
    if (status != Error::Ok) {
        return status;
    }
    version_sum = total_version(root);

    Value result;
    status = evaluate(root, result);
    if (status != Error::Ok) {
        return status;
    }

    value = std::move(result);
    return Error::Ok;
}

#if !BITEXPR_NO_EXCEPTIONS

/**
 * @brief Decode hex text into a packet tree, throwing on error.
 *
 * @param hex Hex digits, trailing whitespace allowed
 * @return Root packet
 * @throws BitexprException subclass matching the error code
 */
inline Packet decode_or_throw(std::string_view hex) {
    Packet root;
    auto status = decode(hex, root);
    if (status != Error::Ok) {
        throw_error(status, "decode");
    }
    return root;
}

/**
 * @brief Evaluate a packet tree, throwing on error.
 *
 * @param packet Root of the expression
 * @return Value of the expression
 * @throws MalformedOperandsException on an arity error
 */
inline Value evaluate_or_throw(const Packet& packet) {
    Value result;
    auto status = evaluate(packet, result);
    if (status != Error::Ok) {
        throw_error(status, "evaluate");
    }
    return result;
}

#endif // !BITEXPR_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace bitexpr

#endif // BITEXPR_HPP
