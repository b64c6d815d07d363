/**
 * @file evaluator.hpp
 * @brief Expression evaluation over a packet tree.
 *
 * - Literal: its value
 * - Sum / Product: fold over the children (identities 0 and 1)
 * - Minimum / Maximum: smallest / largest child
 * - GreaterThan / LessThan / EqualTo: 1 if the relation holds between the
 *   first and second child, else 0
 *
 * Comparisons need exactly two children and Minimum / Maximum need at
 * least one. Anything else is reported as Error::MalformedOperands; extra
 * operands are never dropped and missing ones are never defaulted.
 *
 * Evaluation only reads the tree, so the same tree can be evaluated from
 * several threads at once.
 */

#ifndef BITEXPR_EVALUATOR_HPP
#define BITEXPR_EVALUATOR_HPP

#include "config.hpp"
#include "error.hpp"
#include "packet.hpp"
#include "value.hpp"

namespace bitexpr {

/**
 * @brief Evaluate a packet tree.
 *
 * @param packet Root of the expression
 * @param[out] result Value of the expression; untouched on error
 * @return Error::Ok on success, Error::MalformedOperands on an arity error
 *         anywhere in the tree
 */
Error evaluate(const Packet& packet, Value& result);

} // namespace bitexpr

#endif // BITEXPR_EVALUATOR_HPP
