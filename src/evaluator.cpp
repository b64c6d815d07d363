/**
 * @file evaluator.cpp
 * @brief Expression evaluation.
 */

#include <bitexpr/evaluator.hpp>

#include <utility>
#include <vector>

namespace bitexpr {

/**
 * @brief Check the child count an operator needs.
 */
static bool has_valid_arity(PacketKind kind, std::size_t num_children) noexcept {
    if (!is_operator(kind)) {
        return false;
    }
    if (is_comparison(kind)) {
        return num_children == 2;
    }
    if (kind == PacketKind::Minimum || kind == PacketKind::Maximum) {
        return num_children > 0;
    }
    return true;
}

static Value truth(bool holds) {
    return holds ? Value(1) : Value(0);
}

Error evaluate(const Packet& packet, Value& result) {
    if (packet.is_literal()) {
        result = packet.value();
        return Error::Ok;
    }

    const PacketKind kind = packet.kind();
    const auto& children = packet.children();

    if (!has_valid_arity(kind, children.size())) {
        return Error::MalformedOperands;
    }

    // Evaluate operands in order before combining
    std::vector<Value> operands;
    operands.reserve(children.size());
    for (const Packet& child : children) {
        Value operand;
        auto status = evaluate(child, operand);
        if (status != Error::Ok) {
            return status;
        }
        operands.push_back(std::move(operand));
    }

    Value acc;
    switch (kind) {
    case PacketKind::Sum:
        acc = 0;
        for (const Value& v : operands) {
            acc += v;
        }
        break;
    case PacketKind::Product:
        acc = 1;
        for (const Value& v : operands) {
            acc *= v;
        }
        break;
    case PacketKind::Minimum:
        acc = operands.front();
        for (const Value& v : operands) {
            if (v < acc) {
                acc = v;
            }
        }
        break;
    case PacketKind::Maximum:
        acc = operands.front();
        for (const Value& v : operands) {
            if (v > acc) {
                acc = v;
            }
        }
        break;
    case PacketKind::GreaterThan:
        acc = truth(operands[0] > operands[1]);
        break;
    case PacketKind::LessThan:
        acc = truth(operands[0] < operands[1]);
        break;
    case PacketKind::EqualTo:
        acc = truth(operands[0] == operands[1]);
        break;
    default:
        return Error::MalformedOperands;
    }

    result = std::move(acc);
    return Error::Ok;
}

} // namespace bitexpr
