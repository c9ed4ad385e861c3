// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the boolean circuit IR
 *
 * Demonstrates:
 * - Working with operations as truth tables
 * - Creating circuits programmatically
 * - Evaluating with flat and grouped signatures
 * - Handling construction errors
 */

#include "ir/Circuit.hpp"
#include "ir/CircuitError.hpp"
#include "ir/Operation.hpp"

#include <iostream>
#include <variant>
#include <vector>

using namespace circ;

namespace {

void printBits(const BitValue& value) {
    if (const auto* flat = std::get_if<BitVector>(&value)) {
        for (Bit b : *flat) std::cout << b;
        return;
    }
    std::cout << "[";
    const auto& groups = std::get<BitGroups>(value);
    for (std::size_t i = 0; i < groups.size(); ++i) {
        if (i > 0) std::cout << " ";
        for (Bit b : groups[i]) std::cout << b;
    }
    std::cout << "]";
}

}  // namespace

int main() {
    std::cout << "=== Boolean Circuits - Basic Usage ===\n\n";

    // =========================================================================
    // 1. Operations
    // =========================================================================
    std::cout << "1. Operations are truth tables:\n";

    for (const auto& op : {ir::Operation::not_(), ir::Operation::and_(),
                           ir::Operation::xor_(), ir::Operation::imp()}) {
        std::cout << "   " << op << " table:";
        for (Bit b : op.table()) std::cout << " " << b;
        std::cout << "\n";
    }

    ir::Operation majority(std::vector<Bit>{0, 0, 0, 1, 0, 1, 1, 1});
    std::cout << "   Majority of three: " << majority
              << ", majority(1, 0, 1) = " << majority.apply({1, 0, 1}) << "\n\n";

    // =========================================================================
    // 2. Creating a circuit programmatically
    // =========================================================================
    std::cout << "2. Creating a full adder:\n";

    ir::Circuit adder(ir::Signature(ir::Format{3}, ir::Format{1, 1}));
    GateId a = adder.addInput();
    GateId b = adder.addInput();
    GateId cin = adder.addInput();
    GateId half = adder.addGate(ir::Operation::xor_(), {a, b});
    GateId sum = adder.addGate(ir::Operation::xor_(), {half, cin});
    GateId gen = adder.addGate(ir::Operation::and_(), {a, b});
    GateId prop = adder.addGate(ir::Operation::and_(), {half, cin});
    GateId cout_ = adder.addGate(ir::Operation::or_(), {gen, prop});
    adder.addOutput(cout_);
    adder.addOutput(sum);

    std::cout << "   Gates: " << adder.count() << "\n";
    std::cout << "   Depth: " << adder.depth() << "\n";
    std::cout << "   AND depth: "
              << adder.depth([](const ir::Gate& g) { return g.operation() == ir::Operation::and_(); })
              << "\n";
    std::cout << "   " << adder.signature() << "\n\n";

    // =========================================================================
    // 3. Evaluating
    // =========================================================================
    std::cout << "3. Evaluating the full adder (carry, sum):\n";

    for (const BitVector& bits : {BitVector{0, 0, 0}, BitVector{1, 0, 1}, BitVector{1, 1, 1}}) {
        std::cout << "   ";
        for (Bit bit : bits) std::cout << bit;
        std::cout << " -> ";
        printBits(adder.evaluate(BitGroups{bits}));
        std::cout << "\n";
    }

    adder.setSignature(ir::Signature());
    std::cout << "   Flat signature: 110 -> ";
    printBits(adder.evaluate(BitVector{1, 1, 0}));
    std::cout << "\n\n";

    // =========================================================================
    // 4. Construction errors
    // =========================================================================
    std::cout << "4. Invalid constructions are rejected:\n";

    try {
        adder.addGate(ir::Operation::not_(), {cout_ + 1});
    } catch (const ir::CircuitError& e) {
        std::cout << "   " << e.what() << "\n";
    }

    try {
        adder.addGate(ir::Operation::and_(), {a});
    } catch (const ir::CircuitError& e) {
        std::cout << "   " << e.what() << "\n";
    }

    std::cout << "   Gates still: " << adder.count() << "\n";

    std::cout << "\n=== Done! ===\n";

    return 0;
}
