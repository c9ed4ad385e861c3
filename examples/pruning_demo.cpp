// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file pruning_demo.cpp
 * @brief Demonstrates canonicalization with pruneAndTopologicallySortStable()
 *
 * Shows:
 * - Which gates survive pruning and why
 * - Reachability marking on the gate collection
 * - The stable three-block order of the canonical form
 */

#include "ir/Circuit.hpp"
#include "ir/GateCollection.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace circ;

int main() {
    std::cout << "=== Pruning and Stable Topological Sort ===\n\n";

    // Outputs and inputs are added out of order on purpose.
    ir::Circuit circuit;
    GateId x = circuit.addInput();
    GateId nx = circuit.addGate(ir::Operation::not_(), {x});
    GateId first = circuit.addOutput(nx);
    GateId y = circuit.addInput();
    GateId unused = circuit.addGate(ir::Operation::nand(), {x, y});
    GateId both = circuit.addGate(ir::Operation::and_(), {nx, y});
    circuit.addGate(ir::Operation::or_(), {unused, both});
    GateId second = circuit.addOutput(both);
    circuit.addInput();

    std::cout << "Original circuit:\n" << circuit << "\n";

    // Reachability from the outputs
    const ir::GateCollection& gates = circuit.gates();
    std::vector<bool> live = gates.markReachable({first, second});
    std::cout << "Reachable from outputs:";
    for (GateId id = 0; id < live.size(); ++id) {
        if (live[id]) std::cout << " " << id;
    }
    std::cout << "\n\n";

    BitVector before = circuit.evaluateFlat({1, 1, 0});

    circuit.pruneAndTopologicallySortStable();

    std::cout << "Canonical circuit:\n" << circuit << "\n";
    std::cout << "Legible form: " << circuit.gates().toLegible() << "\n";

    BitVector after = circuit.evaluateFlat({1, 1, 0});
    std::cout << "Results unchanged: " << (before == after ? "yes" : "no") << "\n";

    // A second pass is a no-op
    std::string once = circuit.gates().toLegible();
    circuit.pruneAndTopologicallySortStable();
    std::cout << "Idempotent: " << (circuit.gates().toLegible() == once ? "yes" : "no") << "\n";

    std::cout << "\n=== Done! ===\n";

    return 0;
}
