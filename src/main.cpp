// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file main.cpp
 * @brief Boolean circuit demonstration
 *
 * Demonstrates circuit construction, canonicalization and evaluation using
 * the circ::ir library.
 *
 * Usage: circ_demo [--verbose]
 */

#include "ir/Circuit.hpp"

#include <cstring>
#include <iostream>

namespace {

void printStatistics(const char* title, const circ::ir::Circuit& c, bool verbose) {
    using circ::ir::Gate;

    std::cout << title << ":\n";
    std::cout << "  Gates: " << c.count() << "\n";
    std::cout << "  Inputs: " << c.numInputs() << "\n";
    std::cout << "  Outputs: " << c.numOutputs() << "\n";
    std::cout << "  Depth: " << c.depth() << "\n";
    std::cout << "  Logic depth: "
              << c.depth([](const Gate& g) { return !g.operation().isIdentity(); }) << "\n";
    std::cout << "  Legible: " << c.gates().toLegible() << "\n";
    if (verbose) {
        std::cout << c;
    }
    std::cout << "\n";
}

void printTruthTable(const circ::ir::Circuit& c) {
    using namespace circ;

    const std::size_t n = c.numInputs();
    for (std::size_t row = 0; row < (std::size_t{1} << n); ++row) {
        BitVector bits(n);
        for (std::size_t i = 0; i < n; ++i) {
            bits[i] = static_cast<Bit>((row >> (n - 1 - i)) & 1U);
        }
        std::cout << "  ";
        for (Bit b : bits) std::cout << b;
        std::cout << " -> ";
        for (Bit b : c.evaluateFlat(bits)) std::cout << b;
        std::cout << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace circ;
    using namespace circ::ir;

    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Usage: " << argv[0] << " [--verbose]\n";
            return 2;
        }
    }

    try {
        std::cout << "=== Boolean Circuits ===\n\n";

        // A single AND gate between two inputs and an output
        std::cout << "Building AND circuit...\n";
        Circuit conj;
        GateId a = conj.addInput();
        GateId b = conj.addInput();
        conj.addOutput(conj.addGate(Operation::and_(), {a, b}));
        printStatistics("AND circuit", conj, verbose);
        printTruthTable(conj);
        std::cout << "  As operation: " << conj.toOperation() << "\n\n";

        // Dead logic and a disconnected constant component
        std::cout << "Building circuit with dead gates...\n";
        Circuit messy;
        GateId x = messy.addInput();
        messy.addInput();
        GateId nx = messy.addGate(Operation::not_(), {x});
        messy.addGate(Operation::and_(), {x, nx});
        GateId t = messy.addGate(Operation::nt());
        GateId f = messy.addGate(Operation::nf());
        messy.addOutput(messy.addGate(Operation::or_(), {t, f}));
        printStatistics("Before pruning", messy, verbose);

        messy.pruneAndTopologicallySortStable();
        printStatistics("After pruning", messy, verbose);

        // Constant circuit with grouped signature
        std::cout << "Building constant circuit...\n";
        Circuit constant(Signature(Format{0}, Format{1}));
        GateId one = constant.addGate(Operation::nt());
        GateId zero = constant.addGate(Operation::nf());
        constant.addOutput(constant.addGate(Operation::xor_(), {one, zero}));
        printStatistics("Constant circuit", constant, verbose);

        auto result = std::get<BitGroups>(constant.evaluate(BitGroups{{}}));
        std::cout << "  " << constant.signature() << " evaluates to "
                  << result.at(0).at(0) << "\n";
    } catch (const CircuitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nDone.\n";
    return 0;
}
