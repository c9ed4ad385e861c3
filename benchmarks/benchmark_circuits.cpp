// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file benchmark_circuits.cpp
 * @brief Benchmark suite for circuit construction, canonicalization and evaluation
 *
 * Benchmarks the IR with standard circuit patterns:
 * - Random layered circuits (with dead logic to prune)
 * - Ripple-carry adder
 * - Deep unary chains
 */

#include "ir/Circuit.hpp"
#include "ir/Operation.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace circ;

// ============================================================================
// Circuit Generators
// ============================================================================

/**
 * @brief Generates a random layered circuit.
 *
 * Each gate of a layer reads from the previous layer only. A handful of
 * gates in the last layer feed outputs, so much of the circuit is dead.
 */
ir::Circuit generateLayered(std::size_t width, std::size_t layers, unsigned seed = 42) {
    static const std::vector<ir::Operation> ops = {
        ir::Operation::and_(), ir::Operation::or_(), ir::Operation::xor_(),
        ir::Operation::nand(), ir::Operation::nor(), ir::Operation::not_()};

    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::size_t> op_dist(0, ops.size() - 1);
    std::uniform_int_distribution<std::size_t> wire_dist(0, width - 1);

    ir::Circuit circuit;
    std::vector<GateId> previous;
    for (std::size_t i = 0; i < width; ++i) {
        previous.push_back(circuit.addInput());
    }

    for (std::size_t layer = 0; layer < layers; ++layer) {
        std::vector<GateId> current;
        for (std::size_t i = 0; i < width; ++i) {
            const ir::Operation& op = ops[op_dist(rng)];
            std::vector<GateId> inputs;
            for (std::size_t a = 0; a < op.arity(); ++a) {
                inputs.push_back(previous[wire_dist(rng)]);
            }
            current.push_back(circuit.addGate(op, std::move(inputs)));
        }
        previous = std::move(current);
    }

    for (std::size_t i = 0; i < width; i += 8) {
        circuit.addOutput(previous[i]);
    }

    return circuit;
}

/**
 * @brief Generates a ripple-carry adder.
 *
 * Adds two n-bit numbers given most significant bit first; the outputs are
 * the carry out followed by the n sum bits, most significant first.
 * Uses 2n inputs and 5n - 3 logic gates.
 */
ir::Circuit generateAdder(std::size_t n_bits) {
    ir::Circuit circuit(ir::Signature(ir::Format{n_bits, n_bits}, ir::Format{1, n_bits}));

    std::vector<GateId> a(n_bits);
    std::vector<GateId> b(n_bits);
    for (std::size_t i = 0; i < n_bits; ++i) a[i] = circuit.addInput();
    for (std::size_t i = 0; i < n_bits; ++i) b[i] = circuit.addInput();

    std::vector<GateId> sums(n_bits);
    GateId carry = INVALID_GATE_ID;
    for (std::size_t k = n_bits; k-- > 0;) {
        GateId half = circuit.addGate(ir::Operation::xor_(), {a[k], b[k]});
        GateId gen = circuit.addGate(ir::Operation::and_(), {a[k], b[k]});
        if (carry == INVALID_GATE_ID) {
            // Least significant bit: half adder
            sums[k] = half;
            carry = gen;
            continue;
        }
        sums[k] = circuit.addGate(ir::Operation::xor_(), {half, carry});
        GateId prop = circuit.addGate(ir::Operation::and_(), {half, carry});
        carry = circuit.addGate(ir::Operation::or_(), {gen, prop});
    }

    circuit.addOutput(carry);
    for (GateId s : sums) {
        circuit.addOutput(s);
    }

    return circuit;
}

/**
 * @brief Generates a chain of NOT gates between one input and one output.
 */
ir::Circuit generateChain(std::size_t length) {
    ir::Circuit circuit;
    GateId last = circuit.addInput();
    for (std::size_t i = 0; i < length; ++i) {
        last = circuit.addGate(ir::Operation::not_(), {last});
    }
    circuit.addOutput(last);
    return circuit;
}

// ============================================================================
// Benchmarking Infrastructure
// ============================================================================

struct BenchmarkResult {
    std::string name;
    std::size_t n_inputs;
    std::size_t original_gates;
    std::size_t pruned_gates;
    std::size_t depth;
    double build_time_ms;
    double prune_time_ms;
    double eval_time_ms;
    double reduction_pct;
};

template <typename Generator>
BenchmarkResult runBenchmark(const std::string& name, Generator generate, std::size_t evaluations) {
    using Clock = std::chrono::high_resolution_clock;

    BenchmarkResult result;
    result.name = name;

    // Construction
    auto build_start = Clock::now();
    ir::Circuit circuit = generate();
    auto build_end = Clock::now();
    result.build_time_ms = std::chrono::duration<double, std::milli>(build_end - build_start).count();

    result.n_inputs = circuit.numInputs();
    result.original_gates = circuit.count();

    // Prune and sort
    auto prune_start = Clock::now();
    circuit.pruneAndTopologicallySortStable();
    auto prune_end = Clock::now();
    result.prune_time_ms = std::chrono::duration<double, std::milli>(prune_end - prune_start).count();

    result.pruned_gates = circuit.count();
    result.depth = circuit.depth();

    // Evaluation on random inputs
    std::mt19937 rng(7);
    std::uniform_int_distribution<Bit> bit_dist(0, 1);
    BitVector input(result.n_inputs);

    auto eval_start = Clock::now();
    for (std::size_t e = 0; e < evaluations; ++e) {
        for (Bit& b : input) b = bit_dist(rng);
        (void)circuit.evaluateFlat(input);
    }
    auto eval_end = Clock::now();
    result.eval_time_ms = std::chrono::duration<double, std::milli>(eval_end - eval_start).count();

    if (result.original_gates > 0) {
        result.reduction_pct = 100.0 *
            (1.0 - static_cast<double>(result.pruned_gates) / static_cast<double>(result.original_gates));
    } else {
        result.reduction_pct = 0.0;
    }

    return result;
}

void printResults(const std::vector<BenchmarkResult>& results) {
    std::cout << "\n";
    std::cout << "================================================================================\n";
    std::cout << "                           BOOLEAN CIRCUIT BENCHMARKS                           \n";
    std::cout << "================================================================================\n\n";

    std::cout << std::left << std::setw(22) << "Circuit"
              << std::right << std::setw(8) << "Inputs"
              << std::setw(10) << "Original"
              << std::setw(10) << "Pruned"
              << std::setw(8) << "Depth"
              << std::setw(12) << "Pruned %"
              << "\n";

    std::cout << std::string(70, '-') << "\n";

    for (const auto& r : results) {
        std::cout << std::left << std::setw(22) << r.name
                  << std::right << std::setw(8) << r.n_inputs
                  << std::setw(10) << r.original_gates
                  << std::setw(10) << r.pruned_gates
                  << std::setw(8) << r.depth
                  << std::setw(11) << std::fixed << std::setprecision(1) << r.reduction_pct << "%"
                  << "\n";
    }

    std::cout << "\n";
    std::cout << "Timing:\n";
    std::cout << std::string(70, '-') << "\n";

    double total_build = 0;
    double total_prune = 0;
    double total_eval = 0;

    for (const auto& r : results) {
        std::cout << std::left << std::setw(22) << r.name
                  << "  Build: " << std::setw(8) << std::fixed << std::setprecision(2) << r.build_time_ms << " ms"
                  << "  Prune: " << std::setw(8) << std::fixed << std::setprecision(2) << r.prune_time_ms << " ms"
                  << "  Eval: " << std::setw(8) << std::fixed << std::setprecision(2) << r.eval_time_ms << " ms"
                  << "\n";
        total_build += r.build_time_ms;
        total_prune += r.prune_time_ms;
        total_eval += r.eval_time_ms;
    }

    std::cout << std::string(70, '-') << "\n";
    std::cout << std::left << std::setw(22) << "TOTAL"
              << "  Build: " << std::setw(8) << std::fixed << std::setprecision(2) << total_build << " ms"
              << "  Prune: " << std::setw(8) << std::fixed << std::setprecision(2) << total_prune << " ms"
              << "  Eval: " << std::setw(8) << std::fixed << std::setprecision(2) << total_eval << " ms"
              << "\n\n";
}

/**
 * @brief Checks the adder against integer addition on a few operands.
 */
bool verifyAdder(std::size_t n_bits) {
    ir::Circuit adder = generateAdder(n_bits);
    const std::size_t mask = (std::size_t{1} << n_bits) - 1;

    for (std::size_t x : {std::size_t{0}, std::size_t{1}, mask / 3, mask}) {
        for (std::size_t y : {std::size_t{0}, mask / 5, mask}) {
            BitGroups operands(2, BitVector(n_bits));
            for (std::size_t i = 0; i < n_bits; ++i) {
                operands[0][i] = static_cast<Bit>((x >> (n_bits - 1 - i)) & 1U);
                operands[1][i] = static_cast<Bit>((y >> (n_bits - 1 - i)) & 1U);
            }

            auto out = std::get<BitGroups>(adder.evaluate(operands));
            std::size_t sum = static_cast<std::size_t>(out[0][0]);
            for (Bit b : out[1]) {
                sum = (sum << 1) | static_cast<std::size_t>(b);
            }
            if (sum != x + y) {
                return false;
            }
        }
    }
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    try {
        std::cout << "Verifying adder circuits...\n";
        for (std::size_t n : {4UL, 8UL, 16UL}) {
            if (!verifyAdder(n)) {
                std::cerr << "Adder-" << n << " computed a wrong sum\n";
                return 1;
            }
        }

        std::cout << "Generating benchmark circuits...\n";

        std::vector<BenchmarkResult> results;

        // Random layered benchmarks
        for (auto [w, l] : std::vector<std::pair<std::size_t, std::size_t>>{{16, 50}, {64, 100}, {256, 200}}) {
            results.push_back(runBenchmark(
                "Layered-" + std::to_string(w) + "x" + std::to_string(l),
                [w = w, l = l] { return generateLayered(w, l); }, 200));
        }

        // Adder benchmarks
        for (std::size_t n : {8UL, 32UL, 128UL}) {
            results.push_back(runBenchmark(
                "Adder-" + std::to_string(n),
                [n] { return generateAdder(n); }, 1000));
        }

        // Chain benchmarks
        for (std::size_t n : {1000UL, 100000UL}) {
            results.push_back(runBenchmark(
                "Chain-" + std::to_string(n),
                [n] { return generateChain(n); }, 100));
        }

        printResults(results);
    } catch (const ir::CircuitError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
