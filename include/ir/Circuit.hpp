// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Circuit.hpp
 * @brief Boolean circuit: a gate DAG plus its input/output signature
 *
 * Provides the Circuit class for building, canonicalizing and evaluating
 * boolean circuits. Every circuit input and every circuit output is a
 * dedicated identity gate, so the number and order of inputs and outputs
 * is always well defined.
 *
 * @see GateCollection.hpp for the gate DAG
 * @see Signature.hpp for input/output formatting
 */

#pragma once

#include "CircuitError.hpp"
#include "Gate.hpp"
#include "GateCollection.hpp"
#include "Operation.hpp"
#include "Signature.hpp"
#include "Types.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace circ::ir {

/// @brief Predicate selecting gates for count() and depth()
using GatePredicate = std::function<bool(const Gate&)>;

/**
 * @brief A boolean circuit built gate by gate.
 *
 * Example:
 * @code
 * Circuit c;
 * GateId a = c.addInput();
 * GateId b = c.addInput();
 * GateId g = c.addGate(Operation::and_(), {a, b});
 * c.addOutput(g);
 *
 * c.evaluate(BitVector{1, 1});   // BitVector{1}
 * @endcode
 */
class Circuit {
public:
    /**
     * @brief Constructs an empty circuit.
     * @param signature Input/output format (flat on both sides by default)
     */
    explicit Circuit(Signature signature = Signature())
        : signature_(std::move(signature))
    {}

    // Move semantics (circuits can be large)
    Circuit(Circuit&&) noexcept = default;
    Circuit& operator=(Circuit&&) noexcept = default;

    // Delete copy (use clone() if needed)
    Circuit(const Circuit&) = delete;
    Circuit& operator=(const Circuit&) = delete;

    ~Circuit() noexcept = default;

    // -------------------------------------------------------------------------
    // Gate Management
    // -------------------------------------------------------------------------

    /**
     * @brief Adds a gate to the circuit.
     *
     * Non-input gates must name exactly arity() existing gates as inputs;
     * input gates name none.
     *
     * @param operation Logic of the gate
     * @param inputs Ids of existing gates, in argument order
     * @param is_input Whether the gate is a circuit input
     * @param is_output Whether the gate is a circuit output
     * @return Id (position) of the new gate
     * @throws CircuitError (RoleViolation, DanglingOutputReuse, ArityMismatch)
     * @throws std::out_of_range if an input id does not name an existing gate
     */
    GateId addGate(Operation operation,
                   std::vector<GateId> inputs = {},
                   bool is_input = false,
                   bool is_output = false) {
        return gates_.addGate(std::move(operation), std::move(inputs),
                              is_input, is_output, InputArity::Exact);
    }

    /// @brief Adds a circuit input (an identity gate without inputs).
    GateId addInput() {
        return addGate(Operation::id(), {}, true, false);
    }

    /// @brief Adds a circuit output fed by the given gate.
    GateId addOutput(GateId source) {
        return addGate(Operation::id(), {source}, false, true);
    }

    /// @brief Returns the gate at the specified position.
    [[nodiscard]] const Gate& gate(GateId id) const { return gates_.gate(id); }

    /// @brief Returns the gate DAG.
    [[nodiscard]] const GateCollection& gates() const noexcept { return gates_; }

    // -------------------------------------------------------------------------
    // Signature
    // -------------------------------------------------------------------------

    [[nodiscard]] const Signature& signature() const noexcept { return signature_; }

    /// @brief Replaces the signature; only affects later evaluate() formatting.
    void setSignature(Signature signature) { signature_ = std::move(signature); }

    // -------------------------------------------------------------------------
    // Circuit Properties
    // -------------------------------------------------------------------------

    /// @brief Returns the number of gates.
    [[nodiscard]] std::size_t count() const noexcept { return gates_.size(); }

    /// @brief Counts the gates that satisfy a predicate.
    [[nodiscard]] std::size_t count(const GatePredicate& predicate) const {
        return static_cast<std::size_t>(
            std::count_if(gates_.begin(), gates_.end(), predicate));
    }

    /// @brief Returns the number of input gates.
    [[nodiscard]] std::size_t numInputs() const {
        return count([](const Gate& g) { return g.isInput(); });
    }

    /// @brief Returns the number of output gates.
    [[nodiscard]] std::size_t numOutputs() const {
        return count([](const Gate& g) { return g.isOutput(); });
    }

    /// @brief Returns true if the circuit has no gates.
    [[nodiscard]] bool empty() const noexcept { return gates_.empty(); }

    /**
     * @brief Calculates the circuit depth counting every gate.
     * @return Longest path length in gates (0 for empty circuits)
     */
    [[nodiscard]] std::size_t depth() const {
        return depth([](const Gate&) { return true; });
    }

    /**
     * @brief Calculates the circuit depth with respect to selected gates.
     *
     * The depth of a gate is its own weight (1 if it satisfies the predicate,
     * 0 otherwise) plus the largest depth among its inputs. Computed in one
     * forward pass, which relies on inputs preceding their consumers (true in
     * insertion order and after pruneAndTopologicallySortStable()).
     *
     * @param predicate Gates that count toward depth (e.g. only AND gates)
     * @return Maximum gate depth (0 for empty circuits)
     */
    [[nodiscard]] std::size_t depth(const GatePredicate& predicate) const {
        std::vector<std::size_t> depths(gates_.size(), 0);
        std::size_t result = 0;

        for (const Gate& g : gates_) {
            std::size_t max_input = 0;
            for (GateId input : g.inputs()) {
                max_input = std::max(max_input, depths[input]);
            }
            const std::size_t d = (predicate(g) ? 1 : 0) + max_input;
            depths[g.position()] = d;
            result = std::max(result, d);
        }

        return result;
    }

    // -------------------------------------------------------------------------
    // Canonical Form
    // -------------------------------------------------------------------------

    /**
     * @brief Removes interior gates with no path to an output and sorts the
     *        gates into input, interior and output blocks, keeping the
     *        original relative order within each block.
     *
     * Evaluation results are unchanged. Gate ids obtained before the call
     * are invalidated.
     */
    void pruneAndTopologicallySortStable() {
        gates_.pruneAndTopologicallySortStable();
    }

    // -------------------------------------------------------------------------
    // Evaluation
    // -------------------------------------------------------------------------

    /**
     * @brief Evaluates the circuit on an input in the signature's input format.
     * @param input Flat bits, or grouped bits when the signature has an input format
     * @return Output in the signature's output format
     * @throws CircuitError (ShapeError, ArityMismatch) on a malformed input
     */
    [[nodiscard]] BitValue evaluate(const BitValue& input) const {
        return signature_.output(evaluateFlat(signature_.input(input)));
    }

    /**
     * @brief Evaluates the circuit on flat bits, bypassing the signature.
     *
     * Input bits are bound to the input gates in position order. The result
     * holds one bit per output gate, in position order.
     *
     * @param input One bit per input gate
     * @throws CircuitError (ArityMismatch) on a wrong input length
     * @throws CircuitError (ShapeError) on a non-bit entry
     */
    [[nodiscard]] BitVector evaluateFlat(const BitVector& input) const {
        const std::size_t inputs = numInputs();
        if (input.size() != inputs) {
            throw arityMismatch(
                "circuit has " + std::to_string(inputs) +
                " input gate(s), got " + std::to_string(input.size()) + " bit(s)");
        }

        BitVector wire(gates_.size(), 0);
        BitVector args;
        std::size_t next = 0;
        for (const Gate& g : gates_) {
            if (g.isInput()) {
                const Bit b = input[next++];
                if (b != 0 && b != 1) {
                    throw shapeError("each bit must be represented by 0 or 1");
                }
                wire[g.position()] = b;
            } else if (g.isComputed()) {
                args.clear();
                for (GateId in : g.inputs()) {
                    args.push_back(wire[in]);
                }
                wire[g.position()] = g.operation().apply(args);
            }
        }

        BitVector output;
        for (const Gate& g : gates_) {
            if (g.isOutput() && g.isSink()) {
                output.push_back(wire[g.position()]);
            }
        }
        return output;
    }

    /**
     * @brief Converts a single-output circuit into the boolean function it
     *        computes. Cost is exponential in the number of inputs.
     *
     * Rows follow the input gates in position order, first input as the most
     * significant bit. A grouped input format is honored.
     *
     * @throws CircuitError (ArityMismatch) unless there is exactly one output gate
     * @throws std::invalid_argument if there are more than MAX_ARITY inputs
     */
    [[nodiscard]] Operation toOperation() const {
        if (numOutputs() != 1) {
            throw arityMismatch("circuit must have exactly one output gate");
        }
        const std::size_t n = numInputs();
        if (n > constants::MAX_ARITY) {
            throw std::invalid_argument(
                "Truth table of " + std::to_string(n) +
                " inputs exceeds maximum arity of " +
                std::to_string(constants::MAX_ARITY));
        }

        std::vector<Bit> table;
        table.reserve(std::size_t{1} << n);
        BitVector bits(n, 0);
        for (std::size_t row = 0; row < (std::size_t{1} << n); ++row) {
            for (std::size_t i = 0; i < n; ++i) {
                bits[i] = static_cast<Bit>((row >> (n - 1 - i)) & 1U);
            }

            BitValue input = bits;
            if (signature_.inputFormat().has_value()) {
                input = Signature::split(bits, *signature_.inputFormat());
            }
            table.push_back(firstBit(evaluate(input)));
        }
        return Operation(std::move(table));
    }

    // -------------------------------------------------------------------------
    // Utilities
    // -------------------------------------------------------------------------

    /**
     * @brief Creates a deep copy of the circuit.
     */
    [[nodiscard]] Circuit clone() const {
        Circuit copy(signature_);
        copy.gates_ = gates_.clone();
        return copy;
    }

    /**
     * @brief Returns a string representation of the circuit.
     * @return Multi-line string showing circuit structure
     */
    [[nodiscard]] std::string toString() const {
        std::string result = "Circuit(" + std::to_string(gates_.size()) +
                             " gates, " + std::to_string(numInputs()) +
                             " inputs, " + std::to_string(numOutputs()) +
                             " outputs, depth " + std::to_string(depth()) + "):\n";
        for (const Gate& g : gates_) {
            result += "  [" + std::to_string(g.position()) + "] " + g.toString() + "\n";
        }
        return result;
    }

private:
    GateCollection gates_;
    Signature signature_;

    static Bit firstBit(const BitValue& output) {
        if (const auto* flat = std::get_if<BitVector>(&output)) {
            return flat->at(0);
        }
        return std::get<BitGroups>(output).at(0).at(0);
    }
};

/**
 * @brief Stream output operator for Circuit.
 * @param os Output stream
 * @param circuit The circuit to output
 * @return Reference to the output stream
 */
inline std::ostream& operator<<(std::ostream& os, const Circuit& circuit) {
    os << circuit.toString();
    return os;
}

}  // namespace circ::ir
