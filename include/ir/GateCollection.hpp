// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file GateCollection.hpp
 * @brief Owning, ordered container of the gates of one circuit DAG
 *
 * Provides the GateCollection class, an arena of gates indexed by position.
 * The collection validates edges when a gate is inserted, maintains the
 * derived output edges, marks reachability and rewrites itself into the
 * pruned, stably sorted canonical form.
 *
 * Because a gate can only name gates that already exist as its inputs, the
 * collection is acyclic by construction and insertion order is a
 * topological order.
 *
 * @see Gate.hpp for the node type
 * @see Circuit.hpp for the circuit-level wrapper
 */

#pragma once

#include "CircuitError.hpp"
#include "Gate.hpp"
#include "Operation.hpp"
#include "Types.hpp"

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace circ::ir {

/**
 * @brief How strictly a new gate's input count is checked.
 */
enum class InputArity {
    ZeroOrExact,  ///< Either no inputs (drawn from the external input) or arity inputs
    Exact,        ///< Non-input gates must name exactly arity inputs
};

/**
 * @brief Ordered, owning collection of gates forming a DAG.
 *
 * A gate's id is its position in the collection. Edges in both directions
 * are stored as ids, so the collection is the only owner of gate state.
 *
 * Example:
 * @code
 * GateCollection gates;
 * GateId a = gates.addGate(Operation::id(), {}, true);
 * GateId b = gates.addGate(Operation::id(), {}, true);
 * GateId c = gates.addGate(Operation::and_(), {a, b});
 * gates.addGate(Operation::id(), {c}, false, true);
 *
 * gates.toLegible();  // "(('id',), ('id',), ('and', 0, 1), ('id', 2))"
 * @endcode
 */
class GateCollection {
public:
    using const_iterator = std::vector<Gate>::const_iterator;

    GateCollection() = default;

    // Move semantics
    GateCollection(GateCollection&&) noexcept = default;
    GateCollection& operator=(GateCollection&&) noexcept = default;

    // Delete copy (use clone() if needed)
    GateCollection(const GateCollection&) = delete;
    GateCollection& operator=(const GateCollection&) = delete;

    ~GateCollection() noexcept = default;

    // -------------------------------------------------------------------------
    // Gate Management
    // -------------------------------------------------------------------------

    /**
     * @brief Appends a gate and links it to its inputs.
     *
     * All checks run before anything is modified, so a failing call leaves
     * the collection and every existing gate untouched.
     *
     * @param operation Logic of the new gate
     * @param inputs Ids of existing gates, in argument order
     * @param is_input Whether the gate is a circuit input
     * @param is_output Whether the gate is a circuit output
     * @param rule Input count rule for non-input gates
     * @return Id (position) of the new gate
     * @throws CircuitError (RoleViolation) for a role on a non-identity gate
     * @throws CircuitError (DanglingOutputReuse) if an input is an output gate
     * @throws CircuitError (ArityMismatch) if the input count is not allowed
     * @throws std::out_of_range if an input id does not name an existing gate
     */
    GateId addGate(Operation operation,
                   std::vector<GateId> inputs = {},
                   bool is_input = false,
                   bool is_output = false,
                   InputArity rule = InputArity::ZeroOrExact) {
        Gate gate(std::move(operation), std::move(inputs), is_input, is_output);
        validateInputs(gate, rule);

        const GateId id = gates_.size();
        gate.setPosition(id);
        gates_.push_back(std::move(gate));

        // Designate the new gate as a consumer of each of its inputs.
        for (GateId input : gates_.back().inputs()) {
            gates_[input].addOutput(id);
        }
        return id;
    }

    /**
     * @brief Returns the gate at the specified position.
     * @throws std::out_of_range if id >= size()
     */
    [[nodiscard]] const Gate& gate(GateId id) const {
        if (id >= gates_.size()) {
            throw std::out_of_range(
                "Gate index " + std::to_string(id) +
                " out of range [0, " + std::to_string(gates_.size()) + ")");
        }
        return gates_[id];
    }

    /// @brief Returns all gates in position order.
    [[nodiscard]] const std::vector<Gate>& gates() const noexcept { return gates_; }

    /// @brief Returns the number of gates.
    [[nodiscard]] std::size_t size() const noexcept { return gates_.size(); }

    /// @brief Returns true if the collection has no gates.
    [[nodiscard]] bool empty() const noexcept { return gates_.empty(); }

    /// @brief Removes all gates.
    void clear() noexcept { gates_.clear(); }

    [[nodiscard]] const_iterator begin() const noexcept { return gates_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return gates_.end(); }

    // -------------------------------------------------------------------------
    // Graph Queries
    // -------------------------------------------------------------------------

    /**
     * @brief Returns ids of source gates (no inputs).
     */
    [[nodiscard]] std::vector<GateId> sources() const {
        std::vector<GateId> result;
        for (const Gate& g : gates_) {
            if (g.isSource()) {
                result.push_back(g.position());
            }
        }
        return result;
    }

    /**
     * @brief Returns ids of sink gates (not consumed by any gate).
     */
    [[nodiscard]] std::vector<GateId> sinks() const {
        std::vector<GateId> result;
        for (const Gate& g : gates_) {
            if (g.isSink()) {
                result.push_back(g.position());
            }
        }
        return result;
    }

    /**
     * @brief Returns ids of the output gates that terminate the circuit:
     *        identity gates flagged as outputs with no consumers.
     */
    [[nodiscard]] std::vector<GateId> effectiveOutputs() const {
        std::vector<GateId> result;
        for (const Gate& g : gates_) {
            if (g.isOutput() && g.isSink() && g.operation().isIdentity()) {
                result.push_back(g.position());
            }
        }
        return result;
    }

    /**
     * @brief Marks every gate reachable from a gate through input edges.
     *
     * Gates already marked are not revisited, so repeated calls on the same
     * scratch vector accumulate. The scratch vector is owned by the caller and
     * is grown to size() if needed.
     *
     * @param id Gate to start from
     * @param visited Per-position mark flags
     * @throws std::out_of_range if id does not name a gate
     */
    void mark(GateId id, std::vector<bool>& visited) const {
        (void)gate(id);
        if (visited.size() < gates_.size()) {
            visited.resize(gates_.size(), false);
        }

        std::vector<GateId> pending{id};
        while (!pending.empty()) {
            const GateId current = pending.back();
            pending.pop_back();
            if (visited[current]) {
                continue;
            }
            visited[current] = true;
            for (GateId input : gates_[current].inputs()) {
                if (!visited[input]) {
                    pending.push_back(input);
                }
            }
        }
    }

    /**
     * @brief Returns the set of gates reachable backward from the given roots.
     * @param roots Gates to start from
     * @return Per-position flags, freshly reset before marking
     */
    [[nodiscard]] std::vector<bool> markReachable(const std::vector<GateId>& roots) const {
        std::vector<bool> visited(gates_.size(), false);
        for (GateId root : roots) {
            mark(root, visited);
        }
        return visited;
    }

    // -------------------------------------------------------------------------
    // Canonical Form
    // -------------------------------------------------------------------------

    /**
     * @brief Prunes gates with no path to an output and sorts the rest stably.
     *
     * The rebuilt sequence has three blocks, each in original relative order:
     * input gates, surviving interior gates, and effective output gates (whose
     * output edges are cleared). Input gates are kept even when no output
     * depends on them. Interior gates survive only if they are reachable
     * backward from an effective output and feed at least one gate.
     *
     * All gate ids are rewritten to the new positions; ids obtained before
     * the call are invalidated.
     */
    void pruneAndTopologicallySortStable() {
        const std::vector<GateId> terminals = effectiveOutputs();
        const std::vector<bool> reachable = markReachable(terminals);

        std::vector<GateId> order;  // Old ids in their new order
        order.reserve(gates_.size());

        // Input gates at the beginning. Sources that take their arguments
        // from the external input are kept alongside them while reachable.
        for (const Gate& g : gates_) {
            const bool placeholder = !g.isInput() && !g.isOutput() &&
                                     !g.operation().isNullary() &&
                                     reachable[g.position()];
            if (g.isSource() && (g.isInput() || placeholder)) {
                order.push_back(g.position());
            }
        }

        // Surviving interior gates.
        for (const Gate& g : gates_) {
            if (g.isComputed() && !g.isSink() &&
                !g.isInput() && !g.isOutput() &&
                reachable[g.position()]) {
                order.push_back(g.position());
            }
        }

        // Effective outputs at the end.
        order.insert(order.end(), terminals.begin(), terminals.end());

        std::vector<GateId> remap(gates_.size(), INVALID_GATE_ID);
        for (std::size_t i = 0; i < order.size(); ++i) {
            remap[order[i]] = i;
        }
        for (GateId old_id : order) {
            for (GateId input : gates_[old_id].inputs()) {
                if (remap[input] == INVALID_GATE_ID) {
                    throw std::logic_error(
                        "Pruning dropped input " + std::to_string(input) +
                        " of surviving gate " + std::to_string(old_id) +
                        " (internal error: should not happen)");
                }
            }
        }

        std::vector<Gate> rebuilt;
        rebuilt.reserve(order.size());
        for (GateId old_id : order) {
            Gate g = std::move(gates_[old_id]);
            g.setPosition(remap[old_id]);
            for (GateId& input : g.inputs_) {
                input = remap[input];
            }
            if (g.isOutput()) {
                g.outputs_.clear();
            } else {
                std::vector<GateId> consumers;
                for (GateId consumer : g.outputs_) {
                    if (remap[consumer] != INVALID_GATE_ID) {
                        consumers.push_back(remap[consumer]);
                    }
                }
                g.outputs_ = std::move(consumers);
            }
            rebuilt.push_back(std::move(g));
        }

        gates_ = std::move(rebuilt);
    }

    // -------------------------------------------------------------------------
    // Evaluation
    // -------------------------------------------------------------------------

    /**
     * @brief Returns the number of bits raw evaluation consumes: the arity of
     *        every gate with no inputs.
     */
    [[nodiscard]] std::size_t requiredInputs() const noexcept {
        std::size_t total = 0;
        for (const Gate& g : gates_) {
            if (g.isSource()) {
                total += g.arity();
            }
        }
        return total;
    }

    /**
     * @brief Evaluates the collection on its own terms.
     *
     * Gates are evaluated in position order. A gate without inputs takes its
     * arguments from the next arity() bits of the input. The result holds the
     * value of every sink, in position order.
     *
     * @param input Exactly requiredInputs() bits
     * @throws CircuitError (ArityMismatch) on a wrong input length
     */
    [[nodiscard]] BitVector evaluate(const BitVector& input) const {
        const std::size_t required = requiredInputs();
        if (input.size() != required) {
            throw arityMismatch(
                "gate collection requires " + std::to_string(required) +
                " input bit(s), got " + std::to_string(input.size()));
        }

        BitVector wire(gates_.size(), 0);
        BitVector args;
        std::size_t next = 0;
        for (const Gate& g : gates_) {
            args.clear();
            if (g.isSource()) {
                args.assign(input.begin() + static_cast<std::ptrdiff_t>(next),
                            input.begin() + static_cast<std::ptrdiff_t>(next + g.arity()));
                next += g.arity();
            } else {
                for (GateId in : g.inputs()) {
                    args.push_back(wire[in]);
                }
            }
            wire[g.position()] = g.operation().apply(args);
        }

        BitVector result;
        for (const Gate& g : gates_) {
            if (g.isSink()) {
                result.push_back(wire[g.position()]);
            }
        }
        return result;
    }

    /**
     * @brief Converts a single-sink collection into the boolean function it
     *        computes. Cost is exponential in requiredInputs().
     * @throws CircuitError (ArityMismatch) unless there is exactly one sink
     * @throws std::invalid_argument if requiredInputs() exceeds MAX_ARITY
     */
    [[nodiscard]] Operation toOperation() const {
        const std::size_t n = requiredInputs();
        if (n > constants::MAX_ARITY) {
            throw std::invalid_argument(
                "Truth table of " + std::to_string(n) +
                " inputs exceeds maximum arity of " +
                std::to_string(constants::MAX_ARITY));
        }
        if (sinks().size() != 1) {
            throw arityMismatch(
                "gate collection must have exactly one output when evaluated");
        }

        std::vector<Bit> table;
        table.reserve(std::size_t{1} << n);
        BitVector input(n, 0);
        for (std::size_t row = 0; row < (std::size_t{1} << n); ++row) {
            for (std::size_t i = 0; i < n; ++i) {
                input[i] = static_cast<Bit>((row >> (n - 1 - i)) & 1U);
            }
            table.push_back(evaluate(input)[0]);
        }
        return Operation(std::move(table));
    }

    // -------------------------------------------------------------------------
    // Utilities
    // -------------------------------------------------------------------------

    /**
     * @brief Returns the canonical legible form: for each gate in position
     *        order, its operation name followed by its input positions.
     *
     * Example: (('id',), ('id',), ('and', 0, 1), ('id', 2))
     */
    [[nodiscard]] std::string toLegible() const {
        std::string result = "(";
        for (std::size_t i = 0; i < gates_.size(); ++i) {
            if (i > 0) result += ", ";
            const Gate& g = gates_[i];
            result += "('" + g.operation().name() + "'";
            if (g.inputs().empty()) {
                result += ",";
            }
            for (GateId input : g.inputs()) {
                result += ", " + std::to_string(input);
            }
            result += ")";
        }
        if (gates_.size() == 1) {
            result += ",";
        }
        return result + ")";
    }

    /// @brief Creates a deep copy of the collection.
    [[nodiscard]] GateCollection clone() const {
        GateCollection copy;
        copy.gates_ = gates_;
        return copy;
    }

    /**
     * @brief Structural equality: same operations, input positions and roles
     *        at every position.
     */
    [[nodiscard]] bool operator==(const GateCollection& other) const noexcept {
        if (gates_.size() != other.gates_.size()) {
            return false;
        }
        for (std::size_t i = 0; i < gates_.size(); ++i) {
            const Gate& a = gates_[i];
            const Gate& b = other.gates_[i];
            if (a.operation() != b.operation() ||
                a.inputs() != b.inputs() ||
                a.isInput() != b.isInput() ||
                a.isOutput() != b.isOutput()) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] bool operator!=(const GateCollection& other) const noexcept {
        return !(*this == other);
    }

    /**
     * @brief Returns a string representation of the collection.
     * @return Multi-line string, one gate per line
     */
    [[nodiscard]] std::string toString() const {
        std::string result = "Gates(" + std::to_string(gates_.size()) + "):\n";
        for (const Gate& g : gates_) {
            result += "  [" + std::to_string(g.position()) + "] " + g.toString() + "\n";
        }
        return result;
    }

private:
    std::vector<Gate> gates_;

    /**
     * @brief Validates a new gate's input edges against the collection.
     */
    void validateInputs(const Gate& g, InputArity rule) const {
        for (GateId input : g.inputs()) {
            if (input >= gates_.size()) {
                throw std::out_of_range(
                    "Input gate " + std::to_string(input) +
                    " does not exist (collection has " +
                    std::to_string(gates_.size()) + " gates)");
            }
            if (gates_[input].isOutput()) {
                throw danglingOutputReuse(
                    "output gates cannot be designated as inputs into other gates");
            }
        }

        const std::size_t count = g.inputs().size();
        const std::size_t arity = g.arity();
        if (g.isInput()) {
            if (count != 0) {
                throw arityMismatch("input gates cannot have inputs");
            }
            return;
        }
        if (rule == InputArity::Exact) {
            if (count == 0 && arity > 0) {
                throw arityMismatch(
                    "non-input circuit gate must have its inputs specified");
            }
            if (count != arity) {
                throw arityMismatch(
                    "number of circuit gate inputs must match arity of gate operation");
            }
        } else if (count != 0 && count != arity) {
            throw arityMismatch(
                "number of inputs must equal operation arity or zero");
        }
    }
};

/**
 * @brief Stream output operator for GateCollection.
 */
inline std::ostream& operator<<(std::ostream& os, const GateCollection& gates) {
    os << gates.toString();
    return os;
}

}  // namespace circ::ir
