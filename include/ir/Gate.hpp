// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Gate.hpp
 * @brief Logic gate node of a circuit DAG
 *
 * Provides the Gate class: one boolean operation together with its ordered
 * input edges, its derived output edges and its circuit role. Edges are gate
 * ids (positions) into the owning GateCollection.
 *
 * @see GateCollection.hpp for the owning container
 * @see Operation.hpp for the gate logic
 */

#pragma once

#include "CircuitError.hpp"
#include "Operation.hpp"
#include "Types.hpp"

#include <algorithm>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace circ::ir {

// Forward declaration
class GateCollection;

/**
 * @brief A node in the circuit DAG.
 *
 * A gate holds an operation, the ids of the gates feeding it (in argument
 * order) and the ids of the gates it feeds (in insertion order, without
 * duplicates). Gates are created and owned by a GateCollection; the output
 * edges and the position are maintained by the collection only.
 */
class Gate {
public:
    /**
     * @brief Constructs an unattached gate.
     * @param operation Logic of the gate
     * @param inputs Ids of the input gates, in argument order
     * @param is_input Whether this gate is a circuit input
     * @param is_output Whether this gate is a circuit output
     * @throws CircuitError (RoleViolation) if an input or output gate does not
     *         carry the identity operation, or if the gate claims both roles
     */
    Gate(Operation operation,
         std::vector<GateId> inputs,
         bool is_input = false,
         bool is_output = false)
        : operation_(std::move(operation))
        , inputs_(std::move(inputs))
        , is_input_(is_input)
        , is_output_(is_output)
        , position_(INVALID_GATE_ID)
    {
        validate();
    }

    ~Gate() noexcept = default;
    Gate(const Gate&) = default;
    Gate& operator=(const Gate&) = default;
    Gate(Gate&&) noexcept = default;
    Gate& operator=(Gate&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    /// @brief Returns the gate operation.
    [[nodiscard]] const Operation& operation() const noexcept { return operation_; }

    /// @brief Returns input gate ids, in argument order.
    [[nodiscard]] const std::vector<GateId>& inputs() const noexcept { return inputs_; }

    /// @brief Returns ids of gates consuming this gate, in insertion order.
    [[nodiscard]] const std::vector<GateId>& outputs() const noexcept { return outputs_; }

    /// @brief Returns true if this gate is a circuit input.
    [[nodiscard]] bool isInput() const noexcept { return is_input_; }

    /// @brief Returns true if this gate is a circuit output.
    [[nodiscard]] bool isOutput() const noexcept { return is_output_; }

    /// @brief Returns the gate's index in its collection.
    [[nodiscard]] GateId position() const noexcept { return position_; }

    /// @brief Returns the operation arity (convenience accessor).
    [[nodiscard]] std::size_t arity() const noexcept { return operation_.arity(); }

    /// @brief Returns true if no gate feeds this gate.
    [[nodiscard]] bool isSource() const noexcept { return inputs_.empty(); }

    /// @brief Returns true if this gate feeds no other gate.
    [[nodiscard]] bool isSink() const noexcept { return outputs_.empty(); }

    /**
     * @brief Returns true if evaluation computes this gate from its inputs:
     *        it has inputs, or it is a constant that is not a circuit input.
     */
    [[nodiscard]] bool isComputed() const noexcept {
        return !inputs_.empty() || (operation_.isNullary() && !is_input_);
    }

    /// @brief Returns a string representation of the gate.
    [[nodiscard]] std::string toString() const {
        std::string result = operation_.name();
        if (!inputs_.empty()) {
            result += "(";
            for (std::size_t i = 0; i < inputs_.size(); ++i) {
                if (i > 0) result += ", ";
                result += std::to_string(inputs_[i]);
            }
            result += ")";
        }
        if (is_input_) result += " [input]";
        if (is_output_) result += " [output]";
        return result;
    }

private:
    friend class GateCollection;  // GateCollection manages edges and positions

    Operation operation_;
    std::vector<GateId> inputs_;
    std::vector<GateId> outputs_;
    bool is_input_;
    bool is_output_;
    GateId position_;

    /// @brief Records a consumer; repeated consumers are ignored.
    void addOutput(GateId consumer) {
        if (std::find(outputs_.begin(), outputs_.end(), consumer) == outputs_.end()) {
            outputs_.push_back(consumer);
        }
    }

    void setPosition(GateId position) noexcept { position_ = position; }

    void validate() const {
        if (is_input_ && !operation_.isIdentity()) {
            throw roleViolation(
                "input gates must correspond to the identity operation, got " +
                operation_.name());
        }
        if (is_input_ && is_output_) {
            throw roleViolation("a gate cannot be both a circuit input and a circuit output");
        }
        if (is_output_ && !operation_.isIdentity()) {
            throw roleViolation(
                "output gates must correspond to the identity operation, got " +
                operation_.name());
        }
    }
};

/**
 * @brief Stream output operator for Gate.
 */
inline std::ostream& operator<<(std::ostream& os, const Gate& gate) {
    os << gate.toString();
    return os;
}

}  // namespace circ::ir
