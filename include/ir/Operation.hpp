// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Operation.hpp
 * @brief Boolean operation represented by its truth table
 *
 * Provides the Operation value type used as the logic of every gate,
 * along with factory methods for the nullary, unary and binary operations
 * that carry a display name.
 *
 * @see Gate.hpp for the graph node that wraps an operation
 * @see Types.hpp for common type definitions
 */

#pragma once

#include "CircuitError.hpp"
#include "Types.hpp"

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace circ::ir {

/**
 * @brief Returns the display name of a truth table, or an empty view if the
 *        table has no conventional name.
 * @param arity Number of arguments
 * @param table Truth table of length 2^arity
 */
[[nodiscard]] inline std::string_view operationName(
        std::size_t arity, const std::vector<Bit>& table) noexcept {
    if (arity > 2) {
        return {};
    }
    // Encode the table with row 0 as the most significant digit.
    unsigned code = 0;
    for (Bit b : table) {
        code = (code << 1U) | static_cast<unsigned>(b);
    }

    switch (arity) {
        case 0:
            return code == 0 ? "nf" : "nt";
        case 1:
            switch (code) {
                case 0b00: return "uf";
                case 0b01: return "id";
                case 0b10: return "not";
                case 0b11: return "ut";
            }
            break;
        case 2:
            switch (code) {
                case 0b0001: return "and";
                case 0b0010: return "nimp";
                case 0b0011: return "fst";
                case 0b0100: return "nif";
                case 0b0101: return "snd";
                case 0b0110: return "xor";
                case 0b0111: return "or";
                case 0b1000: return "nor";
                case 0b1001: return "xnor";
                case 0b1010: return "nsnd";
                case 0b1011: return "if";
                case 0b1100: return "nfst";
                case 0b1101: return "imp";
                case 0b1110: return "nand";
                default:     break;
            }
            break;
    }
    return {};
}

/**
 * @brief An n-ary boolean function.
 *
 * Operations are value types compared by truth table. Row i of the table
 * holds the result for the argument tuple whose binary encoding is i, with
 * the first argument as the most significant bit.
 *
 * Example:
 * @code
 * auto op = Operation::and_();
 * op.arity();            // 2
 * op.apply({1, 1});      // 1
 * op.name();             // "and"
 * @endcode
 */
class Operation {
public:
    /**
     * @brief Constructs an operation from its truth table.
     * @param table Truth table with 2^arity entries, each 0 or 1
     * @throws std::invalid_argument if the table length is not a power of two,
     *         exceeds 2^MAX_ARITY, or holds a non-bit entry
     */
    explicit Operation(std::vector<Bit> table)
        : table_(std::move(table))
        , arity_(0)
    {
        validate();
    }

    // -------------------------------------------------------------------------
    // Factory Methods
    // -------------------------------------------------------------------------

    /// @brief Constant false (nullary).
    [[nodiscard]] static Operation nf() { return Operation(std::vector<Bit>{0}); }

    /// @brief Constant true (nullary).
    [[nodiscard]] static Operation nt() { return Operation(std::vector<Bit>{1}); }

    /// @brief Unary constant false.
    [[nodiscard]] static Operation uf() { return Operation(std::vector<Bit>{0, 0}); }

    /// @brief Identity; the only operation allowed on circuit inputs and outputs.
    [[nodiscard]] static Operation id() { return Operation(std::vector<Bit>{0, 1}); }

    /// @brief Negation.
    [[nodiscard]] static Operation not_() { return Operation(std::vector<Bit>{1, 0}); }

    /// @brief Unary constant true.
    [[nodiscard]] static Operation ut() { return Operation(std::vector<Bit>{1, 1}); }

    [[nodiscard]] static Operation and_() { return Operation(std::vector<Bit>{0, 0, 0, 1}); }
    [[nodiscard]] static Operation nimp() { return Operation(std::vector<Bit>{0, 0, 1, 0}); }
    [[nodiscard]] static Operation fst() { return Operation(std::vector<Bit>{0, 0, 1, 1}); }
    [[nodiscard]] static Operation nif() { return Operation(std::vector<Bit>{0, 1, 0, 0}); }
    [[nodiscard]] static Operation snd() { return Operation(std::vector<Bit>{0, 1, 0, 1}); }
    [[nodiscard]] static Operation xor_() { return Operation(std::vector<Bit>{0, 1, 1, 0}); }
    [[nodiscard]] static Operation or_() { return Operation(std::vector<Bit>{0, 1, 1, 1}); }
    [[nodiscard]] static Operation nor() { return Operation(std::vector<Bit>{1, 0, 0, 0}); }
    [[nodiscard]] static Operation xnor() { return Operation(std::vector<Bit>{1, 0, 0, 1}); }
    [[nodiscard]] static Operation nsnd() { return Operation(std::vector<Bit>{1, 0, 1, 0}); }
    [[nodiscard]] static Operation if_() { return Operation(std::vector<Bit>{1, 0, 1, 1}); }
    [[nodiscard]] static Operation nfst() { return Operation(std::vector<Bit>{1, 1, 0, 0}); }
    [[nodiscard]] static Operation imp() { return Operation(std::vector<Bit>{1, 1, 0, 1}); }
    [[nodiscard]] static Operation nand() { return Operation(std::vector<Bit>{1, 1, 1, 0}); }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    /// @brief Returns the number of arguments.
    [[nodiscard]] std::size_t arity() const noexcept { return arity_; }

    /// @brief Returns the truth table.
    [[nodiscard]] const std::vector<Bit>& table() const noexcept { return table_; }

    /// @brief Returns true for the unary identity operation.
    [[nodiscard]] bool isIdentity() const noexcept {
        return arity_ == 1 && table_[0] == 0 && table_[1] == 1;
    }

    /// @brief Returns true for a constant (zero-argument) operation.
    [[nodiscard]] bool isNullary() const noexcept { return arity_ == 0; }

    /**
     * @brief Applies the operation.
     * @param args Exactly arity() bits
     * @return Result bit
     * @throws CircuitError (ArityMismatch) on a wrong argument count,
     *         (ShapeError) on a non-bit argument
     */
    [[nodiscard]] Bit apply(const BitVector& args) const {
        if (args.size() != arity_) {
            throw arityMismatch(
                "operation " + name() + " expects " + std::to_string(arity_) +
                " argument(s), got " + std::to_string(args.size()));
        }
        std::size_t row = 0;
        for (Bit b : args) {
            if (b != 0 && b != 1) {
                throw shapeError("each bit must be represented by 0 or 1");
            }
            row = (row << 1U) | static_cast<std::size_t>(b);
        }
        return table_[row];
    }

    /**
     * @brief Returns the display name ("and", "id", ...), or the truth table
     *        as a tuple for operations without a conventional name.
     */
    [[nodiscard]] std::string name() const {
        std::string_view known = operationName(arity_, table_);
        if (!known.empty()) {
            return std::string(known);
        }
        std::string result = "(";
        for (std::size_t i = 0; i < table_.size(); ++i) {
            if (i > 0) result += ", ";
            result += std::to_string(table_[i]);
        }
        return result + ")";
    }

    // -------------------------------------------------------------------------
    // Operators
    // -------------------------------------------------------------------------

    [[nodiscard]] bool operator==(const Operation& other) const noexcept {
        return table_ == other.table_;
    }

    [[nodiscard]] bool operator!=(const Operation& other) const noexcept {
        return !(*this == other);
    }

    /// @brief Returns a string representation of the operation.
    [[nodiscard]] std::string toString() const {
        return name() + "/" + std::to_string(arity_);
    }

private:
    std::vector<Bit> table_;
    std::size_t arity_;

    void validate() {
        const std::size_t size = table_.size();
        if (size == 0 || (size & (size - 1)) != 0) {
            throw std::invalid_argument(
                "Truth table length must be a power of two, got " +
                std::to_string(size));
        }
        while ((std::size_t{1} << arity_) < size) {
            ++arity_;
        }
        if (arity_ > constants::MAX_ARITY) {
            throw std::invalid_argument(
                "Operation arity " + std::to_string(arity_) +
                " exceeds maximum of " + std::to_string(constants::MAX_ARITY));
        }
        for (Bit b : table_) {
            if (b != 0 && b != 1) {
                throw std::invalid_argument(
                    "Truth table entries must be 0 or 1");
            }
        }
    }
};

/**
 * @brief Stream output operator for Operation.
 */
inline std::ostream& operator<<(std::ostream& os, const Operation& op) {
    os << op.toString();
    return os;
}

}  // namespace circ::ir
