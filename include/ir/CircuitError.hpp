// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file CircuitError.hpp
 * @brief Error types for circuit construction and evaluation
 *
 * Every failure in the IR layer is a programming error of the caller and is
 * surfaced immediately as a CircuitError carrying its category.
 *
 * @see GateCollection.hpp for construction errors
 * @see Signature.hpp for shape errors
 */
#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace circ::ir {

/**
 * @brief Category of circuit error.
 */
enum class CircuitErrorKind {
    RoleViolation,        ///< Input/output gate with a non-identity operation
    DanglingOutputReuse,  ///< Output gate used as another gate's input
    ArityMismatch,        ///< Input count does not match an operation or signature
    ShapeError,           ///< Value is not a well-formed (grouped) bit vector
};

/**
 * @brief Get string representation of error kind.
 */
[[nodiscard]] constexpr std::string_view errorKindName(CircuitErrorKind kind) noexcept {
    switch (kind) {
        case CircuitErrorKind::RoleViolation:       return "role violation";
        case CircuitErrorKind::DanglingOutputReuse: return "dangling output reuse";
        case CircuitErrorKind::ArityMismatch:       return "arity mismatch";
        case CircuitErrorKind::ShapeError:          return "shape error";
    }
    return "error";
}

/**
 * @brief Exception thrown when a circuit operation fails.
 *
 * Inherits from std::runtime_error for compatibility with
 * standard exception handling. Format: "error_kind: message".
 */
class CircuitError : public std::runtime_error {
public:
    CircuitError(CircuitErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(errorKindName(kind)) + ": " + message)
        , kind_(kind)
        , message_(message) {}

    [[nodiscard]] CircuitErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    CircuitErrorKind kind_;
    std::string message_;
};

/**
 * @brief Stream output for CircuitError.
 */
inline std::ostream& operator<<(std::ostream& os, const CircuitError& error) {
    os << error.what();
    return os;
}

/**
 * @brief Helper to create a role violation error.
 */
[[nodiscard]] inline CircuitError roleViolation(const std::string& message) {
    return CircuitError(CircuitErrorKind::RoleViolation, message);
}

/**
 * @brief Helper to create a dangling output reuse error.
 */
[[nodiscard]] inline CircuitError danglingOutputReuse(const std::string& message) {
    return CircuitError(CircuitErrorKind::DanglingOutputReuse, message);
}

/**
 * @brief Helper to create an arity mismatch error.
 */
[[nodiscard]] inline CircuitError arityMismatch(const std::string& message) {
    return CircuitError(CircuitErrorKind::ArityMismatch, message);
}

/**
 * @brief Helper to create a shape error.
 */
[[nodiscard]] inline CircuitError shapeError(const std::string& message) {
    return CircuitError(CircuitErrorKind::ShapeError, message);
}

}  // namespace circ::ir
