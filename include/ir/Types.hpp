// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Types.hpp
 * @brief Common type aliases and constants for the circuit library
 *
 * Provides foundational types used throughout the circ library including
 * gate identifiers, bit vectors and structural limits.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <variant>
#include <vector>

namespace circ {

/// @brief Type alias for gate identifiers (the gate's position in its collection)
using GateId = std::size_t;

/// @brief A single bit; valid values are 0 and 1
using Bit = int;

/// @brief Flat bit vector
using BitVector = std::vector<Bit>;

/// @brief Grouped bit vectors (one entry per signature group)
using BitGroups = std::vector<BitVector>;

/// @brief Either a flat or a grouped bit vector, as governed by a Signature
using BitValue = std::variant<BitVector, BitGroups>;

/// @brief Sentinel value for invalid/unassigned gate IDs
inline constexpr GateId INVALID_GATE_ID = std::numeric_limits<GateId>::max();

namespace constants {

/// @brief Largest arity for truth tables (operations and extracted functions)
inline constexpr std::size_t MAX_ARITY = 20;

}  // namespace constants

}  // namespace circ
