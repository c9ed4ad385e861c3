// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file Signature.hpp
 * @brief Input and output bit vector formats of a circuit
 *
 * A signature converts a caller's (optionally grouped) input into the flat
 * bit vector a circuit consumes, and groups the flat output bits a circuit
 * produces. A side without a format is flat.
 *
 * @see Circuit.hpp for evaluation
 */

#pragma once

#include "CircuitError.hpp"
#include "Types.hpp"

#include <cstddef>
#include <numeric>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace circ::ir {

/// @brief Lengths of the bit vector groups on one side of a signature
using Format = std::vector<std::size_t>;

/**
 * @brief Circuit signature: the input and output bit vector formats.
 *
 * Example:
 * @code
 * Signature sig(Format{3, 1}, Format{2, 3});
 * sig.input(BitGroups{{1, 0, 0}, {1}});   // {1, 0, 0, 1}
 * sig.output(BitVector{1, 0, 0, 1, 1});   // BitGroups{{1, 0}, {0, 1, 1}}
 * @endcode
 */
class Signature {
public:
    /// @brief Constructs a signature that is flat on both sides.
    Signature() = default;

    /**
     * @brief Constructs a signature with optional group formats.
     * @param input_format Input group lengths, or nullopt for a flat input
     * @param output_format Output group lengths, or nullopt for a flat output
     */
    explicit Signature(std::optional<Format> input_format,
                       std::optional<Format> output_format = std::nullopt)
        : input_format_(std::move(input_format))
        , output_format_(std::move(output_format))
    {}

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] const std::optional<Format>& inputFormat() const noexcept {
        return input_format_;
    }

    [[nodiscard]] const std::optional<Format>& outputFormat() const noexcept {
        return output_format_;
    }

    /// @brief Returns the total number of input bits, if the input is grouped.
    [[nodiscard]] std::optional<std::size_t> inputLength() const {
        return totalLength(input_format_);
    }

    /// @brief Returns the total number of output bits, if the output is grouped.
    [[nodiscard]] std::optional<std::size_t> outputLength() const {
        return totalLength(output_format_);
    }

    // -------------------------------------------------------------------------
    // Conversion
    // -------------------------------------------------------------------------

    /**
     * @brief Converts an input matching the input format into flat bits.
     * @param value Flat bits (no input format) or one group per format entry
     * @return Flattened bit vector
     * @throws CircuitError (ShapeError) if the value has the wrong shape or
     *         holds a non-bit entry
     * @throws CircuitError (ArityMismatch) if group lengths differ from the format
     */
    [[nodiscard]] BitVector input(const BitValue& value) const {
        if (!input_format_.has_value()) {
            const auto* flat = std::get_if<BitVector>(&value);
            if (flat == nullptr) {
                throw shapeError("input must be a flat bit vector");
            }
            checkBits(*flat);
            return *flat;
        }

        const auto* groups = std::get_if<BitGroups>(&value);
        if (groups == nullptr) {
            throw shapeError("input must be a list of bit vectors");
        }

        Format lengths;
        lengths.reserve(groups->size());
        for (const BitVector& group : *groups) {
            checkBits(group);
            lengths.push_back(group.size());
        }
        if (lengths != *input_format_) {
            throw arityMismatch("input format does not match signature");
        }

        BitVector flat;
        for (const BitVector& group : *groups) {
            flat.insert(flat.end(), group.begin(), group.end());
        }
        return flat;
    }

    /**
     * @brief Converts flat output bits into the output format.
     * @param bits Flat output bits
     * @return The bits unchanged (no output format) or grouped per format
     * @throws CircuitError (ArityMismatch) if the format's total length
     *         differs from the number of bits
     */
    [[nodiscard]] BitValue output(const BitVector& bits) const {
        if (!output_format_.has_value()) {
            return bits;
        }
        return split(bits, *output_format_);
    }

    /**
     * @brief Splits flat bits into consecutive groups of the given lengths.
     * @throws CircuitError (ArityMismatch) if the lengths do not sum to bits.size()
     */
    [[nodiscard]] static BitGroups split(const BitVector& bits, const Format& format) {
        const std::size_t total = std::accumulate(format.begin(), format.end(), std::size_t{0});
        if (total != bits.size()) {
            throw arityMismatch(
                "format covers " + std::to_string(total) +
                " bit(s) but " + std::to_string(bits.size()) + " were given");
        }

        BitGroups groups;
        groups.reserve(format.size());
        auto it = bits.begin();
        for (std::size_t length : format) {
            groups.emplace_back(it, it + static_cast<std::ptrdiff_t>(length));
            it += static_cast<std::ptrdiff_t>(length);
        }
        return groups;
    }

    // -------------------------------------------------------------------------
    // Operators
    // -------------------------------------------------------------------------

    [[nodiscard]] bool operator==(const Signature& other) const noexcept {
        return input_format_ == other.input_format_ &&
               output_format_ == other.output_format_;
    }

    [[nodiscard]] bool operator!=(const Signature& other) const noexcept {
        return !(*this == other);
    }

    /// @brief Returns a string representation of the signature.
    [[nodiscard]] std::string toString() const {
        return "Signature(input: " + formatString(input_format_) +
               ", output: " + formatString(output_format_) + ")";
    }

private:
    std::optional<Format> input_format_;
    std::optional<Format> output_format_;

    static void checkBits(const BitVector& bits) {
        for (Bit b : bits) {
            if (b != 0 && b != 1) {
                throw shapeError("each bit must be represented by 0 or 1");
            }
        }
    }

    static std::optional<std::size_t> totalLength(const std::optional<Format>& format) {
        if (!format.has_value()) {
            return std::nullopt;
        }
        return std::accumulate(format->begin(), format->end(), std::size_t{0});
    }

    static std::string formatString(const std::optional<Format>& format) {
        if (!format.has_value()) {
            return "flat";
        }
        std::string result = "[";
        for (std::size_t i = 0; i < format->size(); ++i) {
            if (i > 0) result += ", ";
            result += std::to_string((*format)[i]);
        }
        return result + "]";
    }
};

/**
 * @brief Stream output operator for Signature.
 */
inline std::ostream& operator<<(std::ostream& os, const Signature& signature) {
    os << signature.toString();
    return os;
}

}  // namespace circ::ir
