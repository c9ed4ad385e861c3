// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Rylan Malarchick

/**
 * @file test_circuit.cpp
 * @brief Unit tests for the Circuit class
 */

#include "ir/Circuit.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace circ::ir {
namespace {

using testing_helpers::thrownKind;

/// Flat evaluation result of a circuit without an output format.
BitVector run(const Circuit& c, const BitVector& input) {
    return std::get<BitVector>(c.evaluate(input));
}

/// Two inputs, an AND gate and one output.
Circuit makeAndCircuit() {
    Circuit c;
    GateId g0 = c.addGate(Operation::id(), {}, true);
    GateId g1 = c.addGate(Operation::id(), {}, true);
    GateId g2 = c.addGate(Operation::and_(), {g0, g1});
    c.addGate(Operation::id(), {g2}, false, true);
    return c;
}

/// xor(not a, not b) with the given signature.
Circuit makeXorOfNots(Signature sig) {
    Circuit c(std::move(sig));
    GateId g0 = c.addInput();
    GateId g1 = c.addInput();
    GateId g2 = c.addGate(Operation::not_(), {g0});
    GateId g3 = c.addGate(Operation::not_(), {g1});
    GateId g4 = c.addGate(Operation::xor_(), {g2, g3});
    c.addOutput(g4);
    return c;
}

// =============================================================================
// Construction Tests
// =============================================================================

TEST(CircuitConstructionTest, StartsEmpty) {
    Circuit c;
    EXPECT_EQ(c.count(), 0);
    EXPECT_TRUE(c.empty());
    EXPECT_EQ(c.signature(), Signature());
}

TEST(CircuitConstructionTest, CountsGates) {
    Circuit c = makeAndCircuit();
    EXPECT_EQ(c.count(), 4);
    EXPECT_EQ(c.numInputs(), 2);
    EXPECT_EQ(c.numOutputs(), 1);
    EXPECT_EQ(c.count([](const Gate& g) { return g.operation().isIdentity(); }), 3);
}

TEST(CircuitConstructionTest, ConvenienceBuilders) {
    Circuit c;
    GateId a = c.addInput();
    GateId o = c.addOutput(a);
    EXPECT_TRUE(c.gate(a).isInput());
    EXPECT_TRUE(c.gate(o).isOutput());
    EXPECT_EQ(c.gate(o).inputs(), (std::vector<GateId>{a}));
}

TEST(CircuitConstructionTest, InputRoleRequiresIdentity) {
    Circuit c;
    EXPECT_EQ(thrownKind([&] { c.addGate(Operation::not_(), {}, true); }),
              CircuitErrorKind::RoleViolation);
}

TEST(CircuitConstructionTest, OutputRoleRequiresIdentity) {
    Circuit c;
    GateId a = c.addInput();
    GateId b = c.addInput();
    EXPECT_EQ(thrownKind([&] { c.addGate(Operation::and_(), {a, b}, false, true); }),
              CircuitErrorKind::RoleViolation);
}

TEST(CircuitConstructionTest, OutputCannotBeReused) {
    Circuit c;
    GateId in = c.addInput();
    GateId g0 = c.addGate(Operation::id(), {in}, false, true);
    EXPECT_EQ(thrownKind([&] { c.addGate(Operation::not_(), {g0}); }),
              CircuitErrorKind::DanglingOutputReuse);
    EXPECT_EQ(c.count(), 2);
}

TEST(CircuitConstructionTest, NonInputGateNeedsItsInputs) {
    Circuit c;
    GateId a = c.addInput();
    EXPECT_EQ(thrownKind([&] { c.addGate(Operation::not_()); }),
              CircuitErrorKind::ArityMismatch);
    EXPECT_EQ(thrownKind([&] { c.addGate(Operation::and_(), {a}); }),
              CircuitErrorKind::ArityMismatch);
    EXPECT_EQ(thrownKind([&] { c.addGate(Operation::and_(), {a, a, a}); }),
              CircuitErrorKind::ArityMismatch);
    EXPECT_EQ(c.count(), 1);
    EXPECT_TRUE(c.gate(a).outputs().empty());
}

TEST(CircuitConstructionTest, InputGateTakesNoInputs) {
    Circuit c;
    GateId a = c.addInput();
    EXPECT_EQ(thrownKind([&] { c.addGate(Operation::id(), {a}, true); }),
              CircuitErrorKind::ArityMismatch);
}

TEST(CircuitConstructionTest, ConstantsNeedNoInputs) {
    Circuit c;
    EXPECT_NO_THROW(c.addGate(Operation::nt()));
    EXPECT_NO_THROW(c.addGate(Operation::nf()));
}

TEST(CircuitConstructionTest, ThrowsOnUnknownInput) {
    Circuit c;
    EXPECT_THROW(c.addGate(Operation::not_(), {0}), std::out_of_range);
}

// =============================================================================
// Evaluation Tests
// =============================================================================

TEST(CircuitEvaluateTest, AndScenario) {
    Circuit c = makeAndCircuit();
    EXPECT_EQ(run(c, {0, 0}), (BitVector{0}));
    EXPECT_EQ(run(c, {0, 1}), (BitVector{0}));
    EXPECT_EQ(run(c, {1, 0}), (BitVector{0}));
    EXPECT_EQ(run(c, {1, 1}), (BitVector{1}));
}

TEST(CircuitEvaluateTest, OutputsFollowPositionOrder) {
    Circuit c;
    GateId a = c.addInput();
    GateId b = c.addInput();
    GateId n = c.addGate(Operation::not_(), {a});
    c.addOutput(b);
    c.addOutput(n);
    EXPECT_EQ(run(c, {0, 1}), (BitVector{1, 1}));
    EXPECT_EQ(run(c, {1, 0}), (BitVector{0, 0}));
}

TEST(CircuitEvaluateTest, GroupedSignature) {
    Circuit c = makeXorOfNots(Signature(Format{2}, Format{1}));
    EXPECT_EQ(std::get<BitGroups>(c.evaluate(BitGroups{{0, 0}})), (BitGroups{{0}}));
    EXPECT_EQ(std::get<BitGroups>(c.evaluate(BitGroups{{0, 1}})), (BitGroups{{1}}));
    EXPECT_EQ(std::get<BitGroups>(c.evaluate(BitGroups{{1, 0}})), (BitGroups{{1}}));
    EXPECT_EQ(std::get<BitGroups>(c.evaluate(BitGroups{{1, 1}})), (BitGroups{{0}}));
}

TEST(CircuitEvaluateTest, SignatureCanBeReplaced) {
    Circuit c = makeXorOfNots(Signature(Format{2}, Format{1}));

    c.setSignature(Signature(Format{1, 1}, Format{1}));
    EXPECT_EQ(std::get<BitGroups>(c.evaluate(BitGroups{{0}, {1}})), (BitGroups{{1}}));
    EXPECT_EQ(thrownKind([&] { (void)c.evaluate(BitGroups{{0, 1}}); }),
              CircuitErrorKind::ArityMismatch);

    c.setSignature(Signature());
    EXPECT_EQ(run(c, {0, 1}), (BitVector{1}));
    EXPECT_EQ(run(c, {1, 1}), (BitVector{0}));
}

TEST(CircuitEvaluateTest, ConstantCircuitWithoutInputs) {
    Circuit c;
    GateId g0 = c.addGate(Operation::nt());
    GateId g1 = c.addGate(Operation::nf());
    GateId g2 = c.addGate(Operation::or_(), {g0, g1});
    c.addOutput(g2);
    EXPECT_EQ(run(c, {}), (BitVector{1}));

    c.setSignature(Signature(Format{0}, Format{1}));
    EXPECT_EQ(std::get<BitGroups>(c.evaluate(BitGroups{{}})), (BitGroups{{1}}));
}

TEST(CircuitEvaluateTest, EveryInputNeedsABit) {
    Circuit c;
    GateId g0 = c.addInput();
    c.addInput();
    GateId g2 = c.addGate(Operation::not_(), {g0});
    c.addGate(Operation::and_(), {g0, g2});
    GateId g4 = c.addGate(Operation::nt());
    GateId g5 = c.addGate(Operation::nf());
    GateId g6 = c.addGate(Operation::or_(), {g4, g5});
    c.addOutput(g6);

    EXPECT_EQ(run(c, {0, 1}), (BitVector{1}));
    EXPECT_EQ(thrownKind([&] { (void)c.evaluate(BitVector{0}); }),
              CircuitErrorKind::ArityMismatch);
}

TEST(CircuitEvaluateTest, ThrowsOnMalformedInput) {
    Circuit c = makeAndCircuit();
    EXPECT_EQ(thrownKind([&] { (void)c.evaluate(BitVector{1}); }),
              CircuitErrorKind::ArityMismatch);
    EXPECT_EQ(thrownKind([&] { (void)c.evaluate(BitVector{1, 2}); }),
              CircuitErrorKind::ShapeError);
    EXPECT_EQ(thrownKind([&] { (void)c.evaluate(BitGroups{{1, 1}}); }),
              CircuitErrorKind::ShapeError);
}

TEST(CircuitEvaluateTest, GroupedSignatureRejectsFlatInput) {
    Circuit c = makeXorOfNots(Signature(Format{2}, Format{1}));
    EXPECT_EQ(thrownKind([&] { (void)c.evaluate(BitVector{0, 1}); }),
              CircuitErrorKind::ShapeError);
}

TEST(CircuitEvaluateTest, FlatEvaluationBypassesSignature) {
    Circuit c = makeXorOfNots(Signature(Format{2}, Format{1}));
    EXPECT_EQ(c.evaluateFlat({1, 0}), (BitVector{1}));
    EXPECT_EQ(thrownKind([&] { (void)c.evaluateFlat({1, 0, 0}); }),
              CircuitErrorKind::ArityMismatch);
}

TEST(CircuitEvaluateTest, SignatureLengthsAreNotCheckedAtConstruction) {
    // The circuit has one input, the signature declares two bits.
    Circuit c(Signature(Format{2}));
    c.addOutput(c.addInput());
    EXPECT_EQ(thrownKind([&] { (void)c.evaluate(BitGroups{{0, 1}}); }),
              CircuitErrorKind::ArityMismatch);
}

// =============================================================================
// Prune and Sort Tests
// =============================================================================

TEST(CircuitPruneTest, DeadGateIsRemoved) {
    Circuit c = makeAndCircuit();
    const std::size_t before = c.count();

    c.addGate(Operation::or_(), {0, 1});
    EXPECT_EQ(c.count(), before + 1);

    c.pruneAndTopologicallySortStable();
    EXPECT_EQ(c.count(), before);
    EXPECT_EQ(c.gates().toLegible(), "(('id',), ('id',), ('and', 0, 1), ('id', 2))");

    EXPECT_EQ(run(c, {0, 0}), (BitVector{0}));
    EXPECT_EQ(run(c, {0, 1}), (BitVector{0}));
    EXPECT_EQ(run(c, {1, 0}), (BitVector{0}));
    EXPECT_EQ(run(c, {1, 1}), (BitVector{1}));
}

TEST(CircuitPruneTest, DisconnectedComponents) {
    Circuit c;
    GateId g0 = c.addInput();
    c.addInput();
    GateId g2 = c.addGate(Operation::not_(), {g0});
    c.addGate(Operation::and_(), {g0, g2});
    GateId g4 = c.addGate(Operation::nt());
    GateId g5 = c.addGate(Operation::nf());
    GateId g6 = c.addGate(Operation::or_(), {g4, g5});
    c.addOutput(g6);
    EXPECT_EQ(c.count(), 8);

    c.pruneAndTopologicallySortStable();

    EXPECT_EQ(c.count(), 6);
    std::vector<std::string> names;
    for (const Gate& g : c.gates()) {
        names.push_back(g.operation().name());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"id", "id", "nt", "nf", "or", "id"}));
    EXPECT_EQ(run(c, {0, 1}), (BitVector{1}));
}

TEST(CircuitPruneTest, PreservesInputAndOutputOrder) {
    Circuit c;
    GateId a = c.addInput();
    GateId n = c.addGate(Operation::not_(), {a});
    c.addOutput(n);
    GateId b = c.addInput();
    GateId x = c.addGate(Operation::xor_(), {a, b});
    c.addOutput(x);

    const BitVector before = run(c, {1, 0});
    c.pruneAndTopologicallySortStable();

    EXPECT_EQ(c.gates().toLegible(),
              "(('id',), ('id',), ('not', 0), ('xor', 0, 1), ('id', 2), ('id', 3))");
    EXPECT_EQ(run(c, {1, 0}), before);
}

// =============================================================================
// Depth Tests
// =============================================================================

TEST(CircuitDepthTest, EmptyCircuitHasZeroDepth) {
    Circuit c;
    EXPECT_EQ(c.depth(), 0);
}

TEST(CircuitDepthTest, CountsEveryGateByDefault) {
    Circuit c = makeAndCircuit();
    EXPECT_EQ(c.depth(), 3);
}

TEST(CircuitDepthTest, PredicateSelectsGates) {
    Circuit c = makeAndCircuit();
    EXPECT_EQ(c.depth([](const Gate& g) { return g.operation() == Operation::and_(); }), 1);
    EXPECT_EQ(c.depth([](const Gate& g) { return !g.operation().isIdentity(); }), 1);
    EXPECT_EQ(c.depth([](const Gate&) { return false; }), 0);
}

TEST(CircuitDepthTest, UnaryChain) {
    Circuit c(Signature(Format{1}, Format{1}));
    GateId last = c.addInput();
    for (int i = 0; i < 8; ++i) {
        last = c.addGate(Operation::not_(), {last});
    }
    c.addOutput(last);
    c.pruneAndTopologicallySortStable();

    EXPECT_EQ(c.depth(), 10);
    EXPECT_EQ(c.depth([](const Gate& g) { return g.operation() == Operation::not_(); }), 8);
}

TEST(CircuitDepthTest, LongUnbalancedChain) {
    Circuit c;
    GateId a = c.addInput();
    GateId b = c.addInput();
    GateId last = c.addGate(Operation::not_(), {a});
    GateId other = c.addGate(Operation::not_(), {b});
    for (int i = 0; i < 998; ++i) {
        last = c.addGate(Operation::xor_(), {other, last});
    }
    c.addOutput(last);
    c.pruneAndTopologicallySortStable();

    // input, not, 998 xor gates, output
    EXPECT_EQ(c.depth(), 1001);
}

TEST(CircuitDepthTest, BalancedXorTree) {
    Circuit c(Signature(Format{8}, Format{1}));
    std::vector<GateId> level;
    for (int i = 0; i < 8; ++i) {
        level.push_back(c.addInput());
    }
    while (level.size() > 1) {
        std::vector<GateId> next;
        for (std::size_t i = 0; i < level.size(); i += 2) {
            next.push_back(c.addGate(Operation::xor_(), {level[i], level[i + 1]}));
        }
        level = next;
    }
    c.addOutput(level[0]);
    c.pruneAndTopologicallySortStable();

    auto is_xor = [](const Gate& g) { return g.operation() == Operation::xor_(); };
    auto is_and = [](const Gate& g) { return g.operation() == Operation::and_(); };
    EXPECT_EQ(c.depth(), 5);
    EXPECT_EQ(c.depth(is_xor), 3);
    EXPECT_EQ(c.depth(is_and), 0);

    auto out = std::get<BitGroups>(c.evaluate(BitGroups{{1, 0, 1, 1, 0, 0, 0, 0}}));
    EXPECT_EQ(out, (BitGroups{{1}}));
}

// =============================================================================
// Truth Table Tests
// =============================================================================

TEST(CircuitTruthTableTest, ToOperation) {
    Circuit c;
    GateId a = c.addInput();
    GateId b = c.addInput();
    GateId x = c.addInput();
    GateId g = c.addGate(Operation::and_(), {a, b});
    GateId y = c.addGate(Operation::xor_(), {g, x});
    c.addOutput(y);

    EXPECT_EQ(c.toOperation().table(), (std::vector<Bit>{0, 1, 0, 1, 0, 1, 1, 0}));

    c.setSignature(Signature(Format{2, 1}, Format{1}));
    EXPECT_EQ(c.toOperation().table(), (std::vector<Bit>{0, 1, 0, 1, 0, 1, 1, 0}));
}

TEST(CircuitTruthTableTest, AndCircuitIsAnd) {
    EXPECT_EQ(makeAndCircuit().toOperation(), Operation::and_());
}

TEST(CircuitTruthTableTest, RequiresSingleOutput) {
    Circuit c;
    GateId a = c.addInput();
    c.addOutput(a);
    c.addOutput(a);
    EXPECT_EQ(thrownKind([&] { (void)c.toOperation(); }),
              CircuitErrorKind::ArityMismatch);
}

// =============================================================================
// Utility Tests
// =============================================================================

TEST(CircuitUtilityTest, CloneIsIndependent) {
    Circuit c = makeAndCircuit();
    Circuit copy = c.clone();
    copy.addGate(Operation::or_(), {0, 1});

    EXPECT_EQ(c.count(), 4);
    EXPECT_EQ(copy.count(), 5);
    EXPECT_EQ(copy.signature(), c.signature());
}

TEST(CircuitUtilityTest, ToStringShowsSummary) {
    std::string s = makeAndCircuit().toString();
    EXPECT_NE(s.find("Circuit(4 gates, 2 inputs, 1 outputs, depth 3)"), std::string::npos);
    EXPECT_NE(s.find("[2] and(0, 1)"), std::string::npos);
}

TEST(CircuitUtilityTest, StreamOperator) {
    Circuit c = makeAndCircuit();
    std::ostringstream os;
    os << c;
    EXPECT_EQ(os.str(), c.toString());
}

}  // namespace
}  // namespace circ::ir
