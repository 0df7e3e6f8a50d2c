// ----------------------------------------------------------------------------
// Copyright (c) 2013-2014 by Graz University of Technology and
//                            Johannes Kepler University Linz
//
// This is free software; you can redistribute it and/or
// modify it under the terms of the GNU Lesser General Public
// License as published by the Free Software Foundation; either
// version 3 of the License, or (at your option) any later version.
//
// This software is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
// Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public
// License along with this library; if not, see
// <http://www.gnu.org/licenses/>.
//
// For more information about this software see
//   <http://www.iaik.tugraz.at/content/research/design_verification/demiurge/>
// or email the authors directly.
//
// ----------------------------------------------------------------------------


#include "CircuitState.h"
#include "AigCircuit.h"
#include "TestCircuits.h"
#include "gtest/gtest.h"

// The AND gate circuit has the nodes 0 (constant), 1 and 2 (inputs), and 3 (the gate).

TEST(CircuitStateTest, InitialState) {
  AigCircuit *circuit = TestCircuits::andGate();
  CircuitState state(*circuit);
  EXPECT_EQ(state.getValue(0), CircuitState::VAL_FALSE);
  EXPECT_EQ(state.getValue(1), CircuitState::VAL_UNDEF);
  EXPECT_EQ(state.getLitValue(AigCircuit::makeLit(0, true)), CircuitState::VAL_TRUE);
  EXPECT_EQ(state.getResidualSize(), 3u);
  delete circuit;
}

TEST(CircuitStateTest, BackwardPropagationOfTrueGate) {
  AigCircuit *circuit = TestCircuits::andGate();
  CircuitState state(*circuit);
  EXPECT_TRUE(state.assignLit(circuit->getOutput()));
  EXPECT_EQ(state.getValue(1), CircuitState::VAL_TRUE);
  EXPECT_EQ(state.getValue(2), CircuitState::VAL_TRUE);
  EXPECT_EQ(state.getResidualSize(), 0u);
  delete circuit;
}

TEST(CircuitStateTest, ForwardPropagationOfFalseInput) {
  AigCircuit *circuit = TestCircuits::andGate();
  CircuitState state(*circuit);
  EXPECT_TRUE(state.assign(1, false));
  EXPECT_EQ(state.getValue(3), CircuitState::VAL_FALSE);
  EXPECT_EQ(state.getValue(2), CircuitState::VAL_UNDEF);
  delete circuit;
}

TEST(CircuitStateTest, FalseGateWithTrueInput) {
  AigCircuit *circuit = TestCircuits::andGate();
  CircuitState state(*circuit);
  EXPECT_TRUE(state.assign(3, false));
  EXPECT_EQ(state.getValue(1), CircuitState::VAL_UNDEF);
  EXPECT_TRUE(state.assign(1, true));
  EXPECT_EQ(state.getValue(2), CircuitState::VAL_FALSE);
  delete circuit;
}

TEST(CircuitStateTest, BufferIsNotLive) {
  AigCircuit *circuit = TestCircuits::andGate();
  CircuitState state(*circuit);
  EXPECT_TRUE(state.isLive(3));
  EXPECT_TRUE(state.assign(1, true));
  // the gate now just copies input 2:
  EXPECT_FALSE(state.isLive(3));
  EXPECT_TRUE(state.isLive(2));
  EXPECT_EQ(state.getNrOfLiveFanouts(2), 0u);
  EXPECT_EQ(state.getResidualSize(), 1u);
  delete circuit;
}

TEST(CircuitStateTest, ConflictAndBacktrack) {
  AigCircuit *circuit = TestCircuits::andGate();
  CircuitState state(*circuit);
  size_t root = state.mark();
  EXPECT_TRUE(state.assign(3, true));
  size_t after_output = state.mark();
  EXPECT_FALSE(state.assign(1, false));
  state.backtrack(after_output);
  EXPECT_EQ(state.getValue(1), CircuitState::VAL_TRUE);
  state.backtrack(root);
  EXPECT_EQ(state.getValue(1), CircuitState::VAL_UNDEF);
  EXPECT_EQ(state.getValue(3), CircuitState::VAL_UNDEF);
  EXPECT_EQ(state.getValue(0), CircuitState::VAL_FALSE);
  EXPECT_EQ(state.getResidualSize(), 3u);
  delete circuit;
}

TEST(CircuitStateTest, ContradictionConflictsImmediately) {
  AigCircuit *circuit = TestCircuits::contradiction();
  CircuitState state(*circuit);
  EXPECT_FALSE(state.assignLit(circuit->getOutput()));
  delete circuit;
}

TEST(CircuitStateTest, XorPropagatesBothWays) {
  TestCircuits builder;
  AigLit x1 = builder.addInput();
  AigLit x2 = builder.addInput();
  AigLit out = builder.addXor(x1, x2);
  AigCircuit *circuit = builder.build(out);
  CircuitState state(*circuit);
  EXPECT_TRUE(state.assignLit(out));
  EXPECT_TRUE(state.assign(AigCircuit::litNode(x1), true));
  EXPECT_EQ(state.getLitValue(x2), CircuitState::VAL_FALSE);
  delete circuit;
}
