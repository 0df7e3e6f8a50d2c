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


#include "AigCircuit.h"
#include "FileUtils.h"
#include "TestCircuits.h"
#include "gtest/gtest.h"

#include <unistd.h>

// -------------------------------------------------------------------------------------------
// Building and validation
// -------------------------------------------------------------------------------------------

TEST(AigCircuitTest, AndGateStructure) {
  AigCircuit *circuit = TestCircuits::andGate();
  ASSERT_EQ(circuit->getNrOfNodes(), 4u);
  ASSERT_EQ(circuit->getInputs().size(), 2u);
  ASSERT_EQ(circuit->getAnds().size(), 1u);
  EXPECT_EQ(circuit->getNode(0).kind_, AigCircuit::CONST_FALSE);
  EXPECT_EQ(circuit->getNode(1).kind_, AigCircuit::INPUT);
  EXPECT_EQ(circuit->getNode(3).kind_, AigCircuit::AND);
  EXPECT_EQ(circuit->getOutput(), AigCircuit::makeLit(3, false));
  EXPECT_EQ(circuit->getConeSize(), 3u);
  ASSERT_EQ(circuit->getFanouts(1).size(), 1u);
  EXPECT_EQ(circuit->getFanouts(1)[0], 3u);
  EXPECT_TRUE(circuit->getFanouts(3).empty());
  delete circuit;
}

TEST(AigCircuitTest, EvaluateAndGate) {
  AigCircuit *circuit = TestCircuits::andGate();
  for(int bits = 0; bits < 4; ++bits) {
    vector<bool> values;
    values.push_back((bits & 1) != 0);
    values.push_back((bits & 2) != 0);
    EXPECT_EQ(circuit->evaluate(values), bits == 3) << "bits " << bits;
  }
  delete circuit;
}

TEST(AigCircuitTest, EvaluateParityMiter) {
  AigCircuit *correct = TestCircuits::parityMiter(4, false);
  AigCircuit *buggy = TestCircuits::parityMiter(4, true);
  for(int bits = 0; bits < 16; ++bits) {
    vector<bool> values;
    for(int cnt = 0; cnt < 4; ++cnt)
      values.push_back(((bits >> cnt) & 1) != 0);
    EXPECT_FALSE(correct->evaluate(values));
    EXPECT_TRUE(buggy->evaluate(values));
  }
  delete correct;
  delete buggy;
}

TEST(AigCircuitTest, GatesAreSortedTopologically) {
  // 8 = 6 & 2 is given before 6 = 2 & 4:
  vector<AigLit> inputs;
  inputs.push_back(2);
  inputs.push_back(4);
  vector<AigCircuit::AndDef> ands(2);
  ands[0].lhs_ = 8; ands[0].rhs0_ = 6; ands[0].rhs1_ = 2;
  ands[1].lhs_ = 6; ands[1].rhs0_ = 2; ands[1].rhs1_ = 5;
  AigCircuit *circuit = AigCircuit::fromAigerLits(inputs, ands, 8, vector<string>());
  const vector<unsigned> &order = circuit->getAnds();
  ASSERT_EQ(order.size(), 2u);
  for(size_t cnt = 0; cnt < order.size(); ++cnt) {
    const AigCircuit::Node &gate = circuit->getNode(order[cnt]);
    EXPECT_LT(AigCircuit::litNode(gate.rhs0_), order[cnt]);
    EXPECT_LT(AigCircuit::litNode(gate.rhs1_), order[cnt]);
  }
  vector<bool> values(2, false);
  values[0] = true;
  EXPECT_TRUE(circuit->evaluate(values));
  values[1] = true;
  EXPECT_FALSE(circuit->evaluate(values));
  delete circuit;
}

TEST(AigCircuitTest, DanglingGateIsOutsideCone) {
  TestCircuits builder;
  AigLit x1 = builder.addInput();
  AigLit x2 = builder.addInput();
  AigLit used = builder.addAnd(x1, x2);
  builder.addAnd(x1, AigCircuit::negLit(x2));
  AigCircuit *circuit = builder.build(used);
  EXPECT_EQ(circuit->getAnds().size(), 2u);
  EXPECT_EQ(circuit->getConeSize(), 3u);
  delete circuit;
}

TEST(AigCircuitTest, RejectsInvertedDefinition) {
  vector<AigLit> inputs(1, 2);
  vector<AigCircuit::AndDef> ands(1);
  ands[0].lhs_ = 5; ands[0].rhs0_ = 2; ands[0].rhs1_ = 2;
  EXPECT_THROW(AigCircuit::fromAigerLits(inputs, ands, 4, vector<string>()), FormatError);
}

TEST(AigCircuitTest, RejectsDuplicateDefinition) {
  vector<AigLit> inputs(1, 2);
  vector<AigCircuit::AndDef> ands(1);
  ands[0].lhs_ = 2; ands[0].rhs0_ = 2; ands[0].rhs1_ = 2;
  EXPECT_THROW(AigCircuit::fromAigerLits(inputs, ands, 2, vector<string>()), FormatError);
}

TEST(AigCircuitTest, RejectsUndefinedOperand) {
  vector<AigLit> inputs(1, 2);
  vector<AigCircuit::AndDef> ands(1);
  ands[0].lhs_ = 4; ands[0].rhs0_ = 2; ands[0].rhs1_ = 7;
  EXPECT_THROW(AigCircuit::fromAigerLits(inputs, ands, 4, vector<string>()), FormatError);
}

TEST(AigCircuitTest, RejectsUndefinedOutput) {
  vector<AigLit> inputs(1, 2);
  vector<AigCircuit::AndDef> ands;
  EXPECT_THROW(AigCircuit::fromAigerLits(inputs, ands, 10, vector<string>()), FormatError);
}

TEST(AigCircuitTest, RejectsCycle) {
  vector<AigLit> inputs(1, 2);
  vector<AigCircuit::AndDef> ands(2);
  ands[0].lhs_ = 4; ands[0].rhs0_ = 2; ands[0].rhs1_ = 6;
  ands[1].lhs_ = 6; ands[1].rhs0_ = 5; ands[1].rhs1_ = 2;
  EXPECT_THROW(AigCircuit::fromAigerLits(inputs, ands, 4, vector<string>()), FormatError);
}

// -------------------------------------------------------------------------------------------
// Loading AIGER files
// -------------------------------------------------------------------------------------------

static string writeTmpAiger(const string &name, const string &content) {
  ostringstream file_name;
  file_name << "/tmp/aigcube_test_" << getpid() << "_" << name << ".aag";
  EXPECT_TRUE(FileUtils::writeFile(file_name.str(), content));
  return file_name.str();
}

TEST(AigCircuitTest, LoadAsciiFile) {
  string file = writeTmpAiger("and", "aag 3 2 0 1 1\n2\n4\n6\n6 2 4\ni0 a\ni1 b\n");
  ScopedFile guard(file, false);
  AigCircuit *circuit = AigCircuit::loadFromFile(file);
  EXPECT_EQ(circuit->getInputs().size(), 2u);
  EXPECT_EQ(circuit->getAnds().size(), 1u);
  EXPECT_EQ(circuit->getNode(circuit->getInputs()[0]).name_, "a");
  EXPECT_EQ(circuit->getNode(circuit->getInputs()[1]).name_, "b");
  vector<bool> values(2, true);
  EXPECT_TRUE(circuit->evaluate(values));
  delete circuit;
}

TEST(AigCircuitTest, LoadRejectsLatches) {
  string file = writeTmpAiger("latch", "aag 1 0 1 1 0\n2 3\n2\n");
  ScopedFile guard(file, false);
  EXPECT_THROW(AigCircuit::loadFromFile(file), FormatError);
}

TEST(AigCircuitTest, LoadRejectsTwoOutputs) {
  string file = writeTmpAiger("outputs", "aag 1 1 0 2 0\n2\n2\n3\n");
  ScopedFile guard(file, false);
  EXPECT_THROW(AigCircuit::loadFromFile(file), FormatError);
}

TEST(AigCircuitTest, LoadRejectsMissingFile) {
  EXPECT_THROW(AigCircuit::loadFromFile("/nonexistent/circuit.aag"), FormatError);
}

TEST(AigCircuitTest, LoadRejectsGarbage) {
  string file = writeTmpAiger("garbage", "this is not an aiger file\n");
  ScopedFile guard(file, false);
  EXPECT_THROW(AigCircuit::loadFromFile(file), FormatError);
}
