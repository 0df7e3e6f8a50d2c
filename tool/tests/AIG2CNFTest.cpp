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


#include "AIG2CNF.h"
#include "AigCircuit.h"
#include "Cube.h"
#include "MiniSatApi.h"
#include "TestCircuits.h"
#include "gtest/gtest.h"

static SatSolver::Answer solveWithUnits(const AIG2CNF &encoder, int lit1, int lit2) {
  Cube cube;
  cube.addDecision(lit1);
  cube.addDecision(lit2);
  CubeQuery query = encoder.encodeWithAssumptions(cube, 0);
  MiniSatApi solver;
  vector<int> model;
  return solver.solve(query, 0.0, model);
}

TEST(AIG2CNFTest, AndGateClauses) {
  AigCircuit *circuit = TestCircuits::andGate();
  AIG2CNF encoder(*circuit);
  // three clauses for the gate, one for the constant, one for the output:
  EXPECT_EQ(encoder.getBase().getNrOfClauses(), 5u);
  EXPECT_EQ(encoder.getMaxCNFVar(), 4);
  EXPECT_EQ(encoder.getVarManager().getConstVar(), 4);
  ASSERT_EQ(encoder.getVarManager().getInputVars().size(), 2u);
  EXPECT_EQ(encoder.getVarManager().getInputVars()[0], 1);
  EXPECT_EQ(encoder.getVarManager().getInputVars()[1], 2);
  delete circuit;
}

TEST(AIG2CNFTest, AndGateTruthTable) {
  AigCircuit *circuit = TestCircuits::andGate();
  AIG2CNF encoder(*circuit);
  EXPECT_EQ(solveWithUnits(encoder, 1, 2), SatSolver::SAT);
  EXPECT_EQ(solveWithUnits(encoder, 1, -2), SatSolver::UNSAT);
  EXPECT_EQ(solveWithUnits(encoder, -1, 2), SatSolver::UNSAT);
  EXPECT_EQ(solveWithUnits(encoder, -1, -2), SatSolver::UNSAT);
  delete circuit;
}

TEST(AIG2CNFTest, SyntacticCheckOfAssignments) {
  AigCircuit *circuit = TestCircuits::andGate();
  AIG2CNF encoder(*circuit);
  vector<int> good;
  good.push_back(1);
  good.push_back(2);
  good.push_back(3);
  good.push_back(-4);
  EXPECT_TRUE(encoder.getBase().isSatBy(good));
  vector<int> bad(good);
  bad[1] = -2;
  EXPECT_FALSE(encoder.getBase().isSatBy(bad));
  delete circuit;
}

TEST(AIG2CNFTest, CubeQueryDimacs) {
  AigCircuit *circuit = TestCircuits::andGate();
  AIG2CNF encoder(*circuit);
  Cube cube;
  cube.addDecision(-1);
  cube.addImplied(2);
  CubeQuery query = encoder.encodeWithAssumptions(cube, 7);
  EXPECT_EQ(query.getName(), "cube_0007");
  EXPECT_EQ(query.getNrOfClauses(), 7u);
  EXPECT_EQ(query.toCNF().getNrOfClauses(), 7u);

  ostringstream dimacs;
  query.toDimacs(dimacs);
  istringstream lines(dimacs.str());
  string header;
  getline(lines, header);
  EXPECT_EQ(header, "p cnf 4 7");
  EXPECT_NE(dimacs.str().find("-1 0\n2 0\n"), string::npos);
  // the base is shared, not changed:
  EXPECT_EQ(encoder.getBase().getNrOfClauses(), 5u);
  delete circuit;
}

TEST(AIG2CNFTest, RejectsUnknownLiteral) {
  AigCircuit *circuit = TestCircuits::andGate();
  AIG2CNF encoder(*circuit);
  Cube cube;
  cube.addDecision(5);
  EXPECT_THROW(encoder.encodeWithAssumptions(cube, 0), EncodingError);
  delete circuit;
}

TEST(AIG2CNFTest, GatesOutsideConeAreNotEncoded) {
  TestCircuits builder;
  AigLit x1 = builder.addInput();
  AigLit x2 = builder.addInput();
  AigLit used = builder.addAnd(x1, x2);
  builder.addAnd(x1, AigCircuit::negLit(x2));
  AigCircuit *circuit = builder.build(used);
  AIG2CNF encoder(*circuit);
  EXPECT_EQ(encoder.getBase().getNrOfClauses(), 5u);
  delete circuit;
}
