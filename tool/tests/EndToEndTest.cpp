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


#include "CubeAndConquer.h"
#include "CubeWriter.h"
#include "AIG2CNF.h"
#include "AigCircuit.h"
#include "Cube.h"
#include "FileUtils.h"
#include "LookaheadScorer.h"
#include "ResultReporter.h"
#include "SatSolver.h"
#include "SatSolverFactory.h"
#include "TestCircuits.h"
#include "gtest/gtest.h"

#include <cstdio>
#include <unistd.h>

static CubeAndConquer* makeCnC(const AigCircuit &circuit,
                               SatSolverFactory::SolverKind kind,
                               size_t depth,
                               size_t nr_of_threads) {
  return new CubeAndConquer(circuit,
                            LookaheadScorer::create(LookaheadScorer::PRODUCT),
                            new SatSolverFactory(kind, vector<string>(), "", ""),
                            new LogReporter,
                            depth,
                            10,
                            0.0,
                            nr_of_threads);
}

static bool witnessIsValid(const AigCircuit &circuit, const vector<int> &witness) {
  vector<bool> values;
  for(size_t cnt = 0; cnt < witness.size(); ++cnt)
    values.push_back(witness[cnt] > 0);
  return values.size() == circuit.getInputs().size() && circuit.evaluate(values);
}

// -------------------------------------------------------------------------------------------
// The in-process solvers
// -------------------------------------------------------------------------------------------

class SolverBackendTest : public ::testing::TestWithParam<SatSolverFactory::SolverKind> {
};

TEST_P(SolverBackendTest, AndGateTruthTable) {
  AigCircuit *circuit = TestCircuits::andGate();
  AIG2CNF encoder(*circuit);
  SatSolverFactory factory(GetParam(), vector<string>(), "", "");
  for(int bits = 0; bits < 4; ++bits) {
    Cube cube;
    cube.addDecision((bits & 1) ? 1 : -1);
    cube.addDecision((bits & 2) ? 2 : -2);
    SatSolver *solver = factory.create();
    vector<int> model;
    SatSolver::Answer answer = solver->solve(encoder.encodeWithAssumptions(cube, 0), 5.0, model);
    delete solver;
    if(bits == 3) {
      EXPECT_EQ(answer, SatSolver::SAT);
      EXPECT_TRUE(encoder.getBase().isSatBy(model));
    } else {
      EXPECT_EQ(answer, SatSolver::UNSAT);
    }
  }
  delete circuit;
}

TEST_P(SolverBackendTest, MiterWithoutCubes) {
  AigCircuit *correct = TestCircuits::parityMiter(8, false);
  AigCircuit *buggy = TestCircuits::parityMiter(8, true);
  AIG2CNF correct_encoder(*correct);
  AIG2CNF buggy_encoder(*buggy);
  SatSolverFactory factory(GetParam(), vector<string>(), "", "");
  SatSolver *solver = factory.create();
  vector<int> model;
  EXPECT_EQ(solver->solve(correct_encoder.encodeWithAssumptions(Cube(), 0), 0.0, model),
            SatSolver::UNSAT);
  EXPECT_EQ(solver->solve(buggy_encoder.encodeWithAssumptions(Cube(), 0), 0.0, model),
            SatSolver::SAT);
  delete solver;
  delete correct;
  delete buggy;
}

INSTANTIATE_TEST_CASE_P(InProcess, SolverBackendTest,
                        ::testing::Values(SatSolverFactory::MINISAT_API,
                                          SatSolverFactory::PICOSAT_API,
                                          SatSolverFactory::LINGELING_API));

TEST(SatSolverFactoryTest, ParseKind) {
  SatSolverFactory::SolverKind kind = SatSolverFactory::MINISAT_API;
  EXPECT_TRUE(SatSolverFactory::parseKind("pic_api", kind));
  EXPECT_EQ(kind, SatSolverFactory::PICOSAT_API);
  EXPECT_TRUE(SatSolverFactory::parseKind("LIN_API", kind));
  EXPECT_EQ(kind, SatSolverFactory::LINGELING_API);
  EXPECT_TRUE(SatSolverFactory::parseKind("ext", kind));
  EXPECT_EQ(kind, SatSolverFactory::EXTERNAL);
  EXPECT_FALSE(SatSolverFactory::parseKind("glucose", kind));
}

// -------------------------------------------------------------------------------------------
// Cube-and-conquer
// -------------------------------------------------------------------------------------------

TEST(EndToEndTest, EquivalentMiterIsUnsat) {
  AigCircuit *circuit = TestCircuits::parityMiter(16, false);
  CubeAndConquer *cnc = makeCnC(*circuit, SatSolverFactory::MINISAT_API, 3, 4);
  EXPECT_EQ(cnc->run(), 20);
  const FinalResult &res = cnc->getResult();
  EXPECT_EQ(res.answer_, Verdict::UNSAT);
  ASSERT_EQ(res.verdicts_.size(), 8u);
  for(size_t cnt = 0; cnt < res.verdicts_.size(); ++cnt)
    EXPECT_EQ(res.verdicts_[cnt].getKind(), Verdict::UNSAT);
  delete cnc;
  delete circuit;
}

TEST(EndToEndTest, BuggyMiterIsSat) {
  AigCircuit *circuit = TestCircuits::parityMiter(16, true);
  CubeAndConquer *cnc = makeCnC(*circuit, SatSolverFactory::MINISAT_API, 3, 4);
  EXPECT_EQ(cnc->run(), 10);
  const FinalResult &res = cnc->getResult();
  EXPECT_EQ(res.answer_, Verdict::SAT);
  EXPECT_GE(res.nr_of_sat_, 1u);
  EXPECT_TRUE(witnessIsValid(*circuit, res.witness_));
  delete cnc;
  delete circuit;
}

TEST(EndToEndTest, DepthZeroMatchesPlainSolving) {
  AigCircuit *correct = TestCircuits::parityMiter(10, false);
  AigCircuit *buggy = TestCircuits::parityMiter(10, true);
  CubeAndConquer *cnc_correct = makeCnC(*correct, SatSolverFactory::MINISAT_API, 0, 2);
  CubeAndConquer *cnc_buggy = makeCnC(*buggy, SatSolverFactory::MINISAT_API, 0, 2);
  EXPECT_EQ(cnc_correct->run(), 20);
  EXPECT_EQ(cnc_correct->getResult().verdicts_.size(), 1u);
  EXPECT_EQ(cnc_buggy->run(), 10);
  EXPECT_EQ(cnc_buggy->getResult().verdicts_.size(), 1u);
  delete cnc_correct;
  delete cnc_buggy;
  delete correct;
  delete buggy;
}

TEST(EndToEndTest, TrivialContradictionIsUnsat) {
  AigCircuit *circuit = TestCircuits::contradiction();
  CubeAndConquer *cnc = makeCnC(*circuit, SatSolverFactory::PICOSAT_API, 4, 2);
  EXPECT_EQ(cnc->run(), 20);
  EXPECT_EQ(cnc->getResult().verdicts_.size(), 1u);
  delete cnc;
  delete circuit;
}

TEST(EndToEndTest, SingleThreadGivesSameAnswer) {
  AigCircuit *circuit = TestCircuits::parityMiter(12, false);
  CubeAndConquer *cnc = makeCnC(*circuit, SatSolverFactory::LINGELING_API, 4, 1);
  EXPECT_EQ(cnc->run(), 20);
  delete cnc;
  delete circuit;
}

TEST(EndToEndTest, ExitCodes) {
  EXPECT_EQ(CubeAndConquer::toExitCode(Verdict::SAT), 10);
  EXPECT_EQ(CubeAndConquer::toExitCode(Verdict::UNSAT), 20);
  EXPECT_EQ(CubeAndConquer::toExitCode(Verdict::UNKNOWN), 0);
}

// -------------------------------------------------------------------------------------------
// Writing cubes
// -------------------------------------------------------------------------------------------

TEST(CubeWriterTest, WritesOneFilePerCube) {
  ostringstream dir;
  dir << "/tmp/aigcube_cubes_test_" << getpid();
  AigCircuit *circuit = TestCircuits::parityMiter(16, false);
  CubeWriter writer(*circuit, LookaheadScorer::create(LookaheadScorer::PRODUCT), 3, 10,
                    dir.str());
  EXPECT_EQ(writer.run(), 0);
  const vector<string> &files = writer.getWrittenFiles();
  ASSERT_EQ(files.size(), 8u);
  EXPECT_EQ(files[0], FileUtils::join(dir.str(), "cube_0000.cnf"));
  EXPECT_EQ(files[7], FileUtils::join(dir.str(), "cube_0007.cnf"));
  for(size_t cnt = 0; cnt < files.size(); ++cnt) {
    string content;
    EXPECT_TRUE(FileUtils::readFile(files[cnt], content));
    EXPECT_EQ(content.find("p cnf "), 0u);
    remove(files[cnt].c_str());
  }
  rmdir(dir.str().c_str());
  delete circuit;
}

TEST(CubeWriterTest, NeedsOutputDirectory) {
  AigCircuit *circuit = TestCircuits::andGate();
  CubeWriter writer(*circuit, LookaheadScorer::create(LookaheadScorer::PRODUCT), 2, 10, "");
  EXPECT_THROW(writer.run(), AigCubeException);
  delete circuit;
}

TEST(CubeWriterTest, DescribesCircuit) {
  AigCircuit *circuit = TestCircuits::andGate();
  CubeWriter writer(*circuit, LookaheadScorer::create(LookaheadScorer::PRODUCT), 2, 10, "");
  EXPECT_EQ(writer.describeCircuit(), "2 inputs, 1 AND gates, 3 nodes in the output cone");
  delete circuit;
}
