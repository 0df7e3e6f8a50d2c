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


#include "ExtSatSolver.h"
#include "AIG2CNF.h"
#include "AigCircuit.h"
#include "Cube.h"
#include "FileUtils.h"
#include "Stopwatch.h"
#include "TestCircuits.h"
#include "gtest/gtest.h"

#include <dirent.h>
#include <unistd.h>

// Runs '/bin/sh -c SCRIPT' as the solver. The DIMACS file is passed as $0.
class ExtSatSolverTest : public ::testing::Test {
protected:
  virtual void SetUp() {
    ostringstream dir;
    dir << "/tmp/aigcube_ext_test_" << getpid();
    tmp_dir_ = dir.str();
    ASSERT_TRUE(FileUtils::createDir(tmp_dir_));
    circuit_ = TestCircuits::andGate();
    encoder_ = new AIG2CNF(*circuit_);
  }

  virtual void TearDown() {
    delete encoder_;
    delete circuit_;
    rmdir(tmp_dir_.c_str());
  }

  SatSolver::Answer solve(const string &script, double timeout_sec, vector<int> &model,
                          const string &keep_dir = "") {
    vector<string> command;
    command.push_back("/bin/sh");
    command.push_back("-c");
    command.push_back(script);
    ExtSatSolver solver(command, tmp_dir_, keep_dir);
    CubeQuery query = encoder_->encodeWithAssumptions(Cube(), 3);
    return solver.solve(query, timeout_sec, model);
  }

  size_t countFiles(const string &dir_name) const {
    size_t count = 0;
    DIR *dir = opendir(dir_name.c_str());
    if(dir == NULL)
      return 0;
    for(struct dirent *entry = readdir(dir); entry != NULL; entry = readdir(dir)) {
      string name(entry->d_name);
      if(name != "." && name != "..")
        ++count;
    }
    closedir(dir);
    return count;
  }

  string tmp_dir_;
  AigCircuit *circuit_;
  AIG2CNF *encoder_;
};

TEST_F(ExtSatSolverTest, ExitCode10IsSat) {
  vector<int> model;
  EXPECT_EQ(solve("exit 10", 0.0, model), SatSolver::SAT);
  EXPECT_TRUE(model.empty());
  EXPECT_EQ(countFiles(tmp_dir_), 0u);
}

TEST_F(ExtSatSolverTest, ExitCode20IsUnsat) {
  vector<int> model;
  EXPECT_EQ(solve("exit 20", 0.0, model), SatSolver::UNSAT);
  EXPECT_EQ(countFiles(tmp_dir_), 0u);
}

TEST_F(ExtSatSolverTest, OtherExitCodesAreFailures) {
  vector<int> model;
  EXPECT_THROW(solve("exit 3", 0.0, model), SolverFailure);
  EXPECT_THROW(solve("exit 0", 0.0, model), SolverFailure);
  // without a time limit, 124 is just another exit code:
  EXPECT_THROW(solve("exit 124", 0.0, model), SolverFailure);
  EXPECT_EQ(countFiles(tmp_dir_), 0u);
}

TEST_F(ExtSatSolverTest, TimeoutIsDetected) {
  vector<int> model;
  PointInTime start = Stopwatch::start();
  EXPECT_EQ(solve("sleep 30", 1.0, model), SatSolver::TIMEOUT);
  EXPECT_LT(Stopwatch::getRealTimeSecExact(start), 10.0);
  EXPECT_EQ(countFiles(tmp_dir_), 0u);
}

TEST_F(ExtSatSolverTest, SolverReceivesDimacs) {
  vector<int> model;
  string script = "head -n 1 \"$0\" | grep -q '^p cnf 4 5$' && exit 20; exit 3";
  EXPECT_EQ(solve(script, 0.0, model), SatSolver::UNSAT);
}

TEST_F(ExtSatSolverTest, ModelIsParsed) {
  vector<int> model;
  string script = "echo 's SATISFIABLE'; echo 'v 1 2 3'; echo 'v -4 0'; exit 10";
  ASSERT_EQ(solve(script, 0.0, model), SatSolver::SAT);
  ASSERT_EQ(model.size(), 4u);
  EXPECT_EQ(model[0], 1);
  EXPECT_EQ(model[2], 3);
  EXPECT_EQ(model[3], -4);
}

TEST_F(ExtSatSolverTest, ContradictingAnswerIsFailure) {
  vector<int> model;
  EXPECT_THROW(solve("echo 's UNSATISFIABLE'; exit 10", 0.0, model), SolverFailure);
}

TEST_F(ExtSatSolverTest, KeepsCnfFiles) {
  string keep_dir = tmp_dir_ + "/keep";
  ASSERT_TRUE(FileUtils::createDir(keep_dir));
  vector<int> model;
  EXPECT_EQ(solve("exit 20", 0.0, model, keep_dir), SatSolver::UNSAT);
  string kept = FileUtils::join(keep_dir, "cube_0003.cnf");
  EXPECT_TRUE(FileUtils::fileExists(kept));
  string content;
  EXPECT_TRUE(FileUtils::readFile(kept, content));
  EXPECT_EQ(content.find("p cnf 4 5\n"), 0u);
  remove(kept.c_str());
  rmdir(keep_dir.c_str());
}

TEST(ExtSatSolverQuoteTest, QuotesForTheShell) {
  EXPECT_EQ(ExtSatSolver::quote("kissat"), "'kissat'");
  EXPECT_EQ(ExtSatSolver::quote("it's"), "'it'\\''s'");
}
