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


#include "ConquerScheduler.h"
#include "AIG2CNF.h"
#include "AigCircuit.h"
#include "CubeQuery.h"
#include "SatSolver.h"
#include "SatSolverFactory.h"
#include "Stopwatch.h"
#include "TestCircuits.h"
#include "gtest/gtest.h"

#include <chrono>
#include <new>
#include <thread>

// What a ScriptedSolver does for a certain cube.
enum Action {
  ANSWER_SAT,
  ANSWER_SAT_WRONG_MODEL,
  ANSWER_UNSAT,
  RUN_INTO_TIMEOUT,
  FAIL,
  BREAK_INVARIANT,
  RUN_OUT_OF_MEMORY
};

// A solver that does not solve anything, but answers as scripted per cube index.
class ScriptedSolver : public SatSolver {
public:
  explicit ScriptedSolver(const vector<Action> &script) : script_(script) {}

  virtual Answer solve(const CubeQuery &query, double timeout_sec, vector<int> &model) {
    switch(script_[query.getIndex()]) {
      case ANSWER_SAT:
        model.clear();
        return SAT;
      case ANSWER_SAT_WRONG_MODEL:
        model.assign(query.getMaxVar(), 0);
        for(int var = 1; var <= query.getMaxVar(); ++var)
          model[var - 1] = -var;
        return SAT;
      case ANSWER_UNSAT:
        return UNSAT;
      case RUN_INTO_TIMEOUT: {
        PointInTime start = Stopwatch::start();
        while(!Stopwatch::isExpired(start, timeout_sec))
          this_thread::sleep_for(chrono::milliseconds(10));
        return TIMEOUT;
      }
      case FAIL:
        throw SolverFailure("scripted crash");
      case BREAK_INVARIANT:
        throw EncodingError("scripted invariant violation");
      case RUN_OUT_OF_MEMORY:
        throw bad_alloc();
    }
    return UNSAT;
  }

  virtual string getName() const {
    return "scripted";
  }

protected:
  const vector<Action> &script_;
};

class ScriptedSolverFactory : public SatSolverFactory {
public:
  explicit ScriptedSolverFactory(const vector<Action> &script) :
      SatSolverFactory(SatSolverFactory::MINISAT_API, vector<string>(), "", ""),
      script_(script) {}

  virtual SatSolver* create() const {
    return new ScriptedSolver(script_);
  }

protected:
  const vector<Action> &script_;
};

class ConquerSchedulerTest : public ::testing::Test {
protected:
  virtual void SetUp() {
    circuit_ = TestCircuits::parityMiter(3, false);
    encoder_ = new AIG2CNF(*circuit_);
    // all 8 assignments of the 3 inputs:
    const vector<int> &inputs = encoder_->getVarManager().getInputVars();
    for(int bits = 0; bits < 8; ++bits) {
      Cube cube;
      for(size_t cnt = 0; cnt < inputs.size(); ++cnt)
        cube.addDecision(((bits >> cnt) & 1) ? inputs[cnt] : -inputs[cnt]);
      cubes_.push_back(cube);
    }
    script_.assign(cubes_.size(), ANSWER_UNSAT);
  }

  virtual void TearDown() {
    delete encoder_;
    delete circuit_;
  }

  vector<Verdict> run(double timeout_sec, size_t concurrency) {
    ScriptedSolverFactory factory(script_);
    ConquerScheduler scheduler(*encoder_, factory, timeout_sec, concurrency);
    vector<Verdict> verdicts = scheduler.runAll(cubes_);
    states_ = scheduler.getTaskStates();
    return verdicts;
  }

  AigCircuit *circuit_;
  AIG2CNF *encoder_;
  vector<Cube> cubes_;
  vector<Action> script_;
  vector<ConquerScheduler::TaskState> states_;
};

TEST_F(ConquerSchedulerTest, AllUnsat) {
  vector<Verdict> verdicts = run(0.0, 4);
  ASSERT_EQ(verdicts.size(), 8u);
  for(size_t cnt = 0; cnt < verdicts.size(); ++cnt) {
    EXPECT_EQ(verdicts[cnt].getIndex(), cnt);
    EXPECT_EQ(verdicts[cnt].getKind(), Verdict::UNSAT);
    EXPECT_EQ(states_[cnt], ConquerScheduler::SOLVED);
  }
}

TEST_F(ConquerSchedulerTest, SolverFailureIsContained) {
  script_[2] = FAIL;
  script_[5] = FAIL;
  vector<Verdict> verdicts = run(0.0, 3);
  ASSERT_EQ(verdicts.size(), 8u);
  for(size_t cnt = 0; cnt < verdicts.size(); ++cnt) {
    if(cnt == 2 || cnt == 5) {
      EXPECT_EQ(verdicts[cnt].getKind(), Verdict::UNKNOWN);
      EXPECT_EQ(verdicts[cnt].getReason(), Verdict::SOLVER_ERROR);
      EXPECT_EQ(states_[cnt], ConquerScheduler::SOLVER_FAILED);
    } else {
      EXPECT_EQ(verdicts[cnt].getKind(), Verdict::UNSAT);
    }
  }
}

TEST_F(ConquerSchedulerTest, TimeoutDoesNotBlockSiblings) {
  script_[0] = RUN_INTO_TIMEOUT;
  vector<Verdict> verdicts = run(1.0, 2);
  ASSERT_EQ(verdicts.size(), 8u);
  EXPECT_EQ(verdicts[0].getKind(), Verdict::UNKNOWN);
  EXPECT_EQ(verdicts[0].getReason(), Verdict::TIMEOUT);
  EXPECT_GE(verdicts[0].getElapsed(), 1.0);
  EXPECT_EQ(states_[0], ConquerScheduler::TIMED_OUT);
  for(size_t cnt = 1; cnt < verdicts.size(); ++cnt) {
    EXPECT_EQ(verdicts[cnt].getKind(), Verdict::UNSAT);
    EXPECT_LT(verdicts[cnt].getElapsed(), 1.0);
  }
}

TEST_F(ConquerSchedulerTest, SatCancelsPendingCubes) {
  script_[1] = ANSWER_SAT;
  vector<Verdict> verdicts = run(0.0, 1);
  ASSERT_EQ(verdicts.size(), 8u);
  EXPECT_EQ(verdicts[0].getKind(), Verdict::UNSAT);
  EXPECT_EQ(verdicts[1].getKind(), Verdict::SAT);
  for(size_t cnt = 2; cnt < verdicts.size(); ++cnt) {
    EXPECT_EQ(verdicts[cnt].getKind(), Verdict::UNKNOWN);
    EXPECT_EQ(verdicts[cnt].getReason(), Verdict::CANCELLED);
    EXPECT_EQ(states_[cnt], ConquerScheduler::CANCELLED);
  }
}

TEST_F(ConquerSchedulerTest, SatWithParallelWorkers) {
  script_[0] = ANSWER_SAT;
  vector<Verdict> verdicts = run(0.0, 4);
  ASSERT_EQ(verdicts.size(), 8u);
  EXPECT_EQ(verdicts[0].getKind(), Verdict::SAT);
  // in-flight cubes finish, the others are cancelled, nothing is left undecided:
  for(size_t cnt = 1; cnt < verdicts.size(); ++cnt) {
    EXPECT_NE(verdicts[cnt].getKind(), Verdict::SAT);
    EXPECT_NE(states_[cnt], ConquerScheduler::PENDING);
    EXPECT_NE(states_[cnt], ConquerScheduler::DISPATCHED);
  }
}

TEST_F(ConquerSchedulerTest, WrongModelIsSolverFailure) {
  script_[4] = ANSWER_SAT_WRONG_MODEL;
  vector<Verdict> verdicts = run(0.0, 2);
  EXPECT_EQ(verdicts[4].getKind(), Verdict::UNKNOWN);
  EXPECT_EQ(verdicts[4].getReason(), Verdict::SOLVER_ERROR);
}

TEST_F(ConquerSchedulerTest, FatalErrorIsRethrown) {
  script_[3] = BREAK_INVARIANT;
  EXPECT_THROW(run(0.0, 2), EncodingError);
}

TEST_F(ConquerSchedulerTest, SchedulerIsReusableAfterFatalError) {
  ScriptedSolverFactory factory(script_);
  ConquerScheduler scheduler(*encoder_, factory, 0.0, 4);
  script_[2] = RUN_OUT_OF_MEMORY;
  script_[5] = RUN_OUT_OF_MEMORY;
  EXPECT_THROW(scheduler.runAll(cubes_), bad_alloc);

  script_.assign(cubes_.size(), ANSWER_UNSAT);
  vector<Verdict> verdicts = scheduler.runAll(cubes_);
  ASSERT_EQ(verdicts.size(), 8u);
  for(size_t cnt = 0; cnt < verdicts.size(); ++cnt)
    EXPECT_EQ(verdicts[cnt].getKind(), Verdict::UNSAT);
}

TEST_F(ConquerSchedulerTest, ZeroConcurrencyIsRejected) {
  EXPECT_THROW(run(0.0, 0), ConcurrencyError);
}

TEST_F(ConquerSchedulerTest, MoreWorkersThanCubes) {
  ScriptedSolverFactory factory(script_);
  ConquerScheduler scheduler(*encoder_, factory, 0.0, 64);
  vector<Verdict> verdicts = scheduler.runAll(cubes_);
  EXPECT_EQ(verdicts.size(), 8u);
  EXPECT_EQ(scheduler.getNrOfWorkers(), 8u);
}

TEST_F(ConquerSchedulerTest, NoCubes) {
  cubes_.clear();
  vector<Verdict> verdicts = run(0.0, 4);
  EXPECT_TRUE(verdicts.empty());
}
