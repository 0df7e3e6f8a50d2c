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

// -------------------------------------------------------------------------------------------
/// @file ConquerScheduler.cpp
/// @brief Contains the definition of the class ConquerScheduler.
// -------------------------------------------------------------------------------------------

#include "ConquerScheduler.h"
#include "AIG2CNF.h"
#include "AigCircuit.h"
#include "CubeQuery.h"
#include "SatSolver.h"
#include "SatSolverFactory.h"
#include "Stopwatch.h"
#include "Logger.h"
#include "Utils.h"

#include <system_error>

// -------------------------------------------------------------------------------------------
ConquerScheduler::ConquerScheduler(const AIG2CNF &encoder,
                                   const SatSolverFactory &factory,
                                   double timeout_sec,
                                   size_t concurrency) :
    encoder_(encoder),
    factory_(factory),
    timeout_sec_(timeout_sec),
    concurrency_(concurrency),
    nr_of_workers_(0),
    cubes_(NULL),
    next_index_(0),
    stop_(false)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
ConquerScheduler::~ConquerScheduler()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
vector<Verdict> ConquerScheduler::runAll(const vector<Cube> &cubes)
{
  if(concurrency_ == 0)
    throw ConcurrencyError("The number of workers must be at least 1.");

  cubes_ = &cubes;
  verdicts_.assign(cubes.size(), Verdict());
  states_.assign(cubes.size(), PENDING);
  next_index_ = 0;
  stop_ = false;
  fatal_error_ = exception_ptr();
  nr_of_workers_ = min(concurrency_, cubes.size());
  L_INF("Solving " << cubes.size() << " cubes using " << nr_of_workers_ << " workers ...");

  // Start the threads (the calling thread is the first worker):
  vector<thread> worker_threads;
  if(nr_of_workers_ > 1)
    worker_threads.reserve(nr_of_workers_ - 1);
  try
  {
    for(size_t cnt = 1; cnt < nr_of_workers_; ++cnt)
      worker_threads.push_back(thread(&ConquerScheduler::work, this));
  }
  catch(system_error &e)
  {
    stop_ = true;
    for(size_t cnt = 0; cnt < worker_threads.size(); ++cnt)
      worker_threads[cnt].join();
    throw ConcurrencyError(string("Could not start the worker threads: ") + e.what());
  }
  if(nr_of_workers_ > 0)
    work();

  // Wait until the threads are finished:
  for(size_t cnt = 0; cnt < worker_threads.size(); ++cnt)
    worker_threads[cnt].join();
  if(fatal_error_)
    rethrow_exception(fatal_error_);

  size_t nr_of_cancelled = 0;
  for(size_t cnt = 0; cnt < states_.size(); ++cnt)
  {
    if(states_[cnt] == PENDING)
    {
      states_[cnt] = CANCELLED;
      verdicts_[cnt] = Verdict::unknown(cnt, Verdict::CANCELLED, 0.0);
      ++nr_of_cancelled;
    }
  }
  if(nr_of_cancelled > 0)
    L_INF(nr_of_cancelled << " cubes were not dispatched because a cube is SAT.");
  cubes_ = NULL;
  return verdicts_;
}

// -------------------------------------------------------------------------------------------
const vector<ConquerScheduler::TaskState>& ConquerScheduler::getTaskStates() const
{
  return states_;
}

// -------------------------------------------------------------------------------------------
size_t ConquerScheduler::getNrOfWorkers() const
{
  return nr_of_workers_;
}

// -------------------------------------------------------------------------------------------
void ConquerScheduler::work()
{
  try
  {
    size_t index = 0;
    while(nextTask(index))
      solveCube(index);
  }
  catch(...)
  {
    // fatal, handed over to the thread that called runAll():
    {
      lock_guard<mutex> guard(lock_);
      if(!fatal_error_)
        fatal_error_ = current_exception();
    }
    stop_ = true;
  }
}

// -------------------------------------------------------------------------------------------
bool ConquerScheduler::nextTask(size_t &index)
{
  lock_guard<mutex> guard(lock_);
  if(stop_ || next_index_ >= cubes_->size())
    return false;
  index = next_index_++;
  states_[index] = DISPATCHED;
  return true;
}

// -------------------------------------------------------------------------------------------
void ConquerScheduler::solveCube(size_t index)
{
  PointInTime start = Stopwatch::start();
  CubeQuery query = encoder_.encodeWithAssumptions((*cubes_)[index], index);
  L_DBG("Solving " << query.getName() << " " << (*cubes_)[index].toString() << " ("
        << query.getNrOfClauses() << " clauses) ...");

  SatSolver *solver = factory_.create();
  vector<int> model;
  SatSolver::Answer answer = SatSolver::TIMEOUT;
  vector<int> witness;
  try
  {
    answer = solver->solve(query, timeout_sec_, model);
    if(answer == SatSolver::SAT)
      witness = checkWitness(index, model);
  }
  catch(SolverFailure &e)
  {
    delete solver;
    L_WRN("Solving cube " << index << " failed: " << e.what());
    record(Verdict::unknown(index, Verdict::SOLVER_ERROR, Stopwatch::getRealTimeSecExact(start)),
           SOLVER_FAILED);
    return;
  }
  catch(...)
  {
    delete solver;
    throw;
  }
  delete solver;

  double elapsed = Stopwatch::getRealTimeSecExact(start);
  if(answer == SatSolver::SAT)
    record(Verdict::sat(index, witness, elapsed), SOLVED);
  else if(answer == SatSolver::UNSAT)
    record(Verdict::unsat(index, elapsed), SOLVED);
  else
    record(Verdict::unknown(index, Verdict::TIMEOUT, elapsed), TIMED_OUT);
}

// -------------------------------------------------------------------------------------------
vector<int> ConquerScheduler::checkWitness(size_t index, const vector<int> &model) const
{
  if(model.empty())
    return model;
  const vector<int> &input_vars = encoder_.getVarManager().getInputVars();
  vector<int> witness = Utils::restrictModel(model, input_vars);
  Utils::debugPrint(witness, "Witness of cube " + to_string(index) + ":");
  vector<bool> input_values(witness.size(), false);
  for(size_t cnt = 0; cnt < witness.size(); ++cnt)
    input_values[cnt] = witness[cnt] > 0;
  if(!encoder_.getCircuit().evaluate(input_values))
  {
    ostringstream msg;
    msg << "The model for cube " << index << " does not make the output true.";
    throw SolverFailure(msg.str());
  }
  return witness;
}

// -------------------------------------------------------------------------------------------
void ConquerScheduler::record(const Verdict &verdict, TaskState state)
{
  {
    lock_guard<mutex> guard(lock_);
    verdicts_[verdict.getIndex()] = verdict;
    states_[verdict.getIndex()] = state;
  }
  if(verdict.getKind() == Verdict::SAT)
    stop_ = true;
  L_INF(verdict.toString());
}
