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
/// @file ConquerScheduler.h
/// @brief Contains the declaration of the class ConquerScheduler.
// -------------------------------------------------------------------------------------------

#ifndef ConquerScheduler_H__
#define ConquerScheduler_H__

#include "defines.h"
#include "Verdict.h"
#include "Cube.h"

#include <thread>
#include <mutex>
#include <atomic>
#include <exception>

class AIG2CNF;
class SatSolverFactory;

// -------------------------------------------------------------------------------------------
///
/// @class ConquerScheduler
/// @brief Solves a set of cubes with a fixed pool of worker threads.
///
/// Every worker repeatedly takes the next cube index from a shared counter, builds the
/// CNF of the cube, and solves it with a fresh solver from the SatSolverFactory. The
/// outcome of every cube is classified as follows:
///  - SAT or UNSAT: the cube is solved. A SAT witness is checked by simulating the circuit.
///  - timeout: the cube is UNKNOWN (timeout), the other cubes are not affected.
///  - SolverFailure: the cube is UNKNOWN (solver error), a warning with the cube index is
///    logged, and the other cubes are not affected.
/// No cube is retried.
///
/// As soon as one cube is SAT, the answer is clear, so no further cubes are dispatched.
/// Cubes that are already being solved are allowed to finish. Cubes that have never been
/// dispatched are reported as UNKNOWN (cancelled).
///
/// Any other exception in a worker (e.g., an EncodingError) is fatal: it stops the
/// dispatching of cubes and is rethrown by runAll() after all workers have finished.
///
/// The calling thread acts as one of the workers, so a concurrency of 1 does not start any
/// additional thread.
class ConquerScheduler
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief The life cycle of a conquer task (one per cube).
  enum TaskState
  {
    PENDING,
    DISPATCHED,
    SOLVED,
    TIMED_OUT,
    SOLVER_FAILED,
    CANCELLED
  };

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param encoder The CNF encoding of the circuit. Must outlive this object.
/// @param factory Creates the solvers. Must outlive this object.
/// @param timeout_sec The time limit per cube in seconds (zero or less for no limit).
/// @param concurrency The maximum number of cubes solved in parallel.
  ConquerScheduler(const AIG2CNF &encoder,
                   const SatSolverFactory &factory,
                   double timeout_sec,
                   size_t concurrency);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~ConquerScheduler();

// -------------------------------------------------------------------------------------------
///
/// @brief Solves all cubes.
///
/// @param cubes The cubes to solve.
/// @return One verdict per cube, ordered by cube index.
/// @throws ConcurrencyError If the concurrency is 0 or the threads could not be started.
/// @throws AigCubeException Any fatal error that occurred in a worker.
  vector<Verdict> runAll(const vector<Cube> &cubes);

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the final state of every task of the last call to runAll().
///
/// @return The state of every task, indexed by cube index.
  const vector<TaskState>& getTaskStates() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the number of workers used by the last call to runAll().
///
/// @return The number of workers (including the calling thread).
  size_t getNrOfWorkers() const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief The main loop of a worker.
  void work();

// -------------------------------------------------------------------------------------------
///
/// @brief Takes the next cube to solve.
///
/// @param index Will be set to the index of the cube.
/// @return False if there are no more cubes or a stop was requested.
  bool nextTask(size_t &index);

// -------------------------------------------------------------------------------------------
///
/// @brief Solves one cube and records the verdict.
///
/// @param index The index of the cube.
  void solveCube(size_t index);

// -------------------------------------------------------------------------------------------
///
/// @brief Restricts a model to the inputs and checks it by simulation.
///
/// @param index The index of the cube (for messages).
/// @param model The model returned by the solver. May be empty.
/// @return The values of the inputs as CNF literals (empty if the model was empty).
/// @throws SolverFailure If the model does not make the output TRUE.
  vector<int> checkWitness(size_t index, const vector<int> &model) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Stores the verdict and the final state of a task.
///
/// @param verdict The verdict.
/// @param state The final state of the task.
  void record(const Verdict &verdict, TaskState state);

// -------------------------------------------------------------------------------------------
///
/// @brief The CNF encoding of the circuit.
  const AIG2CNF &encoder_;

// -------------------------------------------------------------------------------------------
///
/// @brief Creates the solvers.
  const SatSolverFactory &factory_;

// -------------------------------------------------------------------------------------------
///
/// @brief The time limit per cube in seconds.
  double timeout_sec_;

// -------------------------------------------------------------------------------------------
///
/// @brief The maximum number of cubes solved in parallel.
  size_t concurrency_;

// -------------------------------------------------------------------------------------------
///
/// @brief The number of workers used by the last run.
  size_t nr_of_workers_;

// -------------------------------------------------------------------------------------------
///
/// @brief The cubes of the current run.
  const vector<Cube> *cubes_;

// -------------------------------------------------------------------------------------------
///
/// @brief The verdicts of the current run, indexed by cube index.
  vector<Verdict> verdicts_;

// -------------------------------------------------------------------------------------------
///
/// @brief The states of the tasks of the current run, indexed by cube index.
  vector<TaskState> states_;

// -------------------------------------------------------------------------------------------
///
/// @brief The index of the next cube to dispatch.
  size_t next_index_;

// -------------------------------------------------------------------------------------------
///
/// @brief Set when no further cubes should be dispatched.
  atomic<bool> stop_;

// -------------------------------------------------------------------------------------------
///
/// @brief The first fatal error that occurred in a worker.
  exception_ptr fatal_error_;

// -------------------------------------------------------------------------------------------
///
/// @brief Protects next_index_, verdicts_, states_, and fatal_error_.
  mutex lock_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  ConquerScheduler(const ConquerScheduler &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  ConquerScheduler& operator=(const ConquerScheduler &other);
};

#endif // ConquerScheduler_H__
