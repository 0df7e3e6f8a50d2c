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
/// @file SatSolver.h
/// @brief Contains the declaration of the class SatSolver.
// -------------------------------------------------------------------------------------------

#ifndef SatSolver_H__
#define SatSolver_H__

#include "defines.h"
#include "Stopwatch.h"

class CubeQuery;

// -------------------------------------------------------------------------------------------
///
/// @struct TimeLimit
/// @brief A deadline that can be handed to the termination callbacks of C solver libraries.
struct TimeLimit
{
///
/// @brief The point in time where solving started.
  PointInTime start_;

///
/// @brief The limit in seconds (zero or less for no limit).
  double timeout_sec_;

///
/// @brief A callback for picosat_set_interrupt() and lglseterm().
///
/// @param state A pointer to a TimeLimit.
/// @return 1 if the deadline has passed, 0 otherwise.
  static int expired(void *state);
};

// -------------------------------------------------------------------------------------------
///
/// @class SatSolver
/// @brief A common interface for all SAT solvers, in-process or external.
///
/// A SatSolver solves one CubeQuery. The conquer stage creates a fresh solver object for
/// every cube, so implementations need not support incremental use and are never shared
/// between threads.
///
/// This class is abstract, i.e., objects of this class cannot be instantiated. Instantiate
/// one of the derived classes instead (or use the SatSolverFactory).
class SatSolver
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief The possible outcomes of a solver call.
  enum Answer
  {
    SAT,
    UNSAT,
    TIMEOUT
  };

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
  SatSolver();

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~SatSolver();

// -------------------------------------------------------------------------------------------
///
/// @brief Solves a query.
///
/// @param query The query to solve.
/// @param timeout_sec The limit for the real time in seconds (zero or less for no limit).
/// @param model Will be set to a satisfying assignment if the answer is SAT and the solver
///        provides one (one literal per variable, positive for TRUE). May be left empty by
///        solvers that do not print a model.
/// @return SAT, UNSAT, or TIMEOUT.
/// @throws SolverFailure If the solver crashed or produced an answer that cannot be
///         interpreted.
  virtual Answer solve(const CubeQuery &query, double timeout_sec, vector<int> &model) = 0;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the name of the solver (for log messages).
///
/// @return The name of the solver.
  virtual string getName() const = 0;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  SatSolver(const SatSolver &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  SatSolver& operator=(const SatSolver &other);
};

#endif // SatSolver_H__
