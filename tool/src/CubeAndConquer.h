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
/// @file CubeAndConquer.h
/// @brief Contains the declaration of the class CubeAndConquer.
// -------------------------------------------------------------------------------------------

#ifndef CubeAndConquer_H__
#define CubeAndConquer_H__

#include "defines.h"
#include "BackEnd.h"
#include "ResultAggregator.h"
#include "CnCStatistics.h"

class AigCircuit;
class LookaheadScorer;
class SatSolverFactory;
class ResultReporter;

// -------------------------------------------------------------------------------------------
///
/// @class CubeAndConquer
/// @brief Decides if the output of a circuit can be TRUE using cube-and-conquer.
///
/// The circuit is encoded into CNF (AIG2CNF) with the output asserted to be TRUE. Then a
/// lookahead procedure (CubeGenerator) splits the input space into cubes, the cubes are
/// solved in parallel (ConquerScheduler), and the verdicts are combined (ResultAggregator)
/// and reported (ResultReporter).
class CubeAndConquer : public BackEnd
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param circuit The circuit to check. Must outlive this object.
/// @param scorer The lookahead scoring function. This object takes over the ownership.
/// @param factory Creates the solvers for the cubes. This object takes over the ownership.
/// @param reporter Presents the results. This object takes over the ownership.
/// @param depth The maximum number of decisions per cube.
/// @param candidates_limit The number of candidates probed per decision (0 for all).
/// @param timeout_sec The time limit per cube in seconds (zero or less for no limit).
/// @param nr_of_threads The number of cubes that are solved in parallel.
  CubeAndConquer(const AigCircuit &circuit,
                 LookaheadScorer *scorer,
                 SatSolverFactory *factory,
                 ResultReporter *reporter,
                 size_t depth,
                 size_t candidates_limit,
                 double timeout_sec,
                 size_t nr_of_threads);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~CubeAndConquer();

// -------------------------------------------------------------------------------------------
///
/// @brief Runs cube-and-conquer.
///
/// @return 10 if the output can be TRUE, 20 if it cannot, 0 if the answer is unknown.
  virtual int run();

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the result of the last run.
///
/// @return The result of the last run.
  const FinalResult& getResult() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Maps an answer to the exit code of the program.
///
/// @param answer The answer.
/// @return 10 for SAT, 20 for UNSAT, 0 for UNKNOWN.
  static int toExitCode(Verdict::Kind answer);

protected:

  LookaheadScorer *scorer_;
  SatSolverFactory *factory_;
  ResultReporter *reporter_;
  size_t depth_;
  size_t candidates_limit_;
  double timeout_sec_;
  size_t nr_of_threads_;

// -------------------------------------------------------------------------------------------
///
/// @brief The result of the last run.
  FinalResult result_;

// -------------------------------------------------------------------------------------------
///
/// @brief The statistics of all runs.
  CnCStatistics statistics_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  CubeAndConquer(const CubeAndConquer &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  CubeAndConquer& operator=(const CubeAndConquer &other);

};

#endif // CubeAndConquer_H__
