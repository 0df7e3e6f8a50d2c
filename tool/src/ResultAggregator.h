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
/// @file ResultAggregator.h
/// @brief Contains the declaration of the class ResultAggregator.
// -------------------------------------------------------------------------------------------

#ifndef ResultAggregator_H__
#define ResultAggregator_H__

#include "defines.h"
#include "Verdict.h"

// -------------------------------------------------------------------------------------------
///
/// @struct FinalResult
/// @brief The answer for the whole circuit, together with some numbers about the run.
struct FinalResult
{
  FinalResult();

  string toString() const;

  /// The answer: SAT, UNSAT or UNKNOWN.
  Verdict::Kind answer_;

  /// The input values of the SAT witness (empty unless the answer is SAT and a model was
  /// available).
  vector<int> witness_;

  /// The index of the cube the witness comes from (only meaningful if the answer is SAT).
  size_t witness_cube_;

  size_t nr_of_sat_;
  size_t nr_of_unsat_;
  size_t nr_of_unknown_;
  size_t nr_of_timeouts_;
  size_t nr_of_errors_;
  size_t nr_of_cancelled_;

  /// The sum of the per-cube solving times in seconds.
  double sum_time_;

  /// The maximum per-cube solving time in seconds.
  double max_time_;

  /// All verdicts, sorted by cube index.
  vector<Verdict> verdicts_;
};

// -------------------------------------------------------------------------------------------
///
/// @class ResultAggregator
/// @brief Combines the verdicts of all cubes into the answer for the circuit.
///
/// The cubes partition the input space, so:
///  - one SAT cube makes the circuit SAT, no matter what the other cubes say,
///  - the circuit is UNSAT only if every cube is UNSAT,
///  - otherwise the answer is UNKNOWN.
/// An empty list of verdicts proves nothing and gives UNKNOWN. The result does not depend on
/// the order of the verdicts.
class ResultAggregator
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Aggregates a list of verdicts.
///
/// @param verdicts The verdicts of the cubes, in any order.
/// @return The final result. If several cubes are SAT, the witness is taken from the one with
///         the lowest index.
  static FinalResult aggregate(const vector<Verdict> &verdicts);

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// The constructor is disabled (set private) as this class only has static methods.
  ResultAggregator();
};

#endif // ResultAggregator_H__
