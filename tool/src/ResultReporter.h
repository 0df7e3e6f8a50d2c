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
/// @file ResultReporter.h
/// @brief Contains the declaration of the classes ResultReporter and LogReporter.
// -------------------------------------------------------------------------------------------

#ifndef ResultReporter_H__
#define ResultReporter_H__

#include "defines.h"
#include "ResultAggregator.h"

// -------------------------------------------------------------------------------------------
///
/// @class ResultReporter
/// @brief An interface for everything that presents the results of a run.
///
/// A reporter receives the verdicts of all cubes ordered by cube index (index, verdict, time)
/// followed by the final result. This class is abstract, i.e., objects of this class cannot be
/// instantiated. Instantiate one of the derived classes instead.
class ResultReporter
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
  ResultReporter();

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~ResultReporter();

// -------------------------------------------------------------------------------------------
///
/// @brief Reports a complete result.
///
/// Calls reportCube() for all verdicts (in the order of the cube index) and then
/// reportFinal().
///
/// @param result The result to report.
  void report(const FinalResult &result);

// -------------------------------------------------------------------------------------------
///
/// @brief Reports the verdict of one cube.
///
/// @param verdict The verdict.
  virtual void reportCube(const Verdict &verdict) = 0;

// -------------------------------------------------------------------------------------------
///
/// @brief Reports the final result.
///
/// @param result The final result.
  virtual void reportFinal(const FinalResult &result) = 0;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  ResultReporter(const ResultReporter &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  ResultReporter& operator=(const ResultReporter &other);
};

// -------------------------------------------------------------------------------------------
///
/// @class LogReporter
/// @brief Prints the results as messages of type Logger::RES.
///
/// The per-cube lines look like "cube 3: UNKNOWN (timeout) after 1.00 sec". The final line
/// starts with "Answer: SAT", "Answer: UNSAT" or "Answer: UNKNOWN". If there is a witness, it
/// is printed as one line with the values of the inputs (1 or 0, in the order of the inputs).
class LogReporter : public ResultReporter
{
public:
  LogReporter();
  virtual ~LogReporter();
  virtual void reportCube(const Verdict &verdict);
  virtual void reportFinal(const FinalResult &result);
};

#endif // ResultReporter_H__
