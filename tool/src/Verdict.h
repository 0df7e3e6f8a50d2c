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
/// @file Verdict.h
/// @brief Contains the declaration of the class Verdict.
// -------------------------------------------------------------------------------------------

#ifndef Verdict_H__
#define Verdict_H__

#include "defines.h"

// -------------------------------------------------------------------------------------------
///
/// @class Verdict
/// @brief The outcome of solving one cube.
///
/// A verdict is SAT (optionally with a witness), UNSAT, or UNKNOWN with a reason. UNKNOWN is
/// never a proof of anything: a timed-out or failed cube leaves the overall answer open.
class Verdict
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief The possible outcomes.
  enum Kind
  {
    SAT,
    UNSAT,
    UNKNOWN
  };

// -------------------------------------------------------------------------------------------
///
/// @brief The reasons for an UNKNOWN outcome.
  enum Reason
  {
///
/// @brief No reason (the outcome is SAT or UNSAT).
    NONE,

///
/// @brief The solver exceeded the time limit.
    TIMEOUT,

///
/// @brief The solver crashed or produced an answer that could not be interpreted.
    SOLVER_ERROR,

///
/// @brief The cube was never dispatched because another cube was already SAT.
    CANCELLED
  };

// -------------------------------------------------------------------------------------------
///
/// @brief Creates a SAT verdict.
///
/// @param index The index of the cube.
/// @param witness The values of the inputs (as CNF literals), empty if unknown.
/// @param elapsed The real time in seconds spent on the cube.
/// @return The verdict.
  static Verdict sat(size_t index, const vector<int> &witness, double elapsed);

// -------------------------------------------------------------------------------------------
///
/// @brief Creates an UNSAT verdict.
///
/// @param index The index of the cube.
/// @param elapsed The real time in seconds spent on the cube.
/// @return The verdict.
  static Verdict unsat(size_t index, double elapsed);

// -------------------------------------------------------------------------------------------
///
/// @brief Creates an UNKNOWN verdict.
///
/// @param index The index of the cube.
/// @param reason Why the outcome is unknown.
/// @param elapsed The real time in seconds spent on the cube.
/// @return The verdict.
  static Verdict unknown(size_t index, Reason reason, double elapsed);

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the name of an outcome.
///
/// @param kind The outcome.
/// @return 'SAT', 'UNSAT', or 'UNKNOWN'.
  static const char* kindToString(Kind kind);

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the name of a reason.
///
/// @param reason The reason.
/// @return 'none', 'timeout', 'solver error', or 'cancelled'.
  static const char* reasonToString(Reason reason);

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor. Creates an UNKNOWN verdict for cube 0 with reason NONE.
  Verdict();

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~Verdict();

// -------------------------------------------------------------------------------------------
  Kind getKind() const;

// -------------------------------------------------------------------------------------------
  Reason getReason() const;

// -------------------------------------------------------------------------------------------
  size_t getIndex() const;

// -------------------------------------------------------------------------------------------
  const vector<int>& getWitness() const;

// -------------------------------------------------------------------------------------------
  double getElapsed() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns a string such as 'cube 3: UNKNOWN (timeout) after 10.02 sec'.
///
/// @return A string representation of the verdict.
  string toString() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Orders verdicts by cube index.
///
/// @param other The verdict to compare with.
/// @return True if this verdict belongs to a cube with a smaller index.
  bool operator<(const Verdict &other) const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param index The index of the cube.
/// @param kind The outcome.
/// @param reason Why the outcome is unknown (NONE for SAT and UNSAT).
/// @param witness The values of the inputs for SAT.
/// @param elapsed The real time in seconds spent on the cube.
  Verdict(size_t index, Kind kind, Reason reason, const vector<int> &witness, double elapsed);

// -------------------------------------------------------------------------------------------
///
/// @brief The index of the cube.
  size_t index_;

// -------------------------------------------------------------------------------------------
///
/// @brief The outcome.
  Kind kind_;

// -------------------------------------------------------------------------------------------
///
/// @brief Why the outcome is unknown.
  Reason reason_;

// -------------------------------------------------------------------------------------------
///
/// @brief The values of the inputs for SAT (may be empty).
  vector<int> witness_;

// -------------------------------------------------------------------------------------------
///
/// @brief The real time in seconds spent on the cube.
  double elapsed_;
};

#endif // Verdict_H__
