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
/// @file MiniSatApi.h
/// @brief Contains the declaration of the class MiniSatApi.
// -------------------------------------------------------------------------------------------

#ifndef MiniSatApi_H__
#define MiniSatApi_H__

#include "defines.h"
#include "SatSolver.h"

// -------------------------------------------------------------------------------------------
///
/// @class MiniSatApi
/// @brief Solves queries with the MiniSat library (in-process).
///
/// MiniSat has no termination callback, so the time limit is enforced by solving with a
/// conflict budget and checking the clock whenever the budget is used up. The learned
/// clauses are kept between the slices.
class MiniSatApi : public SatSolver
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
  MiniSatApi();

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~MiniSatApi();

// -------------------------------------------------------------------------------------------
///
/// @brief Solves a query.
///
/// @param query The query to solve.
/// @param timeout_sec The limit for the real time in seconds (zero or less for no limit).
/// @param model Will be set to a satisfying assignment of all variables if the answer is
///        SAT.
/// @return SAT, UNSAT, or TIMEOUT.
  virtual Answer solve(const CubeQuery &query, double timeout_sec, vector<int> &model);

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the name of the solver.
///
/// @return 'minisat'.
  virtual string getName() const;

// -------------------------------------------------------------------------------------------
///
/// @brief The number of conflicts between two checks of the clock.
  static const int CONFLICTS_PER_SLICE = 10000;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  MiniSatApi(const MiniSatApi &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  MiniSatApi& operator=(const MiniSatApi &other);
};

#endif // MiniSatApi_H__
