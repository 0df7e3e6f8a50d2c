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
/// @file CubeQuery.h
/// @brief Contains the declaration of the class CubeQuery.
// -------------------------------------------------------------------------------------------

#ifndef CubeQuery_H__
#define CubeQuery_H__

#include "defines.h"
#include "CNF.h"

// -------------------------------------------------------------------------------------------
///
/// @class CubeQuery
/// @brief The CNF of one sub-problem: the base encoding of the circuit plus unit clauses.
///
/// A CubeQuery does not copy the base clauses. It only keeps a pointer to the CNF owned by
/// the AIG2CNF encoder, which must outlive the query. Creating a query therefore only costs
/// time in the size of the cube. The base CNF is never modified after construction, so
/// queries of different cubes can be used by different threads concurrently.
class CubeQuery
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param base The clauses shared by all sub-problems.
/// @param max_var The largest variable of the base clauses.
/// @param units The literals to add as unit clauses.
/// @param index The index of the cube in generation order.
  CubeQuery(const CNF &base, int max_var, const vector<int> &units, size_t index);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~CubeQuery();

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the clauses shared by all sub-problems.
///
/// @return The base clauses.
  const CNF& getBase() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the literals that are asserted in addition to the base clauses.
///
/// @return The unit literals.
  const vector<int>& getUnits() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the largest variable of the query.
///
/// @return The largest variable.
  int getMaxVar() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the number of clauses of the query (base clauses plus unit clauses).
///
/// @return The number of clauses.
  size_t getNrOfClauses() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the index of the cube this query was built for.
///
/// @return The index of the cube.
  size_t getIndex() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns a name for the query, e.g., 'cube_0007' for the cube with index 7.
///
/// @return The name of the query.
  string getName() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Writes the query in DIMACS format.
///
/// @param out The stream to write to.
  void toDimacs(ostream &out) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Creates a stand-alone copy of all clauses.
///
/// @return The base clauses plus the unit clauses.
  CNF toCNF() const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief The clauses shared by all sub-problems.
  const CNF *base_;

// -------------------------------------------------------------------------------------------
///
/// @brief The largest variable.
  int max_var_;

// -------------------------------------------------------------------------------------------
///
/// @brief The literals of the cube.
  vector<int> units_;

// -------------------------------------------------------------------------------------------
///
/// @brief The index of the cube.
  size_t index_;
};

#endif // CubeQuery_H__
