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
/// @file CNF.h
/// @brief Contains the declaration of the class CNF.
// -------------------------------------------------------------------------------------------

#ifndef CNF_H__
#define CNF_H__

#include "defines.h"

// -------------------------------------------------------------------------------------------
///
/// @class CNF
/// @brief Represents a propositional formula in Conjunctive Normal Form.
///
/// A CNF is a conjunction of clauses, every clause is a disjunction of literals. A literal
/// is a non-zero integer: positive for a variable, negative for its negation. Every clause is
/// a vector of literals and a CNF is a list of clauses. We only ever append clauses and
/// iterate over them, so a list is all we need.
class CNF
{
public:

// -------------------------------------------------------------------------------------------
///
/// @typedef list<vector<int> >::const_iterator ClauseConstIter
/// @brief A type for a const iterator over the clauses.
  typedef list<vector<int> >::const_iterator ClauseConstIter;

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// After construction, the CNF represents the empty set of clauses, i.e., the formula TRUE.
  CNF();

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// @param other The source for creating the (deep) copy.
  CNF(const CNF &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// @param other The source for creating the (deep) copy.
/// @return The result of the assignment, i.e, *this.
  virtual CNF& operator=(const CNF &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~CNF();

// -------------------------------------------------------------------------------------------
///
/// @brief Adds a new clause to the CNF.
///
/// @param clause The new clause to add.
  void addClause(const vector<int> &clause);

// -------------------------------------------------------------------------------------------
///
/// @brief Conjuncts the CNF with a given cube.
///
/// Every literal of the cube is added as a unit clause, i.e., the cube [2, -4] results in
/// the two unit clauses [2] and [-4].
///
/// @param cube The new cube to add.
  void addCube(const vector<int> &cube);

// -------------------------------------------------------------------------------------------
///
/// @brief Adds a unit clause to the CNF.
///
/// @param lit1 The (one and only) literal of the unit clause to add.
  void add1LitClause(int lit1);

// -------------------------------------------------------------------------------------------
///
/// @brief Adds a clause consisting of two literal to the CNF.
///
/// @param lit1 The first literal of the clause to add.
/// @param lit2 The second literal of the clause to add.
  void add2LitClause(int lit1, int lit2);

// -------------------------------------------------------------------------------------------
///
/// @brief Adds a clause consisting of three literal to the CNF.
///
/// @param lit1 The first literal of the clause to add.
/// @param lit2 The second literal of the clause to add.
/// @param lit3 The third literal of the clause to add.
  void add3LitClause(int lit1, int lit2, int lit3);

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the number of clauses in the CNF.
///
/// @return The number of clauses in the CNF.
  size_t getNrOfClauses() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the clauses of the CNF as list of vectors.
///
/// @return The clauses of the CNF as list of vectors.
  const list<vector<int> >& getClauses() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Checks if the CNF is satisfied by a certain variable assignment.
///
/// This is a purely syntactic check, no SAT-solver is involved. The assignment is passed as
/// a cube: variables occurring positively are TRUE, variables occurring negatively are FALSE.
/// A clause that contains no literal of the cube is considered to be violated.
///
/// @param cube The variable assignment in form of a cube.
/// @return True if every clause contains a literal of the cube, false otherwise.
  bool isSatBy(const vector<int> &cube) const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief The clauses of the CNF.
  list<vector<int> > clauses_;
};

#endif // CNF_H__
