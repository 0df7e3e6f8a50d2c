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
/// @file Cube.h
/// @brief Contains the declaration of the class Cube.
// -------------------------------------------------------------------------------------------

#ifndef Cube_H__
#define Cube_H__

#include "defines.h"

// -------------------------------------------------------------------------------------------
///
/// @class Cube
/// @brief A conjunction of CNF literals that defines one sub-problem.
///
/// A cube is the path from the root to a leaf in the decision tree of the cube generator.
/// Its literals are stored in the order in which they were fixed. Every literal is either a
/// decision (a branch of the decision tree) or implied (a literal that failed-literal probing
/// found to be forced by the literals before it). The decisions of all cubes of one run form
/// a partition of the search space, the implied literals only remove assignments that cannot
/// satisfy the circuit anyway.
class Cube
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor. Creates the empty cube (the formula TRUE).
  Cube();

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~Cube();

// -------------------------------------------------------------------------------------------
///
/// @brief Appends a decision literal.
///
/// @param lit The CNF literal.
  void addDecision(int lit);

// -------------------------------------------------------------------------------------------
///
/// @brief Appends an implied literal.
///
/// @param lit The CNF literal.
  void addImplied(int lit);

// -------------------------------------------------------------------------------------------
///
/// @brief Removes the last literal.
  void popBack();

// -------------------------------------------------------------------------------------------
///
/// @brief Returns all literals in the order in which they were added.
///
/// @return All literals of the cube.
  const vector<int>& getLiterals() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the decision literals in the order in which they were added.
///
/// @return The decision literals of the cube.
  vector<int> getDecisions() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the number of decision literals.
///
/// @return The number of decision literals.
  size_t getNrOfDecisions() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the number of literals.
///
/// @return The number of literals.
  size_t size() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns a string representation such as '[3 -7 (12)]'.
///
/// Implied literals are printed in parentheses.
///
/// @return A string representation of the cube.
  string toString() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Compares two cubes.
///
/// @param other The cube to compare with.
/// @return True if both cubes have the same literals with the same kind in the same order.
  bool operator==(const Cube &other) const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief The literals of the cube.
  vector<int> lits_;

// -------------------------------------------------------------------------------------------
///
/// @brief Maps positions in lits_ to true if the literal is a decision.
  vector<bool> decision_;
};

#endif // Cube_H__
