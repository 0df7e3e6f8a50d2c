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
/// @file TestCircuits.h
/// @brief Contains the declaration of the class TestCircuits.
// -------------------------------------------------------------------------------------------

#ifndef TestCircuits_H__
#define TestCircuits_H__

#include "defines.h"
#include "AigCircuit.h"

// -------------------------------------------------------------------------------------------
///
/// @class TestCircuits
/// @brief Builds small circuits for the unit tests.
///
/// The circuits are built from AIGER literals, like a parsed AIGER file would be.
class TestCircuits
{
public:
  TestCircuits();

  AigLit addInput();
  AigLit addAnd(AigLit rhs0, AigLit rhs1);
  AigLit addOr(AigLit rhs0, AigLit rhs1);
  AigLit addXor(AigLit rhs0, AigLit rhs1);

// -------------------------------------------------------------------------------------------
///
/// @brief Builds the circuit.
///
/// @param output The output literal.
/// @return The circuit. The caller is responsible for deleting it.
  AigCircuit* build(AigLit output) const;

// -------------------------------------------------------------------------------------------
///
/// @brief A single AND gate: output = x1 & x2.
///
/// @return The circuit. The caller is responsible for deleting it.
  static AigCircuit* andGate();

// -------------------------------------------------------------------------------------------
///
/// @brief A circuit whose output can never be true: output = x1 & !x1.
///
/// @return The circuit. The caller is responsible for deleting it.
  static AigCircuit* contradiction();

// -------------------------------------------------------------------------------------------
///
/// @brief A miter comparing two implementations of the parity of n inputs.
///
/// One implementation is a balanced XOR tree, the other one is a chain of XOR gates. The
/// output is the XOR of both. Without a bug, the miter is unsatisfiable. With a bug, the
/// chain uses the negation of the first input, so the two implementations differ for every
/// input assignment.
///
/// @param nr_of_inputs The number of inputs (at least 2).
/// @param with_bug True to inject the bug into the chain.
/// @return The circuit. The caller is responsible for deleting it.
  static AigCircuit* parityMiter(size_t nr_of_inputs, bool with_bug);

protected:
  AigLit xorTree(const vector<AigLit> &lits, size_t from, size_t to);

  unsigned next_var_;
  vector<AigLit> inputs_;
  vector<AigCircuit::AndDef> ands_;
};

#endif // TestCircuits_H__
