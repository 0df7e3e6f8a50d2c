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
/// @file VarManager.h
/// @brief Contains the declaration of the class VarManager.
// -------------------------------------------------------------------------------------------

#ifndef VarManager_H__
#define VarManager_H__

#include "defines.h"
#include "AigCircuit.h"

// -------------------------------------------------------------------------------------------
///
/// @class VarManager
/// @brief Maps the nodes of a circuit to CNF variables.
///
/// The node with id k > 0 is represented by the CNF variable k. The constant node cannot be
/// represented by variable 0 (which is not a valid literal in CNFs), so it gets the extra
/// variable getNrOfNodes(), which is asserted to be false by the encoder.
///
/// The map is computed once per circuit and never changes afterwards. All cube encodings of
/// a circuit share the same VarManager, also across threads.
class VarManager
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param circuit The circuit for which variables are assigned. The reference must remain
///        valid for the lifetime of this object.
  explicit VarManager(const AigCircuit &circuit);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~VarManager();

// -------------------------------------------------------------------------------------------
///
/// @brief Translates a literal of the circuit into a CNF literal.
///
/// @param aig_lit The literal of the circuit.
/// @return The corresponding CNF literal (negative if aig_lit is inverted).
  int aigLitToCnfLit(AigLit aig_lit) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the CNF variable of a node.
///
/// @param node The id of the node.
/// @return The CNF variable of this node.
  int nodeToVar(unsigned node) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the CNF variables of the inputs, in declaration order.
///
/// @return The CNF variables of the inputs.
  const vector<int>& getInputVars() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the largest CNF variable.
///
/// @return The largest CNF variable.
  int getMaxCNFVar() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the CNF variable representing the constant node.
///
/// @return The CNF variable representing the constant node.
  int getConstVar() const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief The number of nodes in the circuit.
  int nr_of_nodes_;

// -------------------------------------------------------------------------------------------
///
/// @brief The CNF variables of the inputs.
  vector<int> input_vars_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  VarManager(const VarManager &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  VarManager& operator=(const VarManager &other);
};

#endif // VarManager_H__
