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
/// @file AIG2CNF.h
/// @brief Contains the declaration of the class AIG2CNF.
// -------------------------------------------------------------------------------------------

#ifndef AIG2CNF_H__
#define AIG2CNF_H__

#include "defines.h"
#include "CNF.h"
#include "VarManager.h"
#include "CubeQuery.h"

class AigCircuit;
class Cube;

// -------------------------------------------------------------------------------------------
///
/// @class AIG2CNF
/// @brief Transforms a circuit into an equisatisfiable CNF.
///
/// The encoding is the Tseitin encoding: every AND gate g = a & b in the cone of influence
/// of the output results in the three clauses (!g | a), (!g | b), and (g | !a | !b). The
/// variable of the constant node is asserted to be false, and the output literal is asserted
/// to be true. Hence, the CNF is satisfiable iff there is an input assignment under which
/// the output evaluates to true.
///
/// The CNF is computed once in the constructor. Sub-problems are then created with
/// @link #encodeWithAssumptions encodeWithAssumptions() @endlink, which only adds the unit
/// clauses of a cube and shares the base clauses.
class AIG2CNF
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param circuit The circuit to encode. It must outlive this object.
  explicit AIG2CNF(const AigCircuit &circuit);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~AIG2CNF();

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the CNF encoding of the circuit with the output asserted.
///
/// @return The CNF encoding of the circuit with the output asserted.
  const CNF& getBase() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the map between circuit nodes and CNF variables.
///
/// @return The map between circuit nodes and CNF variables.
  const VarManager& getVarManager() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the encoded circuit.
///
/// @return The encoded circuit.
  const AigCircuit& getCircuit() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the largest CNF variable.
///
/// @return The largest CNF variable.
  int getMaxCNFVar() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Creates the CNF of one sub-problem.
///
/// @param cube The cube that defines the sub-problem. Its literals must be variables of
///        the VarManager.
/// @param index The index of the cube in generation order.
/// @return The base clauses plus one unit clause per literal of the cube.
  CubeQuery encodeWithAssumptions(const Cube &cube, size_t index) const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief The encoded circuit.
  const AigCircuit &circuit_;

// -------------------------------------------------------------------------------------------
///
/// @brief The map between circuit nodes and CNF variables.
  VarManager var_manager_;

// -------------------------------------------------------------------------------------------
///
/// @brief The CNF encoding of the circuit with the output asserted.
  CNF base_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  AIG2CNF(const AIG2CNF &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  AIG2CNF& operator=(const AIG2CNF &other);
};

#endif // AIG2CNF_H__
