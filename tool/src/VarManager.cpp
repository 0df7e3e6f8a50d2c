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
/// @file VarManager.cpp
/// @brief Contains the definition of the class VarManager.
// -------------------------------------------------------------------------------------------

#include "VarManager.h"

// -------------------------------------------------------------------------------------------
VarManager::VarManager(const AigCircuit &circuit) :
    nr_of_nodes_(static_cast<int>(circuit.getNrOfNodes()))
{
  const vector<unsigned> &inputs = circuit.getInputs();
  input_vars_.reserve(inputs.size());
  for(size_t cnt = 0; cnt < inputs.size(); ++cnt)
    input_vars_.push_back(nodeToVar(inputs[cnt]));
}

// -------------------------------------------------------------------------------------------
VarManager::~VarManager()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
int VarManager::aigLitToCnfLit(AigLit aig_lit) const
{
  int var = nodeToVar(AigCircuit::litNode(aig_lit));
  return AigCircuit::litInverted(aig_lit) ? -var : var;
}

// -------------------------------------------------------------------------------------------
int VarManager::nodeToVar(unsigned node) const
{
  DASSERT(static_cast<int>(node) < nr_of_nodes_, "Node " << node << " does not exist.");
  if(node == 0)
    return nr_of_nodes_;
  return static_cast<int>(node);
}

// -------------------------------------------------------------------------------------------
const vector<int>& VarManager::getInputVars() const
{
  return input_vars_;
}

// -------------------------------------------------------------------------------------------
int VarManager::getMaxCNFVar() const
{
  return nr_of_nodes_;
}

// -------------------------------------------------------------------------------------------
int VarManager::getConstVar() const
{
  return nr_of_nodes_;
}
