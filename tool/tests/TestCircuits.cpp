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
/// @file TestCircuits.cpp
/// @brief Contains the definition of the class TestCircuits.
// -------------------------------------------------------------------------------------------

#include "TestCircuits.h"

// -------------------------------------------------------------------------------------------
TestCircuits::TestCircuits() :
    next_var_(1)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
AigLit TestCircuits::addInput()
{
  AigLit lit = AigCircuit::makeLit(next_var_++, false);
  inputs_.push_back(lit);
  return lit;
}

// -------------------------------------------------------------------------------------------
AigLit TestCircuits::addAnd(AigLit rhs0, AigLit rhs1)
{
  AigCircuit::AndDef def;
  def.lhs_ = AigCircuit::makeLit(next_var_++, false);
  def.rhs0_ = rhs0;
  def.rhs1_ = rhs1;
  ands_.push_back(def);
  return def.lhs_;
}

// -------------------------------------------------------------------------------------------
AigLit TestCircuits::addOr(AigLit rhs0, AigLit rhs1)
{
  return AigCircuit::negLit(addAnd(AigCircuit::negLit(rhs0), AigCircuit::negLit(rhs1)));
}

// -------------------------------------------------------------------------------------------
AigLit TestCircuits::addXor(AigLit rhs0, AigLit rhs1)
{
  AigLit only0 = addAnd(rhs0, AigCircuit::negLit(rhs1));
  AigLit only1 = addAnd(AigCircuit::negLit(rhs0), rhs1);
  return addOr(only0, only1);
}

// -------------------------------------------------------------------------------------------
AigCircuit* TestCircuits::build(AigLit output) const
{
  return AigCircuit::fromAigerLits(inputs_, ands_, output, vector<string>());
}

// -------------------------------------------------------------------------------------------
AigCircuit* TestCircuits::andGate()
{
  TestCircuits builder;
  AigLit x1 = builder.addInput();
  AigLit x2 = builder.addInput();
  return builder.build(builder.addAnd(x1, x2));
}

// -------------------------------------------------------------------------------------------
AigCircuit* TestCircuits::contradiction()
{
  TestCircuits builder;
  AigLit x1 = builder.addInput();
  return builder.build(builder.addAnd(x1, AigCircuit::negLit(x1)));
}

// -------------------------------------------------------------------------------------------
AigCircuit* TestCircuits::parityMiter(size_t nr_of_inputs, bool with_bug)
{
  TestCircuits builder;
  vector<AigLit> x;
  for(size_t cnt = 0; cnt < nr_of_inputs; ++cnt)
    x.push_back(builder.addInput());

  AigLit tree = builder.xorTree(x, 0, x.size());
  AigLit chain = with_bug ? AigCircuit::negLit(x[0]) : x[0];
  for(size_t cnt = 1; cnt < x.size(); ++cnt)
    chain = builder.addXor(chain, x[cnt]);
  return builder.build(builder.addXor(tree, chain));
}

// -------------------------------------------------------------------------------------------
AigLit TestCircuits::xorTree(const vector<AigLit> &lits, size_t from, size_t to)
{
  if(to - from == 1)
    return lits[from];
  size_t middle = from + (to - from) / 2;
  AigLit left = xorTree(lits, from, middle);
  AigLit right = xorTree(lits, middle, to);
  return addXor(left, right);
}
