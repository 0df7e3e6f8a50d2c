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
/// @file AIG2CNF.cpp
/// @brief Contains the definition of the class AIG2CNF.
// -------------------------------------------------------------------------------------------

#include "AIG2CNF.h"
#include "AigCircuit.h"
#include "Cube.h"
#include "Logger.h"

// -------------------------------------------------------------------------------------------
AIG2CNF::AIG2CNF(const AigCircuit &circuit) :
    circuit_(circuit),
    var_manager_(circuit)
{
  // Step 1:
  // clauses defining the outputs of the AND gates in the cone of the output:
  const vector<unsigned> &ands = circuit_.getAnds();
  for(size_t cnt = 0; cnt < ands.size(); ++cnt)
  {
    unsigned gate = ands[cnt];
    if(!circuit_.isInCone(gate))
      continue;
    const AigCircuit::Node &node = circuit_.getNode(gate);
    MASSERT(node.kind_ == AigCircuit::AND, "Node " << gate << " is no AND gate.");
    int out_cnf_lit = var_manager_.nodeToVar(gate);
    int rhs0_cnf_lit = var_manager_.aigLitToCnfLit(node.rhs0_);
    int rhs1_cnf_lit = var_manager_.aigLitToCnfLit(node.rhs1_);
    // (lhs --> rhs0) AND (lhs --> rhs1)
    base_.add2LitClause(-out_cnf_lit, rhs0_cnf_lit);
    base_.add2LitClause(-out_cnf_lit, rhs1_cnf_lit);
    // (!lhs --> (!rhs0 OR !rhs1)
    base_.add3LitClause(out_cnf_lit, -rhs0_cnf_lit, -rhs1_cnf_lit);
  }

  // Step 2:
  // the constant is false, the output is true:
  base_.add1LitClause(-var_manager_.getConstVar());
  base_.add1LitClause(var_manager_.aigLitToCnfLit(circuit_.getOutput()));
  L_DBG("Base CNF: " << var_manager_.getMaxCNFVar() << " variables, "
        << base_.getNrOfClauses() << " clauses.");
}

// -------------------------------------------------------------------------------------------
AIG2CNF::~AIG2CNF()
{
  // nothing to be done
}

// -------------------------------------------------------------------------------------------
const CNF& AIG2CNF::getBase() const
{
  return base_;
}

// -------------------------------------------------------------------------------------------
const VarManager& AIG2CNF::getVarManager() const
{
  return var_manager_;
}

// -------------------------------------------------------------------------------------------
const AigCircuit& AIG2CNF::getCircuit() const
{
  return circuit_;
}

// -------------------------------------------------------------------------------------------
int AIG2CNF::getMaxCNFVar() const
{
  return var_manager_.getMaxCNFVar();
}

// -------------------------------------------------------------------------------------------
CubeQuery AIG2CNF::encodeWithAssumptions(const Cube &cube, size_t index) const
{
  const vector<int> &lits = cube.getLiterals();
  for(size_t cnt = 0; cnt < lits.size(); ++cnt)
  {
    int var = lits[cnt] < 0 ? -lits[cnt] : lits[cnt];
    MASSERT(var > 0 && var <= getMaxCNFVar(), "Cube " << index << " contains unknown literal "
            << lits[cnt] << ".");
  }
  return CubeQuery(base_, getMaxCNFVar(), lits, index);
}
