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
/// @file CNF.cpp
/// @brief Contains the definition of the class CNF.
// -------------------------------------------------------------------------------------------

#include "CNF.h"

// -------------------------------------------------------------------------------------------
CNF::CNF()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
CNF::CNF(const CNF &other) :
    clauses_(other.clauses_)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
CNF& CNF::operator=(const CNF &other)
{
  clauses_ = other.clauses_;
  return *this;
}

// -------------------------------------------------------------------------------------------
CNF::~CNF()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
void CNF::addClause(const vector<int> &clause)
{
  DASSERT(find(clause.begin(), clause.end(), 0) == clause.end(), "0 is not a literal.");
  clauses_.push_back(clause);
}

// -------------------------------------------------------------------------------------------
void CNF::addCube(const vector<int> &cube)
{
  for(size_t cnt = 0; cnt < cube.size(); ++cnt)
    add1LitClause(cube[cnt]);
}

// -------------------------------------------------------------------------------------------
void CNF::add1LitClause(int lit1)
{
  vector<int> clause(1, lit1);
  addClause(clause);
}

// -------------------------------------------------------------------------------------------
void CNF::add2LitClause(int lit1, int lit2)
{
  vector<int> clause(2, lit1);
  clause[1] = lit2;
  addClause(clause);
}

// -------------------------------------------------------------------------------------------
void CNF::add3LitClause(int lit1, int lit2, int lit3)
{
  vector<int> clause(3, lit1);
  clause[1] = lit2;
  clause[2] = lit3;
  addClause(clause);
}

// -------------------------------------------------------------------------------------------
size_t CNF::getNrOfClauses() const
{
  return clauses_.size();
}

// -------------------------------------------------------------------------------------------
const list<vector<int> >& CNF::getClauses() const
{
  return clauses_;
}

// -------------------------------------------------------------------------------------------
bool CNF::isSatBy(const vector<int> &cube) const
{
  set<int> true_lits(cube.begin(), cube.end());
  for(CNF::ClauseConstIter it = clauses_.begin(); it != clauses_.end(); ++it)
  {
    bool sat = false;
    for(size_t cnt = 0; cnt < it->size() && !sat; ++cnt)
      sat = true_lits.count((*it)[cnt]) != 0;
    if(!sat)
      return false;
  }
  return true;
}
