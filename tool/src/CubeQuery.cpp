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
/// @file CubeQuery.cpp
/// @brief Contains the definition of the class CubeQuery.
// -------------------------------------------------------------------------------------------

#include "CubeQuery.h"

#include <iomanip>

// -------------------------------------------------------------------------------------------
CubeQuery::CubeQuery(const CNF &base, int max_var, const vector<int> &units, size_t index) :
    base_(&base),
    max_var_(max_var),
    units_(units),
    index_(index)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
CubeQuery::~CubeQuery()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
const CNF& CubeQuery::getBase() const
{
  return *base_;
}

// -------------------------------------------------------------------------------------------
const vector<int>& CubeQuery::getUnits() const
{
  return units_;
}

// -------------------------------------------------------------------------------------------
int CubeQuery::getMaxVar() const
{
  return max_var_;
}

// -------------------------------------------------------------------------------------------
size_t CubeQuery::getNrOfClauses() const
{
  return base_->getNrOfClauses() + units_.size();
}

// -------------------------------------------------------------------------------------------
size_t CubeQuery::getIndex() const
{
  return index_;
}

// -------------------------------------------------------------------------------------------
string CubeQuery::getName() const
{
  ostringstream name;
  name << "cube_" << setw(4) << setfill('0') << index_;
  return name.str();
}

// -------------------------------------------------------------------------------------------
void CubeQuery::toDimacs(ostream &out) const
{
  out << "p cnf " << max_var_ << " " << getNrOfClauses() << endl;
  const list<vector<int> > &clauses = base_->getClauses();
  for(CNF::ClauseConstIter it = clauses.begin(); it != clauses.end(); ++it)
  {
    for(size_t cnt = 0; cnt < it->size(); ++cnt)
      out << (*it)[cnt] << " ";
    out << "0\n";
  }
  for(size_t cnt = 0; cnt < units_.size(); ++cnt)
    out << units_[cnt] << " 0\n";
}

// -------------------------------------------------------------------------------------------
CNF CubeQuery::toCNF() const
{
  CNF res(*base_);
  res.addCube(units_);
  return res;
}
