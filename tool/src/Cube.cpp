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
/// @file Cube.cpp
/// @brief Contains the definition of the class Cube.
// -------------------------------------------------------------------------------------------

#include "Cube.h"

// -------------------------------------------------------------------------------------------
Cube::Cube()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
Cube::~Cube()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
void Cube::addDecision(int lit)
{
  DASSERT(lit != 0, "0 is not a literal.");
  lits_.push_back(lit);
  decision_.push_back(true);
}

// -------------------------------------------------------------------------------------------
void Cube::addImplied(int lit)
{
  DASSERT(lit != 0, "0 is not a literal.");
  lits_.push_back(lit);
  decision_.push_back(false);
}

// -------------------------------------------------------------------------------------------
void Cube::popBack()
{
  MASSERT(!lits_.empty(), "Cannot remove a literal from the empty cube.");
  lits_.pop_back();
  decision_.pop_back();
}

// -------------------------------------------------------------------------------------------
const vector<int>& Cube::getLiterals() const
{
  return lits_;
}

// -------------------------------------------------------------------------------------------
vector<int> Cube::getDecisions() const
{
  vector<int> res;
  for(size_t cnt = 0; cnt < lits_.size(); ++cnt)
  {
    if(decision_[cnt])
      res.push_back(lits_[cnt]);
  }
  return res;
}

// -------------------------------------------------------------------------------------------
size_t Cube::getNrOfDecisions() const
{
  return static_cast<size_t>(count(decision_.begin(), decision_.end(), true));
}

// -------------------------------------------------------------------------------------------
size_t Cube::size() const
{
  return lits_.size();
}

// -------------------------------------------------------------------------------------------
string Cube::toString() const
{
  ostringstream str;
  str << "[";
  for(size_t cnt = 0; cnt < lits_.size(); ++cnt)
  {
    if(cnt != 0)
      str << " ";
    if(decision_[cnt])
      str << lits_[cnt];
    else
      str << "(" << lits_[cnt] << ")";
  }
  str << "]";
  return str.str();
}

// -------------------------------------------------------------------------------------------
bool Cube::operator==(const Cube &other) const
{
  return lits_ == other.lits_ && decision_ == other.decision_;
}
