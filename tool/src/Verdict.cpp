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
/// @file Verdict.cpp
/// @brief Contains the definition of the class Verdict.
// -------------------------------------------------------------------------------------------

#include "Verdict.h"

#include <iomanip>

// -------------------------------------------------------------------------------------------
Verdict Verdict::sat(size_t index, const vector<int> &witness, double elapsed)
{
  return Verdict(index, SAT, NONE, witness, elapsed);
}

// -------------------------------------------------------------------------------------------
Verdict Verdict::unsat(size_t index, double elapsed)
{
  return Verdict(index, UNSAT, NONE, vector<int>(), elapsed);
}

// -------------------------------------------------------------------------------------------
Verdict Verdict::unknown(size_t index, Reason reason, double elapsed)
{
  MASSERT(reason != NONE, "An unknown verdict needs a reason.");
  return Verdict(index, UNKNOWN, reason, vector<int>(), elapsed);
}

// -------------------------------------------------------------------------------------------
const char* Verdict::kindToString(Kind kind)
{
  if(kind == SAT)
    return "SAT";
  if(kind == UNSAT)
    return "UNSAT";
  return "UNKNOWN";
}

// -------------------------------------------------------------------------------------------
const char* Verdict::reasonToString(Reason reason)
{
  switch(reason)
  {
    case NONE:
      return "none";
    case TIMEOUT:
      return "timeout";
    case SOLVER_ERROR:
      return "solver error";
    case CANCELLED:
      return "cancelled";
  }
  return "?";
}

// -------------------------------------------------------------------------------------------
Verdict::Verdict() :
    index_(0),
    kind_(UNKNOWN),
    reason_(NONE),
    elapsed_(0.0)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
Verdict::~Verdict()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
Verdict::Kind Verdict::getKind() const
{
  return kind_;
}

// -------------------------------------------------------------------------------------------
Verdict::Reason Verdict::getReason() const
{
  return reason_;
}

// -------------------------------------------------------------------------------------------
size_t Verdict::getIndex() const
{
  return index_;
}

// -------------------------------------------------------------------------------------------
const vector<int>& Verdict::getWitness() const
{
  return witness_;
}

// -------------------------------------------------------------------------------------------
double Verdict::getElapsed() const
{
  return elapsed_;
}

// -------------------------------------------------------------------------------------------
string Verdict::toString() const
{
  ostringstream str;
  str << "cube " << index_ << ": " << kindToString(kind_);
  if(kind_ == UNKNOWN)
    str << " (" << reasonToString(reason_) << ")";
  str << " after " << fixed << setprecision(2) << elapsed_ << " sec";
  return str.str();
}

// -------------------------------------------------------------------------------------------
bool Verdict::operator<(const Verdict &other) const
{
  return index_ < other.index_;
}

// -------------------------------------------------------------------------------------------
Verdict::Verdict(size_t index, Kind kind, Reason reason, const vector<int> &witness,
                 double elapsed) :
    index_(index),
    kind_(kind),
    reason_(reason),
    witness_(witness),
    elapsed_(elapsed)
{
  // nothing to do
}
