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
/// @file BackEnd.cpp
/// @brief Contains the definition of the class BackEnd.
// -------------------------------------------------------------------------------------------

#include "BackEnd.h"
#include "AigCircuit.h"

// -------------------------------------------------------------------------------------------
BackEnd::BackEnd(const AigCircuit &circuit) :
         circuit_(circuit)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
BackEnd::~BackEnd()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
string BackEnd::describeCircuit() const
{
  ostringstream oss;
  oss << circuit_.getInputs().size() << " inputs, " << circuit_.getAnds().size()
      << " AND gates, " << circuit_.getConeSize() << " nodes in the output cone";
  return oss.str();
}
