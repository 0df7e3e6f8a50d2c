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
/// @file LookaheadScorer.cpp
/// @brief Contains the definition of the class LookaheadScorer and its implementations.
// -------------------------------------------------------------------------------------------

#include "LookaheadScorer.h"
#include "StringUtils.h"

// -------------------------------------------------------------------------------------------
LookaheadScorer* LookaheadScorer::create(Policy policy)
{
  if(policy == FRACTION)
    return new FractionScorer;
  return new ProductScorer;
}

// -------------------------------------------------------------------------------------------
bool LookaheadScorer::parsePolicy(const string &name, Policy &policy)
{
  string lower = StringUtils::toLowerCase(name);
  if(lower == "product")
    policy = PRODUCT;
  else if(lower == "fraction")
    policy = FRACTION;
  else
    return false;
  return true;
}

// -------------------------------------------------------------------------------------------
LookaheadScorer::LookaheadScorer()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
LookaheadScorer::~LookaheadScorer()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
ProductScorer::ProductScorer()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
ProductScorer::~ProductScorer()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
double ProductScorer::score(size_t, size_t delta_false, size_t delta_true) const
{
  return static_cast<double>(delta_false) * static_cast<double>(delta_true);
}

// -------------------------------------------------------------------------------------------
string ProductScorer::getName() const
{
  return "product";
}

// -------------------------------------------------------------------------------------------
FractionScorer::FractionScorer()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
FractionScorer::~FractionScorer()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
double FractionScorer::score(size_t residual, size_t delta_false, size_t delta_true) const
{
  if(residual == 0)
    return 0.0;
  return static_cast<double>(delta_false + delta_true) / (2.0 * residual);
}

// -------------------------------------------------------------------------------------------
string FractionScorer::getName() const
{
  return "fraction";
}
