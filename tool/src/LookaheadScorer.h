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
/// @file LookaheadScorer.h
/// @brief Contains the declaration of the class LookaheadScorer and its implementations.
// -------------------------------------------------------------------------------------------

#ifndef LookaheadScorer_H__
#define LookaheadScorer_H__

#include "defines.h"

// -------------------------------------------------------------------------------------------
///
/// @class LookaheadScorer
/// @brief An interface for rating splitting candidates based on the result of probing.
///
/// The cube generator fixes a candidate node to FALSE and to TRUE, propagates, and measures
/// by how many nodes the residual circuit shrinks in each case. A LookaheadScorer turns these
/// two numbers into a score. The candidate with the highest score is split on.
///
/// This class is abstract, i.e., objects of this class cannot be instantiated. Use
/// @link #create create() @endlink to obtain one of the implementations.
class LookaheadScorer
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief The available scoring functions.
  enum Policy
  {
///
/// @brief delta_0 * delta_1, favors candidates that simplify both branches equally well.
    PRODUCT,

///
/// @brief (delta_0 + delta_1) / (2 * residual size), the fraction of collapsed nodes.
    FRACTION
  };

// -------------------------------------------------------------------------------------------
///
/// @brief Creates a scorer.
///
/// @param policy The scoring function to use.
/// @return A new scorer. The caller is responsible for deleting it.
  static LookaheadScorer* create(Policy policy);

// -------------------------------------------------------------------------------------------
///
/// @brief Parses the name of a scoring function.
///
/// @param name The name ('product' or 'fraction', case insensitive).
/// @param policy Will be set to the corresponding policy if the name is known.
/// @return True if the name is known, false otherwise.
  static bool parsePolicy(const string &name, Policy &policy);

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
  LookaheadScorer();

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~LookaheadScorer();

// -------------------------------------------------------------------------------------------
///
/// @brief Computes the score of a candidate.
///
/// @param residual The number of live nodes before probing.
/// @param delta_false The reduction of the number of live nodes when the candidate is FALSE.
/// @param delta_true The reduction of the number of live nodes when the candidate is TRUE.
/// @return The score. Higher is better.
  virtual double score(size_t residual, size_t delta_false, size_t delta_true) const = 0;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the name of the scoring function.
///
/// @return The name of the scoring function.
  virtual string getName() const = 0;

private:

// -------------------------------------------------------------------------------------------
  LookaheadScorer(const LookaheadScorer &other);

// -------------------------------------------------------------------------------------------
  LookaheadScorer& operator=(const LookaheadScorer &other);
};

// -------------------------------------------------------------------------------------------
///
/// @class ProductScorer
/// @brief Scores a candidate with delta_0 * delta_1.
class ProductScorer : public LookaheadScorer
{
public:
  ProductScorer();
  virtual ~ProductScorer();
  virtual double score(size_t residual, size_t delta_false, size_t delta_true) const;
  virtual string getName() const;
};

// -------------------------------------------------------------------------------------------
///
/// @class FractionScorer
/// @brief Scores a candidate with the average fraction of nodes collapsed by probing.
class FractionScorer : public LookaheadScorer
{
public:
  FractionScorer();
  virtual ~FractionScorer();
  virtual double score(size_t residual, size_t delta_false, size_t delta_true) const;
  virtual string getName() const;
};

#endif // LookaheadScorer_H__
