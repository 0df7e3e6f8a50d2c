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
/// @file CubeGenerator.h
/// @brief Contains the declaration of the class CubeGenerator.
// -------------------------------------------------------------------------------------------

#ifndef CubeGenerator_H__
#define CubeGenerator_H__

#include "defines.h"
#include "CircuitState.h"
#include "Cube.h"

class AigCircuit;
class VarManager;
class LookaheadScorer;

// -------------------------------------------------------------------------------------------
///
/// @class CubeGenerator
/// @brief Splits the search space of a circuit into cubes with a lookahead heuristic.
///
/// The generator builds a binary decision tree over circuit nodes. The output is asserted
/// TRUE first. In every tree node, the candidates for splitting are selected in two stages:
///  - Structural ranking: every live node gets the rating (indeg + 1) * (outdeg + 1), where
///    indeg is 2 for AND gates and 0 for inputs, and outdeg is the number of live fan-outs.
///    Only the best candidates_limit nodes are kept (ties broken by lowest node id).
///  - Lookahead: every remaining candidate is fixed to FALSE and to TRUE, the consequences are
///    propagated, and the LookaheadScorer rates the two reductions of the residual circuit.
///    The best candidate (ties broken by lowest node id) is split on, FALSE branch first.
///
/// If probing a candidate results in a conflict for one value, the other value is implied.
/// It is added to the cube as an implied literal and does not count as decision. If both
/// values conflict, the branch is refuted and becomes a leaf. A branch also becomes a leaf
/// when the requested depth is reached or no live node is left. Hence, fewer than 2^depth
/// cubes are produced if branches run out of candidates or are refuted.
///
/// The decisions of the produced cubes form a partition: any two cubes contain complementary
/// decisions, and every assignment to the split nodes is covered by exactly one cube. The
/// result is deterministic: running the generator twice gives the same cubes.
class CubeGenerator
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param circuit The circuit to split. Must outlive this object.
/// @param var_manager The map from nodes to CNF variables (for the literals of the cubes).
///        Must outlive this object.
/// @param scorer The scoring function for the lookahead. Must outlive this object.
/// @param candidates_limit The number of candidates that are probed per decision. 0 means
///        that all live nodes are probed.
  CubeGenerator(const AigCircuit &circuit,
                const VarManager &var_manager,
                const LookaheadScorer &scorer,
                size_t candidates_limit);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~CubeGenerator();

// -------------------------------------------------------------------------------------------
///
/// @brief Computes the cubes.
///
/// @param depth The maximum number of decisions per cube. Depth 0 gives a single empty cube.
/// @return The cubes in generation order (depth-first, FALSE branches first). If the
///         output cannot be TRUE at all, the result is a single empty cube.
  vector<Cube> generate(size_t depth);

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the number of probes performed by the last call to generate().
///
/// @return The number of probes.
  size_t getNrOfProbes() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the number of implied literals found by the last call to generate().
///
/// @return The number of implied literals.
  size_t getNrOfForced() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the number of refuted branches found by the last call to generate().
///
/// @return The number of refuted branches.
  size_t getNrOfRefuted() const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief The possible outcomes of the candidate selection.
  enum Selection
  {
    SPLIT,
    FORCED,
    REFUTED,
    EXHAUSTED
  };

// -------------------------------------------------------------------------------------------
///
/// @brief Extends the current cube recursively until the leaves are reached.
///
/// @param depth_left The number of decisions that may still be made.
  void cube(size_t depth_left);

// -------------------------------------------------------------------------------------------
///
/// @brief Chooses the node to split on (or finds an implied literal).
///
/// @param node Will be set to the chosen node (for SPLIT, FORCED, and REFUTED).
/// @param value Will be set to the implied value (for FORCED only).
/// @return The outcome of the selection.
  Selection selectNode(unsigned &node, bool &value);

// -------------------------------------------------------------------------------------------
///
/// @brief Fixes a node temporarily and measures the effect.
///
/// @param node The node to fix.
/// @param value The value for the node.
/// @param residual The number of live nodes before the probe.
/// @param reduction Will be set to the reduction of the number of live nodes.
/// @return False if fixing the node results in a conflict.
  bool probe(unsigned node, bool value, size_t residual, size_t &reduction);

// -------------------------------------------------------------------------------------------
///
/// @brief Ranks the live nodes structurally and returns the best ones.
///
/// @return The ids of the best candidates, best first.
  vector<unsigned> rankCandidates() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the CNF literal that represents a node having a certain value.
///
/// @param node The id of the node.
/// @param value The value of the node.
/// @return The CNF literal.
  int toCnfLit(unsigned node, bool value) const;

// -------------------------------------------------------------------------------------------
///
/// @brief The circuit to split.
  const AigCircuit &circuit_;

// -------------------------------------------------------------------------------------------
///
/// @brief The map from nodes to CNF variables.
  const VarManager &var_manager_;

// -------------------------------------------------------------------------------------------
///
/// @brief The scoring function for the lookahead.
  const LookaheadScorer &scorer_;

// -------------------------------------------------------------------------------------------
///
/// @brief The number of candidates that are probed per decision (0 for all).
  size_t candidates_limit_;

// -------------------------------------------------------------------------------------------
///
/// @brief The current partial assignment of the circuit.
  CircuitState state_;

// -------------------------------------------------------------------------------------------
///
/// @brief The cube of the current tree node.
  Cube current_;

// -------------------------------------------------------------------------------------------
///
/// @brief The cubes found so far.
  vector<Cube> cubes_;

// -------------------------------------------------------------------------------------------
///
/// @brief The number of probes performed.
  size_t nr_of_probes_;

// -------------------------------------------------------------------------------------------
///
/// @brief The number of implied literals found.
  size_t nr_of_forced_;

// -------------------------------------------------------------------------------------------
///
/// @brief The number of refuted branches found.
  size_t nr_of_refuted_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  CubeGenerator(const CubeGenerator &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  CubeGenerator& operator=(const CubeGenerator &other);
};

#endif // CubeGenerator_H__
