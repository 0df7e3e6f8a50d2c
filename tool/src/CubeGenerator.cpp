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
/// @file CubeGenerator.cpp
/// @brief Contains the definition of the class CubeGenerator.
// -------------------------------------------------------------------------------------------

#include "CubeGenerator.h"
#include "AigCircuit.h"
#include "VarManager.h"
#include "LookaheadScorer.h"
#include "Logger.h"

// -------------------------------------------------------------------------------------------
///
/// @struct RankedNode
/// @brief A candidate together with its structural rating.
struct RankedNode
{
  size_t rating_;
  unsigned node_;

  bool operator<(const RankedNode &other) const
  {
    if(rating_ != other.rating_)
      return rating_ > other.rating_;
    return node_ < other.node_;
  }
};

// -------------------------------------------------------------------------------------------
CubeGenerator::CubeGenerator(const AigCircuit &circuit,
                             const VarManager &var_manager,
                             const LookaheadScorer &scorer,
                             size_t candidates_limit) :
    circuit_(circuit),
    var_manager_(var_manager),
    scorer_(scorer),
    candidates_limit_(candidates_limit),
    state_(circuit),
    nr_of_probes_(0),
    nr_of_forced_(0),
    nr_of_refuted_(0)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
CubeGenerator::~CubeGenerator()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
vector<Cube> CubeGenerator::generate(size_t depth)
{
  cubes_.clear();
  current_ = Cube();
  nr_of_probes_ = 0;
  nr_of_forced_ = 0;
  nr_of_refuted_ = 0;

  size_t root_mark = state_.mark();
  if(!state_.assignLit(circuit_.getOutput()))
  {
    L_INF("The output cannot become true, the problem is trivially unsatisfiable.");
    state_.backtrack(root_mark);
    cubes_.push_back(Cube());
    return cubes_;
  }
  L_DBG("Residual size after asserting the output: " << state_.getResidualSize());
  cube(depth);
  state_.backtrack(root_mark);

  L_INF("Generated " << cubes_.size() << " cubes (" << nr_of_probes_ << " probes, "
        << nr_of_forced_ << " implied literals, " << nr_of_refuted_ << " refuted branches).");
  vector<Cube> res;
  res.swap(cubes_);
  return res;
}

// -------------------------------------------------------------------------------------------
size_t CubeGenerator::getNrOfProbes() const
{
  return nr_of_probes_;
}

// -------------------------------------------------------------------------------------------
size_t CubeGenerator::getNrOfForced() const
{
  return nr_of_forced_;
}

// -------------------------------------------------------------------------------------------
size_t CubeGenerator::getNrOfRefuted() const
{
  return nr_of_refuted_;
}

// -------------------------------------------------------------------------------------------
void CubeGenerator::cube(size_t depth_left)
{
  size_t entry_mark = state_.mark();
  size_t nr_of_implied = 0;
  while(true)
  {
    if(depth_left == 0)
    {
      cubes_.push_back(current_);
      break;
    }

    unsigned node = 0;
    bool value = false;
    Selection selection = selectNode(node, value);
    if(selection == FORCED)
    {
      bool ok = state_.assign(node, value);
      MASSERT(ok, "Implied literal of node " << node << " is in conflict.");
      current_.addImplied(toCnfLit(node, value));
      ++nr_of_implied;
      ++nr_of_forced_;
      continue;
    }
    if(selection == REFUTED || selection == EXHAUSTED)
    {
      if(selection == REFUTED)
      {
        ++nr_of_refuted_;
        L_DBG("Branch " << current_.toString() << " refuted at node " << node << ".");
      }
      cubes_.push_back(current_);
      break;
    }

    L_DBG("Splitting " << current_.toString() << " on node " << node << ".");
    for(int val = 0; val < 2; ++val)
    {
      size_t branch_mark = state_.mark();
      bool ok = state_.assign(node, val == 1);
      MASSERT(ok, "Decision on node " << node << " is in conflict.");
      current_.addDecision(toCnfLit(node, val == 1));
      cube(depth_left - 1);
      current_.popBack();
      state_.backtrack(branch_mark);
    }
    break;
  }

  for(size_t cnt = 0; cnt < nr_of_implied; ++cnt)
    current_.popBack();
  state_.backtrack(entry_mark);
}

// -------------------------------------------------------------------------------------------
CubeGenerator::Selection CubeGenerator::selectNode(unsigned &node, bool &value)
{
  vector<unsigned> candidates = rankCandidates();
  if(candidates.empty())
    return EXHAUSTED;

  size_t residual = state_.getResidualSize();
  bool found = false;
  double best_score = 0.0;
  unsigned best_node = 0;
  for(size_t cnt = 0; cnt < candidates.size(); ++cnt)
  {
    unsigned candidate = candidates[cnt];
    size_t delta_false = 0;
    size_t delta_true = 0;
    bool ok_false = probe(candidate, false, residual, delta_false);
    bool ok_true = probe(candidate, true, residual, delta_true);
    if(!ok_false || !ok_true)
    {
      node = candidate;
      if(!ok_false && !ok_true)
        return REFUTED;
      value = ok_true;
      return FORCED;
    }
    double score = scorer_.score(residual, delta_false, delta_true);
    if(!found || score > best_score || (score == best_score && candidate < best_node))
    {
      found = true;
      best_score = score;
      best_node = candidate;
    }
  }
  node = best_node;
  return SPLIT;
}

// -------------------------------------------------------------------------------------------
bool CubeGenerator::probe(unsigned node, bool value, size_t residual, size_t &reduction)
{
  ++nr_of_probes_;
  size_t probe_mark = state_.mark();
  bool ok = state_.assign(node, value);
  if(ok)
    reduction = residual - state_.getResidualSize();
  state_.backtrack(probe_mark);
  return ok;
}

// -------------------------------------------------------------------------------------------
vector<unsigned> CubeGenerator::rankCandidates() const
{
  vector<RankedNode> ranked;
  for(unsigned node = 1; node < circuit_.getNrOfNodes(); ++node)
  {
    if(!state_.isLive(node))
      continue;
    size_t indeg = circuit_.getNode(node).kind_ == AigCircuit::AND ? 2 : 0;
    size_t outdeg = state_.getNrOfLiveFanouts(node);
    RankedNode candidate = {(indeg + 1) * (outdeg + 1), node};
    ranked.push_back(candidate);
  }
  sort(ranked.begin(), ranked.end());
  if(candidates_limit_ != 0 && ranked.size() > candidates_limit_)
    ranked.resize(candidates_limit_);

  vector<unsigned> res;
  res.reserve(ranked.size());
  for(size_t cnt = 0; cnt < ranked.size(); ++cnt)
    res.push_back(ranked[cnt].node_);
  return res;
}

// -------------------------------------------------------------------------------------------
int CubeGenerator::toCnfLit(unsigned node, bool value) const
{
  int var = var_manager_.nodeToVar(node);
  return value ? var : -var;
}
