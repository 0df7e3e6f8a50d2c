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
/// @file CircuitState.cpp
/// @brief Contains the definition of the class CircuitState.
// -------------------------------------------------------------------------------------------

#include "CircuitState.h"

// -------------------------------------------------------------------------------------------
CircuitState::CircuitState(const AigCircuit &circuit) :
    circuit_(circuit),
    values_(circuit.getNrOfNodes(), VAL_UNDEF),
    queue_head_(0)
{
  trail_.reserve(circuit.getNrOfNodes());
  bool ok = assign(0, false);
  MASSERT(ok, "Assigning the constant node failed.");
}

// -------------------------------------------------------------------------------------------
CircuitState::~CircuitState()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
bool CircuitState::assign(unsigned node, bool value)
{
  DASSERT(queue_head_ == trail_.size(), "Propagation queue not empty.");
  bool ok = enqueue(AigCircuit::makeLit(node, false), value) && propagate();
  // a conflict leaves unprocessed entries, skip them:
  queue_head_ = trail_.size();
  return ok;
}

// -------------------------------------------------------------------------------------------
bool CircuitState::assignLit(AigLit lit)
{
  return assign(AigCircuit::litNode(lit), !AigCircuit::litInverted(lit));
}

// -------------------------------------------------------------------------------------------
size_t CircuitState::mark() const
{
  return trail_.size();
}

// -------------------------------------------------------------------------------------------
void CircuitState::backtrack(size_t mark)
{
  MASSERT(mark <= trail_.size(), "Cannot backtrack to " << mark << ".");
  while(trail_.size() > mark)
  {
    values_[trail_.back()] = VAL_UNDEF;
    trail_.pop_back();
  }
  queue_head_ = trail_.size();
}

// -------------------------------------------------------------------------------------------
CircuitState::Value CircuitState::getValue(unsigned node) const
{
  return values_[node];
}

// -------------------------------------------------------------------------------------------
CircuitState::Value CircuitState::getLitValue(AigLit lit) const
{
  Value val = values_[AigCircuit::litNode(lit)];
  if(val == VAL_UNDEF || !AigCircuit::litInverted(lit))
    return val;
  return val == VAL_TRUE ? VAL_FALSE : VAL_TRUE;
}

// -------------------------------------------------------------------------------------------
bool CircuitState::isLive(unsigned node) const
{
  if(node == 0 || !circuit_.isInCone(node) || values_[node] != VAL_UNDEF)
    return false;
  const AigCircuit::Node &n = circuit_.getNode(node);
  if(n.kind_ != AigCircuit::AND)
    return true;
  Value v0 = getLitValue(n.rhs0_);
  Value v1 = getLitValue(n.rhs1_);
  bool buffer = (v0 == VAL_TRUE && v1 == VAL_UNDEF) || (v0 == VAL_UNDEF && v1 == VAL_TRUE);
  return !buffer;
}

// -------------------------------------------------------------------------------------------
size_t CircuitState::getNrOfLiveFanouts(unsigned node) const
{
  const vector<unsigned> &fanouts = circuit_.getFanouts(node);
  size_t nr_of_live = 0;
  for(size_t cnt = 0; cnt < fanouts.size(); ++cnt)
  {
    if(isLive(fanouts[cnt]))
      ++nr_of_live;
  }
  return nr_of_live;
}

// -------------------------------------------------------------------------------------------
size_t CircuitState::getResidualSize() const
{
  size_t size = 0;
  for(unsigned node = 1; node < values_.size(); ++node)
  {
    if(isLive(node))
      ++size;
  }
  return size;
}

// -------------------------------------------------------------------------------------------
const AigCircuit& CircuitState::getCircuit() const
{
  return circuit_;
}

// -------------------------------------------------------------------------------------------
bool CircuitState::enqueue(AigLit lit, bool value)
{
  unsigned node = AigCircuit::litNode(lit);
  Value node_val = (value != AigCircuit::litInverted(lit)) ? VAL_TRUE : VAL_FALSE;
  if(values_[node] != VAL_UNDEF)
    return values_[node] == node_val;
  values_[node] = node_val;
  trail_.push_back(node);
  return true;
}

// -------------------------------------------------------------------------------------------
bool CircuitState::propagateGate(unsigned gate)
{
  const AigCircuit::Node &n = circuit_.getNode(gate);
  Value vg = values_[gate];
  Value v0 = getLitValue(n.rhs0_);
  Value v1 = getLitValue(n.rhs1_);

  // forward:
  if(v0 == VAL_FALSE || v1 == VAL_FALSE)
  {
    if(!enqueue(AigCircuit::makeLit(gate, false), false))
      return false;
  }
  else if(v0 == VAL_TRUE && v1 == VAL_TRUE)
  {
    if(!enqueue(AigCircuit::makeLit(gate, false), true))
      return false;
  }
  vg = values_[gate];

  // backward:
  if(vg == VAL_TRUE)
    return enqueue(n.rhs0_, true) && enqueue(n.rhs1_, true);
  if(vg == VAL_FALSE)
  {
    if(v0 == VAL_TRUE)
      return enqueue(n.rhs1_, false);
    if(v1 == VAL_TRUE)
      return enqueue(n.rhs0_, false);
  }
  return true;
}

// -------------------------------------------------------------------------------------------
bool CircuitState::propagate()
{
  while(queue_head_ < trail_.size())
  {
    unsigned node = trail_[queue_head_++];
    if(circuit_.getNode(node).kind_ == AigCircuit::AND)
    {
      if(!propagateGate(node))
        return false;
    }
    const vector<unsigned> &fanouts = circuit_.getFanouts(node);
    for(size_t cnt = 0; cnt < fanouts.size(); ++cnt)
    {
      if(!propagateGate(fanouts[cnt]))
        return false;
    }
  }
  return true;
}
