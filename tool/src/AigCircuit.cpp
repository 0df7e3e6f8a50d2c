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
/// @file AigCircuit.cpp
/// @brief Contains the definition of the class AigCircuit.
// -------------------------------------------------------------------------------------------

#include "AigCircuit.h"

extern "C" {
 #include "aiger.h"
}

// -------------------------------------------------------------------------------------------
///
/// @class AigerGuard
/// @brief Releases a structure of the AIGER library when going out of scope.
class AigerGuard
{
public:
  explicit AigerGuard(aiger *aig) : aig_(aig) {}
  ~AigerGuard()
  {
    aiger_reset(aig_);
  }
  aiger *aig_;
private:
  AigerGuard(const AigerGuard &other);
  AigerGuard& operator=(const AigerGuard &other);
};

// -------------------------------------------------------------------------------------------
AigCircuit* AigCircuit::loadFromFile(const string &file_name)
{
  AigerGuard guard(aiger_init());
  MASSERT(guard.aig_ != NULL, "Could not initialize the AIGER library.");
  const char *error = aiger_open_and_read_from_file(guard.aig_, file_name.c_str());
  if(error != NULL)
  {
    ostringstream msg;
    msg << "Could not read AIGER file '" << file_name << "' (" << error << ").";
    throw FormatError(msg.str());
  }
  return fromAiger(guard.aig_);
}

// -------------------------------------------------------------------------------------------
AigCircuit* AigCircuit::fromAiger(const aiger *aig)
{
  if(aig->num_latches != 0)
  {
    ostringstream msg;
    msg << "The circuit has " << aig->num_latches << " latches, but only combinational "
        << "circuits are supported.";
    throw FormatError(msg.str());
  }
  if(aig->num_outputs != 1)
  {
    ostringstream msg;
    msg << "The circuit has " << aig->num_outputs << " outputs, but exactly one is required.";
    throw FormatError(msg.str());
  }

  vector<AigLit> inputs;
  vector<string> input_names;
  inputs.reserve(aig->num_inputs);
  input_names.reserve(aig->num_inputs);
  for(unsigned cnt = 0; cnt < aig->num_inputs; ++cnt)
  {
    inputs.push_back(aig->inputs[cnt].lit);
    if(aig->inputs[cnt].name != NULL)
      input_names.push_back(aig->inputs[cnt].name);
    else
      input_names.push_back("");
  }
  vector<AndDef> ands(aig->num_ands);
  for(unsigned cnt = 0; cnt < aig->num_ands; ++cnt)
  {
    ands[cnt].lhs_ = aig->ands[cnt].lhs;
    ands[cnt].rhs0_ = aig->ands[cnt].rhs0;
    ands[cnt].rhs1_ = aig->ands[cnt].rhs1;
  }
  return fromAigerLits(inputs, ands, aig->outputs[0].lit, input_names);
}

// -------------------------------------------------------------------------------------------
AigCircuit* AigCircuit::fromAigerLits(const vector<AigLit> &inputs,
                                      const vector<AndDef> &ands,
                                      AigLit output,
                                      const vector<string> &input_names)
{
  enum DefKind { UNDEFINED, INPUT_DEF, AND_DEF };
  enum Color { WHITE, GRAY, BLACK };

  unsigned max_var = litNode(output);
  for(size_t cnt = 0; cnt < inputs.size(); ++cnt)
    max_var = max(max_var, litNode(inputs[cnt]));
  for(size_t cnt = 0; cnt < ands.size(); ++cnt)
  {
    max_var = max(max_var, litNode(ands[cnt].lhs_));
    max_var = max(max_var, litNode(ands[cnt].rhs0_));
    max_var = max(max_var, litNode(ands[cnt].rhs1_));
  }

  // Step 1:
  // collect the definitions and reject inverted, constant or duplicate ones:
  vector<DefKind> kind(max_var + 1, UNDEFINED);
  vector<size_t> def_index(max_var + 1, 0);
  for(size_t cnt = 0; cnt < inputs.size() + ands.size(); ++cnt)
  {
    bool is_input = cnt < inputs.size();
    AigLit lit = is_input ? inputs[cnt] : ands[cnt - inputs.size()].lhs_;
    unsigned var = litNode(lit);
    ostringstream msg;
    if(litInverted(lit))
      msg << "The definition of literal " << lit << " is inverted.";
    else if(var == 0)
      msg << "The constant cannot be redefined.";
    else if(kind[var] != UNDEFINED)
      msg << "Variable " << var << " (literal " << lit << ") is defined twice.";
    if(!msg.str().empty())
      throw FormatError(msg.str());
    kind[var] = is_input ? INPUT_DEF : AND_DEF;
    def_index[var] = is_input ? cnt : cnt - inputs.size();
  }

  // Step 2:
  // every referenced literal must be defined:
  for(size_t cnt = 0; cnt < ands.size(); ++cnt)
  {
    const AigLit refs[2] = {ands[cnt].rhs0_, ands[cnt].rhs1_};
    for(size_t op = 0; op < 2; ++op)
    {
      unsigned var = litNode(refs[op]);
      if(var != 0 && kind[var] == UNDEFINED)
      {
        ostringstream msg;
        msg << "Literal " << refs[op] << " used by AND gate " << ands[cnt].lhs_
            << " is not defined.";
        throw FormatError(msg.str());
      }
    }
  }
  if(litNode(output) != 0 && kind[litNode(output)] == UNDEFINED)
  {
    ostringstream msg;
    msg << "The output literal " << output << " is not defined.";
    throw FormatError(msg.str());
  }

  // Step 3:
  // sort the AND gates topologically (depth-first, without recursion because the fan-in
  // chains of real circuits can be very long):
  vector<unsigned> order;
  order.reserve(ands.size());
  vector<Color> color(max_var + 1, WHITE);
  for(size_t cnt = 0; cnt < ands.size(); ++cnt)
  {
    unsigned root = litNode(ands[cnt].lhs_);
    if(color[root] != WHITE)
      continue;
    vector<pair<unsigned, unsigned> > stack;
    stack.push_back(make_pair(root, 0U));
    color[root] = GRAY;
    while(!stack.empty())
    {
      unsigned var = stack.back().first;
      unsigned next_op = stack.back().second;
      if(next_op == 2)
      {
        color[var] = BLACK;
        order.push_back(var);
        stack.pop_back();
        continue;
      }
      stack.back().second++;
      const AndDef &def = ands[def_index[var]];
      unsigned child = litNode(next_op == 0 ? def.rhs0_ : def.rhs1_);
      if(kind[child] != AND_DEF || color[child] == BLACK)
        continue;
      if(color[child] == GRAY)
      {
        ostringstream msg;
        msg << "The fan-in of variable " << child << " is cyclic.";
        throw FormatError(msg.str());
      }
      color[child] = GRAY;
      stack.push_back(make_pair(child, 0U));
    }
  }

  // Step 4:
  // renumber the nodes densely and build the circuit:
  AigCircuit *circuit = new AigCircuit;
  vector<unsigned> new_id(max_var + 1, 0);
  circuit->nodes_.reserve(1 + inputs.size() + ands.size());
  Node const_node = {CONST_FALSE, 0, 0, ""};
  circuit->nodes_.push_back(const_node);
  for(size_t cnt = 0; cnt < inputs.size(); ++cnt)
  {
    unsigned id = circuit->nodes_.size();
    new_id[litNode(inputs[cnt])] = id;
    Node input = {INPUT, 0, 0, cnt < input_names.size() ? input_names[cnt] : ""};
    circuit->nodes_.push_back(input);
    circuit->inputs_.push_back(id);
  }
  for(size_t cnt = 0; cnt < order.size(); ++cnt)
  {
    unsigned id = circuit->nodes_.size();
    const AndDef &def = ands[def_index[order[cnt]]];
    new_id[order[cnt]] = id;
    Node gate = {AND,
                 makeLit(new_id[litNode(def.rhs0_)], litInverted(def.rhs0_)),
                 makeLit(new_id[litNode(def.rhs1_)], litInverted(def.rhs1_)),
                 ""};
    circuit->nodes_.push_back(gate);
    circuit->ands_.push_back(id);
  }
  circuit->output_ = makeLit(new_id[litNode(output)], litInverted(output));
  circuit->computeDerivedData();
  return circuit;
}

// -------------------------------------------------------------------------------------------
AigCircuit::~AigCircuit()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
size_t AigCircuit::getNrOfNodes() const
{
  return nodes_.size();
}

// -------------------------------------------------------------------------------------------
const AigCircuit::Node& AigCircuit::getNode(unsigned node) const
{
  DASSERT(node < nodes_.size(), "Node " << node << " does not exist.");
  return nodes_[node];
}

// -------------------------------------------------------------------------------------------
const vector<unsigned>& AigCircuit::getInputs() const
{
  return inputs_;
}

// -------------------------------------------------------------------------------------------
const vector<unsigned>& AigCircuit::getAnds() const
{
  return ands_;
}

// -------------------------------------------------------------------------------------------
AigLit AigCircuit::getOutput() const
{
  return output_;
}

// -------------------------------------------------------------------------------------------
const vector<unsigned>& AigCircuit::getFanouts(unsigned node) const
{
  DASSERT(node < fanouts_.size(), "Node " << node << " does not exist.");
  return fanouts_[node];
}

// -------------------------------------------------------------------------------------------
bool AigCircuit::isInCone(unsigned node) const
{
  return cone_[node];
}

// -------------------------------------------------------------------------------------------
size_t AigCircuit::getConeSize() const
{
  return cone_size_;
}

// -------------------------------------------------------------------------------------------
bool AigCircuit::evaluate(const vector<bool> &input_values) const
{
  MASSERT(input_values.size() == inputs_.size(), "Expected " << inputs_.size() <<
          " input values, got " << input_values.size() << ".");
  vector<bool> val(nodes_.size(), false);
  for(size_t cnt = 0; cnt < inputs_.size(); ++cnt)
    val[inputs_[cnt]] = input_values[cnt];
  for(size_t cnt = 0; cnt < ands_.size(); ++cnt)
  {
    const Node &gate = nodes_[ands_[cnt]];
    bool v0 = val[litNode(gate.rhs0_)] != litInverted(gate.rhs0_);
    bool v1 = val[litNode(gate.rhs1_)] != litInverted(gate.rhs1_);
    val[ands_[cnt]] = v0 && v1;
  }
  return val[litNode(output_)] != litInverted(output_);
}

// -------------------------------------------------------------------------------------------
AigCircuit::AigCircuit() :
    output_(0),
    cone_size_(0)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
void AigCircuit::computeDerivedData()
{
  fanouts_.assign(nodes_.size(), vector<unsigned>());
  for(size_t cnt = 0; cnt < ands_.size(); ++cnt)
  {
    unsigned id = ands_[cnt];
    unsigned op0 = litNode(nodes_[id].rhs0_);
    unsigned op1 = litNode(nodes_[id].rhs1_);
    fanouts_[op0].push_back(id);
    if(op1 != op0)
      fanouts_[op1].push_back(id);
  }

  cone_.assign(nodes_.size(), false);
  cone_[litNode(output_)] = true;
  for(size_t cnt = ands_.size(); 0 < cnt--;)
  {
    unsigned id = ands_[cnt];
    if(!cone_[id])
      continue;
    cone_[litNode(nodes_[id].rhs0_)] = true;
    cone_[litNode(nodes_[id].rhs1_)] = true;
  }
  cone_size_ = 0;
  for(size_t id = 1; id < cone_.size(); ++id)
    if(cone_[id])
      ++cone_size_;
}
