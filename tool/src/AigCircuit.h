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
/// @file AigCircuit.h
/// @brief Contains the declaration of the class AigCircuit.
// -------------------------------------------------------------------------------------------

#ifndef AigCircuit_H__
#define AigCircuit_H__

#include "defines.h"

struct aiger;

// -------------------------------------------------------------------------------------------
///
/// @typedef unsigned AigLit
/// @brief A literal of the circuit: two times the node id plus one if the node is inverted.
///
/// This is the same convention as in the AIGER format, so the literal 0 is the constant FALSE
/// and the literal 1 is the constant TRUE.
typedef unsigned AigLit;

// -------------------------------------------------------------------------------------------
///
/// @class AigCircuit
/// @brief An immutable And-Inverter Graph with exactly one output.
///
/// The nodes of the graph are stored in a flat array and reference each other by their
/// index. Node ids are dense: node 0 is the constant FALSE, the nodes 1 to I are the inputs
/// (in declaration order), and the remaining nodes are the AND gates in topological order,
/// i.e., the fan-in of every gate precedes the gate. The AIGER variable indices of the
/// source file are not preserved.
///
/// A circuit is created once by one of the static factory methods and never changed
/// afterwards. Hence, it can be shared by several threads without locking.
class AigCircuit
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief The kinds of nodes in the circuit.
  enum NodeKind
  {
    CONST_FALSE,
    INPUT,
    AND
  };

// -------------------------------------------------------------------------------------------
///
/// @struct Node
/// @brief One node of the circuit.
///
/// For AND gates, rhs0_ and rhs1_ are the (renumbered) literals of the two operands. For
/// inputs and the constant, they are 0.
  struct Node
  {
    NodeKind kind_;
    AigLit rhs0_;
    AigLit rhs1_;
    string name_;
  };

// -------------------------------------------------------------------------------------------
///
/// @struct AndDef
/// @brief The definition of an AND gate in terms of AIGER literals: lhs_ = rhs0_ & rhs1_.
  struct AndDef
  {
    AigLit lhs_;
    AigLit rhs0_;
    AigLit rhs1_;
  };

// -------------------------------------------------------------------------------------------
///
/// @brief Reads a circuit from an AIGER file (ASCII or binary format).
///
/// @param file_name The name of the file to read.
/// @return The circuit. The caller is responsible for deleting it.
/// @throws FormatError If the file cannot be read or does not describe a combinational
///         circuit with exactly one output.
  static AigCircuit* loadFromFile(const string &file_name);

// -------------------------------------------------------------------------------------------
///
/// @brief Converts a circuit parsed by the AIGER library.
///
/// @param aig The parsed circuit. It is not modified and not deleted.
/// @return The circuit. The caller is responsible for deleting it.
/// @throws FormatError If the circuit has latches or not exactly one output, or if
///         the definitions are inconsistent.
  static AigCircuit* fromAiger(const aiger *aig);

// -------------------------------------------------------------------------------------------
///
/// @brief Builds a circuit from definitions given in AIGER literals.
///
/// The AND gates can be given in any order as long as the graph is acyclic.
///
/// @param inputs The (even) AIGER literals of the inputs, in declaration order.
/// @param ands The definitions of the AND gates.
/// @param output The AIGER literal of the output.
/// @param input_names The names of the inputs. May be empty or shorter than inputs.
/// @return The circuit. The caller is responsible for deleting it.
/// @throws FormatError In case of an inverted or duplicate definition, a reference to an
///         undefined variable, or a cyclic fan-in.
  static AigCircuit* fromAigerLits(const vector<AigLit> &inputs,
                                   const vector<AndDef> &ands,
                                   AigLit output,
                                   const vector<string> &input_names);

// -------------------------------------------------------------------------------------------
///
/// @brief Constructs a literal from a node id and a polarity.
///
/// @param node The node id.
/// @param inverted True for the negated node.
/// @return The literal.
  static AigLit makeLit(unsigned node, bool inverted)
  {
    return (node << 1) | (inverted ? 1U : 0U);
  }

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the node a literal refers to.
///
/// @param lit The literal.
/// @return The node id.
  static unsigned litNode(AigLit lit)
  {
    return lit >> 1;
  }

// -------------------------------------------------------------------------------------------
///
/// @brief Returns true if a literal is inverted.
///
/// @param lit The literal.
/// @return True if the literal refers to the negation of its node.
  static bool litInverted(AigLit lit)
  {
    return (lit & 1U) != 0;
  }

// -------------------------------------------------------------------------------------------
///
/// @brief Negates a literal.
///
/// @param lit The literal.
/// @return The negated literal.
  static AigLit negLit(AigLit lit)
  {
    return lit ^ 1U;
  }

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~AigCircuit();

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the number of nodes (including the constant node 0).
///
/// @return The number of nodes.
  size_t getNrOfNodes() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns a node.
///
/// @param node The id of the node (must be smaller than getNrOfNodes()).
/// @return The node.
  const Node& getNode(unsigned node) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the ids of the inputs in declaration order.
///
/// @return The ids of the inputs.
  const vector<unsigned>& getInputs() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the ids of the AND gates in topological order.
///
/// @return The ids of the AND gates.
  const vector<unsigned>& getAnds() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the output literal.
///
/// @return The output literal.
  AigLit getOutput() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the AND gates that use a certain node as operand.
///
/// @param node The id of the node.
/// @return The ids of all AND gates reading this node.
  const vector<unsigned>& getFanouts(unsigned node) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Checks if a node is in the cone of influence of the output.
///
/// @param node The id of the node.
/// @return True if the output depends on this node.
  bool isInCone(unsigned node) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the number of nodes in the cone of influence of the output.
///
/// The constant node is never counted.
///
/// @return The number of inputs and AND gates the output depends on.
  size_t getConeSize() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Simulates the circuit.
///
/// @param input_values One value per input, in declaration order.
/// @return The value of the output.
  bool evaluate(const vector<bool> &input_values) const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor. Use the static factory methods instead.
  AigCircuit();

// -------------------------------------------------------------------------------------------
///
/// @brief Computes the fan-out lists and the cone of influence.
  void computeDerivedData();

// -------------------------------------------------------------------------------------------
///
/// @brief All nodes, indexed by id.
  vector<Node> nodes_;

// -------------------------------------------------------------------------------------------
///
/// @brief The ids of the inputs in declaration order.
  vector<unsigned> inputs_;

// -------------------------------------------------------------------------------------------
///
/// @brief The ids of the AND gates in topological order.
  vector<unsigned> ands_;

// -------------------------------------------------------------------------------------------
///
/// @brief The output literal.
  AigLit output_;

// -------------------------------------------------------------------------------------------
///
/// @brief The AND gates reading a node, indexed by node id.
  vector<vector<unsigned> > fanouts_;

// -------------------------------------------------------------------------------------------
///
/// @brief Maps node ids to true if the node is in the cone of influence of the output.
  vector<bool> cone_;

// -------------------------------------------------------------------------------------------
///
/// @brief The number of nodes in the cone of influence.
  size_t cone_size_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  AigCircuit(const AigCircuit &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  AigCircuit& operator=(const AigCircuit &other);
};

#endif // AigCircuit_H__
