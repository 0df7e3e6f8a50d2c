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
/// @file CircuitState.h
/// @brief Contains the declaration of the class CircuitState.
// -------------------------------------------------------------------------------------------

#ifndef CircuitState_H__
#define CircuitState_H__

#include "defines.h"
#include "AigCircuit.h"

// -------------------------------------------------------------------------------------------
///
/// @class CircuitState
/// @brief A partial assignment to the nodes of a circuit with propagation and backtracking.
///
/// Every node is FALSE, TRUE or unassigned. Assigning a node propagates the consequences
/// through the circuit. For every AND gate g = a & b, this is complete unit propagation on
/// the three Tseitin clauses of the gate:
///  - a or b FALSE implies g FALSE,
///  - a and b TRUE implies g TRUE,
///  - g TRUE implies a and b TRUE,
///  - g FALSE and a TRUE implies b FALSE (and vice versa).
/// If a node would have to become both TRUE and FALSE, the assignment is in conflict.
///
/// All assignments are recorded on a trail. @link #mark mark() @endlink returns the current
/// position in the trail and @link #backtrack backtrack() @endlink undoes all assignments
/// made after that position. The constant node is assigned FALSE (together with its
/// consequences) on construction; these assignments are never undone.
class CircuitState
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief The value of a node.
  enum Value
  {
    VAL_FALSE = 0,
    VAL_TRUE = 1,
    VAL_UNDEF = 2
  };

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param circuit The circuit. It must outlive this object.
  explicit CircuitState(const AigCircuit &circuit);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~CircuitState();

// -------------------------------------------------------------------------------------------
///
/// @brief Assigns a node and propagates the consequences.
///
/// In case of a conflict, the state is left with the assignments made so far. The caller
/// is expected to backtrack to a mark taken before the call.
///
/// @param node The id of the node.
/// @param value The value for the node.
/// @return False if a conflict was found, true otherwise.
  bool assign(unsigned node, bool value);

// -------------------------------------------------------------------------------------------
///
/// @brief Makes a literal TRUE and propagates the consequences.
///
/// @param lit The literal.
/// @return False if a conflict was found, true otherwise.
  bool assignLit(AigLit lit);

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the current position in the trail.
///
/// @return The current position in the trail.
  size_t mark() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Undoes all assignments made after a certain position in the trail.
///
/// @param mark A value returned by mark() earlier.
  void backtrack(size_t mark);

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the value of a node.
///
/// @param node The id of the node.
/// @return The value of the node.
  Value getValue(unsigned node) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the value of a literal.
///
/// @param lit The literal.
/// @return The value of the literal.
  Value getLitValue(AigLit lit) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Checks if a node still contributes to the difficulty of the problem.
///
/// A node is live if it is in the cone of influence of the output, unassigned, and not a
/// buffer. A buffer is an AND gate with one operand TRUE and the other one unassigned: it
/// has collapsed into a wire.
///
/// @param node The id of the node.
/// @return True if the node is live.
  bool isLive(unsigned node) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the number of live AND gates reading a node.
///
/// @param node The id of the node.
/// @return The number of live fan-outs.
  size_t getNrOfLiveFanouts(unsigned node) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the number of live nodes.
///
/// @return The number of live nodes.
  size_t getResidualSize() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the circuit.
///
/// @return The circuit.
  const AigCircuit& getCircuit() const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief Sets a literal to a value without propagation.
///
/// @param lit The literal.
/// @param value The value for the literal.
/// @return False if the literal already has the opposite value.
  bool enqueue(AigLit lit, bool value);

// -------------------------------------------------------------------------------------------
///
/// @brief Applies the propagation rules of one AND gate.
///
/// @param gate The id of the AND gate.
/// @return False if a conflict was found.
  bool propagateGate(unsigned gate);

// -------------------------------------------------------------------------------------------
///
/// @brief Processes the queue of newly assigned nodes until nothing changes any more.
///
/// @return False if a conflict was found.
  bool propagate();

// -------------------------------------------------------------------------------------------
///
/// @brief The circuit.
  const AigCircuit &circuit_;

// -------------------------------------------------------------------------------------------
///
/// @brief The values of all nodes, indexed by node id.
  vector<Value> values_;

// -------------------------------------------------------------------------------------------
///
/// @brief The assigned nodes in the order of assignment.
  vector<unsigned> trail_;

// -------------------------------------------------------------------------------------------
///
/// @brief The position in the trail up to which the consequences have been propagated.
  size_t queue_head_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  CircuitState(const CircuitState &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  CircuitState& operator=(const CircuitState &other);
};

#endif // CircuitState_H__
