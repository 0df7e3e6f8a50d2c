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
/// @file BackEnd.h
/// @brief Contains the declaration of the class BackEnd.
// -------------------------------------------------------------------------------------------

#ifndef BackEnd_H__
#define BackEnd_H__

#include "defines.h"

class AigCircuit;

// -------------------------------------------------------------------------------------------
///
/// @class BackEnd
/// @brief An interface for the back-ends.
///
/// Every back-end works on one loaded circuit: CubeAndConquer decides whether the output can
/// become TRUE, CubeWriter only splits the problem and writes the cubes as DIMACS files. The
/// circuit is referenced, not copied, and must outlive the back-end. This class is abstract.
class BackEnd
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param circuit The circuit to process.
  explicit BackEnd(const AigCircuit &circuit);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~BackEnd();

// -------------------------------------------------------------------------------------------
///
/// @brief Runs the BackEnd.
///
/// This method is abstract, which means that it has to be implemented in the derived classes,
/// i.e., in all classes actually implementing this interface.
///
/// @return The exit code of the program: 10 if the circuit output can be TRUE, 20 if it
///         cannot, and 0 if the back-end does not know.
  virtual int run() = 0;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns a one-line summary of the circuit this back-end works on.
///
/// @return A string such as '16 inputs, 90 AND gates, 106 nodes in the output cone'.
  string describeCircuit() const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief The circuit to process.
  const AigCircuit &circuit_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  BackEnd(const BackEnd &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  BackEnd& operator=(const BackEnd &other);

};

#endif // BackEnd_H__
