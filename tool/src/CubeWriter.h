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
/// @file CubeWriter.h
/// @brief Contains the declaration of the class CubeWriter.
// -------------------------------------------------------------------------------------------

#ifndef CubeWriter_H__
#define CubeWriter_H__

#include "defines.h"
#include "BackEnd.h"

class AigCircuit;
class LookaheadScorer;

// -------------------------------------------------------------------------------------------
///
/// @class CubeWriter
/// @brief Only generates the cubes and writes every cube query into a DIMACS file.
///
/// The files are called cube_0000.cnf, cube_0001.cnf, ... (in the order in which the cubes
/// are generated) and contain the base CNF of the circuit plus one unit clause per cube
/// literal. They can be solved by any SAT solver, e.g., on a cluster.
class CubeWriter : public BackEnd
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param circuit The circuit to split. Must outlive this object.
/// @param scorer The lookahead scoring function. This object takes over the ownership.
/// @param depth The maximum number of decisions per cube.
/// @param candidates_limit The number of candidates probed per decision (0 for all).
/// @param out_dir The directory for the DIMACS files. It is created if necessary.
  CubeWriter(const AigCircuit &circuit,
             LookaheadScorer *scorer,
             size_t depth,
             size_t candidates_limit,
             const string &out_dir);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~CubeWriter();

// -------------------------------------------------------------------------------------------
///
/// @brief Generates and writes the cubes.
///
/// @return Always 0, because nothing is solved.
/// @throws AigCubeException If a file could not be written.
  virtual int run();

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the names of the files written by the last run.
///
/// @return The names of the files written by the last run.
  const vector<string>& getWrittenFiles() const;

protected:

  LookaheadScorer *scorer_;
  size_t depth_;
  size_t candidates_limit_;
  string out_dir_;
  vector<string> written_files_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  CubeWriter(const CubeWriter &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  CubeWriter& operator=(const CubeWriter &other);

};

#endif // CubeWriter_H__
