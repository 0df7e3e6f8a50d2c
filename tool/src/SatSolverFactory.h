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
/// @file SatSolverFactory.h
/// @brief Contains the declaration of the class SatSolverFactory.
// -------------------------------------------------------------------------------------------

#ifndef SatSolverFactory_H__
#define SatSolverFactory_H__

#include "defines.h"

class SatSolver;

// -------------------------------------------------------------------------------------------
///
/// @class SatSolverFactory
/// @brief Creates fresh SAT solver instances of a configured kind.
///
/// The conquer stage asks the factory for a new solver for every cube. The kind of solver is
/// fixed when the factory is created, so the choice is made once from the configuration and
/// never by name lookup while solving. create() can be called by several threads
/// concurrently.
class SatSolverFactory
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief The available solvers.
  enum SolverKind
  {
///
/// @brief MiniSat, linked as library.
    MINISAT_API,

///
/// @brief PicoSAT, linked as library.
    PICOSAT_API,

///
/// @brief Lingeling, linked as library.
    LINGELING_API,

///
/// @brief Any solver executable following the exit code convention (10 SAT, 20 UNSAT).
    EXTERNAL
  };

// -------------------------------------------------------------------------------------------
///
/// @brief Parses the name of a solver as given on the command line.
///
/// @param name 'min_api', 'pic_api', 'lin_api', or 'ext' (case insensitive).
/// @param kind Will be set to the corresponding kind if the name is known.
/// @return True if the name is known, false otherwise.
  static bool parseKind(const string &name, SolverKind &kind);

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param kind The kind of solver to create.
/// @param ext_command The command line of the external solver (only used for EXTERNAL).
/// @param tmp_dir The directory for temporary files (only used for EXTERNAL).
/// @param keep_dir The directory for keeping the CNF files, or the empty string (only used
///        for EXTERNAL).
  SatSolverFactory(SolverKind kind,
                   const vector<string> &ext_command,
                   const string &tmp_dir,
                   const string &keep_dir);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~SatSolverFactory();

// -------------------------------------------------------------------------------------------
///
/// @brief Creates a new solver.
///
/// @return A new solver. The caller is responsible for deleting it.
  virtual SatSolver* create() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the kind of solver this factory creates.
///
/// @return The kind of solver this factory creates.
  SolverKind getKind() const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief The kind of solver to create.
  SolverKind kind_;

// -------------------------------------------------------------------------------------------
///
/// @brief The command line of the external solver.
  vector<string> ext_command_;

// -------------------------------------------------------------------------------------------
///
/// @brief The directory for temporary files.
  string tmp_dir_;

// -------------------------------------------------------------------------------------------
///
/// @brief The directory for keeping the CNF files (or empty).
  string keep_dir_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  SatSolverFactory(const SatSolverFactory &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  SatSolverFactory& operator=(const SatSolverFactory &other);
};

#endif // SatSolverFactory_H__
