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
/// @file ExtSatSolver.h
/// @brief Contains the declaration of the class ExtSatSolver.
// -------------------------------------------------------------------------------------------

#ifndef ExtSatSolver_H__
#define ExtSatSolver_H__

#include "defines.h"
#include "SatSolver.h"

// -------------------------------------------------------------------------------------------
///
/// @class ExtSatSolver
/// @brief An interface to SAT solvers started as external processes.
///
/// The query is dumped into a file in DIMACS format and the solver is called with the name
/// of this file as last argument. The exit code of the solver is interpreted according to
/// the convention of the SAT competitions: 10 means SAT and 20 means UNSAT. If the solver
/// prints a model in 'v' lines, the model is parsed as well.
///
/// The time limit is enforced with the 'timeout' command of the coreutils: the solver is
/// sent SIGTERM when the limit is exceeded and SIGKILL one second later. Any other exit code
/// (including the one of a crashed solver) results in a SolverFailure.
///
/// The CNF file is removed after solving, unless a directory for keeping the CNFs has been
/// configured. In this case, the file is called 'cube_NNNN.cnf' and stays in this directory.
class ExtSatSolver : public SatSolver
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// @param command The executable of the solver, optionally followed by arguments that come
///        before the name of the CNF file.
/// @param tmp_dir The directory for temporary files.
/// @param keep_dir The directory where the CNF files are kept. Empty if the CNF files
///        should be removed.
  ExtSatSolver(const vector<string> &command, const string &tmp_dir, const string &keep_dir);

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
  virtual ~ExtSatSolver();

// -------------------------------------------------------------------------------------------
///
/// @brief Solves a query with the external solver.
///
/// @param query The query to solve.
/// @param timeout_sec The limit for the real time in seconds (zero or less for no limit).
/// @param model Will be set to the model printed by the solver (if any).
/// @return SAT, UNSAT, or TIMEOUT.
/// @throws SolverFailure If the solver could not be started, crashed, or terminated with an
///         unexpected exit code.
  virtual Answer solve(const CubeQuery &query, double timeout_sec, vector<int> &model);

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the name of the solver.
///
/// @return The executable of the solver.
  virtual string getName() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Quotes a word for the shell.
///
/// @param word The word to quote.
/// @return The word in single quotes.
  static string quote(const string &word);

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief Returns a file name that is unique for this process.
///
/// @param start The beginning of the file name.
/// @return A file name in the temporary directory.
  string getUniqueTmpFileName(const string &start) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the command line for executing the solver.
///
/// @param in_file The name of the CNF file.
/// @param out_file The name of the file for the standard output of the solver.
/// @param timeout_sec The time limit (zero or less for no limit).
/// @return The command line.
  string getSolverCommand(const string &in_file,
                          const string &out_file,
                          double timeout_sec) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Parses the 'v' lines of a solver output.
///
/// @param out_file The name of the file containing the standard output of the solver.
/// @param model Will be set to the literals in the 'v' lines (without the final 0).
/// @throws SolverFailure If the file cannot be read or a 'v' line contains garbage.
  void parseModel(const string &out_file, vector<int> &model) const;

// -------------------------------------------------------------------------------------------
///
/// @brief The executable of the solver, followed by its arguments.
  vector<string> command_;

// -------------------------------------------------------------------------------------------
///
/// @brief The directory for temporary files.
  string tmp_dir_;

// -------------------------------------------------------------------------------------------
///
/// @brief The directory where the CNF files are kept (empty if they are removed).
  string keep_dir_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  ExtSatSolver(const ExtSatSolver &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  ExtSatSolver& operator=(const ExtSatSolver &other);
};

#endif // ExtSatSolver_H__
