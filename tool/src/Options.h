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
/// @file Options.h
/// @brief Contains the declaration of the class Options.
// -------------------------------------------------------------------------------------------

#ifndef Options_H__
#define Options_H__

#include "defines.h"

class BackEnd;
class AigCircuit;
class SatSolverFactory;

// -------------------------------------------------------------------------------------------
///
/// @class Options
/// @brief Parses and stores the command-line options.
///
/// This class is implemented as a singleton: there is only one instance, which can be
/// obtained with instance(). Call parse() once at the beginning of the program. Afterwards,
/// the options can be read with the get-methods, and the configured back-end and solver can
/// be created with getBackEnd() and getSolverFactory().
class Options
{
public:

// -------------------------------------------------------------------------------------------
///
/// @brief The version of the tool.
  static const string VERSION;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the one and only instance of this class.
///
/// @return The one and only instance of this class.
  static Options& instance();

// -------------------------------------------------------------------------------------------
///
/// @brief Parses the command-line arguments.
///
/// Invalid arguments are reported on stderr. Afterwards, hasParseError() returns true.
///
/// @param argc The number of command-line arguments.
/// @param argv The command-line arguments (argv[0] is the name of the program).
/// @return True if the program should terminate immediately (because the help or the
///         version was printed, or because of an error), false otherwise.
  bool parse(int argc, char **argv);

// -------------------------------------------------------------------------------------------
///
/// @brief Returns true if the last call to parse() found invalid arguments.
///
/// @return True if the last call to parse() found invalid arguments.
  bool hasParseError() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the name of the AIGER input file.
///
/// @return The name of the AIGER input file.
  const string& getAigInFileName() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the name of the back-end ('cnc' or 'cubes').
///
/// @return The name of the back-end.
  const string& getBackEndName() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Creates the back-end selected by the user.
///
/// @param circuit The circuit to work on. Must outlive the back-end.
/// @return A new back-end. The caller is responsible for deleting it.
  BackEnd* getBackEnd(const AigCircuit &circuit) const;

// -------------------------------------------------------------------------------------------
///
/// @brief Creates a factory for the SAT solver selected by the user.
///
/// @return A new factory. The caller is responsible for deleting it.
  SatSolverFactory* getSolverFactory() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Returns the name of the directory for temporary files.
///
/// The directory is created if it does not exist yet.
///
/// @return The name of the directory for temporary files.
/// @throws AigCubeException If the directory could not be created.
  string getTmpDirName() const;

  size_t getDepth() const;
  size_t getCandidatesLimit() const;
  double getTimeout() const;
  size_t getNrOfThreads() const;
  const string& getKeepDir() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Prints a help message.
  void printHelp() const;

protected:

// -------------------------------------------------------------------------------------------
///
/// @brief Enables and disables the message types of the Logger according to the print
///        string.
  void initLogger() const;

// -------------------------------------------------------------------------------------------
///
/// @brief Reports an invalid argument.
///
/// @param message The message to print on stderr.
/// @return Always true (so it can be returned by parse() directly).
  bool error(const string &message);

// -------------------------------------------------------------------------------------------
///
/// @brief Sets the depth from a string.
///
/// @param value The string to parse.
/// @return True on success, false if the string is not a non-negative integer.
  bool setDepth(const string &value);

// -------------------------------------------------------------------------------------------
///
/// @brief Sets the limit on the number of lookahead candidates from a string.
///
/// @param value The string to parse.
/// @return True on success, false if the string is not a non-negative integer.
  bool setCandidatesLimit(const string &value);

// -------------------------------------------------------------------------------------------
///
/// @brief Sets the number of worker threads from a string.
///
/// @param value The string to parse.
/// @return True on success, false if the string is not a positive integer.
  bool setNrOfThreads(const string &value);

  string aig_in_file_name_;
  string print_string_;
  string tmp_dir_;
  string back_end_;
  size_t depth_;
  size_t candidates_limit_;
  string score_;
  string sat_solver_;
  vector<string> ext_solver_;
  double timeout_sec_;
  string keep_dir_;
  size_t nr_of_threads_;
  bool parse_error_;

// -------------------------------------------------------------------------------------------
///
/// @brief The one and only instance of this class.
  static Options *instance_;

private:

// -------------------------------------------------------------------------------------------
///
/// @brief Constructor.
///
/// The constructor is disabled (set private) as this class is implemented as a Singleton.
  Options();

// -------------------------------------------------------------------------------------------
///
/// @brief Destructor.
///
/// The destructor is disabled (set private) as this class is implemented as a Singleton.
  virtual ~Options();

// -------------------------------------------------------------------------------------------
///
/// @brief Copy constructor.
///
/// The copy constructor is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
  Options(const Options &other);

// -------------------------------------------------------------------------------------------
///
/// @brief Assignment operator.
///
/// The assignment operator is disabled (set private) and not implemented.
///
/// @param other The source for creating the copy.
/// @return The result of the assignment, i.e, *this.
  Options& operator=(const Options &other);
};

#endif // Options_H__
