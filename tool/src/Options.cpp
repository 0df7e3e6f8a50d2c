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
/// @file Options.cpp
/// @brief Contains the definition of the class Options.
// -------------------------------------------------------------------------------------------

#include "Options.h"
#include "Logger.h"
#include "StringUtils.h"
#include "FileUtils.h"
#include "LookaheadScorer.h"
#include "SatSolverFactory.h"
#include "ResultReporter.h"
#include "CubeAndConquer.h"
#include "CubeWriter.h"

#include <thread>

// -------------------------------------------------------------------------------------------
const string Options::VERSION = string("1.0.0");

// -------------------------------------------------------------------------------------------
Options *Options::instance_ = NULL;

// -------------------------------------------------------------------------------------------
Options &Options::instance()
{
  if(instance_ == NULL)
    instance_ = new Options;
  MASSERT(instance_ != NULL, "Could not create Options instance.");
  return *instance_;
}

// -------------------------------------------------------------------------------------------
bool Options::parse(int argc, char **argv)
{
  parse_error_ = false;
  for(int arg_count = 1; arg_count < argc; ++arg_count)
  {
    string arg(argv[arg_count]);
    if(arg == "--help" || arg == "-h")
    {
      printHelp();
      return true;
    }
    else if(arg == "--version" || arg == "-v")
    {
      cout << "aigcube version " << Options::VERSION << endl;
      return true;
    }
    else if(arg.find("--in=") == 0)
    {
      aig_in_file_name_ = arg.substr(5, string::npos);
    }
    else if(arg == "-i")
    {
      ++arg_count;
      if(arg_count >= argc)
        return error("Option -i must be followed by a filename.");
      aig_in_file_name_ = string(argv[arg_count]);
    }
    else if(arg.find("--print=") == 0)
    {
      print_string_ = arg.substr(8, string::npos);
    }
    else if(arg == "-p")
    {
      ++arg_count;
      if(arg_count >= argc)
        return error("Option -p must be followed by a string indicating what to print.");
      print_string_ = string(argv[arg_count]);
    }
    else if(arg.find("--tmp=") == 0)
    {
      tmp_dir_ = arg.substr(6, string::npos);
    }
    else if(arg == "-t")
    {
      ++arg_count;
      if(arg_count >= argc)
        return error("Option -t must be followed by a directory name.");
      tmp_dir_ = string(argv[arg_count]);
    }
    else if(arg.find("--backend=") == 0)
    {
      back_end_ = arg.substr(10, string::npos);
      StringUtils::toLowerCaseIn(back_end_);
    }
    else if(arg == "-b")
    {
      ++arg_count;
      if(arg_count >= argc)
        return error("Option -b must be followed by a back-end name.");
      back_end_ = string(argv[arg_count]);
      StringUtils::toLowerCaseIn(back_end_);
    }
    else if(arg.find("--depth=") == 0)
    {
      if(!setDepth(arg.substr(8, string::npos)))
        return error("Option --depth needs a non-negative integer number.");
    }
    else if(arg == "-d")
    {
      ++arg_count;
      if(arg_count >= argc || !setDepth(argv[arg_count]))
        return error("Option -d must be followed by a non-negative integer number.");
    }
    else if(arg.find("--candidates=") == 0)
    {
      if(!setCandidatesLimit(arg.substr(13, string::npos)))
        return error("Option --candidates needs a non-negative integer number.");
    }
    else if(arg == "-k")
    {
      ++arg_count;
      if(arg_count >= argc || !setCandidatesLimit(argv[arg_count]))
        return error("Option -k must be followed by a non-negative integer number.");
    }
    else if(arg.find("--score=") == 0)
    {
      score_ = arg.substr(8, string::npos);
      StringUtils::toLowerCaseIn(score_);
    }
    else if(arg.find("--sat_sv=") == 0)
    {
      sat_solver_ = arg.substr(9, string::npos);
      StringUtils::toLowerCaseIn(sat_solver_);
    }
    else if(arg == "-s")
    {
      ++arg_count;
      if(arg_count >= argc)
        return error("Option -s must be followed by a SAT solver name.");
      sat_solver_ = string(argv[arg_count]);
      StringUtils::toLowerCaseIn(sat_solver_);
    }
    else if(arg.find("--ext_solver=") == 0)
    {
      ext_solver_.clear();
      StringUtils::splitWords(arg.substr(13, string::npos), ext_solver_);
    }
    else if(arg == "-x")
    {
      ++arg_count;
      if(arg_count >= argc)
        return error("Option -x must be followed by a solver command.");
      ext_solver_.clear();
      StringUtils::splitWords(argv[arg_count], ext_solver_);
    }
    else if(arg.find("--timeout=") == 0)
    {
      if(!StringUtils::parseSeconds(arg.substr(10, string::npos), timeout_sec_))
        return error("Option --timeout needs a non-negative number of seconds.");
    }
    else if(arg.find("--keep-cnfs=") == 0)
    {
      keep_dir_ = arg.substr(12, string::npos);
    }
    else if(arg.find("--threads=") == 0)
    {
      if(!setNrOfThreads(arg.substr(10, string::npos)))
        return error("Option --threads needs a positive integer number.");
    }
    else if(arg == "-j")
    {
      ++arg_count;
      if(arg_count >= argc || !setNrOfThreads(argv[arg_count]))
        return error("Option -j must be followed by a positive integer number.");
    }
    else
      return error("Unknown option '" + arg + "'.");
  }

  if(aig_in_file_name_ == "")
    return error("No input file given.");
  if(back_end_ != "cnc" && back_end_ != "cubes")
    return error("Unknown back-end '" + back_end_ + "'.");
  LookaheadScorer::Policy policy;
  if(!LookaheadScorer::parsePolicy(score_, policy))
    return error("Unknown lookahead score '" + score_ + "'.");
  SatSolverFactory::SolverKind kind;
  if(!SatSolverFactory::parseKind(sat_solver_, kind))
    return error("Unknown SAT solver '" + sat_solver_ + "'.");
  if(kind == SatSolverFactory::EXTERNAL && ext_solver_.empty())
    return error("The SAT solver 'ext' needs a command (option -x or --ext_solver).");
  if(back_end_ == "cubes" && keep_dir_.empty())
    return error("The back-end 'cubes' needs an output directory (option --keep-cnfs).");
  if(back_end_ == "cnc" && kind != SatSolverFactory::EXTERNAL && !keep_dir_.empty())
    return error("Option --keep-cnfs only applies to the SAT solver 'ext' and the back-end "
                 "'cubes'.");
  initLogger();
  return false;
}

// -------------------------------------------------------------------------------------------
bool Options::hasParseError() const
{
  return parse_error_;
}

// -------------------------------------------------------------------------------------------
const string& Options::getAigInFileName() const
{
  return aig_in_file_name_;
}

// -------------------------------------------------------------------------------------------
const string& Options::getBackEndName() const
{
  return back_end_;
}

// -------------------------------------------------------------------------------------------
BackEnd* Options::getBackEnd(const AigCircuit &circuit) const
{
  LookaheadScorer::Policy policy = LookaheadScorer::PRODUCT;
  bool known = LookaheadScorer::parsePolicy(score_, policy);
  MASSERT(known, "Unknown lookahead score '" << score_ << "'.");
  if(back_end_ == "cnc")
  {
    return new CubeAndConquer(circuit,
                              LookaheadScorer::create(policy),
                              getSolverFactory(),
                              new LogReporter,
                              depth_,
                              candidates_limit_,
                              timeout_sec_,
                              nr_of_threads_);
  }
  if(back_end_ == "cubes")
  {
    return new CubeWriter(circuit,
                          LookaheadScorer::create(policy),
                          depth_,
                          candidates_limit_,
                          keep_dir_);
  }
  MASSERT(false, "Unknown back-end '" << back_end_ << "'.");
  return NULL;
}

// -------------------------------------------------------------------------------------------
SatSolverFactory* Options::getSolverFactory() const
{
  SatSolverFactory::SolverKind kind = SatSolverFactory::MINISAT_API;
  bool known = SatSolverFactory::parseKind(sat_solver_, kind);
  MASSERT(known, "Unknown SAT solver '" << sat_solver_ << "'.");
  string tmp_dir;
  if(kind == SatSolverFactory::EXTERNAL)
  {
    tmp_dir = getTmpDirName();
    if(!keep_dir_.empty() && !FileUtils::createDir(keep_dir_))
      throw AigCubeException("Could not create the directory '" + keep_dir_ + "'.");
  }
  return new SatSolverFactory(kind, ext_solver_, tmp_dir, keep_dir_);
}

// -------------------------------------------------------------------------------------------
string Options::getTmpDirName() const
{
  if(!FileUtils::createDir(tmp_dir_))
    throw AigCubeException("Could not create the directory '" + tmp_dir_ +
                           "' for temporary files.");
  return tmp_dir_;
}

// -------------------------------------------------------------------------------------------
size_t Options::getDepth() const
{
  return depth_;
}

// -------------------------------------------------------------------------------------------
size_t Options::getCandidatesLimit() const
{
  return candidates_limit_;
}

// -------------------------------------------------------------------------------------------
double Options::getTimeout() const
{
  return timeout_sec_;
}

// -------------------------------------------------------------------------------------------
size_t Options::getNrOfThreads() const
{
  return nr_of_threads_;
}

// -------------------------------------------------------------------------------------------
const string& Options::getKeepDir() const
{
  return keep_dir_;
}

// -------------------------------------------------------------------------------------------
void Options::printHelp() const
{
  cout << "Usage: aigcube-bin [options]"                                            << endl;
  cout                                                                              << endl;
  cout << "Decides if the output of a combinational AIGER circuit can become true,"  << endl;
  cout << "using cube-and-conquer: a lookahead procedure splits the problem into"    << endl;
  cout << "cubes, which are then solved in parallel by a SAT solver."                << endl;
  cout << "The exit code is 10 for SAT, 20 for UNSAT, 0 if the answer is unknown,"  << endl;
  cout << "and 1 in case of an error."                                              << endl;
  cout                                                                              << endl;
  cout << "Options:"                                                                << endl;
  cout << "  -h, --help"                                                            << endl;
  cout << "                 Show this help message and exit."                       << endl;
  cout << "  -v, --version"                                                         << endl;
  cout << "                 Print version information and exit."                    << endl;
  cout << "  -i INPUT_FILE, --in=INPUT_FILE"                                        << endl;
  cout << "                 The AIGER file with the circuit to check."              << endl;
  cout << "                 It can be:"                                             << endl;
  cout << "                  - a binary AIGER file (header starts with 'aig'),"     << endl;
  cout << "                  - an ASCII AIGER file (header starts with 'aag'),"     << endl;
  cout << "                  - a compressed file (INPUT_FILE ends with '.gz')."     << endl;
  cout << "                 The circuit must not have latches and must have"        << endl;
  cout << "                 exactly one output."                                    << endl;
  cout << "  -p PRINT, --print=PRINT"                                               << endl;
  cout << "                 A string indicating which messages to print. Every"     << endl;
  cout << "                 character activates a certain type of message. The"     << endl;
  cout << "                 order and case of the characters does not matter."      << endl;
  cout << "                 Possible characters are:"                               << endl;
  cout << "                 E:      Enables the printing of error messages."        << endl;
  cout << "                 W:      Enables the printing of warnings."              << endl;
  cout << "                 R:      Enables the printing of results."               << endl;
  cout << "                 D:      Enables the printing of debugging messages."    << endl;
  cout << "                 I:      Enables the printing of extra information"      << endl;
  cout << "                         (such as progress information)."                << endl;
  cout << "                 L:      Enables the printing of statistics"             << endl;
  cout << "                         (such as performance measures)."                << endl;
  cout << "                 The default is 'EWRI'."                                 << endl;
  cout << "  -t DIR, --tmp=DIR"                                                     << endl;
  cout << "                 The name of a directory for temporary files. This "     << endl;
  cout << "                 directory will be created if it does not exist. "       << endl;
  cout << "                 The default is './tmp'."                                << endl;
  cout << "  -b BACKEND, --backend=BACKEND"                                         << endl;
  cout << "                 The back-end to be used."                               << endl;
  cout << "                 The following back-ends are available:"                 << endl;
  cout << "                 cnc:   Generates the cubes, solves them in parallel,"   << endl;
  cout << "                        and reports the verdict of every cube and the"   << endl;
  cout << "                        final answer."                                   << endl;
  cout << "                 cubes: Only generates the cubes and writes one DIMACS"  << endl;
  cout << "                        file per cube (cube_0000.cnf, ...) into the"     << endl;
  cout << "                        directory given with --keep-cnfs."               << endl;
  cout << "                 The default is 'cnc'."                                  << endl;
  cout << "  -d DEPTH, --depth=DEPTH"                                               << endl;
  cout << "                 The number of decisions per cube. This gives at most"   << endl;
  cout << "                 2^DEPTH cubes. 0 means no splitting at all."            << endl;
  cout << "                 The default is 4."                                      << endl;
  cout << "  -k NUM, --candidates=NUM"                                              << endl;
  cout << "                 The number of nodes probed by the lookahead for every"  << endl;
  cout << "                 decision (the ones with the most connections are"       << endl;
  cout << "                 preferred). 0 means that all nodes are probed."         << endl;
  cout << "                 The default is 10."                                     << endl;
  cout << "  --score=SCORE"                                                         << endl;
  cout << "                 The lookahead score for choosing decisions:"            << endl;
  cout << "                 product:  the product of the reductions of both"        << endl;
  cout << "                           branches (prefers balanced splits)."          << endl;
  cout << "                 fraction: the average fraction of the circuit that is"  << endl;
  cout << "                           decided by the two branches."                 << endl;
  cout << "                 The default is 'product'."                              << endl;
  cout << "  -s SAT_SOLVER, --sat_sv=SAT_SOLVER"                                    << endl;
  cout << "                 The SAT solver to use for the cubes."                   << endl;
  cout << "                 The following SAT solvers are available:"               << endl;
  cout << "                 lin_api: Uses the Lingeling solver via its API."        << endl;
  cout << "                 min_api: Uses the MiniSat solver via its API."          << endl;
  cout << "                 pic_api: Uses the PicoSat solver via its API."          << endl;
  cout << "                 ext:     Runs an external solver (see -x) on a DIMACS"  << endl;
  cout << "                          file. Exit code 10 means SAT, 20 means UNSAT."  << endl;
  cout << "                 The default is 'min_api'."                              << endl;
  cout << "  -x COMMAND, --ext_solver=COMMAND"                                      << endl;
  cout << "                 The command line of the external solver, e.g.,"         << endl;
  cout << "                 'kissat -q'. The name of the DIMACS file is appended."  << endl;
  cout << "  --timeout=SEC"                                                         << endl;
  cout << "                 The time limit for every cube in seconds. Cubes that"   << endl;
  cout << "                 exceed it are reported as UNKNOWN (timeout)."           << endl;
  cout << "                 The default is 0, which means no limit."                << endl;
  cout << "  --keep-cnfs=DIR"                                                       << endl;
  cout << "                 Keep the DIMACS files of the cubes in the directory"    << endl;
  cout << "                 DIR instead of deleting them. Only used by the SAT"     << endl;
  cout << "                 solver 'ext' and the back-end 'cubes'."                 << endl;
  cout << "  -j NUM, --threads=NUM"                                                 << endl;
  cout << "                 The number of cubes solved in parallel."                << endl;
  cout << "                 The default is the number of cores of the CPU."         << endl;
  cout << "Have fun!"                                                               << endl;
}

// -------------------------------------------------------------------------------------------
void Options::initLogger() const
{
  Logger &logger = Logger::instance();
  if(print_string_.find("E") != string::npos || print_string_.find("e") != string::npos)
    logger.enable(Logger::ERR);
  else
    logger.disable(Logger::ERR);
  if(print_string_.find("W") != string::npos || print_string_.find("w") != string::npos)
    logger.enable(Logger::WRN);
  else
    logger.disable(Logger::WRN);
  if(print_string_.find("R") != string::npos || print_string_.find("r") != string::npos)
    logger.enable(Logger::RES);
  else
    logger.disable(Logger::RES);
  if(print_string_.find("I") != string::npos || print_string_.find("i") != string::npos)
    logger.enable(Logger::INF);
  else
    logger.disable(Logger::INF);
  if(print_string_.find("D") != string::npos || print_string_.find("d") != string::npos)
    logger.enable(Logger::DBG);
  else
    logger.disable(Logger::DBG);
  if(print_string_.find("L") != string::npos || print_string_.find("l") != string::npos)
    logger.enable(Logger::LOG);
  else
    logger.disable(Logger::LOG);
}

// -------------------------------------------------------------------------------------------
bool Options::error(const string &message)
{
  cerr << message << endl;
  cerr << "Run with '--help' for a list of options." << endl;
  parse_error_ = true;
  return true;
}

// -------------------------------------------------------------------------------------------
bool Options::setDepth(const string &value)
{
  return StringUtils::parseSize(value, depth_);
}

// -------------------------------------------------------------------------------------------
bool Options::setCandidatesLimit(const string &value)
{
  return StringUtils::parseSize(value, candidates_limit_);
}

// -------------------------------------------------------------------------------------------
bool Options::setNrOfThreads(const string &value)
{
  size_t nr = 0;
  if(!StringUtils::parseSize(value, nr) || nr == 0)
    return false;
  nr_of_threads_ = nr;
  return true;
}

// -------------------------------------------------------------------------------------------
Options::Options():
    aig_in_file_name_(),
    print_string_("EWRI"),
    tmp_dir_("./tmp"),
    back_end_("cnc"),
    depth_(4),
    candidates_limit_(10),
    score_("product"),
    sat_solver_("min_api"),
    ext_solver_(),
    timeout_sec_(0.0),
    keep_dir_(),
    nr_of_threads_(thread::hardware_concurrency()),
    parse_error_(false)
{
  if(nr_of_threads_ == 0)
    nr_of_threads_ = 1;
}

// -------------------------------------------------------------------------------------------
Options::~Options()
{
  // nothing to be done
}
