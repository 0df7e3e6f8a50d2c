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
/// @file ExtSatSolver.cpp
/// @brief Contains the definition of the class ExtSatSolver.
// -------------------------------------------------------------------------------------------

#include "ExtSatSolver.h"
#include "CubeQuery.h"
#include "FileUtils.h"
#include "StringUtils.h"
#include "Logger.h"

#include <atomic>
#include <iomanip>
#include <sys/wait.h>
#include <unistd.h>

// -------------------------------------------------------------------------------------------
///
/// @brief A counter to make the names of temporary files unique across threads.
static atomic<unsigned> tmp_file_counter(0);

// -------------------------------------------------------------------------------------------
ExtSatSolver::ExtSatSolver(const vector<string> &command,
                           const string &tmp_dir,
                           const string &keep_dir) :
    SatSolver(),
    command_(command),
    tmp_dir_(tmp_dir),
    keep_dir_(keep_dir)
{
  MASSERT(!command_.empty(), "No command for the external SAT solver given.");
}

// -------------------------------------------------------------------------------------------
ExtSatSolver::~ExtSatSolver()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
SatSolver::Answer ExtSatSolver::solve(const CubeQuery &query,
                                      double timeout_sec,
                                      vector<int> &model)
{
  bool keep = !keep_dir_.empty();
  string in_file_name = keep ? FileUtils::join(keep_dir_, query.getName() + ".cnf") :
                               getUniqueTmpFileName(query.getName()) + ".cnf";
  ScopedFile in_file(in_file_name, keep);
  ScopedFile out_file(getUniqueTmpFileName(query.getName() + "_answer") + ".out", false);

  ofstream dimacs(in_file.getName().c_str());
  if(dimacs.fail())
    throw SolverFailure("Could not create the file " + in_file.getName() + ".");
  query.toDimacs(dimacs);
  dimacs.close();
  if(dimacs.fail())
    throw SolverFailure("Could not write the file " + in_file.getName() + ".");

  string command = getSolverCommand(in_file.getName(), out_file.getName(), timeout_sec);
  L_LOG("Executing: " << command);
  int status = system(command.c_str());
  if(status == -1)
    throw SolverFailure("Could not start a shell for the command '" + command + "'.");
  if(!WIFEXITED(status))
    throw SolverFailure("The shell for the command '" + command + "' did not terminate.");
  int ret = WEXITSTATUS(status);

  // 124 is what 'timeout' returns after SIGTERM, 128 + 9 after the SIGKILL:
  if(timeout_sec > 0.0 && (ret == 124 || ret == 137))
    return TIMEOUT;
  if(ret == 20)
    return UNSAT;
  if(ret != 10)
  {
    ostringstream msg;
    msg << "The solver " << getName() << " terminated with exit code " << ret << ".";
    throw SolverFailure(msg.str());
  }
  parseModel(out_file.getName(), model);
  return SAT;
}

// -------------------------------------------------------------------------------------------
string ExtSatSolver::getName() const
{
  return command_[0];
}

// -------------------------------------------------------------------------------------------
string ExtSatSolver::quote(const string &word)
{
  string res = "'";
  for(size_t cnt = 0; cnt < word.size(); ++cnt)
  {
    if(word[cnt] == '\'')
      res += "'\\''";
    else
      res += word[cnt];
  }
  res += "'";
  return res;
}

// -------------------------------------------------------------------------------------------
string ExtSatSolver::getUniqueTmpFileName(const string &start) const
{
  ostringstream name;
  name << start << "_" << getpid() << "_" << tmp_file_counter++;
  return FileUtils::join(tmp_dir_, name.str());
}

// -------------------------------------------------------------------------------------------
string ExtSatSolver::getSolverCommand(const string &in_file,
                                      const string &out_file,
                                      double timeout_sec) const
{
  ostringstream cmd;
  if(timeout_sec > 0.0)
    cmd << "timeout -k 1 " << fixed << setprecision(3) << timeout_sec << " ";
  for(size_t cnt = 0; cnt < command_.size(); ++cnt)
    cmd << quote(command_[cnt]) << " ";
  cmd << quote(in_file) << " > " << quote(out_file) << " 2> /dev/null";
  return cmd.str();
}

// -------------------------------------------------------------------------------------------
void ExtSatSolver::parseModel(const string &out_file, vector<int> &model) const
{
  string answer;
  if(!FileUtils::readFile(out_file, answer))
    throw SolverFailure("Could not read the answer of the solver from " + out_file + ".");
  model.clear();
  vector<string> lines;
  StringUtils::splitLines(answer, lines, false);
  for(size_t line_cnt = 0; line_cnt < lines.size(); ++line_cnt)
  {
    const string &line = lines[line_cnt];
    if(line.empty())
      continue;
    if(line[0] == 's' && line.find("UNSAT") != string::npos)
      throw SolverFailure("The solver " + getName() + " returned 10 but printed '" + line + "'.");
    if(line[0] != 'v')
      continue;
    istringstream iss(line.substr(1));
    int lit = 0;
    while(iss >> lit)
    {
      if(lit != 0)
        model.push_back(lit);
    }
    if(!iss.eof())
      throw SolverFailure("Strange model line from solver " + getName() + ": " + line);
  }
}
