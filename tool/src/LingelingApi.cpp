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
/// @file LingelingApi.cpp
/// @brief Contains the definition of the class LingelingApi.
// -------------------------------------------------------------------------------------------

#include "LingelingApi.h"
#include "CubeQuery.h"
#include "CNF.h"

extern "C" {
 #include "lglib.h"
}

// -------------------------------------------------------------------------------------------
///
/// @class LingelingGuard
/// @brief Releases a Lingeling instance when going out of scope.
class LingelingGuard
{
public:
  LingelingGuard() : lgl_(lglinit()) {}
  ~LingelingGuard()
  {
    if(lgl_ != NULL)
      lglrelease(lgl_);
  }
  LGL *lgl_;
private:
  LingelingGuard(const LingelingGuard &other);
  LingelingGuard& operator=(const LingelingGuard &other);
};

// -------------------------------------------------------------------------------------------
LingelingApi::LingelingApi() : SatSolver()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
LingelingApi::~LingelingApi()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
SatSolver::Answer LingelingApi::solve(const CubeQuery &query,
                                      double timeout_sec,
                                      vector<int> &model)
{
  TimeLimit limit = {Stopwatch::start(), timeout_sec};
  LingelingGuard guard;
  if(guard.lgl_ == NULL)
    throw SolverFailure("Could not initialize Lingeling.");
  LGL *lgl = guard.lgl_;
  if(timeout_sec > 0.0)
    lglseterm(lgl, TimeLimit::expired, &limit);

  // Lingeling only knows the variables that occur in some clause:
  vector<bool> used(query.getMaxVar() + 1, false);
  const list<vector<int> > &clauses = query.getBase().getClauses();
  for(CNF::ClauseConstIter it = clauses.begin(); it != clauses.end(); ++it)
  {
    for(size_t cnt = 0; cnt < it->size(); ++cnt)
    {
      int lit = (*it)[cnt];
      lgladd(lgl, lit);
      used[lit < 0 ? -lit : lit] = true;
    }
    lgladd(lgl, 0);
  }
  const vector<int> &units = query.getUnits();
  for(size_t cnt = 0; cnt < units.size(); ++cnt)
  {
    lgladd(lgl, units[cnt]);
    lgladd(lgl, 0);
    used[units[cnt] < 0 ? -units[cnt] : units[cnt]] = true;
  }

  int result = lglsat(lgl);
  if(result == 20)
    return UNSAT;
  if(result != 10)
  {
    if(Stopwatch::isExpired(limit.start_, timeout_sec))
      return TIMEOUT;
    throw SolverFailure("Lingeling returned neither SAT nor UNSAT.");
  }

  model.clear();
  model.reserve(query.getMaxVar());
  for(int var = 1; var <= query.getMaxVar(); ++var)
  {
    if(used[var] && lglderef(lgl, var) > 0)
      model.push_back(var);
    else
      model.push_back(-var);
  }
  return SAT;
}

// -------------------------------------------------------------------------------------------
string LingelingApi::getName() const
{
  return "lingeling";
}
