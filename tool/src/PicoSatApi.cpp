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
/// @file PicoSatApi.cpp
/// @brief Contains the definition of the class PicoSatApi.
// -------------------------------------------------------------------------------------------

#include "PicoSatApi.h"
#include "CubeQuery.h"
#include "CNF.h"

extern "C" {
 #include "picosat.h"
}

// -------------------------------------------------------------------------------------------
///
/// @class PicoSatGuard
/// @brief Releases a PicoSAT instance when going out of scope.
class PicoSatGuard
{
public:
  PicoSatGuard() : ps_(picosat_init()) {}
  ~PicoSatGuard()
  {
    if(ps_ != NULL)
      picosat_reset(ps_);
  }
  PicoSAT *ps_;
private:
  PicoSatGuard(const PicoSatGuard &other);
  PicoSatGuard& operator=(const PicoSatGuard &other);
};

// -------------------------------------------------------------------------------------------
PicoSatApi::PicoSatApi() : SatSolver()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
PicoSatApi::~PicoSatApi()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
SatSolver::Answer PicoSatApi::solve(const CubeQuery &query,
                                    double timeout_sec,
                                    vector<int> &model)
{
  TimeLimit limit = {Stopwatch::start(), timeout_sec};
  PicoSatGuard guard;
  if(guard.ps_ == NULL)
    throw SolverFailure("Could not initialize PicoSAT.");
  PicoSAT *ps = guard.ps_;
  picosat_adjust(ps, query.getMaxVar());
  if(timeout_sec > 0.0)
    picosat_set_interrupt(ps, &limit, TimeLimit::expired);

  const list<vector<int> > &clauses = query.getBase().getClauses();
  for(CNF::ClauseConstIter it = clauses.begin(); it != clauses.end(); ++it)
  {
    for(size_t cnt = 0; cnt < it->size(); ++cnt)
      picosat_add(ps, (*it)[cnt]);
    picosat_add(ps, 0);
  }
  const vector<int> &units = query.getUnits();
  for(size_t cnt = 0; cnt < units.size(); ++cnt)
  {
    picosat_add(ps, units[cnt]);
    picosat_add(ps, 0);
  }

  int result = picosat_sat(ps, -1);
  if(result == PICOSAT_UNSATISFIABLE)
    return UNSAT;
  if(result != PICOSAT_SATISFIABLE)
  {
    if(Stopwatch::isExpired(limit.start_, timeout_sec))
      return TIMEOUT;
    throw SolverFailure("PicoSAT returned neither SAT nor UNSAT.");
  }

  model.clear();
  model.reserve(query.getMaxVar());
  for(int var = 1; var <= query.getMaxVar(); ++var)
    model.push_back(picosat_deref(ps, var) > 0 ? var : -var);
  return SAT;
}

// -------------------------------------------------------------------------------------------
string PicoSatApi::getName() const
{
  return "picosat";
}
