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
/// @file MiniSatApi.cpp
/// @brief Contains the definition of the class MiniSatApi.
// -------------------------------------------------------------------------------------------

#include "MiniSatApi.h"
#include "CubeQuery.h"
#include "CNF.h"

#include "minisat/core/Solver.h"

// -------------------------------------------------------------------------------------------
///
/// @brief Translates a CNF literal into a MiniSat literal.
///
/// @param lit The CNF literal (variables start with 1).
/// @return The MiniSat literal (variables start with 0).
static Minisat::Lit toMinisatLit(int lit)
{
  return Minisat::mkLit((lit < 0 ? -lit : lit) - 1, lit < 0);
}

// -------------------------------------------------------------------------------------------
MiniSatApi::MiniSatApi() : SatSolver()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
MiniSatApi::~MiniSatApi()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
SatSolver::Answer MiniSatApi::solve(const CubeQuery &query,
                                    double timeout_sec,
                                    vector<int> &model)
{
  PointInTime start = Stopwatch::start();
  Minisat::Solver solver;
  for(int var = 0; var < query.getMaxVar(); ++var)
    solver.newVar();

  // a false return value only means that the formula is already known to be unsatisfiable,
  // solveLimited() will then report l_False:
  Minisat::vec<Minisat::Lit> clause;
  const list<vector<int> > &clauses = query.getBase().getClauses();
  for(CNF::ClauseConstIter it = clauses.begin(); it != clauses.end(); ++it)
  {
    clause.clear();
    for(size_t cnt = 0; cnt < it->size(); ++cnt)
      clause.push(toMinisatLit((*it)[cnt]));
    solver.addClause(clause);
  }
  const vector<int> &units = query.getUnits();
  for(size_t cnt = 0; cnt < units.size(); ++cnt)
    solver.addClause(toMinisatLit(units[cnt]));

  Minisat::vec<Minisat::Lit> no_assumptions;
  Minisat::lbool result = l_Undef;
  if(timeout_sec <= 0.0)
  {
    solver.budgetOff();
    result = solver.solveLimited(no_assumptions);
  }
  else
  {
    while(true)
    {
      solver.setConfBudget(CONFLICTS_PER_SLICE);
      result = solver.solveLimited(no_assumptions);
      if(result != l_Undef)
        break;
      if(Stopwatch::isExpired(start, timeout_sec))
        return TIMEOUT;
    }
  }

  if(result == l_False)
    return UNSAT;
  if(result != l_True)
    throw SolverFailure("MiniSat returned neither SAT nor UNSAT.");

  model.clear();
  model.reserve(solver.nVars());
  for(int var = 0; var < solver.nVars(); ++var)
    model.push_back(solver.model[var] == l_True ? var + 1 : -(var + 1));
  return SAT;
}

// -------------------------------------------------------------------------------------------
string MiniSatApi::getName() const
{
  return "minisat";
}
