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
/// @file SatSolverFactory.cpp
/// @brief Contains the definition of the class SatSolverFactory.
// -------------------------------------------------------------------------------------------

#include "SatSolverFactory.h"
#include "MiniSatApi.h"
#include "PicoSatApi.h"
#include "LingelingApi.h"
#include "ExtSatSolver.h"
#include "StringUtils.h"

// -------------------------------------------------------------------------------------------
bool SatSolverFactory::parseKind(const string &name, SolverKind &kind)
{
  string lower = StringUtils::toLowerCase(name);
  if(lower == "min_api")
    kind = MINISAT_API;
  else if(lower == "pic_api")
    kind = PICOSAT_API;
  else if(lower == "lin_api")
    kind = LINGELING_API;
  else if(lower == "ext")
    kind = EXTERNAL;
  else
    return false;
  return true;
}

// -------------------------------------------------------------------------------------------
SatSolverFactory::SatSolverFactory(SolverKind kind,
                                   const vector<string> &ext_command,
                                   const string &tmp_dir,
                                   const string &keep_dir) :
    kind_(kind),
    ext_command_(ext_command),
    tmp_dir_(tmp_dir),
    keep_dir_(keep_dir)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
SatSolverFactory::~SatSolverFactory()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
SatSolver* SatSolverFactory::create() const
{
  switch(kind_)
  {
    case MINISAT_API:
      return new MiniSatApi;
    case PICOSAT_API:
      return new PicoSatApi;
    case LINGELING_API:
      return new LingelingApi;
    case EXTERNAL:
      return new ExtSatSolver(ext_command_, tmp_dir_, keep_dir_);
  }
  MASSERT(false, "Unknown SAT solver kind.");
  return NULL;
}

// -------------------------------------------------------------------------------------------
SatSolverFactory::SolverKind SatSolverFactory::getKind() const
{
  return kind_;
}
