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
/// @file ResultReporter.cpp
/// @brief Contains the definition of the classes ResultReporter and LogReporter.
// -------------------------------------------------------------------------------------------

#include "ResultReporter.h"
#include "Logger.h"

// -------------------------------------------------------------------------------------------
ResultReporter::ResultReporter()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
ResultReporter::~ResultReporter()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
void ResultReporter::report(const FinalResult &result)
{
  for(size_t cnt = 0; cnt < result.verdicts_.size(); ++cnt)
    reportCube(result.verdicts_[cnt]);
  reportFinal(result);
}

// -------------------------------------------------------------------------------------------
LogReporter::LogReporter()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
LogReporter::~LogReporter()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
void LogReporter::reportCube(const Verdict &verdict)
{
  L_RES(verdict.toString());
}

// -------------------------------------------------------------------------------------------
void LogReporter::reportFinal(const FinalResult &result)
{
  L_RES("Answer: " << result.toString());
  if(result.answer_ == Verdict::SAT)
  {
    if(result.witness_.empty())
    {
      L_RES("Witness (cube " << result.witness_cube_ << "): not available");
    }
    else
    {
      ostringstream values;
      for(size_t cnt = 0; cnt < result.witness_.size(); ++cnt)
        values << (result.witness_[cnt] > 0 ? '1' : '0');
      L_RES("Witness (cube " << result.witness_cube_ << "): " << values.str());
    }
  }
  else if(result.answer_ == Verdict::UNKNOWN)
  {
    L_RES("UNKNOWN is not a proof: " << result.nr_of_unknown_ << " cubes remain unsolved.");
  }
}
