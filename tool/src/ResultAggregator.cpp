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
/// @file ResultAggregator.cpp
/// @brief Contains the definition of the class ResultAggregator.
// -------------------------------------------------------------------------------------------

#include "ResultAggregator.h"

#include <iomanip>

// -------------------------------------------------------------------------------------------
FinalResult::FinalResult() :
    answer_(Verdict::UNKNOWN),
    witness_cube_(0),
    nr_of_sat_(0),
    nr_of_unsat_(0),
    nr_of_unknown_(0),
    nr_of_timeouts_(0),
    nr_of_errors_(0),
    nr_of_cancelled_(0),
    sum_time_(0.0),
    max_time_(0.0)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
string FinalResult::toString() const
{
  ostringstream res;
  res << Verdict::kindToString(answer_) << " (" << verdicts_.size() << " cubes: "
      << nr_of_sat_ << " SAT, " << nr_of_unsat_ << " UNSAT, " << nr_of_unknown_ << " UNKNOWN";
  if(nr_of_unknown_ != 0)
  {
    res << " [" << nr_of_timeouts_ << " timeouts, " << nr_of_errors_ << " solver errors, "
        << nr_of_cancelled_ << " cancelled]";
  }
  res << fixed << setprecision(2) << ", " << sum_time_ << " sec in total, "
      << max_time_ << " sec max)";
  return res.str();
}

// -------------------------------------------------------------------------------------------
FinalResult ResultAggregator::aggregate(const vector<Verdict> &verdicts)
{
  FinalResult res;
  res.verdicts_ = verdicts;
  stable_sort(res.verdicts_.begin(), res.verdicts_.end());

  bool found_sat = false;
  for(size_t cnt = 0; cnt < res.verdicts_.size(); ++cnt)
  {
    const Verdict &v = res.verdicts_[cnt];
    res.sum_time_ += v.getElapsed();
    if(v.getElapsed() > res.max_time_)
      res.max_time_ = v.getElapsed();
    if(v.getKind() == Verdict::SAT)
    {
      ++res.nr_of_sat_;
      if(!found_sat)
      {
        found_sat = true;
        res.witness_ = v.getWitness();
        res.witness_cube_ = v.getIndex();
      }
    }
    else if(v.getKind() == Verdict::UNSAT)
      ++res.nr_of_unsat_;
    else
    {
      ++res.nr_of_unknown_;
      if(v.getReason() == Verdict::TIMEOUT)
        ++res.nr_of_timeouts_;
      else if(v.getReason() == Verdict::SOLVER_ERROR)
        ++res.nr_of_errors_;
      else if(v.getReason() == Verdict::CANCELLED)
        ++res.nr_of_cancelled_;
    }
  }

  if(found_sat)
    res.answer_ = Verdict::SAT;
  else if(!res.verdicts_.empty() && res.nr_of_unsat_ == res.verdicts_.size())
    res.answer_ = Verdict::UNSAT;
  else
    res.answer_ = Verdict::UNKNOWN;
  return res;
}
