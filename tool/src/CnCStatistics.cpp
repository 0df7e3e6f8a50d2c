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
/// @file CnCStatistics.cpp
/// @brief Contains the definition of the class CnCStatistics.
// -------------------------------------------------------------------------------------------

#include "CnCStatistics.h"
#include "ResultAggregator.h"
#include "Logger.h"

// -------------------------------------------------------------------------------------------
CnCStatistics::CnCStatistics() :
                  cube_cpu_time_(0.0),
                  cube_real_time_(0.0),
                  nr_of_cubes_(0),
                  nr_of_probes_(0),
                  nr_of_forced_(0),
                  nr_of_refuted_(0),
                  conquer_cpu_time_(0.0),
                  conquer_real_time_(0.0),
                  sum_cube_time_(0.0),
                  max_cube_time_(0.0),
                  nr_of_sat_(0),
                  nr_of_unsat_(0),
                  nr_of_unknown_(0)
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
CnCStatistics::~CnCStatistics()
{
  // nothing to do
}

// -------------------------------------------------------------------------------------------
void CnCStatistics::notifyCubeStart()
{
  cube_start_time_ = Stopwatch::start();
}

// -------------------------------------------------------------------------------------------
void CnCStatistics::notifyCubeEnd(size_t nr_of_cubes, size_t nr_of_probes,
                                  size_t nr_of_forced, size_t nr_of_refuted)
{
  cube_cpu_time_ += Stopwatch::getCPUTimeSec(cube_start_time_);
  cube_real_time_ += Stopwatch::getRealTimeSecExact(cube_start_time_);
  nr_of_cubes_ += nr_of_cubes;
  nr_of_probes_ += nr_of_probes;
  nr_of_forced_ += nr_of_forced;
  nr_of_refuted_ += nr_of_refuted;
}

// -------------------------------------------------------------------------------------------
void CnCStatistics::notifyConquerStart()
{
  conquer_start_time_ = Stopwatch::start();
}

// -------------------------------------------------------------------------------------------
void CnCStatistics::notifyConquerEnd(const FinalResult &result)
{
  conquer_cpu_time_ += Stopwatch::getCPUTimeSec(conquer_start_time_);
  conquer_real_time_ += Stopwatch::getRealTimeSecExact(conquer_start_time_);
  sum_cube_time_ += result.sum_time_;
  if(result.max_time_ > max_cube_time_)
    max_cube_time_ = result.max_time_;
  nr_of_sat_ += result.nr_of_sat_;
  nr_of_unsat_ += result.nr_of_unsat_;
  nr_of_unknown_ += result.nr_of_unknown_;
}

// -------------------------------------------------------------------------------------------
void CnCStatistics::logStatistics() const
{
  L_LOG("Nr. of cubes: " << nr_of_cubes_);
  L_LOG(" Lookahead probes: " << nr_of_probes_);
  L_LOG(" Forced literals: " << nr_of_forced_);
  L_LOG(" Refuted branches: " << nr_of_refuted_);
  L_LOG(" Cube generation took:");
  L_LOG("   " << cube_cpu_time_ <<  " sec CPU time.");
  L_LOG("   " << cube_real_time_ <<  " sec real time.");

  L_LOG("Solved cubes: " << nr_of_sat_ << " SAT, " << nr_of_unsat_ << " UNSAT, "
        << nr_of_unknown_ << " UNKNOWN");
  L_LOG(" Conquer phase took:");
  L_LOG("   " << conquer_cpu_time_ <<  " sec CPU time (all threads).");
  L_LOG("   " << conquer_real_time_ <<  " sec real time.");
  double avg_cube_time = 0.0;
  size_t nr_of_solved = nr_of_sat_ + nr_of_unsat_ + nr_of_unknown_;
  if(nr_of_solved != 0)
    avg_cube_time = sum_cube_time_ / nr_of_solved;
  L_LOG("   " << sum_cube_time_ <<  " sec real time summed over all cubes.");
  L_LOG("   " << avg_cube_time <<  " sec real time per cube on average.");
  L_LOG("   " << max_cube_time_ <<  " sec real time for the hardest cube.");
  if(conquer_real_time_ > 0.0)
    L_LOG(" Speedup of the worker pool: " << sum_cube_time_ / conquer_real_time_);
}
